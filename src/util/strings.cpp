#include <util/strings.hpp>

#include <boost/beast/core/detail/base64.hpp>

#include <cctype>
#include <sstream>

namespace util {

std::string trim(std::string_view text) {
    auto const is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while(not text.empty() and is_space(text.front()))
        text.remove_prefix(1);
    while(not text.empty() and is_space(text.back()))
        text.remove_suffix(1);
    return std::string{ text };
}

std::string join_url(std::string_view base, std::string_view path) {
    while(not base.empty() and base.back() == '/')
        base.remove_suffix(1);

    std::string result{ base };
    if(not path.empty() and path.front() != '/')
        result += '/';
    result += path;
    return result;
}

std::optional<std::pair<std::string, std::string>> split_assignment(std::string_view text) {
    auto const eq = text.find('=');
    if(eq == std::string_view::npos or eq == 0)
        return std::nullopt;
    return std::make_pair(std::string{ text.substr(0, eq) }, std::string{ text.substr(eq + 1) });
}

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::istringstream in{ std::string{ text } };
    for(std::string word; in >> word;)
        words.push_back(word);
    return words;
}

std::string base64_encode(std::string_view data) {
    namespace base64 = boost::beast::detail::base64;

    std::string result(base64::encoded_size(data.size()), '\0');
    result.resize(base64::encode(result.data(), data.data(), data.size()));
    return result;
}

} // namespace util
