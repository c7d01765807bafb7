#include <flow/curl_template.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace {

bool is_line_break(std::string_view text, std::size_t pos) {
    return text[pos] == '\n' or (text[pos] == '\r' and pos + 1 < text.size() and text[pos + 1] == '\n');
}

// length of the line break starting at pos
std::size_t line_break_size(std::string_view text, std::size_t pos) {
    return text[pos] == '\r' ? 2 : 1;
}

std::string uppercase(std::string value) {
    std::transform(std::begin(value), std::end(value), std::begin(value),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

std::vector<std::string> tokenize_command(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;

    auto const flush = [&] {
        if(in_token)
            tokens.push_back(std::move(current));
        current.clear();
        in_token = false;
    };

    for(std::size_t i = 0; i < text.size(); ++i) {
        auto const c = text[i];

        if(c == '\'') {
            auto const close = text.find('\'', i + 1);
            if(close == std::string_view::npos)
                throw std::invalid_argument{ "unterminated single quote" };
            current.append(text.substr(i + 1, close - i - 1));
            in_token = true;
            i        = close;
        } else if(c == '"') {
            auto j = i + 1;
            for(; j < text.size() and text[j] != '"'; ++j) {
                if(text[j] == '\\' and j + 1 < text.size()) {
                    if(is_line_break(text, j + 1)) {
                        j += line_break_size(text, j + 1);
                        continue;
                    }
                    if(std::string_view{ "\"\\$`" }.find(text[j + 1]) != std::string_view::npos) {
                        current += text[++j];
                        continue;
                    }
                }
                current += text[j];
            }
            if(j >= text.size())
                throw std::invalid_argument{ "unterminated double quote" };
            in_token = true;
            i        = j;
        } else if(c == '\\') {
            if(i + 1 >= text.size())
                continue;
            if(is_line_break(text, i + 1)) {
                i += line_break_size(text, i + 1);
                continue;
            }
            current += text[++i];
            in_token = true;
        } else if(std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            current += c;
            in_token = true;
        }
    }
    flush();

    return tokens;
}

CurlCommand parse_curl(std::string_view text) {
    static std::set<std::string_view> const ignored_flags = {
        "-s", "--silent", "-S", "--show-error", "-sS", "-k", "--insecure",
        "-i", "--include", "-v", "--verbose", "-L", "--location"
    };

    auto const tokens = tokenize_command(text);
    if(tokens.empty() or tokens.front() != "curl")
        throw std::invalid_argument{ "template must start with 'curl'" };

    CurlCommand command;
    for(std::size_t i = 1; i < tokens.size(); ++i) {
        auto const &token = tokens[i];

        auto const argument = [&]() -> std::string const & {
            if(i + 1 >= tokens.size())
                throw std::invalid_argument{ fmt::format("option '{}' needs an argument", token) };
            return tokens[++i];
        };

        if(token == "-X" or token == "--request") {
            command.method = uppercase(argument());
        } else if(token == "-H" or token == "--header") {
            auto const &header = argument();
            if(header.find(':') == std::string::npos)
                throw std::invalid_argument{ fmt::format("header '{}' has no ':'", header) };
            command.headers.push_back(header);
        } else if(token == "-d" or token == "--data" or token == "--data-raw" or token == "--data-binary") {
            command.data.push_back(argument());
        } else if(token == "-u" or token == "--user") {
            command.user = argument();
        } else if(ignored_flags.contains(token)) {
            continue;
        } else if(token.starts_with("-")) {
            throw std::invalid_argument{ fmt::format("unsupported curl option '{}'", token) };
        } else if(command.url.empty()) {
            command.url = token;
        } else {
            throw std::invalid_argument{ fmt::format("more than one url given ('{}' and '{}')", command.url, token) };
        }
    }

    if(command.url.empty())
        throw std::invalid_argument{ "template has no url" };

    return command;
}
