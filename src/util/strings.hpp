#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util {

std::string trim(std::string_view text);

// "https://host/base/" + "/token" -> "https://host/base/token"
std::string join_url(std::string_view base, std::string_view path);

// "name=value" -> { "name", "value" }; nullopt when there is no '=' or the name is empty
std::optional<std::pair<std::string, std::string>> split_assignment(std::string_view text);

std::vector<std::string> split_words(std::string_view text);

std::string base64_encode(std::string_view data);

} // namespace util
