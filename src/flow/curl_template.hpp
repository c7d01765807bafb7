#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief A request template written as a curl command line
 *
 * Only the options meaningful for a single request are understood:
 * -X/--request, -H/--header, -d/--data (and --data-raw/--data-binary),
 * -u/--user. A handful of output flags (-s, -k, -i, -v, -L) are accepted
 * and ignored. Every piece keeps its placeholders; substitution happens
 * piecewise after tokenization so inserted values never change how the
 * command is split.
 */
struct CurlCommand {
    std::string method; // empty when not given: GET, or POST when data is present
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    std::vector<std::string> data;    // joined with '&' like curl does
    std::optional<std::string> user;  // "user:password" for basic auth
};

/**
 * @brief Splits a command line the way a POSIX shell would for quoting purposes
 *
 * Supports single quotes, double quotes with backslash escapes and
 * backslash-newline continuations. No expansion of any kind is performed.
 *
 * @throws std::invalid_argument on unterminated quotes
 */
std::vector<std::string> tokenize_command(std::string_view text);

/**
 * @throws std::invalid_argument when the text is not a usable curl command
 */
CurlCommand parse_curl(std::string_view text);
