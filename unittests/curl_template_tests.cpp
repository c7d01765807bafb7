#include <gtest/gtest.h>

#include <flow/curl_template.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using tokens_t = std::vector<std::string>;

TEST(CurlTemplate, TokenizesShellQuoting) {
    EXPECT_EQ(tokenize_command(R"(curl 'a b' "c \"d\" \$e" f\ g)"), (tokens_t{ "curl", "a b", R"(c "d" $e)", "f g" }));
    EXPECT_EQ(tokenize_command("curl -d ''"), (tokens_t{ "curl", "-d", "" }));
    EXPECT_EQ(tokenize_command("curl x'y'\"z\""), (tokens_t{ "curl", "xyz" }));
}

TEST(CurlTemplate, JoinsContinuationLines) {
    EXPECT_EQ(tokenize_command("curl \\\n  -X POST \\\r\n  url"), (tokens_t{ "curl", "-X", "POST", "url" }));
}

TEST(CurlTemplate, RejectsUnterminatedQuotes) {
    EXPECT_THROW(tokenize_command("curl 'abc"), std::invalid_argument);
    EXPECT_THROW(tokenize_command("curl \"abc"), std::invalid_argument);
}

TEST(CurlTemplate, ParsesRequestParts) {
    auto const command = parse_curl(R"(curl -s -X post {token_endpoint} \
        -H "Accept: application/json" \
        --header 'X-API-KEY: <api-key>' \
        -d grant_type=refresh_token \
        --data-raw "refresh_token=<refresh-token>" \
        -u '<id>:<secret>')");

    EXPECT_EQ(command.method, "POST");
    EXPECT_EQ(command.url, "{token_endpoint}");
    EXPECT_EQ(command.headers, (tokens_t{ "Accept: application/json", "X-API-KEY: <api-key>" }));
    EXPECT_EQ(command.data, (tokens_t{ "grant_type=refresh_token", "refresh_token=<refresh-token>" }));
    ASSERT_TRUE(command.user);
    EXPECT_EQ(*command.user, "<id>:<secret>");
}

TEST(CurlTemplate, MethodIsLeftEmptyWhenNotGiven) {
    auto const command = parse_curl("curl -k https://as/userinfo -H 'Authorization: Bearer <t>'");
    EXPECT_TRUE(command.method.empty());
    EXPECT_EQ(command.url, "https://as/userinfo");
    EXPECT_FALSE(command.user);
}

TEST(CurlTemplate, RejectsWhatItCannotSend) {
    EXPECT_THROW(parse_curl("wget https://as"), std::invalid_argument);
    EXPECT_THROW(parse_curl(""), std::invalid_argument);
    EXPECT_THROW(parse_curl("curl"), std::invalid_argument);
    EXPECT_THROW(parse_curl("curl https://a https://b"), std::invalid_argument);
    EXPECT_THROW(parse_curl("curl --compressed https://a"), std::invalid_argument);
    EXPECT_THROW(parse_curl("curl https://a -H NoColon"), std::invalid_argument);
    EXPECT_THROW(parse_curl("curl https://a -d"), std::invalid_argument);
}
