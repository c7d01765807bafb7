#pragma once

#include <web/http.hpp>

#include <concepts>
#include <type_traits>

// clang-format off
template <typename T>
concept HttpFetcher = requires(T const a, HttpRequest const &r) {
    { a.fetch(r) } -> std::convertible_to<HttpResponse>;
};
// clang-format on
