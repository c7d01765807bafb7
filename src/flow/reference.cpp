#include <flow/reference.hpp>
#include <util/overloaded.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <stdexcept>

namespace ref {

Reference parse(std::string_view text) {
    auto const fail = [text](std::string_view why) {
        return std::invalid_argument{ fmt::format("reference '{}' {}", text, why) };
    };

    if(text.starts_with("input.")) {
        auto const name = text.substr(6);
        if(name.empty())
            throw fail("names no input");
        return Input{ std::string{ name } };
    }

    if(not text.starts_with("step."))
        throw fail("must have the form step.<id>.<field> or input.<name>");

    auto const rest = text.substr(5);
    auto const dot  = rest.find('.');
    if(dot == std::string_view::npos or dot == 0 or dot + 1 == rest.size())
        throw fail("must have the form step.<id>.<field>");

    return StepField{ std::string{ rest.substr(0, dot) }, std::string{ rest.substr(dot + 1) } };
}

std::string to_string(Reference const &reference) {
    // clang-format off
    return std::visit(overloaded {
        [](StepField const &field) { return fmt::format("step.{}.{}", field.step, field.field); },
        [](Input const &input) { return fmt::format("input.{}", input.name); }},
    reference);
    // clang-format on
}

} // namespace ref
