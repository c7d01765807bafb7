#include <flow/manual_completion.hpp>
#include <util/strings.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <stdexcept>

ManualCompletion parse_completion(std::string_view text) {
    auto const colon = text.find(':');
    auto const step  = util::trim(text.substr(0, colon));
    if(step.empty())
        throw std::invalid_argument{ fmt::format("completion '{}' names no step", text) };

    std::vector<std::string> assignments;
    if(colon != std::string_view::npos) {
        auto rest = text.substr(colon + 1);
        while(not rest.empty()) {
            auto const comma = rest.find(',');
            if(auto piece = util::trim(rest.substr(0, comma)); not piece.empty())
                assignments.push_back(std::move(piece));
            rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
        }
    }

    return ManualCompletion{ step, parse_fields(assignments) };
}

FieldMap parse_fields(std::vector<std::string> const &assignments) {
    FieldMap fields;
    for(auto const &assignment : assignments) {
        auto const pair = util::split_assignment(assignment);
        if(not pair)
            throw std::invalid_argument{ fmt::format("'{}' is not of the form name=value", assignment) };
        fields[pair->first] = pair->second;
    }
    return fields;
}
