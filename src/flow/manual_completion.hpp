#pragma once

#include <flow/session_state.hpp>

#include <string>
#include <string_view>
#include <vector>

// an external completion signal for a manual step
struct ManualCompletion {
    std::string step;
    FieldMap fields;
};

/**
 * @brief Parses "step" or "step:name=value,name=value"
 *
 * @throws std::invalid_argument
 */
ManualCompletion parse_completion(std::string_view text);

// name=value words; every value is kept as a string. throws std::invalid_argument
FieldMap parse_fields(std::vector<std::string> const &assignments);
