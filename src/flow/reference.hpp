#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace ref {

// step.<id>.<field>; the field may be a dotted path into the step's fields
struct StepField {
    std::string step;
    std::string field;
};

// input.<name>; a session input supplied by the user
struct Input {
    std::string name;
};

using Reference = std::variant<StepField, Input>;

/**
 * @brief Parses the textual form of a substitution reference
 *
 * @param text
 * @return Reference
 * @throws std::invalid_argument when the text is neither form
 */
Reference parse(std::string_view text);

std::string to_string(Reference const &reference);

} // namespace ref
