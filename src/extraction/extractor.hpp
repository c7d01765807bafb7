#pragma once

#include <flow/session_state.hpp>

#include <inja/inja.hpp>

#include <optional>
#include <string>
#include <vector>

class FieldExtractor {
public:
    struct Outcome {
        FieldMap fields;
        std::vector<std::string> missing; // requested keys the body did not carry
    };

    /**
     * @brief Pulls the requested keys out of a json response body
     *
     * Keys may be dotted paths into nested objects; a key that literally
     * exists at the top level wins over the path interpretation. Without a
     * key list every top-level scalar of an object body is taken. Null
     * values count as absent.
     *
     * @param body parsed response; anything but an object yields no fields
     * @param keys
     * @return Outcome
     */
    Outcome extract(inja::json const &body, std::optional<std::vector<std::string>> const &keys) const;

private:
    inja::json const *lookup(inja::json const &body, std::string const &path) const;
};
