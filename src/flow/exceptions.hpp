#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

// fatal, raised while loading the flow document. no partial graph is ever served.
struct ConfigError : public std::runtime_error {
    enum class Kind {
        INVALID_DOCUMENT,
        DUPLICATE_STEP,
        UNKNOWN_STEP_REFERENCE,
        CYCLIC_DEPENDENCY,
        MALFORMED_TEMPLATE,
        MALFORMED_REFERENCE,
        UNKNOWN_INPUT_REFERENCE,
    };

    ConfigError(Kind kind, std::string const &message)
        : std::runtime_error{ message }
        , kind{ kind } { }

    Kind kind;
};

// a step's request could not be rendered. the step fails, the session goes on.
struct SubstitutionError : public std::runtime_error {
    enum class Kind {
        UNRESOLVED_ENDPOINT,
        MISSING_UPSTREAM_VALUE,
        UNBOUND_PLACEHOLDER,
        MISSING_INPUT,
    };

    SubstitutionError(Kind kind, std::string const &step, std::string const &token, std::string const &message)
        : std::runtime_error{ message }
        , kind{ kind }
        , step{ step }
        , token{ token } { }

    Kind kind;
    std::string step;
    std::string token;
};

// session state corruption; a driving logic bug, fatal to the session
struct InvariantError : public std::logic_error {
    using std::logic_error::logic_error;
};

// an external signal (manual completion, restart) was rejected; session state is untouched
struct SessionError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::string_view to_string(ConfigError::Kind kind);
std::string_view to_string(SubstitutionError::Kind kind);
