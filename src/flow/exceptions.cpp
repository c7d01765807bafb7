#include <flow/exceptions.hpp>

std::string_view to_string(ConfigError::Kind kind) {
    switch(kind) {
    case ConfigError::Kind::INVALID_DOCUMENT:
        return "invalid document";
    case ConfigError::Kind::DUPLICATE_STEP:
        return "duplicate step";
    case ConfigError::Kind::UNKNOWN_STEP_REFERENCE:
        return "unknown step reference";
    case ConfigError::Kind::CYCLIC_DEPENDENCY:
        return "cyclic dependency";
    case ConfigError::Kind::MALFORMED_TEMPLATE:
        return "malformed template";
    case ConfigError::Kind::MALFORMED_REFERENCE:
        return "malformed reference";
    case ConfigError::Kind::UNKNOWN_INPUT_REFERENCE:
        return "unknown input reference";
    }
    return "unknown";
}

std::string_view to_string(SubstitutionError::Kind kind) {
    switch(kind) {
    case SubstitutionError::Kind::UNRESOLVED_ENDPOINT:
        return "unresolved endpoint";
    case SubstitutionError::Kind::MISSING_UPSTREAM_VALUE:
        return "missing upstream value";
    case SubstitutionError::Kind::UNBOUND_PLACEHOLDER:
        return "unbound placeholder";
    case SubstitutionError::Kind::MISSING_INPUT:
        return "missing input";
    }
    return "unknown";
}
