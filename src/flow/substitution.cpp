#include <flow/exceptions.hpp>
#include <flow/substitution.hpp>
#include <util/overloaded.hpp>
#include <util/strings.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <strings.h>

namespace {

using Bindings = std::vector<std::pair<std::string, std::string>>;

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) or c == '_';
}

bool is_identifier(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) or c == '_';
}

bool is_placeholder_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) or c == '_' or c == '-' or c == '.' or c == ':';
}

// {name} tokens that one of the step's rules binds are left for rule substitution
std::string resolve_endpoints(std::string_view text, StepGraph::Step const &step, EndpointMap const &discovered, EndpointMap const &defaults) {
    auto const &step_id = step.id();
    std::string out;
    out.reserve(text.size());

    for(std::size_t i = 0; i < text.size();) {
        if(text[i] == '{' and i + 1 < text.size() and is_identifier_start(text[i + 1])) {
            auto j = i + 1;
            while(j < text.size() and is_identifier(text[j]))
                ++j;

            if(j < text.size() and text[j] == '}') {
                auto const name  = std::string{ text.substr(i + 1, j - i - 1) };
                auto const token = text.substr(i, j - i + 1);

                if(std::any_of(std::begin(step.rules), std::end(step.rules), [token](StepGraph::Rule const &rule) { return rule.token == token; })) {
                    out += token;
                } else if(auto const it = discovered.find(name); it != std::end(discovered) and not it->second.empty()) {
                    out += it->second;
                } else if(auto const def = defaults.find(name); def != std::end(defaults) and not def->second.empty()) {
                    out += def->second;
                } else {
                    throw SubstitutionError{ SubstitutionError::Kind::UNRESOLVED_ENDPOINT, step_id, "{" + name + "}",
                        fmt::format("step '{}': endpoint '{}' was neither discovered nor configured as a default", step_id, name) };
                }

                i = j + 1;
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

std::string resolve_value(StepGraph::Rule const &rule, std::string const &step_id, SessionState const &state, InputMap const &inputs) {
    // clang-format off
    return std::visit(overloaded {
        [&](ref::StepField const &field) -> std::string {
            if(not state.is_completed(field.step))
                throw SubstitutionError{ SubstitutionError::Kind::MISSING_UPSTREAM_VALUE, step_id, rule.token,
                    fmt::format("step '{}': '{}' needs {} but step '{}' is {}",
                        step_id, rule.token, ref::to_string(rule.reference), field.step, to_string(state.status(field.step))) };

            auto const *value = state.field(field.step, field.field);
            if(value == nullptr)
                throw SubstitutionError{ SubstitutionError::Kind::MISSING_UPSTREAM_VALUE, step_id, rule.token,
                    fmt::format("step '{}': '{}' needs {} but step '{}' produced no field '{}'",
                        step_id, rule.token, ref::to_string(rule.reference), field.step, field.field) };

            return to_substitution_text(*value);
        },
        [&](ref::Input const &input) -> std::string {
            auto const it = inputs.find(input.name);
            if(it == std::end(inputs))
                throw SubstitutionError{ SubstitutionError::Kind::MISSING_INPUT, step_id, rule.token,
                    fmt::format("step '{}': '{}' needs input '{}' which has no value", step_id, rule.token, input.name) };
            return it->second;
        }},
    rule.reference);
    // clang-format on
}

bool has_header(std::vector<Header> const &headers, std::string_view name) {
    return std::any_of(std::begin(headers), std::end(headers), [name](Header const &header) {
        return header.first.size() == name.size() and ::strncasecmp(header.first.data(), name.data(), name.size()) == 0;
    });
}

} // namespace

std::vector<std::string> find_placeholders(std::string_view text) {
    std::vector<std::string> found;

    for(std::size_t i = 0; i < text.size(); ++i) {
        if(text[i] != '<' or i + 1 >= text.size() or not std::isalnum(static_cast<unsigned char>(text[i + 1])))
            continue;

        auto j = i + 1;
        while(j < text.size() and is_placeholder_char(text[j]))
            ++j;

        if(j < text.size() and text[j] == '>') {
            found.emplace_back(text.substr(i, j - i + 1));
            i = j;
        }
    }
    return found;
}

std::string substitute_tokens(std::string_view text, Bindings const &bindings) {
    std::string out;
    out.reserve(text.size());

    for(std::size_t i = 0; i < text.size();) {
        Bindings::value_type const *best = nullptr;
        for(auto const &binding : bindings) {
            auto const &token = binding.first;
            if(token.empty() or text.compare(i, token.size(), token) != 0)
                continue;
            if(best == nullptr or token.size() > best->first.size())
                best = &binding;
        }

        if(best != nullptr) {
            out += best->second;
            i += best->first.size();
        } else {
            out += text[i++];
        }
    }
    return out;
}

RenderedRequest render(StepGraph::Step const &step, SessionState const &state, EndpointMap const &discovered, EndpointMap const &defaults, InputMap const &inputs) {
    if(not step.command)
        throw InvariantError{ fmt::format("step '{}' has no request template to render", step.id()) };

    auto const &command = *step.command;
    auto const endpoints = [&](std::string const &piece) {
        return resolve_endpoints(piece, step, discovered, defaults);
    };

    auto url     = endpoints(command.url);
    auto method  = endpoints(command.method);
    auto headers = std::vector<std::string>{};
    auto data    = std::vector<std::string>{};
    std::transform(std::begin(command.headers), std::end(command.headers), std::back_inserter(headers), endpoints);
    std::transform(std::begin(command.data), std::end(command.data), std::back_inserter(data), endpoints);
    auto user = command.user ? std::optional<std::string>{ endpoints(*command.user) } : std::nullopt;

    Bindings bindings;
    for(auto const &rule : step.rules)
        bindings.emplace_back(rule.token, resolve_value(rule, step.id(), state, inputs));

    auto const check_bound = [&](std::string const &piece) {
        for(auto const &token : find_placeholders(piece)) {
            auto const bound = std::any_of(std::begin(step.rules), std::end(step.rules),
                [&token](StepGraph::Rule const &rule) { return rule.token == token; });
            if(not bound)
                throw SubstitutionError{ SubstitutionError::Kind::UNBOUND_PLACEHOLDER, step.id(), token,
                    fmt::format("step '{}': placeholder '{}' has no substitution rule", step.id(), token) };
        }
    };

    check_bound(method);
    check_bound(url);
    std::for_each(std::begin(headers), std::end(headers), check_bound);
    std::for_each(std::begin(data), std::end(data), check_bound);
    if(user)
        check_bound(*user);

    RenderedRequest request;
    request.url    = substitute_tokens(url, bindings);
    request.method = substitute_tokens(method, bindings);
    if(request.method.empty())
        request.method = data.empty() ? "GET" : "POST";

    for(auto const &header : headers) {
        auto const rendered = substitute_tokens(header, bindings);
        auto const colon    = rendered.find(':');
        request.headers.emplace_back(util::trim(rendered.substr(0, colon)), util::trim(rendered.substr(colon + 1)));
    }

    std::vector<std::string> parts;
    std::transform(std::begin(data), std::end(data), std::back_inserter(parts),
        [&bindings](std::string const &piece) { return substitute_tokens(piece, bindings); });
    request.body = fmt::format("{}", fmt::join(parts, "&"));

    if(user)
        request.headers.emplace_back("Authorization", "Basic " + util::base64_encode(substitute_tokens(*user, bindings)));

    if(not request.body.empty() and not has_header(request.headers, "Content-Type"))
        request.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");

    return request;
}
