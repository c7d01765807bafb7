#pragma once

#include <flow/endpoints.hpp>
#include <flow/session_state.hpp>

#include <inja/inja.hpp>

#include <string>

/**
 * @brief The data instructions are rendered against
 *
 * One object per completed step holding its fields, keyed by step id, plus
 * "inputs" with every supplied input that is not marked secret.
 */
inja::json make_instruction_store(SessionState const &state, InputMap const &inputs);

// throws inja::InjaError when the text does not render against the store
std::string render_instructions(std::string const &text, SessionState const &state, InputMap const &inputs);
