#include <flow/instructions.hpp>

inja::json make_instruction_store(SessionState const &state, InputMap const &inputs) {
    auto store = inja::json::object();

    for(auto const &[id, result] : state.results()) {
        if(result.status == StepStatus::COMPLETED)
            store[id] = inja::json(result.fields);
    }

    auto visible = inja::json::object();
    for(auto const &input : state.graph().inputs()) {
        auto const it = inputs.find(input.name);
        if(it != std::end(inputs) and not input.secret)
            visible[input.name] = it->second;
    }
    store["inputs"] = visible;

    return store;
}

std::string render_instructions(std::string const &text, SessionState const &state, InputMap const &inputs) {
    inja::Environment env;
    return env.render(text, make_instruction_store(state, inputs));
}
