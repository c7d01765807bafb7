#include <extraction/extractor.hpp>

FieldExtractor::Outcome FieldExtractor::extract(inja::json const &body, std::optional<std::vector<std::string>> const &keys) const {
    Outcome outcome;

    if(not keys) {
        if(not body.is_object())
            return outcome;

        for(auto const &item : body.items()) {
            if(item.value().is_primitive() and not item.value().is_null())
                outcome.fields.emplace(item.key(), item.value());
        }
        return outcome;
    }

    for(auto const &key : *keys) {
        if(auto const *value = lookup(body, key); value != nullptr)
            outcome.fields.emplace(key, *value);
        else
            outcome.missing.push_back(key);
    }
    return outcome;
}

inja::json const *FieldExtractor::lookup(inja::json const &body, std::string const &path) const {
    if(not body.is_object())
        return nullptr;

    if(auto const it = body.find(path); it != body.end())
        return it->is_null() ? nullptr : &*it;

    auto const *current = &body;
    std::string::size_type start = 0;

    while(true) {
        auto const dot = path.find('.', start);
        auto const key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        if(not current->is_object())
            return nullptr;
        auto const it = current->find(key);
        if(it == current->end())
            return nullptr;

        current = &*it;
        if(dot == std::string::npos)
            break;
        start = dot + 1;
    }

    return current->is_null() ? nullptr : current;
}
