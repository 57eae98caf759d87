/**
 * @file Placeholder.cpp
 * @brief Implementation of placeholder scanning and substitution
 */

#include "expconf/Placeholder.hpp"
#include "expconf/DotPath.hpp"

namespace expconf {

namespace {
    bool is_name_char(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
    }

    bool in_scope(PlaceholderForm form, SubstitutionScope scope) {
        switch (scope) {
            case SubstitutionScope::immediate_only: return form == PlaceholderForm::immediate;
            case SubstitutionScope::deferred_only: return form == PlaceholderForm::deferred;
            case SubstitutionScope::both: return true;
        }
        return false;
    }
}

std::vector<PlaceholderToken> find_placeholders(const std::string& text) {
    std::vector<PlaceholderToken> tokens;
    std::size_t i = 0;

    while (i < text.size()) {
        if (text[i] != '%') {
            ++i;
            continue;
        }
        if (i + 1 < text.size() && text[i + 1] == '%') {
            i += 2; // "%%" is literal
            continue;
        }

        std::size_t start = i + 1;
        PlaceholderForm form = PlaceholderForm::immediate;
        if (start < text.size() && text[start] == '^') {
            form = PlaceholderForm::deferred;
            ++start;
        }

        std::size_t end = start;
        while (end < text.size() && is_name_char(text[end])) {
            ++end;
        }

        if (end > start && end < text.size() && text[end] == '%') {
            PlaceholderToken token;
            token.offset = i;
            token.length = end + 1 - i;
            token.name = text.substr(start, end - start);
            token.form = form;
            tokens.push_back(std::move(token));
            i = end + 1;
        } else {
            ++i;
        }
    }

    return tokens;
}

std::string substitute_placeholders(const std::string& text,
                                    const Value& snapshot,
                                    const SafePlaceholderSet& safe,
                                    SubstitutionScope scope,
                                    const ResolutionContext& context,
                                    std::size_t* substituted) {
    const auto tokens = find_placeholders(text);
    if (tokens.empty()) {
        return text;
    }

    std::string out;
    out.reserve(text.size());
    std::size_t cursor = 0;

    for (const auto& token : tokens) {
        out.append(text, cursor, token.offset - cursor);
        cursor = token.offset + token.length;

        if (!in_scope(token.form, scope) || safe.count(token.name) > 0) {
            out.append(text, token.offset, token.length);
            continue;
        }

        const Value* target = find_by_dot(snapshot, token.name);
        if (target == nullptr) {
            throw UnresolvedPlaceholderError(token.name, context.name, context.kind);
        }

        out += to_placeholder_text(*target);
        if (substituted != nullptr) {
            ++*substituted;
        }
    }

    out.append(text, cursor, std::string::npos);
    return out;
}

std::size_t substitute_in_value(Value& value,
                                const Value& snapshot,
                                const SafePlaceholderSet& safe,
                                SubstitutionScope scope,
                                const ResolutionContext& context) {
    std::size_t count = 0;

    if (value.is_string()) {
        value = substitute_placeholders(value.get_ref<const std::string&>(),
                                        snapshot, safe, scope, context, &count);
    } else if (value.is_array() || value.is_object()) {
        for (auto& element : value) {
            count += substitute_in_value(element, snapshot, safe, scope, context);
        }
    }

    return count;
}

} // namespace expconf
