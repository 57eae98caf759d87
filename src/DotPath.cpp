/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "expconf/DotPath.hpp"
#include <sstream>

namespace expconf {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

std::string normalize_dot_path(const std::string& path) {
    return join_dot_path(split_dot_path(path));
}

const Value* get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;

    for (const auto& seg : split_dot_path(path)) {
        if (!current->is_object()) {
            throw TypeError(path, "object", type_name(*current));
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            throw KeyError(path, seg);
        }
        current = &(*it);
    }

    return current;
}

const Value* find_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;

    for (const auto& seg : split_dot_path(path)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }

    return current;
}

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!current->is_object()) {
            *current = Value::object();
        }
        current = &(*current)[segments[i]];
    }

    if (!current->is_object()) {
        *current = Value::object();
    }
    (*current)[segments.back()] = value;
}

namespace {
    void flatten_into(const Value& node, const std::string& prefix,
                      std::map<std::string, Value>& out) {
        if (is_leaf(node)) {
            if (!prefix.empty()) {
                out[prefix] = node;
            }
            return;
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            const std::string path = prefix.empty() ? it.key() : prefix + "." + it.key();
            flatten_into(it.value(), path, out);
        }
    }
}

std::map<std::string, Value> flatten_leaves(const Value& data) {
    std::map<std::string, Value> out;
    flatten_into(data, "", out);
    return out;
}

std::vector<std::string> ancestor_paths(const std::string& path) {
    std::vector<std::string> result;
    std::string current;
    const auto segments = split_dot_path(path);

    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!current.empty()) current += '.';
        current += segments[i];
        result.push_back(current);
    }

    return result;
}

bool is_descendant_path(const std::string& path, const std::string& ancestor) {
    if (ancestor.empty()) {
        return !path.empty();
    }
    return path.size() > ancestor.size() + 1 &&
           path.compare(0, ancestor.size(), ancestor) == 0 &&
           path[ancestor.size()] == '.';
}

} // namespace expconf
