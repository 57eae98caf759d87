/**
 * @file ProvenanceTracker.cpp
 * @brief Implementation of provenance tracking
 */

#include "expconf/ProvenanceTracker.hpp"
#include "expconf/DotPath.hpp"
#include "expconf/Errors.hpp"

#include <chrono>
#include <sstream>

namespace expconf {

namespace {
    double now_seconds() {
        using namespace std::chrono;
        return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
    }

    // An exported entry has string "file" and "kind" members; an
    // intermediate node holds only mappings, even for a key named "file"
    bool is_entry_value(const Value& value) {
        if (!value.is_object()) {
            return false;
        }
        const auto file = value.find("file");
        const auto kind = value.find("kind");
        return file != value.end() && file->is_string() &&
               kind != value.end() && kind->is_string();
    }
}

std::string to_string(ResolutionKind kind) {
    switch (kind) {
        case ResolutionKind::direct: return "direct";
        case ResolutionKind::immediate: return "immediate";
        case ResolutionKind::deferred: return "deferred";
    }
    return "direct";
}

std::optional<ResolutionKind> parse_resolution_kind(const std::string& name) {
    if (name == "direct") return ResolutionKind::direct;
    if (name == "immediate") return ResolutionKind::immediate;
    if (name == "deferred") return ResolutionKind::deferred;
    return std::nullopt;
}

// ============================================================================
// ProvEntry
// ============================================================================

Value ProvEntry::to_value() const {
    Value out = {
        {"file", file},
        {"kind", expconf::to_string(kind)},
        {"timestamp", timestamp}
    };
    if (line) out["line"] = *line;
    if (col) out["col"] = *col;
    return out;
}

ProvEntry ProvEntry::from_value(const Value& value) {
    if (!value.is_object() || !value.contains("file")) {
        throw KeyError("provenance entry", "file");
    }

    ProvEntry entry;
    entry.file = to_placeholder_text(value.at("file"));

    if (value.contains("kind") && value["kind"].is_string()) {
        entry.kind = parse_resolution_kind(value["kind"].get<std::string>())
                         .value_or(ResolutionKind::direct);
    }
    if (value.contains("line") && value["line"].is_number_integer()) {
        entry.line = value["line"].get<int>();
    }
    if (value.contains("col") && value["col"].is_number_integer()) {
        entry.col = value["col"].get<int>();
    }
    if (value.contains("timestamp") && value["timestamp"].is_number()) {
        entry.timestamp = value["timestamp"].get<double>();
    }
    return entry;
}

std::string ProvEntry::to_string() const {
    std::ostringstream oss;
    oss << "ProvEntry(" << file;
    if (line) {
        oss << ":" << *line;
        if (col) oss << ":" << *col;
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// ProvenanceTracker
// ============================================================================

void ProvenanceTracker::track(const std::string& path, const std::string& file,
                              ResolutionKind kind, std::optional<int> line,
                              std::optional<int> col) {
    ProvEntry entry;
    entry.file = file;
    entry.kind = kind;
    entry.line = line;
    entry.col = col;
    entry.timestamp = now_seconds();
    entries_[path] = std::move(entry);
}

void ProvenanceTracker::track(const std::string& path, ProvEntry entry) {
    entries_[path] = std::move(entry);
}

void ProvenanceTracker::set_kind(const std::string& path, ResolutionKind kind) {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        throw ProvenanceInconsistencyError(path, "value resolved for an untracked key");
    }
    it->second.kind = kind;
}

const ProvEntry* ProvenanceTracker::get(const std::string& path) const {
    auto it = entries_.find(path);
    return it == entries_.end() ? nullptr : &it->second;
}

bool ProvenanceTracker::contains(const std::string& path) const {
    return entries_.count(path) > 0;
}

bool ProvenanceTracker::erase(const std::string& path) {
    return entries_.erase(path) > 0;
}

std::size_t ProvenanceTracker::erase_descendants(const std::string& prefix) {
    // Descendants of "a.b" sort contiguously after "a.b."
    const std::string lower = prefix + ".";
    std::size_t removed = 0;
    auto it = entries_.lower_bound(lower);
    while (it != entries_.end() && is_descendant_path(it->first, prefix)) {
        it = entries_.erase(it);
        ++removed;
    }
    return removed;
}

std::vector<std::string> ProvenanceTracker::paths() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [path, entry] : entries_) {
        out.push_back(path);
    }
    return out;
}

Value ProvenanceTracker::export_to_value() const {
    Value result = Value::object();

    for (const auto& [path, entry] : entries_) {
        const auto segments = split_dot_path(path);
        if (segments.empty()) {
            continue;
        }

        Value* current = &result;
        bool collision = false;
        for (size_t i = 0; i + 1 < segments.size(); ++i) {
            Value& next = (*current)[segments[i]];
            if (next.is_null()) {
                next = Value::object();
            } else if (!next.is_object() || is_entry_value(next)) {
                collision = true;
                break;
            }
            current = &next;
        }
        if (collision) {
            continue;
        }

        Value& leaf = (*current)[segments.back()];
        if (leaf.is_object() && !leaf.empty() && !is_entry_value(leaf)) {
            // Already an intermediate node for deeper entries
            continue;
        }
        leaf = entry.to_value();
    }

    return result;
}

void ProvenanceTracker::import_from_value(const Value& nested, const std::string& prefix) {
    if (!nested.is_object()) {
        return;
    }

    for (auto it = nested.begin(); it != nested.end(); ++it) {
        const std::string path = prefix.empty() ? it.key() : prefix + "." + it.key();
        const Value& value = it.value();
        if (!value.is_object()) {
            continue;
        }
        if (is_entry_value(value)) {
            entries_[path] = ProvEntry::from_value(value);
        } else {
            import_from_value(value, path);
        }
    }
}

std::string ProvenanceTracker::to_string() const {
    std::ostringstream oss;
    oss << "ProvenanceTracker(" << entries_.size()
        << (entries_.size() == 1 ? " parameter" : " parameters") << " tracked)";
    return oss.str();
}

} // namespace expconf
