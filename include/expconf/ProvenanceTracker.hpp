/**
 * @file ProvenanceTracker.hpp
 * @brief Which fragment last supplied each configuration key
 *
 * The tracker is a flat index keyed by dot-path ("DEFAULT.EXPID",
 * "JOBS.SIM.WALLCLOCK") holding the latest entry per key: tracking a
 * key again overwrites its entry (last writer wins). It is updated in
 * the same step as the configuration value it describes, never
 * recomputed.
 *
 * Example:
 * ```cpp
 * ProvenanceTracker tracker;
 * tracker.track("DEFAULT.EXPID", "/conf/expdef.yml", ResolutionKind::direct, 5);
 * if (const ProvEntry* e = tracker.get("DEFAULT.EXPID")) {
 *     std::cout << e->to_string();   // ProvEntry(/conf/expdef.yml:5)
 * }
 * Value nested = tracker.export_to_value();
 * // {"DEFAULT": {"EXPID": {"file": "/conf/expdef.yml", "kind": "direct",
 * //                        "line": 5, "timestamp": ...}}}
 * ```
 */

#ifndef EXPCONF_PROVENANCETRACKER_HPP
#define EXPCONF_PROVENANCETRACKER_HPP

#include "expconf/Value.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace expconf {

/**
 * @brief How a key obtained its final value
 */
enum class ResolutionKind {
    direct,     ///< Written as-is by its fragment
    immediate,  ///< Changed by the immediate (per-fragment) pass
    deferred    ///< Changed by the deferred (post-merge) pass
};

std::string to_string(ResolutionKind kind);
std::optional<ResolutionKind> parse_resolution_kind(const std::string& name);

/**
 * @brief Provenance of a single key
 */
struct ProvEntry {
    std::string file;
    ResolutionKind kind = ResolutionKind::direct;
    std::optional<int> line;
    std::optional<int> col;
    double timestamp = 0.0;   ///< Seconds since the epoch when tracked

    /**
     * @brief {"file", "kind", "timestamp", "line"?, "col"?}
     */
    Value to_value() const;

    /**
     * @brief Inverse of to_value()
     *
     * "kind" defaults to direct, "timestamp" to 0.
     *
     * @throws KeyError if "file" is missing
     */
    static ProvEntry from_value(const Value& value);

    /**
     * @brief "ProvEntry(<file>[:line[:col]])"
     */
    std::string to_string() const;
};

/**
 * @brief Flat, ordered map from key path to its latest ProvEntry
 */
class ProvenanceTracker {
public:
    using Map = std::map<std::string, ProvEntry>;
    using const_iterator = Map::const_iterator;

    /**
     * @brief Record (or overwrite) the source of a key
     *
     * The timestamp is set to the current time.
     */
    void track(const std::string& path, const std::string& file,
               ResolutionKind kind = ResolutionKind::direct,
               std::optional<int> line = std::nullopt,
               std::optional<int> col = std::nullopt);

    /**
     * @brief Record a complete entry as-is
     */
    void track(const std::string& path, ProvEntry entry);

    /**
     * @brief Change the resolution kind of an existing entry
     * @throws ProvenanceInconsistencyError if the key is not tracked
     */
    void set_kind(const std::string& path, ResolutionKind kind);

    /**
     * @return Entry for the key, or nullptr if not tracked
     */
    const ProvEntry* get(const std::string& path) const;

    bool contains(const std::string& path) const;

    /**
     * @brief Remove one entry
     * @return true if it existed
     */
    bool erase(const std::string& path);

    /**
     * @brief Remove every entry strictly below @p prefix
     * @return Number of entries removed
     */
    std::size_t erase_descendants(const std::string& prefix);

    void clear() noexcept { entries_.clear(); }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    /**
     * @brief Tracked key paths in sorted order
     */
    std::vector<std::string> paths() const;

    /**
     * @brief Export as a nested mapping mirroring the configuration
     *
     * Each leaf is ProvEntry::to_value(). An entry whose path runs
     * through another entry (a collision that valid configurations
     * never produce) is skipped.
     */
    Value export_to_value() const;

    /**
     * @brief Import a nested mapping produced by export_to_value()
     *
     * A mapping with string "file" and "kind" members is an entry;
     * other mappings are recursed into, so configuration keys named
     * like entry members round-trip; non-mapping values are ignored. Imports accumulate
     * and overwrite existing entries.
     */
    void import_from_value(const Value& nested, const std::string& prefix = "");

    /**
     * @brief "ProvenanceTracker(N parameters tracked)"
     */
    std::string to_string() const;

private:
    Map entries_;
};

} // namespace expconf

#endif // EXPCONF_PROVENANCETRACKER_HPP
