/**
 * @file ConfigBuilder.hpp
 * @brief Merge engine: folds fragments in load order
 *
 * The builder owns the in-progress configuration and its provenance.
 * Each apply() writes one fragment (last writer wins) and immediately
 * resolves that fragment's `%KEY%` placeholders against the state
 * merged so far. finish() resolves `%^KEY%` placeholders against the
 * complete merge and freezes the result.
 *
 * Example:
 * ```cpp
 * ConfigBuilder builder;
 * for (const auto& fragment : fragments) builder.apply(fragment);
 * ResolvedConfig config = std::move(builder).finish();
 * ```
 *
 * Each builder is independent; separate pipelines may run on separate
 * builders concurrently.
 */

#ifndef EXPCONF_CONFIGBUILDER_HPP
#define EXPCONF_CONFIGBUILDER_HPP

#include "expconf/Fragment.hpp"
#include "expconf/Placeholder.hpp"
#include "expconf/ProvenanceTracker.hpp"
#include "expconf/ResolvedConfig.hpp"
#include "expconf/Value.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace expconf {

class ConfigBuilder {
public:
    /**
     * @param safe_placeholders Names never substituted, fixed for the
     *        whole build
     */
    explicit ConfigBuilder(SafePlaceholderSet safe_placeholders = {});

    /**
     * @brief Merge one fragment and run its immediate pass
     *
     * The fragment's position must equal the number of fragments
     * already applied.
     *
     * @throws ConfigError if applied out of order or after finish()
     * @throws UnresolvedPlaceholderError if a `%KEY%` names an absent key
     */
    void apply(const Fragment& fragment);

    /**
     * @brief Run the deferred pass and freeze the configuration
     *
     * @throws UnresolvedPlaceholderError if a `%^KEY%` names an absent key
     * @throws ProvenanceInconsistencyError on an internal defect
     */
    ResolvedConfig finish() &&;

    const Value& data() const noexcept { return data_; }
    const ProvenanceTracker& provenance() const noexcept { return provenance_; }
    const SafePlaceholderSet& safe_placeholders() const noexcept { return safe_; }
    std::size_t fragments_applied() const noexcept { return applied_; }

private:
    /// Write one leaf and its provenance in the same step
    void write_leaf(const FragmentLeaf& leaf, const std::string& fragment_id);

    void resolve_immediate(const Fragment& fragment, const std::vector<std::string>& paths);
    void resolve_deferred();

    Value data_ = Value::object();
    ProvenanceTracker provenance_;
    SafePlaceholderSet safe_;
    std::size_t applied_ = 0;
    bool finished_ = false;
};

/**
 * @brief Every SAFE_PLACEHOLDERS name found in any of the fragments
 */
SafePlaceholderSet collect_safe_placeholders(const std::vector<Fragment>& fragments);

/**
 * @brief Merge and resolve an ordered fragment list in one call
 *
 * The safe set is @p extra_safe joined with collect_safe_placeholders().
 * Nothing is returned if any fragment fails.
 */
ResolvedConfig resolve_fragments(const std::vector<Fragment>& fragments,
                                 const SafePlaceholderSet& extra_safe = {});

} // namespace expconf

#endif // EXPCONF_CONFIGBUILDER_HPP
