/**
 * @file Pipeline.hpp
 * @brief One-call assembly of a resolved configuration from files
 *
 * Order of operations:
 * 1. load fragment files, position i is fragment_paths[i]
 * 2. append the overrides fragment (if any overrides were given)
 * 3. collect the safe set (options + every SAFE_PLACEHOLDERS entry)
 * 4. merge, immediate pass per fragment, deferred pass
 * 5. enforce mandatory keys
 */

#ifndef EXPCONF_PIPELINE_HPP
#define EXPCONF_PIPELINE_HPP

#include "expconf/Fragment.hpp"
#include "expconf/Placeholder.hpp"
#include "expconf/ResolvedConfig.hpp"
#include <string>
#include <vector>

namespace expconf {

/**
 * @brief Options for building a configuration from several sources.
 */
struct PipelineOptions {
    std::vector<std::string> fragment_paths;
    SafePlaceholderSet safe_placeholders;
    std::vector<std::string> overrides;     ///< "KEY=VALUE", final precedence
    std::vector<std::string> mandatory;
};

/**
 * @brief Fragments in load order, overrides fragment last
 */
std::vector<Fragment> collect_fragments(const PipelineOptions& options);

/**
 * @brief Run the whole assembly
 *
 * @throws FileNotFoundError, FragmentFormatError, UnresolvedPlaceholderError,
 *         MissingMandatoryConfig
 */
ResolvedConfig run_pipeline(const PipelineOptions& options);

} // namespace expconf

#endif // EXPCONF_PIPELINE_HPP
