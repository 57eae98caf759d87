/**
 * @file Pipeline.cpp
 * @brief Implementation of configuration assembly
 */

#include "expconf/Pipeline.hpp"
#include "expconf/ConfigBuilder.hpp"
#include "expconf/Loader.hpp"
#include "expconf/Log.hpp"
#include "expconf/Parse.hpp"

namespace expconf {

std::vector<Fragment> collect_fragments(const PipelineOptions& options) {
    std::vector<Fragment> fragments = load_fragment_files(options.fragment_paths);
    if (!options.overrides.empty()) {
        fragments.push_back(make_override_fragment(options.overrides, fragments.size()));
        log_message(LogLevel::debug,
                    std::to_string(options.overrides.size()) + " command-line override(s)");
    }
    return fragments;
}

ResolvedConfig run_pipeline(const PipelineOptions& options) {
    const std::vector<Fragment> fragments = collect_fragments(options);
    if (fragments.empty()) {
        log_message(LogLevel::warning, "No configuration fragments given");
    }

    ResolvedConfig config = resolve_fragments(fragments, options.safe_placeholders);
    config.enforce_mandatory(options.mandatory);
    return config;
}

} // namespace expconf
