/**
 * @file ScriptRenderer.hpp
 * @brief Renders job templates against a resolved configuration
 *
 * Output is always header + substituted body + tailer. The body goes
 * through one substitution pass in which `%KEY%` and `%^KEY%` both
 * resolve against the final configuration.
 *
 * Configuration keys read while rendering:
 * - EXTENDED_HEADER_PATH / EXTENDED_TAILER_PATH: extra text, relative to
 *   the project root. `JOBS.<section>.EXTENDED_*_PATH` takes precedence
 *   when the job context names a section.
 */

#ifndef EXPCONF_SCRIPTRENDERER_HPP
#define EXPCONF_SCRIPTRENDERER_HPP

#include "expconf/ExitStatus.hpp"
#include "expconf/ResolvedConfig.hpp"
#include <string>

namespace expconf {

inline constexpr const char* kExtendedHeaderKey = "EXTENDED_HEADER_PATH";
inline constexpr const char* kExtendedTailerKey = "EXTENDED_TAILER_PATH";

/**
 * @brief A job script template
 */
struct Template {
    std::string name;   ///< Usually the template file name
    std::string body;

    /**
     * @throws FileNotFoundError
     */
    static Template from_file(const std::string& path);
};

/**
 * @brief Final script text and the file name it should be stored under
 */
struct RenderedScript {
    std::string file_name;
    std::string text;
};

struct RenderOptions {
    /// Base for relative EXTENDED_*_PATH values
    std::string project_root = ".";
};

/**
 * @brief Replace any extension of @p name by ".cmd"
 *
 * Examples: "sim.sh" → "sim.cmd", "a000_SIM" → "a000_SIM.cmd",
 *           "dir/post.py" → "post.cmd"
 */
std::string cmd_file_name(const std::string& name);

class ScriptRenderer {
public:
    /**
     * The configuration must outlive the renderer; it is never modified.
     */
    explicit ScriptRenderer(const ResolvedConfig& config, RenderOptions options = {});

    /**
     * @brief Render one template for one job
     *
     * A job without a name takes the template file name's stem, so
     * the script and both status artifacts share one name.
     *
     * @throws ConfigError for a job name validate_job_name() rejects
     * @throws UnresolvedPlaceholderError (template context) for absent keys
     * @throws FileNotFoundError for a missing extended header/tailer
     */
    RenderedScript render(const Template& tmpl, const JobContext& job) const;

    /**
     * @brief Substitute both placeholder forms against the configuration
     */
    std::string substitute(const std::string& text, const std::string& context_name) const;

    const ResolvedConfig& config() const noexcept { return config_; }

private:
    std::string extended_text(const std::string& key, const JobContext& job,
                              const std::string& template_name) const;

    const ResolvedConfig& config_;
    RenderOptions options_;
};

/**
 * @brief Write a rendered script into @p directory with mode 0755
 * @return Path of the written file
 */
std::string write_script(const RenderedScript& script, const std::string& directory);

} // namespace expconf

#endif // EXPCONF_SCRIPTRENDERER_HPP
