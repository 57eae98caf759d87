/**
 * @file ScriptRenderer.cpp
 * @brief Implementation of template rendering
 */

#include "expconf/ScriptRenderer.hpp"
#include "expconf/DotPath.hpp"
#include "expconf/Errors.hpp"
#include "expconf/Loader.hpp"
#include "expconf/Log.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace expconf {

Template Template::from_file(const std::string& path) {
    Template tmpl;
    tmpl.name = fs::path(path).filename().string();
    tmpl.body = read_text_file(path);
    return tmpl;
}

std::string cmd_file_name(const std::string& name) {
    fs::path p = fs::path(name).filename();
    p.replace_extension(".cmd");
    return p.string();
}

ScriptRenderer::ScriptRenderer(const ResolvedConfig& config, RenderOptions options)
    : config_(config)
    , options_(std::move(options)) {}

std::string ScriptRenderer::substitute(const std::string& text,
                                       const std::string& context_name) const {
    const ResolutionContext context{context_name,
                                    UnresolvedPlaceholderError::Context::template_body};
    return substitute_placeholders(text, config_.data(), config_.safe_placeholders(),
                                   SubstitutionScope::both, context);
}

std::string ScriptRenderer::extended_text(const std::string& key, const JobContext& job,
                                          const std::string& template_name) const {
    const Value* setting = nullptr;
    if (!job.section.empty()) {
        setting = find_by_dot(config_.data(), "JOBS." + job.section + "." + key);
    }
    if (setting == nullptr) {
        setting = find_by_dot(config_.data(), key);
    }
    if (setting == nullptr || setting->is_null()) {
        return {};
    }
    if (!setting->is_string()) {
        throw ConfigError(key + " must be a file path, got " + type_name(*setting));
    }

    const std::string& relative = setting->get_ref<const std::string&>();
    if (relative.empty()) {
        return {};
    }

    fs::path file(relative);
    if (file.is_relative()) {
        file = fs::path(options_.project_root.empty() ? "." : options_.project_root) / file;
    }
    if (!fs::exists(file)) {
        throw FileNotFoundError(file.string());
    }

    log_message(LogLevel::debug, "Using " + key + " '" + file.string() + "'");
    return substitute(read_text_file(file.string()), template_name);
}

RenderedScript ScriptRenderer::render(const Template& tmpl, const JobContext& context) const {
    JobContext job = context;
    if (job.job_name.empty()) {
        job.job_name = fs::path(tmpl.name).stem().string();
    }
    validate_job_name(job.job_name);

    const std::string body = substitute(tmpl.body, tmpl.name);
    const std::string extended_header = extended_text(kExtendedHeaderKey, job, tmpl.name);
    const std::string extended_tailer = extended_text(kExtendedTailerKey, job, tmpl.name);

    RenderedScript script;
    script.file_name = cmd_file_name(job.job_name);
    script.text = build_header(job, extended_header);
    script.text += body;
    if (!body.empty() && body.back() != '\n') {
        script.text += '\n';
    }
    script.text += build_tailer(job, extended_tailer);

    log_message(LogLevel::info, "Rendered '" + tmpl.name + "' as " + script.file_name);
    return script;
}

std::string write_script(const RenderedScript& script, const std::string& directory) {
    const fs::path dir(directory.empty() ? "." : directory);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw ConfigError("Cannot create directory '" + dir.string() + "': " + ec.message());
    }

    const fs::path target = dir / script.file_name;
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ConfigError("Cannot write script '" + target.string() + "'");
        }
        out << script.text;
        if (!out) {
            throw ConfigError("Failed writing script '" + target.string() + "'");
        }
    }

    fs::permissions(target,
                    fs::perms::owner_all |
                    fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw ConfigError("Cannot make '" + target.string() + "' executable: " + ec.message());
    }
    return target.string();
}

} // namespace expconf
