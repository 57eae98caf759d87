// Repeated options are collected one value per flag; values may contain commas
#define CXXOPTS_VECTOR_DELIMITER '\0'
#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "expconf/Errors.hpp"
#include "expconf/ExitStatus.hpp"
#include "expconf/Loader.hpp"
#include "expconf/Log.hpp"
#include "expconf/Pipeline.hpp"
#include "expconf/ScriptRenderer.hpp"

using nlohmann::json;
using namespace expconf;

namespace {
    std::vector<std::string> split_list(const std::string& s) {
        std::vector<std::string> out;
        std::string item;
        std::istringstream iss(s);
        while (std::getline(iss, item, ',')) {
            const auto first = item.find_first_not_of(" \t");
            if (first == std::string::npos) continue;
            const auto last = item.find_last_not_of(" \t");
            out.push_back(item.substr(first, last - first + 1));
        }
        return out;
    }

    int write_or_print(const std::string& text, const std::string& out, const std::string& what) {
        if (out.empty()) {
            std::cout << text;
            if (!text.empty() && text.back() != '\n') std::cout << "\n";
            return 0;
        }
        std::ofstream ofs(out);
        if (!ofs) {
            std::cerr << "Error: cannot write to " << out << "\n";
            return 1;
        }
        ofs << text;
        std::cout << "Wrote " << what << " to " << out << "\n";
        return 0;
    }
}

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("expconf", "Merge experiment configuration fragments and render job scripts");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("f,fragment", "Configuration fragment (YAML/JSON/TOML), repeatable, in load order",
             cxxopts::value<std::vector<std::string>>())
            ("safe", "Placeholder name never substituted, repeatable or comma-separated",
             cxxopts::value<std::vector<std::string>>())
            ("override", "KEY=VALUE applied after all fragments, repeatable",
             cxxopts::value<std::vector<std::string>>())
            ("mandatory", "Comma-separated list of mandatory dot-keys",
             cxxopts::value<std::string>()->default_value(""))
            ("v,verbose", "Log progress")
            ("debug", "Log every resolution step")
            ("h,help", "Show help");

        options.add_options("Command")
            ("format", "dump: json, yaml or toml", cxxopts::value<std::string>()->default_value("json"))
            ("out", "dump/provenance: output file; render: output directory",
             cxxopts::value<std::string>()->default_value(""))
            ("job", "render: job name (default: template file stem)", cxxopts::value<std::string>()->default_value(""))
            ("section", "render: job section for per-job settings",
             cxxopts::value<std::string>()->default_value(""))
            ("logdir", "render: directory of the status artifacts",
             cxxopts::value<std::string>()->default_value("."))
            ("root", "render: project root for extended header/tailer paths",
             cxxopts::value<std::string>());

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help({"", "Command"}) << "\n";
            std::cout << "Commands: dump | get KEY | source KEY | provenance | render TEMPLATE --job NAME | check SCRIPT\n";
            return 0;
        }

        configure_log_from_env();
        if (result.count("verbose")) set_log_level(LogLevel::info);
        if (result.count("debug")) set_log_level(LogLevel::debug);

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw ConfigError("insufficient arguments for command '" + cmd + "'");
            }
        };

        // CHECK works on a rendered script alone
        if (cmd == "check") {
            expect_args(2);
            const auto problems = check_exit_status_contract(read_text_file(cmdv[1]));
            for (const auto& p : problems) {
                std::cout << cmdv[1] << ": " << p << "\n";
            }
            if (problems.empty()) {
                std::cout << cmdv[1] << ": OK\n";
                return 0;
            }
            return 1;
        }

        PipelineOptions pipeline;
        if (result.count("fragment")) {
            pipeline.fragment_paths = result["fragment"].as<std::vector<std::string>>();
        }
        if (result.count("safe")) {
            for (const auto& entry : result["safe"].as<std::vector<std::string>>()) {
                for (auto& name : split_list(entry)) pipeline.safe_placeholders.insert(name);
            }
        }
        if (result.count("override")) {
            pipeline.overrides = result["override"].as<std::vector<std::string>>();
        }
        pipeline.mandatory = split_list(result["mandatory"].as<std::string>());

        const ResolvedConfig cfg = run_pipeline(pipeline);
        const std::string out = result["out"].as<std::string>();

        // DUMP
        if (cmd == "dump") {
            const std::string format = result["format"].as<std::string>();
            std::string text;
            if (format == "json") text = cfg.to_json_string(2);
            else if (format == "yaml") text = cfg.to_yaml_string();
            else if (format == "toml") text = cfg.to_toml_string();
            else {
                std::cerr << "Error: unknown format '" << format << "'\n";
                return 1;
            }
            return write_or_print(text, out, format);
        }

        // GET
        if (cmd == "get") {
            expect_args(2);
            const std::string key = cmdv[1];
            if (!cfg.contains(key)) {
                std::cerr << "Key not found: " << key << "\n";
                return 1;
            }
            std::cout << cfg.at(key).dump(2) << "\n";
            return 0;
        }

        // SOURCE
        if (cmd == "source") {
            expect_args(2);
            const auto entry = cfg.source_of(cmdv[1]);
            if (!entry) {
                std::cerr << "No provenance for: " << cmdv[1] << "\n";
                return 1;
            }
            std::cout << entry->to_string() << " " << to_string(entry->kind) << "\n";
            return 0;
        }

        // PROVENANCE
        if (cmd == "provenance") {
            if (!out.empty()) {
                cfg.write_provenance_json(out);
                std::cout << "Wrote provenance to " << out << "\n";
                return 0;
            }
            std::cout << cfg.provenance().export_to_value().dump(2) << "\n";
            return 0;
        }

        // RENDER
        if (cmd == "render") {
            expect_args(2);
            RenderOptions render_options;
            if (result.count("root")) {
                render_options.project_root = result["root"].as<std::string>();
            } else if (auto env_root = get_env_var("EXPCONF_PROJECT_ROOT")) {
                render_options.project_root = *env_root;
            }

            JobContext job;
            job.job_name = result["job"].as<std::string>();
            job.log_dir = result["logdir"].as<std::string>();
            job.section = result["section"].as<std::string>();

            ScriptRenderer renderer(cfg, render_options);
            const RenderedScript script = renderer.render(Template::from_file(cmdv[1]), job);
            if (out.empty()) {
                std::cout << script.text;
                return 0;
            }
            std::cout << "Wrote " << write_script(script, out) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
