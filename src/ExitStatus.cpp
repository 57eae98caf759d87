/**
 * @file ExitStatus.cpp
 * @brief Header/tailer text and contract validation
 */

#include "expconf/ExitStatus.hpp"
#include "expconf/Errors.hpp"

#include <sstream>

namespace expconf {

namespace {
    const char* const kBanner =
        "###############################################################################";
    const char* const kTailerTitle = "#                   expconf tailer";
    const char* const kExitTrap = "trap expconf_on_exit EXIT";
    const char* const kStatusWrite = "echo \"${exit_code}\" > \"${expconf_stat_file}\"";
    const char* const kCompletedWrite = "touch \"${expconf_completed_file}\"";

    std::string signal_trap_line(const TrappedSignal& sig) {
        return "trap 'expconf_on_signal " + std::to_string(sig.number) + "' " + sig.name;
    }

    std::string signal_exit_expression() {
        return "$((" + std::to_string(kSignalExitBase) + " + $1))";
    }

    std::size_t count_occurrences(const std::string& text, const std::string& needle) {
        std::size_t count = 0;
        for (auto pos = text.find(needle); pos != std::string::npos;
             pos = text.find(needle, pos + needle.size())) {
            ++count;
        }
        return count;
    }

    void append_block(std::ostringstream& oss, const std::string& text) {
        if (text.empty()) {
            return;
        }
        oss << text;
        if (text.back() != '\n') {
            oss << '\n';
        }
    }
}

const std::vector<TrappedSignal>& trapped_signals() {
    static const std::vector<TrappedSignal> signals = {
        {"HUP", 1},
        {"INT", 2},
        {"QUIT", 3},
        {"TERM", 15},
        {"XCPU", 24},
        {"XFSZ", 25}
    };
    return signals;
}

std::string status_file_name(const std::string& job_name) {
    return job_name + "_STAT";
}

std::string completed_file_name(const std::string& job_name) {
    return job_name + "_COMPLETED";
}

void validate_job_name(const std::string& job_name) {
    if (job_name.empty()) {
        throw ConfigError("Job name is empty: status artifacts need a job name");
    }
    for (unsigned char c : job_name) {
        if (c < 0x20 || c == 0x7f) {
            throw ConfigError("Job name '" + job_name + "' contains a control character");
        }
        if (c == '/') {
            throw ConfigError("Job name '" + job_name + "' contains '/'");
        }
    }
}

std::string shell_quote(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string build_header(const JobContext& job, const std::string& extended_header) {
    validate_job_name(job.job_name);

    std::ostringstream oss;
    oss << "#!/bin/bash\n"
        << kBanner << "\n"
        << "#                   " << job.job_name << "\n"
        << kBanner << "\n"
        << "#\n"
        << "# Exit status: " << status_file_name(job.job_name)
        << " holds the exit code, " << completed_file_name(job.job_name)
        << " marks success.\n"
        << "#\n"
        << "set -xuve\n"
        << "expconf_job_name=" << shell_quote(job.job_name) << "\n"
        << "expconf_log_dir=" << shell_quote(job.log_dir.empty() ? "." : job.log_dir) << "\n"
        << "expconf_stat_file=\"${expconf_log_dir}/${expconf_job_name}_STAT\"\n"
        << "expconf_completed_file=\"${expconf_log_dir}/${expconf_job_name}_COMPLETED\"\n"
        << "\n"
        << "expconf_on_exit() {\n"
        << "    local exit_code=$?\n"
        << "    trap - EXIT\n"
        << "    " << kStatusWrite << "\n"
        << "    exit \"${exit_code}\"\n"
        << "}\n"
        << "\n"
        << "expconf_on_signal() {\n"
        << "    local exit_code=" << signal_exit_expression() << "\n"
        << "    trap - EXIT";
    for (const auto& sig : trapped_signals()) {
        oss << " " << sig.name;
    }
    oss << "\n"
        << "    " << kStatusWrite << "\n"
        << "    exit \"${exit_code}\"\n"
        << "}\n"
        << "\n"
        << kExitTrap << "\n";
    for (const auto& sig : trapped_signals()) {
        oss << signal_trap_line(sig) << "\n";
    }
    oss << "rm -f \"${expconf_completed_file}\"\n"
        << "\n";

    append_block(oss, extended_header);
    return oss.str();
}

std::string build_tailer(const JobContext& job, const std::string& extended_tailer) {
    validate_job_name(job.job_name);

    std::ostringstream oss;
    oss << "\n"
        << kBanner << "\n"
        << kTailerTitle << "\n"
        << kBanner << "\n";
    append_block(oss, extended_tailer);
    oss << "# " << job.job_name << " finished its body\n"
        << kCompletedWrite << "\n"
        << "exit 0\n";
    return oss.str();
}

std::vector<std::string> check_exit_status_contract(const std::string& script) {
    std::vector<std::string> problems;

    if (script.compare(0, 2, "#!") != 0) {
        problems.push_back("script does not start with an interpreter line");
    }

    if (script.find("expconf_job_name=''\n") != std::string::npos) {
        problems.push_back("job name is empty");
    }

    const auto exit_trap = script.find(kExitTrap);
    if (exit_trap == std::string::npos) {
        problems.push_back("missing EXIT trap");
    }

    std::size_t last_trap = exit_trap == std::string::npos ? 0 : exit_trap;
    for (const auto& sig : trapped_signals()) {
        const auto pos = script.find(signal_trap_line(sig));
        if (pos == std::string::npos) {
            problems.push_back(std::string("signal ") + sig.name + " (" +
                               std::to_string(sig.number) + ") is not trapped");
        } else if (pos > last_trap) {
            last_trap = pos;
        }
    }

    if (script.find(signal_exit_expression()) == std::string::npos) {
        problems.push_back("signal handler does not compute " +
                           std::to_string(kSignalExitBase) + " + signal number");
    }

    if (count_occurrences(script, kStatusWrite) < 2) {
        problems.push_back("status artifact is not written by both handlers");
    }

    const auto completed = count_occurrences(script, kCompletedWrite);
    if (completed == 0) {
        problems.push_back("completion artifact is never written");
    } else if (completed > 1) {
        problems.push_back("completion artifact is written more than once");
    } else {
        const auto tailer = script.find(kTailerTitle);
        const auto touch = script.find(kCompletedWrite);
        if (tailer == std::string::npos || touch < tailer) {
            problems.push_back("completion artifact is written outside the tailer");
        } else if (touch < last_trap) {
            problems.push_back("completion artifact is written before the traps are installed");
        }
    }

    return problems;
}

} // namespace expconf
