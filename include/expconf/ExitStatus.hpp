/**
 * @file ExitStatus.hpp
 * @brief Exit-status contract embedded in every rendered script
 *
 * The header installs an EXIT trap and traps on HUP, INT, QUIT, TERM,
 * XCPU and XFSZ:
 * - EXIT: writes `<job>_STAT` with the script's real exit code
 * - signal N: writes `<job>_STAT` with 128 + N, then exits with it
 *
 * Only the tailer, after the job body ran to completion, writes
 * `<job>_COMPLETED`; its presence is a strict success signal.
 *
 * SIGKILL, or a signal arriving while a non-interruptible foreground
 * command runs, produces neither artifact. Nothing here tries to hide
 * that gap.
 */

#ifndef EXPCONF_EXITSTATUS_HPP
#define EXPCONF_EXITSTATUS_HPP

#include <string>
#include <vector>

namespace expconf {

/**
 * @brief A signal intercepted by the rendered script
 */
struct TrappedSignal {
    const char* name;   ///< Name as understood by the shell `trap` builtin
    int number;         ///< POSIX/Linux signal number
};

/// Exit codes of signal-terminated scripts are this base plus the signal number
constexpr int kSignalExitBase = 128;

/**
 * @brief HUP(1), INT(2), QUIT(3), TERM(15), XCPU(24), XFSZ(25)
 */
const std::vector<TrappedSignal>& trapped_signals();

constexpr int signal_exit_code(int signal_number) noexcept {
    return kSignalExitBase + signal_number;
}

/**
 * @brief Runtime identity of the job a script is rendered for
 */
struct JobContext {
    std::string job_name;
    std::string log_dir = ".";
    std::string section;    ///< Job section (e.g. "SIM"), for per-job settings
};

std::string status_file_name(const std::string& job_name);
std::string completed_file_name(const std::string& job_name);

/**
 * @brief Reject job names that cannot name the status artifacts
 *
 * @throws ConfigError if @p job_name is empty, contains a control
 *         character (it is written into comment lines) or a '/'
 */
void validate_job_name(const std::string& job_name);

/**
 * @brief Quote a string for a POSIX shell (single quotes)
 */
std::string shell_quote(const std::string& text);

/**
 * @brief Default header followed by @p extended_header
 *
 * The extended text runs after the traps are installed.
 *
 * @throws ConfigError if the job name fails validate_job_name()
 */
std::string build_header(const JobContext& job, const std::string& extended_header = "");

/**
 * @brief Default tailer with @p extended_tailer inserted before the
 *        completion block
 *
 * The extended text runs before the completion artifact is written,
 * so its failure leaves no `<job>_COMPLETED` behind.
 */
std::string build_tailer(const JobContext& job, const std::string& extended_tailer = "");

/**
 * @brief Check a rendered script against the contract
 *
 * Verifies a non-empty job name, the EXIT trap, a trap for every signal of trapped_signals()
 * with its number, the 128 + N arithmetic, and that the completion
 * artifact is written once, by the tailer only.
 *
 * @return One message per violation; empty when the script complies
 */
std::vector<std::string> check_exit_status_contract(const std::string& script);

} // namespace expconf

#endif // EXPCONF_EXITSTATUS_HPP
