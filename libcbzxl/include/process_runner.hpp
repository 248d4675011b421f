/**
 * @file process_runner.hpp
 * @brief Runs external programs with captured output and a hard timeout.
 */

#ifndef CBZXL_PROCESS_RUNNER_HPP
#define CBZXL_PROCESS_RUNNER_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbzxl {

/**
 * @brief Result of a subordinate process invocation.
 */
struct ProcessResult {
    int exit_code = -1;      ///< Exit status, 128+signal if killed, -1 if never started
    std::string out;         ///< Captured stdout
    std::string err;         ///< Captured stderr
    bool launched = false;   ///< fork/exec succeeded
    bool timed_out = false;  ///< Killed because the timeout expired

    [[nodiscard]] bool ok() const noexcept {
        return launched && !timed_out && exit_code == 0;
    }
};

/**
 * @brief Runs @p args (argv[0] looked up in PATH) and waits for it.
 *
 * stdin is /dev/null; stdout and stderr are captured. When @p timeout
 * expires the child is killed with SIGKILL and reaped. Never throws on
 * process failures: they are reported through the returned struct.
 */
ProcessResult run_process(const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout);

/**
 * @brief Locates an executable the way execvp would.
 * @return The full path, or std::nullopt when not found in PATH.
 */
std::optional<std::filesystem::path> find_executable(std::string_view name);

} // namespace cbzxl

#endif // CBZXL_PROCESS_RUNNER_HPP
