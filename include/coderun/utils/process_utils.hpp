/**
 * @file process_utils.hpp
 * @brief Child process execution with separate pipes, deadline and output cap
 *
 * Used by the docker driver for every runtime call. Unlike popen(), stdout and
 * stderr are captured separately, output beyond the cap is drained and
 * dropped instead of buffered, and a deadline can terminate the child.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <cstddef>

namespace coderun {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Execution constraints for ProcessUtils::Run()
 */
struct ProcessOptions {
    std::chrono::milliseconds timeout{0};      ///< Wall-clock limit (0 = none)
    std::size_t max_output_bytes{64 * 1024};   ///< Per-stream capture cap
    std::function<void()> on_timeout;          ///< Called before the child is killed
};

/**
 * @struct ProcessResult
 * @brief Captured outcome of a child process
 */
struct ProcessResult {
    int exit_code{-1};                     ///< Exit status, or 128+signal if signalled
    bool timed_out{false};                 ///< Killed at the deadline
    bool signaled{false};                  ///< Terminated by a signal
    std::string stdout_output;             ///< Captured stdout
    std::string stderr_output;             ///< Captured stderr
    bool stdout_truncated{false};          ///< stdout exceeded the cap
    bool stderr_truncated{false};          ///< stderr exceeded the cap
    std::chrono::milliseconds duration{0}; ///< Wall time

    bool Succeeded() const { return !timed_out && exit_code == 0; }
};

/**
 * @class ProcessUtils
 * @brief Static helpers for running external programs
 */
class ProcessUtils {
public:
    /**
     * @brief Run argv[0] (PATH lookup) with stdin bound to /dev/null
     *
     * A program that cannot be executed yields exit code 127 with the reason
     * on stderr, the same as a shell would report.
     *
     * @throws std::system_error if pipes cannot be created, fork fails or
     *         the child cannot be reaped
     * @throws std::invalid_argument if argv is empty
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const ProcessOptions& options = ProcessOptions{});

    /**
     * @brief Run and report whether the program exited 0
     */
    static bool Succeeds(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));
};

} // namespace utils
} // namespace coderun
