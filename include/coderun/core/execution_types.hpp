/**
 * @file execution_types.hpp
 * @brief Request, result and status types shared by the execution pipeline
 *
 * An ExecutionRequest is the parsed inbound value ({code, language}); an
 * ExecutionResult is the single outcome produced per request. Both are plain
 * values: created per call, never retained by the orchestrator.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>
#include <chrono>

namespace coderun {
namespace core {

/**
 * @enum ExecutionStatus
 * @brief Outcome of a single execution request
 *
 * Exactly one status is assigned per request. SUCCESS, RUNTIME_ERROR,
 * COMPILE_ERROR and TIMED_OUT describe the submitted program; the remaining
 * values are request-level failures where the program never ran to an
 * outcome.
 */
enum class ExecutionStatus {
    SUCCESS,              ///< Compile (if any) and run both exited 0
    RUNTIME_ERROR,        ///< Run step exited non-zero
    COMPILE_ERROR,        ///< Compile step failed, run step never executed
    TIMED_OUT,            ///< Run step killed at its time limit
    SANDBOX_UNAVAILABLE,  ///< Container runtime could not provision or drive the sandbox
    UNKNOWN_LANGUAGE,     ///< No profile registered for the language id
    ADMISSION_TIMEOUT,    ///< No execution slot became free in time
    INVALID_REQUEST       ///< Empty or oversized code
};

/**
 * @struct ExecutionRequest
 * @brief Parsed inbound request
 */
struct ExecutionRequest {
    std::string code;      ///< Source text to inject into the sandbox
    std::string language;  ///< Exact, case-sensitive language id
};

/**
 * @struct ExecutionResult
 * @brief Outcome of one request
 *
 * stdout/stderr are capped at the configured output limit; the matching
 * `*_truncated` flag is set when bytes were dropped. `exit_code` is empty
 * when the process was killed or never started.
 */
struct ExecutionResult {
    ExecutionStatus status{ExecutionStatus::SANDBOX_UNAVAILABLE};  ///< Final classification
    std::string language;                 ///< Language id of the request
    std::string stdout_output;            ///< Captured standard output
    std::string stderr_output;            ///< Captured standard error
    bool stdout_truncated{false};         ///< stdout exceeded the cap
    bool stderr_truncated{false};         ///< stderr exceeded the cap
    std::optional<int> exit_code;         ///< Exit code of the last step that ran
    std::chrono::milliseconds elapsed{0}; ///< Wall time of the whole request
    std::string error_message;            ///< Reason for request-level failures
    bool teardown_failed{false};          ///< Sandbox destroy failed (status unaffected)
};

/**
 * @brief Stable wire name for a status ("Success", "TimedOut", ...)
 */
const char* StatusToString(ExecutionStatus status);

/**
 * @brief Parse a wire name produced by StatusToString()
 * @return Matching status, or std::nullopt for unknown names
 */
std::optional<ExecutionStatus> StatusFromString(const std::string& name);

/**
 * @brief Check whether a status is a request-level failure
 *
 * UNKNOWN_LANGUAGE, ADMISSION_TIMEOUT, SANDBOX_UNAVAILABLE and
 * INVALID_REQUEST are failures of the request itself. The other statuses are
 * successful orchestrations describing the user's program.
 */
bool IsRequestFailure(ExecutionStatus status);

} // namespace core
} // namespace coderun
