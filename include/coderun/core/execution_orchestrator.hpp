/**
 * @file execution_orchestrator.hpp
 * @brief Runs untrusted code snippets in ephemeral sandboxes
 *
 * The orchestrator turns an ExecutionRequest into an ExecutionResult:
 *
 * ```
 * request
 *   → validate (size bounds)
 *   → LanguageRegistry::Resolve          (UnknownLanguage, nothing created)
 *   → AdmissionController::Acquire       (AdmissionTimeout, nothing created)
 *   → SandboxDriver::Create              (SandboxUnavailable, nothing left running)
 *   → InjectFile(source_filename, code)
 *   → [compile_command]                  (CompileError → teardown, run skipped)
 *   → run_command                        (TimedOut / RuntimeError / Success)
 *   → teardown (always)                  (failure logged and counted, status kept)
 *   → release slot
 * ```
 *
 * **Sequencing**: For one request the sandbox steps are strictly
 * sequential; a step starts only after the previous one terminally finished,
 * including a forced kill. Different requests interleave freely up to the
 * admission capacity.
 *
 * **Timeouts**: The driver enforces each step's limit. As a backstop the
 * orchestrator waits on the driver call for `limit + kill_grace`; if the
 * call is still running it kills the sandbox itself and reports the step as
 * timed out.
 *
 * **Retries**: None. Every compile/run failure and timeout is terminal.
 *
 * @date 2025
 */

#pragma once

#include "coderun/core/execution_types.hpp"
#include "coderun/core/language_registry.hpp"
#include "coderun/core/admission_controller.hpp"
#include "coderun/sandbox/sandbox_driver.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace coderun {
namespace core {

/**
 * @struct OrchestratorStatistics
 * @brief Counters exposed for operators
 */
struct OrchestratorStatistics {
    std::uint64_t total_requests{0};                        ///< Completed requests
    std::map<ExecutionStatus, std::uint64_t> by_status;     ///< Completed requests per status
    std::uint64_t teardown_failures{0};                     ///< Sandboxes that may be orphaned
    std::size_t in_flight{0};                               ///< Requests currently executing
};

/**
 * @struct ExecutionOrchestratorConfig
 * @brief Orchestration limits not carried by language profiles
 */
struct ExecutionOrchestratorConfig {
    std::chrono::milliseconds compile_time_limit{5000};  ///< Default compile step limit
    std::chrono::milliseconds kill_grace{2000};          ///< Watchdog slack beyond a step limit
    std::size_t max_output_bytes{64 * 1024};             ///< Per-stream output cap
    std::size_t max_code_bytes{64 * 1024};               ///< Maximum submitted code size
    bool network_enabled{false};                         ///< Give sandboxes network access
};

/**
 * @class ExecutionOrchestrator
 * @brief Drives one sandbox per request through provision, compile, run, teardown
 *
 * **Thread Safety**: Execute() may be called concurrently from any number
 * of threads. The registry is only read; the admission controller is the
 * only shared mutable state on the request path.
 *
 * **Usage Example**:
 * @code
 * auto registry = std::make_shared<const LanguageRegistry>(LanguageRegistry::WithBuiltins());
 * auto driver = std::make_shared<sandbox::DockerSandboxDriver>();
 * auto admission = std::make_shared<AdmissionController>(4, std::chrono::seconds(30));
 *
 * ExecutionOrchestrator orchestrator(registry, driver, admission);
 * auto result = orchestrator.Execute({"print(1+1)", "python"});
 * // result.status == ExecutionStatus::SUCCESS, result.stdout_output == "2\n"
 * @endcode
 */
class ExecutionOrchestrator {
public:
    using Config = ExecutionOrchestratorConfig;

    /**
     * @brief Construct orchestrator
     * @param registry Read-only language profiles
     * @param driver Sandbox capability
     * @param admission Shared concurrency limiter
     * @param config Orchestration limits
     * @throws std::invalid_argument if any collaborator is null
     */
    ExecutionOrchestrator(std::shared_ptr<const LanguageRegistry> registry,
                          std::shared_ptr<sandbox::SandboxDriver> driver,
                          std::shared_ptr<AdmissionController> admission,
                          const Config& config = Config{});

    ExecutionOrchestrator(const ExecutionOrchestrator&) = delete;
    ExecutionOrchestrator& operator=(const ExecutionOrchestrator&) = delete;

    /**
     * @brief Execute one request
     *
     * Never throws for request-level failures: UNKNOWN_LANGUAGE,
     * ADMISSION_TIMEOUT, SANDBOX_UNAVAILABLE and INVALID_REQUEST are
     * returned as the result status with `error_message` set.
     *
     * @param request Code and language id
     * @return Exactly one classified result
     */
    ExecutionResult Execute(const ExecutionRequest& request);

    /**
     * @brief Execute on a background thread
     * @return Future resolving to the same result Execute() would return
     */
    std::future<ExecutionResult> ExecuteAsync(ExecutionRequest request);

    /**
     * @brief Snapshot of the operator counters
     */
    OrchestratorStatistics GetStatistics() const;

    const Config& GetConfig() const { return config_; }

private:
    class ScopedSandbox;

    void ValidateRequest(const ExecutionRequest& request) const;
    ExecutionResult RunInSandbox(const ExecutionRequest& request, const LanguageProfile& profile);
    sandbox::RunOutput RunStep(ScopedSandbox& sandbox,
                               const std::vector<std::string>& command,
                               std::chrono::milliseconds limit,
                               const char* step_name);
    void CaptureOutput(const sandbox::RunOutput& output, ExecutionResult& result) const;
    sandbox::SandboxLimits LimitsFor(const LanguageProfile& profile) const;
    void RecordOutcome(const ExecutionResult& result);

    std::shared_ptr<const LanguageRegistry> registry_;
    std::shared_ptr<sandbox::SandboxDriver> driver_;
    std::shared_ptr<AdmissionController> admission_;
    Config config_;

    mutable std::mutex stats_mutex_;
    OrchestratorStatistics stats_;
    std::atomic<std::size_t> in_flight_{0};
    std::atomic<std::uint64_t> teardown_failures_{0};
};

} // namespace core
} // namespace coderun
