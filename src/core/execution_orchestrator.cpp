/**
 * @file execution_orchestrator.cpp
 * @brief Provision → inject → compile → run → teardown for one request
 *
 * **Cleanup Guarantee**:
 * The provisioned sandbox lives in a ScopedSandbox for its whole lifetime
 * and Destroy() is called exactly once: by Teardown() on the normal path,
 * by the destructor when a driver call throws. The admission Slot outlives
 * the sandbox, so teardown always happens before the slot is released.
 *
 * **Watchdog**:
 * Each compile/run step is a driver call on a worker thread. The
 * orchestrator waits for `limit + kill_grace`; if the driver has not
 * returned by then it kills the sandbox and waits for the call to unwind
 * before continuing, so steps never overlap.
 *
 * @date 2025
 */

#include "coderun/core/execution_orchestrator.hpp"
#include "coderun/core/execution_errors.hpp"
#include "coderun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace coderun {
namespace core {

// ============================================================================
// SCOPED SANDBOX
// ============================================================================

/**
 * Owns one sandbox handle and destroys it exactly once.
 */
class ExecutionOrchestrator::ScopedSandbox {
public:
    enum class State {
        READY,      ///< Created and started
        KILLED,     ///< Forcibly stopped by the watchdog
        DESTROYED,  ///< Destroy() succeeded
        ORPHANED    ///< Destroy() failed or threw
    };

    ScopedSandbox(sandbox::SandboxDriver& driver,
                  sandbox::SandboxHandle handle,
                  std::atomic<std::uint64_t>& teardown_failures)
        : driver_(driver)
        , handle_(std::move(handle))
        , teardown_failures_(teardown_failures) {
    }

    ~ScopedSandbox() {
        Teardown();
    }

    ScopedSandbox(const ScopedSandbox&) = delete;
    ScopedSandbox& operator=(const ScopedSandbox&) = delete;

    const sandbox::SandboxHandle& Handle() const { return handle_; }

    void Kill() {
        try {
            if (!driver_.Kill(handle_)) {
                spdlog::warn("Kill of sandbox {} was not acknowledged", handle_.id);
            }
        }
        catch (const std::exception& e) {
            spdlog::error("Kill of sandbox {} failed: {}", handle_.id, e.what());
        }
        state_ = State::KILLED;
    }

    /**
     * Destroys the sandbox if not yet done.
     * @return false if the sandbox may have been left behind
     */
    bool Teardown() noexcept {
        if (torn_down_) {
            return state_ == State::DESTROYED;
        }
        torn_down_ = true;

        bool destroyed = false;
        try {
            destroyed = driver_.Destroy(handle_);
        }
        catch (const std::exception& e) {
            spdlog::error("Destroy of sandbox {} threw: {}", handle_.id, e.what());
        }

        if (destroyed) {
            state_ = State::DESTROYED;
            return true;
        }

        state_ = State::ORPHANED;
        teardown_failures_.fetch_add(1);
        spdlog::error("Sandbox {} (image {}) may be orphaned; remove it manually or run --cleanup-orphans",
                      handle_.id, handle_.image);
        return false;
    }

private:
    sandbox::SandboxDriver& driver_;
    sandbox::SandboxHandle handle_;
    std::atomic<std::uint64_t>& teardown_failures_;
    State state_{State::READY};
    bool torn_down_{false};
};

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ExecutionOrchestrator::ExecutionOrchestrator(std::shared_ptr<const LanguageRegistry> registry,
                                             std::shared_ptr<sandbox::SandboxDriver> driver,
                                             std::shared_ptr<AdmissionController> admission,
                                             const Config& config)
    : registry_(std::move(registry))
    , driver_(std::move(driver))
    , admission_(std::move(admission))
    , config_(config) {
    if (!registry_ || !driver_ || !admission_) {
        throw std::invalid_argument("ExecutionOrchestrator requires a registry, a driver and an admission controller");
    }

    spdlog::info("Execution orchestrator ready: {} language(s), {} slot(s), output cap {} bytes",
                 registry_->Size(), admission_->Capacity(), config_.max_output_bytes);
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult ExecutionOrchestrator::Execute(const ExecutionRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    in_flight_.fetch_add(1);

    ExecutionResult result;

    try {
        ValidateRequest(request);

        const LanguageProfile& profile = registry_->Resolve(request.language);
        spdlog::debug("Resolved '{}' → image {}", request.language, profile.image_reference);

        // Released after RunInSandbox() has torn the sandbox down.
        AdmissionController::Slot slot = admission_->Acquire();
        spdlog::debug("Admitted '{}' request ({} / {} slots in use)",
                      request.language, admission_->InUse(), admission_->Capacity());

        result = RunInSandbox(request, profile);
    }
    catch (const ExecutionError& e) {
        result = ExecutionResult{};
        result.status = e.Status();
        result.error_message = e.what();
        spdlog::warn("Request for '{}' failed: {} ({})",
                     request.language, StatusToString(e.Status()), e.what());
    }
    catch (const std::exception& e) {
        // Anything else escaping a driver is an infrastructure failure.
        result = ExecutionResult{};
        result.status = ExecutionStatus::SANDBOX_UNAVAILABLE;
        result.error_message = e.what();
        spdlog::error("Request for '{}' aborted by unexpected error: {}", request.language, e.what());
    }

    result.language = request.language;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    in_flight_.fetch_sub(1);
    RecordOutcome(result);

    spdlog::info("Execution finished: language={} status={} exit_code={} elapsed={}ms",
                 result.language, StatusToString(result.status),
                 result.exit_code ? std::to_string(*result.exit_code) : std::string("null"),
                 result.elapsed.count());
    return result;
}

std::future<ExecutionResult> ExecutionOrchestrator::ExecuteAsync(ExecutionRequest request) {
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        return Execute(request);
    });
}

void ExecutionOrchestrator::ValidateRequest(const ExecutionRequest& request) const {
    if (request.code.empty()) {
        throw InvalidRequestError("Code must not be empty");
    }
    if (request.code.size() > config_.max_code_bytes) {
        throw InvalidRequestError("Code is " + std::to_string(request.code.size()) +
                                  " bytes, limit is " + std::to_string(config_.max_code_bytes));
    }
}

ExecutionResult ExecutionOrchestrator::RunInSandbox(const ExecutionRequest& request,
                                                    const LanguageProfile& profile) {
    ExecutionResult result;

    ScopedSandbox sandbox(*driver_,
                          driver_->Create(profile.image_reference, LimitsFor(profile)),
                          teardown_failures_);

    driver_->InjectFile(sandbox.Handle(), profile.source_filename, request.code);

    bool compiled = true;
    if (profile.RequiresCompilation()) {
        const auto limit = profile.compile_time_limit.value_or(config_.compile_time_limit);
        auto compile = RunStep(sandbox, *profile.compile_command, limit, "compile");

        if (compile.killed || !compile.exit_code || *compile.exit_code != 0) {
            compiled = false;
            CaptureOutput(compile, result);
            result.status = ExecutionStatus::COMPILE_ERROR;
            result.exit_code = compile.killed ? std::nullopt : compile.exit_code;
            if (compile.killed) {
                result.error_message = "Compilation exceeded " + std::to_string(limit.count()) + " ms";
            }
        }
    }

    if (compiled) {
        auto run = RunStep(sandbox, profile.run_command, profile.limits.time_limit, "run");
        CaptureOutput(run, result);

        if (run.killed || !run.exit_code) {
            result.status = ExecutionStatus::TIMED_OUT;
            result.exit_code.reset();
        } else if (*run.exit_code == 0) {
            result.status = ExecutionStatus::SUCCESS;
            result.exit_code = 0;
        } else {
            result.status = ExecutionStatus::RUNTIME_ERROR;
            result.exit_code = run.exit_code;
        }
    }

    // Normal-path teardown so its outcome lands in the result; on any
    // exception the destructor does the same.
    result.teardown_failed = !sandbox.Teardown();
    return result;
}

sandbox::RunOutput ExecutionOrchestrator::RunStep(ScopedSandbox& sandbox,
                                                  const std::vector<std::string>& command,
                                                  std::chrono::milliseconds limit,
                                                  const char* step_name) {
    spdlog::debug("Sandbox {}: {} step, limit {} ms: {}",
                  sandbox.Handle().id.substr(0, 12), step_name, limit.count(),
                  utils::StringUtils::FormatCommand(command));

    auto pending = std::async(std::launch::async, [this, &sandbox, &command, limit]() {
        return driver_->Run(sandbox.Handle(), command, limit, config_.max_output_bytes);
    });

    if (pending.wait_for(limit + config_.kill_grace) == std::future_status::ready) {
        auto output = pending.get();
        if (output.killed) {
            spdlog::info("Sandbox {}: {} step hit its {} ms limit",
                         sandbox.Handle().id.substr(0, 12), step_name, limit.count());
        }
        return output;
    }

    spdlog::warn("Sandbox {}: {} step still running {} ms past its limit, killing sandbox",
                 sandbox.Handle().id.substr(0, 12), step_name, config_.kill_grace.count());
    sandbox.Kill();

    // The driver call must finish before the next step may start.
    auto output = pending.get();
    output.killed = true;
    output.exit_code.reset();
    return output;
}

void ExecutionOrchestrator::CaptureOutput(const sandbox::RunOutput& output,
                                          ExecutionResult& result) const {
    result.stdout_output = output.stdout_output;
    result.stderr_output = output.stderr_output;
    // Drivers are not trusted to honour the cap.
    const bool stdout_cut = utils::StringUtils::Truncate(result.stdout_output, config_.max_output_bytes);
    const bool stderr_cut = utils::StringUtils::Truncate(result.stderr_output, config_.max_output_bytes);
    result.stdout_truncated = output.stdout_truncated || stdout_cut;
    result.stderr_truncated = output.stderr_truncated || stderr_cut;
}

sandbox::SandboxLimits ExecutionOrchestrator::LimitsFor(const LanguageProfile& profile) const {
    sandbox::SandboxLimits limits;
    limits.memory_limit_mb = profile.limits.memory_limit_mb;
    limits.cpu_limit = profile.limits.cpu_limit;
    limits.pids_limit = profile.limits.pids_limit;
    limits.network_enabled = config_.network_enabled;
    return limits;
}

// ============================================================================
// STATISTICS
// ============================================================================

void ExecutionOrchestrator::RecordOutcome(const ExecutionResult& result) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total_requests++;
    stats_.by_status[result.status]++;
}

OrchestratorStatistics ExecutionOrchestrator::GetStatistics() const {
    OrchestratorStatistics snapshot;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        snapshot = stats_;
    }
    snapshot.teardown_failures = teardown_failures_.load();
    snapshot.in_flight = in_flight_.load();
    return snapshot;
}

} // namespace core
} // namespace coderun
