/**
 * @file sandbox_driver.hpp
 * @brief Capability interface over the external container runtime
 *
 * The orchestrator never talks to a container runtime directly; it drives a
 * SandboxDriver. The production implementation is DockerSandboxDriver, tests
 * use a scripted fake.
 *
 * **Contract**:
 * - Create() either returns a handle to a running, isolated sandbox or
 *   throws SandboxUnavailableError leaving nothing behind.
 * - InjectFile() and Run() throw SandboxUnavailableError on infrastructure
 *   failure. A program that exits non-zero is not a failure.
 * - Run() enforces its timeout: a process still running at the deadline is
 *   killed and reported with `killed = true` and no exit code.
 * - Destroy() is called exactly once per handle by the owner. It reports
 *   failure by returning false; it must not be retried by the driver.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>

namespace coderun {
namespace sandbox {

/**
 * @struct SandboxLimits
 * @brief Isolation and resource settings applied at creation
 */
struct SandboxLimits {
    std::size_t memory_limit_mb{1024};  ///< Memory ceiling (MiB), no swap
    double cpu_limit{1.0};              ///< CPU share (cores)
    int pids_limit{1024};               ///< Process count limit
    bool network_enabled{false};        ///< Network access (off unless explicitly enabled)
};

/**
 * @struct SandboxHandle
 * @brief Opaque reference to one provisioned sandbox
 */
struct SandboxHandle {
    std::string id;     ///< Runtime identifier (container id)
    std::string image;  ///< Image the sandbox was created from
};

/**
 * @struct RunOutput
 * @brief Captured result of one command inside a sandbox
 */
struct RunOutput {
    std::string stdout_output;             ///< Standard output (capped)
    std::string stderr_output;             ///< Standard error (capped)
    bool stdout_truncated{false};          ///< stdout exceeded the cap
    bool stderr_truncated{false};          ///< stderr exceeded the cap
    std::optional<int> exit_code;          ///< Empty when killed
    bool killed{false};                    ///< Terminated at the deadline
    std::chrono::milliseconds duration{0}; ///< Wall time of the command
};

/**
 * @class SandboxDriver
 * @brief Abstract sandbox lifecycle: create, inject, run, kill, destroy
 *
 * **Thread Safety**: Implementations must allow concurrent calls on
 * distinct handles. Kill() may be called from another thread while Run()
 * on the same handle is in progress.
 */
class SandboxDriver {
public:
    virtual ~SandboxDriver() = default;

    /**
     * @brief Provision an isolated sandbox from an image
     * @throws core::SandboxUnavailableError if the image or runtime is unavailable
     */
    virtual SandboxHandle Create(const std::string& image, const SandboxLimits& limits) = 0;

    /**
     * @brief Write a file into the sandbox working directory
     * @throws core::SandboxUnavailableError on runtime failure
     */
    virtual void InjectFile(const SandboxHandle& handle,
                            const std::string& filename,
                            const std::string& contents) = 0;

    /**
     * @brief Run a command inside the sandbox
     * @param handle Sandbox to run in
     * @param command argv, run from the sandbox working directory
     * @param timeout Wall-clock limit
     * @param max_output_bytes Per-stream capture cap
     * @throws core::SandboxUnavailableError if the command could not be started
     */
    virtual RunOutput Run(const SandboxHandle& handle,
                          const std::vector<std::string>& command,
                          std::chrono::milliseconds timeout,
                          std::size_t max_output_bytes) = 0;

    /**
     * @brief Forcibly stop everything running in the sandbox
     * @return true if the runtime acknowledged the kill
     */
    virtual bool Kill(const SandboxHandle& handle) = 0;

    /**
     * @brief Remove the sandbox and its resources
     * @return true on success; false means the sandbox may be orphaned
     */
    virtual bool Destroy(const SandboxHandle& handle) = 0;
};

} // namespace sandbox
} // namespace coderun
