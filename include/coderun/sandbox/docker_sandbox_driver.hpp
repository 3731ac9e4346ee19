/**
 * @file docker_sandbox_driver.hpp
 * @brief SandboxDriver implementation backed by the docker CLI
 *
 * Each sandbox is one container created from the profile image with a
 * keep-alive command, so several commands (compile, run) can be executed in
 * it with `docker exec` before it is removed.
 *
 * **Security Hardening** (applied to every container):
 * - `--network none` unless the caller explicitly enables networking
 * - `--memory` with `--memory-swap` equal to it (no swap)
 * - `--cpus`, `--pids-limit`
 * - `--cap-drop ALL`, `--security-opt no-new-privileges`
 * - Never `--privileged`
 *
 * Containers carry the `coderun.managed=true` label so leaked ones can be
 * found and removed with RemoveOrphans().
 *
 * @date 2025
 */

#pragma once

#include "coderun/sandbox/sandbox_driver.hpp"
#include "coderun/utils/process_utils.hpp"

#include <string>
#include <vector>
#include <chrono>

namespace coderun {
namespace sandbox {

/**
 * @struct DockerDriverConfig
 * @brief docker CLI settings
 */
struct DockerDriverConfig {
    std::string runtime_binary{"docker"};                 ///< docker or a compatible CLI (podman)
    std::string working_directory{"/sandbox"};            ///< Container working directory
    std::string name_prefix{"coderun"};                   ///< Container name prefix
    std::string managed_label{"coderun.managed"};         ///< Label marking our containers
    std::vector<std::string> keepalive_command{"sleep", "infinity"};  ///< Container main process
    std::chrono::milliseconds control_timeout{30000};     ///< Limit for create/cp/kill/rm calls
    std::string user;                                     ///< Optional --user
};

/**
 * @class DockerSandboxDriver
 * @brief Drives sandboxes through `docker create/start/cp/exec/kill/rm`
 *
 * **Usage Example**:
 * @code
 * DockerSandboxDriver driver;
 * auto handle = driver.Create("python:3.12-slim", SandboxLimits{});
 * driver.InjectFile(handle, "main.py", "print(1+1)\n");
 * auto out = driver.Run(handle, {"python3", "main.py"}, std::chrono::seconds(5), 65536);
 * driver.Destroy(handle);
 * @endcode
 */
class DockerSandboxDriver : public SandboxDriver {
public:
    explicit DockerSandboxDriver(const DockerDriverConfig& config = DockerDriverConfig{});

    SandboxHandle Create(const std::string& image, const SandboxLimits& limits) override;

    void InjectFile(const SandboxHandle& handle,
                    const std::string& filename,
                    const std::string& contents) override;

    RunOutput Run(const SandboxHandle& handle,
                  const std::vector<std::string>& command,
                  std::chrono::milliseconds timeout,
                  std::size_t max_output_bytes) override;

    bool Kill(const SandboxHandle& handle) override;

    bool Destroy(const SandboxHandle& handle) override;

    /**
     * @brief Check that the runtime binary answers `--version`
     */
    bool IsRuntimeAvailable() const;

    /**
     * @brief Ids of all containers carrying the managed label
     */
    std::vector<std::string> ListManaged() const;

    /**
     * @brief Force-remove every managed container
     * @return Number of containers removed
     */
    std::size_t RemoveOrphans();

    /**
     * @brief Arguments (after the binary) for `docker create`
     */
    std::vector<std::string> BuildCreateArgs(const std::string& image,
                                             const SandboxLimits& limits,
                                             const std::string& container_name) const;

    /**
     * @brief Arguments (after the binary) for `docker exec`
     */
    std::vector<std::string> BuildExecArgs(const SandboxHandle& handle,
                                           const std::vector<std::string>& command) const;

    const DockerDriverConfig& GetConfig() const { return config_; }

private:
    utils::ProcessResult RunControl(const std::vector<std::string>& args) const;
    /// Asks the daemon, not the exec output, whether the container still runs
    bool IsRunning(const SandboxHandle& handle) const;
    std::string GenerateContainerName() const;

    DockerDriverConfig config_;
};

} // namespace sandbox
} // namespace coderun
