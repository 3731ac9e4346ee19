/**
 * @file docker_sandbox_driver.cpp
 * @brief docker CLI implementation of the sandbox lifecycle
 *
 * **Container Lifecycle**:
 * ```
 * docker create (hardened, keep-alive command) → docker start
 *   → docker cp <staged source> <id>:/sandbox/<file>
 *   → docker exec <id> <compile argv>      (optional)
 *   → docker exec <id> <run argv>          (deadline → docker kill)
 *   → docker rm --force --volumes <id>
 * ```
 *
 * **Failure Mapping**:
 * - Non-zero `create`/`start`/`cp` → SandboxUnavailableError
 * - Non-zero `exec` while `docker inspect` no longer reports the container
 *   as running (daemon gone, container removed, missing CLI)
 *   → SandboxUnavailableError
 * - Any other non-zero `exec` status belongs to the user's program; its
 *   stderr is never used for classification
 *
 * A container that was created but could not be started is force-removed
 * before the error is raised, so a failed Create() leaves nothing behind.
 *
 * @date 2025
 */

#include "coderun/sandbox/docker_sandbox_driver.hpp"
#include "coderun/core/execution_errors.hpp"
#include "coderun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace coderun {
namespace sandbox {

namespace {

using utils::StringUtils;

constexpr std::size_t kControlOutputLimit = 1024 * 1024;

std::string ShortId(const std::string& id) {
    return id.substr(0, 12);
}

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

std::filesystem::path StagingPath(const std::string& prefix, const std::string& filename) {
    static std::atomic<std::uint64_t> counter{0};
    std::ostringstream name;
    name << prefix << "_src_" << ::getpid() << "_" << counter.fetch_add(1) << "_" << filename;
    return std::filesystem::temp_directory_path() / name.str();
}

} // anonymous namespace

DockerSandboxDriver::DockerSandboxDriver(const DockerDriverConfig& config)
    : config_(config) {
    spdlog::debug("Docker sandbox driver using '{}' (workdir {})",
                  config_.runtime_binary, config_.working_directory);
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

SandboxHandle DockerSandboxDriver::Create(const std::string& image, const SandboxLimits& limits) {
    const auto name = GenerateContainerName();
    spdlog::info("Creating sandbox {} from image {}", name, image);

    auto created = RunControl(BuildCreateArgs(image, limits, name));
    if (!created.Succeeded()) {
        const auto reason = StringUtils::Trim(created.stderr_output);
        spdlog::error("Failed to create sandbox from {}: {}", image, reason);

        // A create that timed out may still complete inside the daemon.
        if (created.timed_out && !RunControl({"rm", "--force", name}).Succeeded()) {
            spdlog::warn("Could not confirm removal of {} after create timeout", name);
        }
        throw core::SandboxUnavailableError(
            "Failed to create sandbox from image '" + image + "': " +
            (created.timed_out ? std::string("runtime did not respond") : reason));
    }

    SandboxHandle handle;
    handle.id = StringUtils::Trim(created.stdout_output);
    handle.image = image;
    if (handle.id.empty()) {
        handle.id = name;
    }

    auto started = RunControl({"start", handle.id});
    if (!started.Succeeded()) {
        const auto reason = StringUtils::Trim(started.stderr_output);
        spdlog::error("Failed to start sandbox {}: {}", ShortId(handle.id), reason);

        auto removed = RunControl({"rm", "--force", handle.id});
        if (!removed.Succeeded()) {
            spdlog::error("Sandbox {} could not be removed after failed start; remove it manually: {}",
                          handle.id, StringUtils::Trim(removed.stderr_output));
        }
        throw core::SandboxUnavailableError("Failed to start sandbox: " + reason);
    }

    spdlog::debug("Sandbox {} running", ShortId(handle.id));
    return handle;
}

// ============================================================================
// FILE INJECTION
// ============================================================================

void DockerSandboxDriver::InjectFile(const SandboxHandle& handle,
                                     const std::string& filename,
                                     const std::string& contents) {
    if (!StringUtils::IsPlainFileName(filename)) {
        throw std::invalid_argument("Refusing to inject non-plain file name '" + filename + "'");
    }

    const auto staged = StagingPath(config_.name_prefix, filename);
    {
        std::ofstream out(staged, std::ios::binary | std::ios::trunc);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        if (!out) {
            std::error_code ec;
            std::filesystem::remove(staged, ec);
            throw core::SandboxUnavailableError("Cannot stage source file at " + staged.string());
        }
    }

    const auto destination = handle.id + ":" + config_.working_directory + "/" + filename;
    auto copied = RunControl({"cp", staged.string(), destination});

    std::error_code ec;
    std::filesystem::remove(staged, ec);
    if (ec) {
        spdlog::warn("Could not remove staged file {}: {}", staged.string(), ec.message());
    }

    if (!copied.Succeeded()) {
        const auto reason = StringUtils::Trim(copied.stderr_output);
        spdlog::error("Failed to copy {} into sandbox {}: {}", filename, ShortId(handle.id), reason);
        throw core::SandboxUnavailableError("Failed to inject '" + filename + "': " + reason);
    }

    spdlog::debug("Injected {} ({} bytes) into sandbox {}", filename, contents.size(), ShortId(handle.id));
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

RunOutput DockerSandboxDriver::Run(const SandboxHandle& handle,
                                   const std::vector<std::string>& command,
                                   std::chrono::milliseconds timeout,
                                   std::size_t max_output_bytes) {
    std::vector<std::string> argv{config_.runtime_binary};
    auto exec_args = BuildExecArgs(handle, command);
    argv.insert(argv.end(), exec_args.begin(), exec_args.end());

    utils::ProcessOptions options;
    options.timeout = timeout;
    options.max_output_bytes = max_output_bytes;
    options.on_timeout = [this, &handle, timeout]() {
        spdlog::warn("Sandbox {} exceeded {} ms, killing", ShortId(handle.id), timeout.count());
        Kill(handle);
    };

    spdlog::debug("Executing in {}: {}", ShortId(handle.id), StringUtils::FormatCommand(command));

    utils::ProcessResult exec;
    try {
        exec = utils::ProcessUtils::Run(argv, options);
    }
    catch (const std::system_error& e) {
        throw core::SandboxUnavailableError(std::string("Cannot launch runtime: ") + e.what());
    }

    if (!exec.timed_out && exec.exit_code != 0 && !IsRunning(handle)) {
        spdlog::error("Sandbox {} is gone after exec exited with {}", ShortId(handle.id), exec.exit_code);
        throw core::SandboxUnavailableError("Sandbox " + ShortId(handle.id) + " is no longer running");
    }

    RunOutput output;
    output.stdout_output = std::move(exec.stdout_output);
    output.stderr_output = std::move(exec.stderr_output);
    output.stdout_truncated = exec.stdout_truncated;
    output.stderr_truncated = exec.stderr_truncated;
    output.duration = exec.duration;
    output.killed = exec.timed_out;
    if (!exec.timed_out) {
        output.exit_code = exec.exit_code;
    }
    return output;
}

// ============================================================================
// TERMINATION AND REMOVAL
// ============================================================================

bool DockerSandboxDriver::Kill(const SandboxHandle& handle) {
    auto killed = RunControl({"kill", handle.id});
    if (!killed.Succeeded()) {
        spdlog::warn("docker kill {} failed: {}", ShortId(handle.id),
                     StringUtils::Trim(killed.stderr_output));
        return false;
    }
    return true;
}

bool DockerSandboxDriver::Destroy(const SandboxHandle& handle) {
    auto removed = RunControl({"rm", "--force", "--volumes", handle.id});
    if (!removed.Succeeded()) {
        spdlog::error("Failed to remove sandbox {}: {}", handle.id,
                      removed.timed_out ? std::string("runtime did not respond")
                                        : StringUtils::Trim(removed.stderr_output));
        return false;
    }
    spdlog::debug("Sandbox {} removed", ShortId(handle.id));
    return true;
}

// ============================================================================
// RUNTIME QUERIES
// ============================================================================

bool DockerSandboxDriver::IsRuntimeAvailable() const {
    return utils::ProcessUtils::Succeeds({config_.runtime_binary, "--version"});
}

std::vector<std::string> DockerSandboxDriver::ListManaged() const {
    auto listed = RunControl({
        "ps", "--all", "--quiet", "--no-trunc",
        "--filter", "label=" + config_.managed_label + "=true"
    });
    if (!listed.Succeeded()) {
        spdlog::error("Failed to list managed sandboxes: {}", StringUtils::Trim(listed.stderr_output));
        return {};
    }

    std::vector<std::string> ids;
    for (const auto& line : StringUtils::Split(listed.stdout_output, '\n')) {
        auto id = StringUtils::Trim(line);
        if (!id.empty()) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::size_t DockerSandboxDriver::RemoveOrphans() {
    std::size_t removed = 0;
    for (const auto& id : ListManaged()) {
        SandboxHandle handle;
        handle.id = id;
        if (Destroy(handle)) {
            ++removed;
        }
    }
    spdlog::info("Removed {} managed sandbox(es)", removed);
    return removed;
}

// ============================================================================
// COMMAND CONSTRUCTION
// ============================================================================

std::vector<std::string> DockerSandboxDriver::BuildCreateArgs(const std::string& image,
                                                              const SandboxLimits& limits,
                                                              const std::string& container_name) const {
    std::vector<std::string> args;

    args.push_back("create");
    args.push_back("--name");
    args.push_back(container_name);
    args.push_back("--label");
    args.push_back(config_.managed_label + "=true");

    args.push_back("--network");
    if (limits.network_enabled) {
        spdlog::warn("Sandbox {} created with network access", container_name);
        args.push_back("bridge");
    } else {
        args.push_back("none");
    }

    // Memory without swap
    args.push_back("--memory");
    args.push_back(std::to_string(limits.memory_limit_mb) + "m");
    args.push_back("--memory-swap");
    args.push_back(std::to_string(limits.memory_limit_mb) + "m");

    args.push_back("--cpus");
    args.push_back(FormatCpus(limits.cpu_limit));

    args.push_back("--pids-limit");
    args.push_back(std::to_string(limits.pids_limit));

    args.push_back("--cap-drop");
    args.push_back("ALL");
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");

    args.push_back("--workdir");
    args.push_back(config_.working_directory);

    if (!config_.user.empty()) {
        args.push_back("--user");
        args.push_back(config_.user);
    }

    // Image (must be last before command)
    args.push_back(image);
    args.insert(args.end(), config_.keepalive_command.begin(), config_.keepalive_command.end());

    return args;
}

std::vector<std::string> DockerSandboxDriver::BuildExecArgs(const SandboxHandle& handle,
                                                            const std::vector<std::string>& command) const {
    std::vector<std::string> args{"exec", "--workdir", config_.working_directory};
    if (!config_.user.empty()) {
        args.push_back("--user");
        args.push_back(config_.user);
    }
    args.push_back(handle.id);
    args.insert(args.end(), command.begin(), command.end());
    return args;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

utils::ProcessResult DockerSandboxDriver::RunControl(const std::vector<std::string>& args) const {
    std::vector<std::string> argv{config_.runtime_binary};
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", StringUtils::FormatCommand(argv));

    utils::ProcessOptions options;
    options.timeout = config_.control_timeout;
    options.max_output_bytes = kControlOutputLimit;

    try {
        return utils::ProcessUtils::Run(argv, options);
    }
    catch (const std::system_error& e) {
        utils::ProcessResult failed;
        failed.exit_code = -1;
        failed.stderr_output = e.what();
        return failed;
    }
}

bool DockerSandboxDriver::IsRunning(const SandboxHandle& handle) const {
    auto inspected = RunControl({"inspect", "--format", "{{.State.Running}}", handle.id});
    if (!inspected.Succeeded()) {
        spdlog::warn("docker inspect {} failed: {}", ShortId(handle.id),
                     StringUtils::Trim(inspected.stderr_output));
        return false;
    }
    return StringUtils::Trim(inspected.stdout_output) == "true";
}

std::string DockerSandboxDriver::GenerateContainerName() const {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint32_t> dis(0, 0xFFFFFF);

    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    std::ostringstream oss;
    oss << config_.name_prefix << "_" << timestamp << "_"
        << std::hex << std::setw(6) << std::setfill('0') << dis(gen);
    return oss.str();
}

} // namespace sandbox
} // namespace coderun
