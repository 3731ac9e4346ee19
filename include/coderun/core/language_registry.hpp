/**
 * @file language_registry.hpp
 * @brief Language id to execution profile mapping
 *
 * A LanguageProfile is the per-language recipe consumed uniformly by the
 * orchestrator: which image to provision, where to put the submitted code,
 * what (if anything) to compile, what to run, and the resource limits to
 * apply. Compile-then-run and run-only languages differ only in whether
 * `compile_command` is present.
 *
 * The registry is populated once at startup and then shared read-only
 * (typically as `std::shared_ptr<const LanguageRegistry>`) between all
 * concurrent executions. Resolve() is a const, lock-free lookup.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstddef>

namespace coderun {
namespace core {

/**
 * @struct ResourceLimits
 * @brief Per-sandbox resource ceilings
 *
 * Defaults follow the container settings the service has always used:
 * 1 GiB of memory without swap, one CPU, 1024 processes.
 */
struct ResourceLimits {
    std::size_t memory_limit_mb{1024};               ///< Memory ceiling (MiB), swap disabled
    double cpu_limit{1.0};                           ///< CPU share (cores)
    int pids_limit{1024};                            ///< Maximum process count
    std::chrono::milliseconds time_limit{10000};     ///< Run step wall-clock limit
};

/**
 * @struct LanguageProfile
 * @brief Immutable execution recipe for one language
 */
struct LanguageProfile {
    std::string language_id;                               ///< Exact lookup key
    std::string image_reference;                           ///< Pre-built sandbox image
    std::string source_filename;                           ///< File the code is injected as
    std::optional<std::vector<std::string>> compile_command;  ///< Optional compile argv
    std::vector<std::string> run_command;                  ///< Run argv
    ResourceLimits limits;                                 ///< Resource ceilings
    std::optional<std::chrono::milliseconds> compile_time_limit;  ///< Falls back to service default

    bool RequiresCompilation() const {
        return compile_command.has_value() && !compile_command->empty();
    }
};

/**
 * @class LanguageRegistry
 * @brief Exact-match lookup of language profiles
 *
 * Lookup is case-sensitive and never guesses: "Python" does not resolve to
 * "python". Register() is only meant for startup; once the registry is
 * shared, it must not be mutated.
 *
 * **Usage Example**:
 * @code
 * auto registry = std::make_shared<LanguageRegistry>(LanguageRegistry::WithBuiltins());
 * const auto& profile = registry->Resolve("python");   // throws UnknownLanguageError
 * @endcode
 */
class LanguageRegistry {
public:
    LanguageRegistry() = default;

    /**
     * @brief Build a registry from a list of profiles
     * @throws std::invalid_argument if a profile is malformed
     */
    explicit LanguageRegistry(const std::vector<LanguageProfile>& profiles);

    /**
     * @brief Registry populated with BuiltinProfiles()
     */
    static LanguageRegistry WithBuiltins();

    /**
     * @brief Profiles shipped with the service (c, cpp, python, python2, javascript)
     */
    static std::vector<LanguageProfile> BuiltinProfiles();

    /**
     * @brief Add or replace a profile
     *
     * Validates that the id, image, source file name and run command are
     * present, and that the source file name is a bare file name (no path
     * separators, not "." or "..").
     *
     * @throws std::invalid_argument if the profile is malformed
     */
    void Register(const LanguageProfile& profile);

    /**
     * @brief Resolve a language id to its profile
     * @param language_id Exact, case-sensitive id
     * @return Reference valid for the registry's lifetime
     * @throws UnknownLanguageError if no profile is registered
     */
    const LanguageProfile& Resolve(const std::string& language_id) const;

    /**
     * @brief Non-throwing lookup
     */
    const LanguageProfile* Find(const std::string& language_id) const;

    bool Contains(const std::string& language_id) const;

    /**
     * @brief Registered ids in lexical order
     */
    std::vector<std::string> ListLanguages() const;

    std::size_t Size() const { return profiles_.size(); }

    /**
     * @brief Check a profile without registering it
     * @return Empty string if valid, otherwise the reason
     */
    static std::string ValidateProfile(const LanguageProfile& profile);

private:
    std::map<std::string, LanguageProfile> profiles_;
};

/**
 * @class LanguageProfileBuilder
 * @brief Fluent API for constructing language profiles
 *
 * **Usage Example**:
 * @code
 * auto profile = LanguageProfileBuilder("c")
 *     .WithImage("gcc:13")
 *     .WithSourceFile("main.c")
 *     .WithCompileCommand({"gcc", "-O2", "-o", "main", "main.c"})
 *     .WithRunCommand({"./main"})
 *     .WithTimeLimit(std::chrono::seconds(5))
 *     .Build();
 * @endcode
 */
class LanguageProfileBuilder {
public:
    explicit LanguageProfileBuilder(const std::string& language_id) {
        profile_.language_id = language_id;
    }

    LanguageProfileBuilder& WithImage(const std::string& image) {
        profile_.image_reference = image;
        return *this;
    }

    LanguageProfileBuilder& WithSourceFile(const std::string& filename) {
        profile_.source_filename = filename;
        return *this;
    }

    LanguageProfileBuilder& WithCompileCommand(const std::vector<std::string>& command) {
        profile_.compile_command = command;
        return *this;
    }

    LanguageProfileBuilder& WithRunCommand(const std::vector<std::string>& command) {
        profile_.run_command = command;
        return *this;
    }

    LanguageProfileBuilder& WithMemoryLimit(std::size_t mb) {
        profile_.limits.memory_limit_mb = mb;
        return *this;
    }

    LanguageProfileBuilder& WithCPULimit(double cpus) {
        profile_.limits.cpu_limit = cpus;
        return *this;
    }

    LanguageProfileBuilder& WithPidsLimit(int pids) {
        profile_.limits.pids_limit = pids;
        return *this;
    }

    LanguageProfileBuilder& WithTimeLimit(std::chrono::milliseconds limit) {
        profile_.limits.time_limit = limit;
        return *this;
    }

    LanguageProfileBuilder& WithCompileTimeLimit(std::chrono::milliseconds limit) {
        profile_.compile_time_limit = limit;
        return *this;
    }

    LanguageProfile Build() const {
        return profile_;
    }

private:
    LanguageProfile profile_;
};

} // namespace core
} // namespace coderun
