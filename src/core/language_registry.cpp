/**
 * @file language_registry.cpp
 * @brief Built-in language profiles and exact-match lookup
 *
 * **Built-in Profiles**:
 * | id         | image              | compile                               | run               |
 * |------------|--------------------|---------------------------------------|-------------------|
 * | c          | gcc:13             | gcc -O2 -o main main.c -lm            | ./main            |
 * | cpp        | gcc:13             | g++ -O2 -std=c++17 -o main main.cpp   | ./main            |
 * | python     | python:3.12-slim   | -                                     | python3 main.py   |
 * | python2    | python:2.7-slim    | -                                     | python2 main.py   |
 * | javascript | node:20-slim       | -                                     | node main.js      |
 *
 * All built-ins use the default ResourceLimits (1 GiB, 1 CPU, 1024 pids,
 * 10 s run limit). Images are expected to be pulled in advance.
 *
 * @date 2025
 */

#include "coderun/core/language_registry.hpp"
#include "coderun/core/execution_errors.hpp"
#include "coderun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace coderun {
namespace core {

LanguageRegistry::LanguageRegistry(const std::vector<LanguageProfile>& profiles) {
    for (const auto& profile : profiles) {
        Register(profile);
    }
}

LanguageRegistry LanguageRegistry::WithBuiltins() {
    return LanguageRegistry(BuiltinProfiles());
}

std::vector<LanguageProfile> LanguageRegistry::BuiltinProfiles() {
    std::vector<LanguageProfile> profiles;

    profiles.push_back(LanguageProfileBuilder("c")
        .WithImage("gcc:13")
        .WithSourceFile("main.c")
        .WithCompileCommand({"gcc", "-O2", "-o", "main", "main.c", "-lm"})
        .WithRunCommand({"./main"})
        .Build());

    profiles.push_back(LanguageProfileBuilder("cpp")
        .WithImage("gcc:13")
        .WithSourceFile("main.cpp")
        .WithCompileCommand({"g++", "-O2", "-std=c++17", "-o", "main", "main.cpp"})
        .WithRunCommand({"./main"})
        .Build());

    profiles.push_back(LanguageProfileBuilder("python")
        .WithImage("python:3.12-slim")
        .WithSourceFile("main.py")
        .WithRunCommand({"python3", "main.py"})
        .Build());

    profiles.push_back(LanguageProfileBuilder("python2")
        .WithImage("python:2.7-slim")
        .WithSourceFile("main.py")
        .WithRunCommand({"python2", "main.py"})
        .Build());

    profiles.push_back(LanguageProfileBuilder("javascript")
        .WithImage("node:20-slim")
        .WithSourceFile("main.js")
        .WithRunCommand({"node", "main.js"})
        .Build());

    return profiles;
}

std::string LanguageRegistry::ValidateProfile(const LanguageProfile& profile) {
    if (profile.language_id.empty()) {
        return "language id is empty";
    }
    if (profile.image_reference.empty()) {
        return "image reference is empty";
    }
    if (!utils::StringUtils::IsPlainFileName(profile.source_filename)) {
        return "source file name '" + profile.source_filename + "' is not a plain file name";
    }
    if (profile.run_command.empty() || profile.run_command.front().empty()) {
        return "run command is empty";
    }
    if (profile.compile_command.has_value() &&
        !profile.compile_command->empty() &&
        profile.compile_command->front().empty()) {
        return "compile command has an empty program name";
    }
    if (profile.limits.memory_limit_mb == 0) {
        return "memory limit is zero";
    }
    if (profile.limits.cpu_limit <= 0.0) {
        return "cpu limit must be positive";
    }
    if (profile.limits.pids_limit <= 0) {
        return "pids limit must be positive";
    }
    if (profile.limits.time_limit.count() <= 0) {
        return "time limit must be positive";
    }
    if (profile.compile_time_limit.has_value()) {
        if (profile.compile_time_limit->count() <= 0) {
            return "compile time limit must be positive";
        }
        if (*profile.compile_time_limit >= profile.limits.time_limit) {
            return "compile time limit must be shorter than the time limit";
        }
    }
    return "";
}

void LanguageRegistry::Register(const LanguageProfile& profile) {
    auto problem = ValidateProfile(profile);
    if (!problem.empty()) {
        throw std::invalid_argument("Invalid profile '" + profile.language_id + "': " + problem);
    }

    auto [it, inserted] = profiles_.insert_or_assign(profile.language_id, profile);
    spdlog::debug("{} language profile '{}' (image: {}, compiled: {})",
                  inserted ? "Registered" : "Replaced",
                  it->first, it->second.image_reference,
                  it->second.RequiresCompilation());
}

const LanguageProfile& LanguageRegistry::Resolve(const std::string& language_id) const {
    auto it = profiles_.find(language_id);
    if (it == profiles_.end()) {
        throw UnknownLanguageError(language_id);
    }
    return it->second;
}

const LanguageProfile* LanguageRegistry::Find(const std::string& language_id) const {
    auto it = profiles_.find(language_id);
    return it == profiles_.end() ? nullptr : &it->second;
}

bool LanguageRegistry::Contains(const std::string& language_id) const {
    return profiles_.count(language_id) > 0;
}

std::vector<std::string> LanguageRegistry::ListLanguages() const {
    std::vector<std::string> ids;
    ids.reserve(profiles_.size());
    for (const auto& entry : profiles_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace core
} // namespace coderun
