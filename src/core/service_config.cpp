/**
 * @file service_config.cpp
 * @brief JSON configuration loading, environment overrides and validation
 *
 * @date 2025
 */

#include "coderun/core/service_config.hpp"
#include "coderun/core/execution_errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace coderun {
namespace core {

using json = nlohmann::json;

namespace {

// Upper bound for every duration setting; keeps deadline arithmetic on
// steady_clock well clear of overflow.
constexpr std::chrono::milliseconds kMaxDuration = std::chrono::hours(24);

void CheckDuration(std::chrono::milliseconds value, const std::string& key) {
    if (value > kMaxDuration) {
        throw ConfigError(key + " must not exceed " + std::to_string(kMaxDuration.count()) + " ms");
    }
}

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

[[noreturn]] void WrongType(const std::string& key, const char* expected) {
    throw ConfigError("Setting '" + key + "' must be " + expected);
}

std::size_t ReadCount(const json& value, const std::string& key) {
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        WrongType(key, "a non-negative integer");
    }
    return value.get<std::size_t>();
}

std::chrono::milliseconds ReadMillis(const json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        WrongType(key, "an integer number of milliseconds");
    }
    return std::chrono::milliseconds(value.get<long long>());
}

double ReadNumber(const json& value, const std::string& key) {
    if (!value.is_number()) {
        WrongType(key, "a number");
    }
    return value.get<double>();
}

std::string ReadString(const json& value, const std::string& key) {
    if (!value.is_string()) {
        WrongType(key, "a string");
    }
    return value.get<std::string>();
}

bool ReadBool(const json& value, const std::string& key) {
    if (!value.is_boolean()) {
        WrongType(key, "true or false");
    }
    return value.get<bool>();
}

std::vector<std::string> ReadCommand(const json& value, const std::string& key) {
    if (!value.is_array()) {
        WrongType(key, "an array of strings");
    }
    std::vector<std::string> argv;
    for (const auto& item : value) {
        if (!item.is_string()) {
            WrongType(key, "an array of strings");
        }
        argv.push_back(item.get<std::string>());
    }
    return argv;
}

LanguageOverride ParseOverride(const json& data, const std::string& id) {
    if (!data.is_object()) {
        WrongType("overrides." + id, "an object");
    }

    const std::string prefix = "overrides." + id + ".";
    LanguageOverride entry;
    if (data.contains("time_limit_ms")) {
        entry.time_limit = ReadMillis(data["time_limit_ms"], prefix + "time_limit_ms");
    }
    if (data.contains("memory_limit_mb")) {
        entry.memory_limit_mb = ReadCount(data["memory_limit_mb"], prefix + "memory_limit_mb");
    }
    if (data.contains("cpu_limit")) {
        entry.cpu_limit = ReadNumber(data["cpu_limit"], prefix + "cpu_limit");
    }
    if (data.contains("image")) {
        entry.image_reference = ReadString(data["image"], prefix + "image");
    }
    return entry;
}

LanguageProfile ParseLanguage(const json& data, std::size_t index) {
    const std::string prefix = "languages[" + std::to_string(index) + "].";
    if (!data.is_object()) {
        WrongType("languages[" + std::to_string(index) + "]", "an object");
    }
    for (const char* required : {"id", "image", "source_filename", "run_command"}) {
        if (!data.contains(required)) {
            throw ConfigError("Setting '" + prefix + required + "' is required");
        }
    }

    LanguageProfileBuilder builder(ReadString(data["id"], prefix + "id"));
    builder.WithImage(ReadString(data["image"], prefix + "image"))
           .WithSourceFile(ReadString(data["source_filename"], prefix + "source_filename"))
           .WithRunCommand(ReadCommand(data["run_command"], prefix + "run_command"));

    if (data.contains("compile_command") && !data["compile_command"].is_null()) {
        builder.WithCompileCommand(ReadCommand(data["compile_command"], prefix + "compile_command"));
    }
    if (data.contains("memory_limit_mb")) {
        builder.WithMemoryLimit(ReadCount(data["memory_limit_mb"], prefix + "memory_limit_mb"));
    }
    if (data.contains("cpu_limit")) {
        builder.WithCPULimit(ReadNumber(data["cpu_limit"], prefix + "cpu_limit"));
    }
    if (data.contains("pids_limit")) {
        const auto pids = ReadCount(data["pids_limit"], prefix + "pids_limit");
        if (pids > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            WrongType(prefix + "pids_limit", "a reasonable process count");
        }
        builder.WithPidsLimit(static_cast<int>(pids));
    }
    if (data.contains("time_limit_ms")) {
        builder.WithTimeLimit(ReadMillis(data["time_limit_ms"], prefix + "time_limit_ms"));
    }
    if (data.contains("compile_time_limit_ms")) {
        builder.WithCompileTimeLimit(ReadMillis(data["compile_time_limit_ms"], prefix + "compile_time_limit_ms"));
    }
    return builder.Build();
}

void ApplyConfigFromJson(ServiceConfig& config, const json& data) {
    if (!data.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    for (const auto& item : data.items()) {
        const auto& key = item.key();
        const auto& value = item.value();

        if (key == "max_concurrent_executions") {
            config.max_concurrent_executions = ReadCount(value, key);
        } else if (key == "queue_wait_timeout_ms") {
            config.queue_wait_timeout = ReadMillis(value, key);
        } else if (key == "max_output_bytes") {
            config.max_output_bytes = ReadCount(value, key);
        } else if (key == "max_code_bytes") {
            config.max_code_bytes = ReadCount(value, key);
        } else if (key == "compile_time_limit_ms") {
            config.compile_time_limit = ReadMillis(value, key);
        } else if (key == "kill_grace_ms") {
            config.kill_grace = ReadMillis(value, key);
        } else if (key == "runtime") {
            config.runtime_binary = ReadString(value, key);
        } else if (key == "network_enabled") {
            config.network_enabled = ReadBool(value, key);
        } else if (key == "overrides") {
            if (!value.is_object()) {
                WrongType(key, "an object keyed by language id");
            }
            for (const auto& entry : value.items()) {
                config.overrides[entry.key()] = ParseOverride(entry.value(), entry.key());
            }
        } else if (key == "languages") {
            if (!value.is_array()) {
                WrongType(key, "an array of language profiles");
            }
            config.languages.clear();
            for (std::size_t i = 0; i < value.size(); ++i) {
                config.languages.push_back(ParseLanguage(value[i], i));
            }
        } else {
            spdlog::warn("Ignoring unknown configuration key '{}'", key);
        }
    }
}

std::size_t ParseEnvCount(const char* name, const std::string& text) {
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value < 0) {
            throw std::invalid_argument(text);
        }
        return static_cast<std::size_t>(value);
    }
    catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " must be a non-negative integer, got '" + text + "'");
    }
}

} // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

ServiceConfig ParseConfig(const std::string& json_text) {
    json data;
    try {
        data = json::parse(json_text);
    }
    catch (const json::parse_error& e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }

    ServiceConfig config;
    ApplyConfigFromJson(config, data);
    return config;
}

ServiceConfig LoadConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::info("Loading configuration from {}", path.string());
    return ParseConfig(buffer.str());
}

void ApplyEnvironment(ServiceConfig& config) {
    const auto capacity = GetEnv("CODERUN_MAX_CONCURRENT");
    if (!capacity.empty()) {
        config.max_concurrent_executions = ParseEnvCount("CODERUN_MAX_CONCURRENT", capacity);
        spdlog::debug("CODERUN_MAX_CONCURRENT={}", config.max_concurrent_executions);
    }

    const auto queue_timeout = GetEnv("CODERUN_QUEUE_TIMEOUT_MS");
    if (!queue_timeout.empty()) {
        config.queue_wait_timeout = std::chrono::milliseconds(
            ParseEnvCount("CODERUN_QUEUE_TIMEOUT_MS", queue_timeout));
        spdlog::debug("CODERUN_QUEUE_TIMEOUT_MS={}", config.queue_wait_timeout.count());
    }

    const auto runtime = GetEnv("CODERUN_RUNTIME");
    if (!runtime.empty()) {
        config.runtime_binary = runtime;
        spdlog::debug("CODERUN_RUNTIME={}", config.runtime_binary);
    }
}

// ============================================================================
// VALIDATION
// ============================================================================

void ValidateConfig(const ServiceConfig& config) {
    if (config.max_concurrent_executions == 0) {
        throw ConfigError("max_concurrent_executions must be at least 1");
    }
    if (config.queue_wait_timeout.count() < 0) {
        throw ConfigError("queue_wait_timeout_ms must not be negative");
    }
    if (config.max_output_bytes == 0) {
        throw ConfigError("max_output_bytes must be at least 1");
    }
    if (config.max_code_bytes == 0) {
        throw ConfigError("max_code_bytes must be at least 1");
    }
    if (config.compile_time_limit.count() <= 0) {
        throw ConfigError("compile_time_limit_ms must be positive");
    }
    if (config.kill_grace.count() < 0) {
        throw ConfigError("kill_grace_ms must not be negative");
    }
    CheckDuration(config.queue_wait_timeout, "queue_wait_timeout_ms");
    CheckDuration(config.compile_time_limit, "compile_time_limit_ms");
    CheckDuration(config.kill_grace, "kill_grace_ms");
    for (const auto& [id, entry] : config.overrides) {
        if (entry.time_limit) {
            CheckDuration(*entry.time_limit, "overrides." + id + ".time_limit_ms");
        }
    }
    for (const auto& profile : config.languages) {
        CheckDuration(profile.limits.time_limit, "languages." + profile.language_id + ".time_limit_ms");
        if (profile.compile_time_limit) {
            CheckDuration(*profile.compile_time_limit,
                          "languages." + profile.language_id + ".compile_time_limit_ms");
        }
    }
    if (config.runtime_binary.empty()) {
        throw ConfigError("runtime must name a container CLI");
    }
}

LanguageRegistry BuildLanguageRegistry(const ServiceConfig& config) {
    LanguageRegistry registry;

    try {
        for (const auto& profile : LanguageRegistry::BuiltinProfiles()) {
            registry.Register(profile);
        }
        for (const auto& profile : config.languages) {
            registry.Register(profile);
        }

        for (const auto& [id, entry] : config.overrides) {
            const LanguageProfile* base = registry.Find(id);
            if (base == nullptr) {
                throw ConfigError("Override for unknown language '" + id + "'");
            }

            LanguageProfile adjusted = *base;
            if (entry.time_limit) {
                adjusted.limits.time_limit = *entry.time_limit;
            }
            if (entry.memory_limit_mb) {
                adjusted.limits.memory_limit_mb = *entry.memory_limit_mb;
            }
            if (entry.cpu_limit) {
                adjusted.limits.cpu_limit = *entry.cpu_limit;
            }
            if (entry.image_reference) {
                adjusted.image_reference = *entry.image_reference;
            }
            registry.Register(adjusted);
        }
    }
    catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    // Profiles without their own compile limit fall back to the service one.
    for (const auto& id : registry.ListLanguages()) {
        const LanguageProfile& profile = registry.Resolve(id);
        if (profile.RequiresCompilation() && !profile.compile_time_limit &&
            config.compile_time_limit >= profile.limits.time_limit) {
            throw ConfigError("compile_time_limit_ms (" + std::to_string(config.compile_time_limit.count()) +
                              ") must be shorter than the time limit of '" + id + "' (" +
                              std::to_string(profile.limits.time_limit.count()) + " ms)");
        }
    }

    spdlog::debug("Language registry built with {} profile(s)", registry.Size());
    return registry;
}

ExecutionOrchestrator::Config MakeOrchestratorConfig(const ServiceConfig& config) {
    ExecutionOrchestrator::Config orchestrator;
    orchestrator.compile_time_limit = config.compile_time_limit;
    orchestrator.kill_grace = config.kill_grace;
    orchestrator.max_output_bytes = config.max_output_bytes;
    orchestrator.max_code_bytes = config.max_code_bytes;
    orchestrator.network_enabled = config.network_enabled;
    return orchestrator;
}

} // namespace core
} // namespace coderun
