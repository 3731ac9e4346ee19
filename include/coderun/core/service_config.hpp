/**
 * @file service_config.hpp
 * @brief Service configuration loaded once at startup
 *
 * **File Format** (JSON, every key optional):
 * ```
 * {
 *   "max_concurrent_executions": 4,
 *   "queue_wait_timeout_ms": 30000,
 *   "max_output_bytes": 65536,
 *   "max_code_bytes": 65536,
 *   "compile_time_limit_ms": 5000,
 *   "kill_grace_ms": 2000,
 *   "runtime": "docker",
 *   "network_enabled": false,
 *   "overrides": {
 *     "python": {"time_limit_ms": 2000, "memory_limit_mb": 256, "cpu_limit": 0.5, "image": "python:3.11"}
 *   },
 *   "languages": [
 *     {"id": "ruby", "image": "ruby:3.3", "source_filename": "main.rb",
 *      "run_command": ["ruby", "main.rb"], "time_limit_ms": 5000}
 *   ]
 * }
 * ```
 *
 * Environment variables CODERUN_MAX_CONCURRENT, CODERUN_QUEUE_TIMEOUT_MS and
 * CODERUN_RUNTIME take precedence over the file.
 *
 * @date 2025
 */

#pragma once

#include "coderun/core/language_registry.hpp"
#include "coderun/core/execution_orchestrator.hpp"

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <filesystem>
#include <cstddef>

namespace coderun {
namespace core {

/**
 * @struct LanguageOverride
 * @brief Per-language adjustments applied on top of a profile
 */
struct LanguageOverride {
    std::optional<std::chrono::milliseconds> time_limit;  ///< Run step limit
    std::optional<std::size_t> memory_limit_mb;           ///< Memory ceiling
    std::optional<double> cpu_limit;                      ///< CPU share
    std::optional<std::string> image_reference;           ///< Replacement image
};

/**
 * @struct ServiceConfig
 * @brief Everything the service reads at startup
 */
struct ServiceConfig {
    std::size_t max_concurrent_executions{4};             ///< Admission capacity
    std::chrono::milliseconds queue_wait_timeout{30000};  ///< Admission queue wait
    std::size_t max_output_bytes{64 * 1024};              ///< Per-stream output cap
    std::size_t max_code_bytes{64 * 1024};                ///< Submitted code cap
    std::chrono::milliseconds compile_time_limit{5000};   ///< Default compile step limit
    std::chrono::milliseconds kill_grace{2000};           ///< Watchdog slack
    std::string runtime_binary{"docker"};                 ///< Container CLI
    bool network_enabled{false};                          ///< Sandbox network access

    std::map<std::string, LanguageOverride> overrides;    ///< Keyed by language id
    std::vector<LanguageProfile> languages;               ///< Extra or replacement profiles
};

/**
 * @brief Parse configuration from JSON text
 * @throws ConfigError on malformed JSON or wrongly typed values
 */
ServiceConfig ParseConfig(const std::string& json_text);

/**
 * @brief Read and parse a configuration file
 * @throws ConfigError if the file cannot be read or parsed
 */
ServiceConfig LoadConfigFile(const std::filesystem::path& path);

/**
 * @brief Apply CODERUN_* environment overrides
 * @throws ConfigError if a variable holds a non-numeric value where a number is expected
 */
void ApplyEnvironment(ServiceConfig& config);

/**
 * @brief Reject configurations the service cannot run with
 * @throws ConfigError naming the offending setting
 */
void ValidateConfig(const ServiceConfig& config);

/**
 * @brief Built-in profiles, replaced by configured ones, with overrides applied
 * @throws ConfigError if an override names an unknown language or a profile is invalid
 */
LanguageRegistry BuildLanguageRegistry(const ServiceConfig& config);

/**
 * @brief Orchestrator settings derived from the service configuration
 */
ExecutionOrchestrator::Config MakeOrchestratorConfig(const ServiceConfig& config);

} // namespace core
} // namespace coderun
