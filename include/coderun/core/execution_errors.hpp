/**
 * @file execution_errors.hpp
 * @brief Exception types for request-level failures
 *
 * Each error carries the ExecutionStatus it maps to, so the orchestrator can
 * turn any of them into an ExecutionResult without per-type branching.
 *
 * @date 2025
 */

#pragma once

#include "coderun/core/execution_types.hpp"

#include <stdexcept>
#include <string>
#include <chrono>

namespace coderun {
namespace core {

/**
 * @class ExecutionError
 * @brief Base class for failures that abort a request before an outcome
 */
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(ExecutionStatus status, const std::string& message)
        : std::runtime_error(message)
        , status_(status) {
    }

    ExecutionStatus Status() const noexcept { return status_; }

private:
    ExecutionStatus status_;
};

/**
 * @class UnknownLanguageError
 * @brief No profile is registered under the requested language id
 */
class UnknownLanguageError : public ExecutionError {
public:
    explicit UnknownLanguageError(const std::string& language_id)
        : ExecutionError(ExecutionStatus::UNKNOWN_LANGUAGE,
                         "Unknown language: '" + language_id + "'")
        , language_id_(language_id) {
    }

    const std::string& LanguageId() const noexcept { return language_id_; }

private:
    std::string language_id_;
};

/**
 * @class AdmissionTimeoutError
 * @brief Queue wait for an execution slot exceeded its timeout
 */
class AdmissionTimeoutError : public ExecutionError {
public:
    explicit AdmissionTimeoutError(std::chrono::milliseconds waited)
        : ExecutionError(ExecutionStatus::ADMISSION_TIMEOUT,
                         "No execution slot available after " +
                         std::to_string(waited.count()) + " ms")
        , waited_(waited) {
    }

    std::chrono::milliseconds Waited() const noexcept { return waited_; }

private:
    std::chrono::milliseconds waited_;
};

/**
 * @class SandboxUnavailableError
 * @brief Container runtime failed to create, populate or drive a sandbox
 */
class SandboxUnavailableError : public ExecutionError {
public:
    explicit SandboxUnavailableError(const std::string& message)
        : ExecutionError(ExecutionStatus::SANDBOX_UNAVAILABLE, message) {
    }
};

/**
 * @class InvalidRequestError
 * @brief Request rejected before lookup (empty or oversized code)
 */
class InvalidRequestError : public ExecutionError {
public:
    explicit InvalidRequestError(const std::string& message)
        : ExecutionError(ExecutionStatus::INVALID_REQUEST, message) {
    }
};

/**
 * @class ConfigError
 * @brief Malformed or inconsistent service configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {
    }
};

} // namespace core
} // namespace coderun
