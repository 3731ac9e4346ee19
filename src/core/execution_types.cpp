/**
 * @file execution_types.cpp
 * @brief Status names and classification helpers
 *
 * @date 2025
 */

#include "coderun/core/execution_types.hpp"

#include <array>
#include <utility>

namespace coderun {
namespace core {

namespace {

constexpr std::array<std::pair<ExecutionStatus, const char*>, 8> kStatusNames = {{
    {ExecutionStatus::SUCCESS, "Success"},
    {ExecutionStatus::RUNTIME_ERROR, "RuntimeError"},
    {ExecutionStatus::COMPILE_ERROR, "CompileError"},
    {ExecutionStatus::TIMED_OUT, "TimedOut"},
    {ExecutionStatus::SANDBOX_UNAVAILABLE, "SandboxUnavailable"},
    {ExecutionStatus::UNKNOWN_LANGUAGE, "UnknownLanguage"},
    {ExecutionStatus::ADMISSION_TIMEOUT, "AdmissionTimeout"},
    {ExecutionStatus::INVALID_REQUEST, "InvalidRequest"},
}};

} // anonymous namespace

const char* StatusToString(ExecutionStatus status) {
    for (const auto& [value, name] : kStatusNames) {
        if (value == status) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<ExecutionStatus> StatusFromString(const std::string& name) {
    for (const auto& [value, status_name] : kStatusNames) {
        if (name == status_name) {
            return value;
        }
    }
    return std::nullopt;
}

bool IsRequestFailure(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::UNKNOWN_LANGUAGE:
        case ExecutionStatus::ADMISSION_TIMEOUT:
        case ExecutionStatus::SANDBOX_UNAVAILABLE:
        case ExecutionStatus::INVALID_REQUEST:
            return true;
        default:
            return false;
    }
}

} // namespace core
} // namespace coderun
