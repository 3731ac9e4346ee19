/**
 * @file json_reporter.hpp
 * @brief JSON rendering of execution results and parsing of inbound requests
 *
 * Result shape:
 * ```
 * {
 *   "status": "Success" | "RuntimeError" | "CompileError" | "TimedOut" |
 *             "SandboxUnavailable" | "UnknownLanguage" | "AdmissionTimeout" |
 *             "InvalidRequest",
 *   "language": "python",
 *   "stdout": "...", "stderr": "...",
 *   "exit_code": 0 | null,
 *   "elapsed_ms": 12,
 *   "truncated": {"stdout": false, "stderr": false},   // diagnostics
 *   "error": "...",                                    // diagnostics, only when set
 *   "teardown_failed": true                            // diagnostics, only when set
 * }
 * ```
 *
 * Program output is arbitrary bytes; invalid UTF-8 is replaced with U+FFFD
 * when rendering instead of failing the request.
 *
 * @date 2025
 */

#pragma once

#include "coderun/core/execution_types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace coderun {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Rendering options
 */
struct JsonReporterConfig {
    bool pretty_print{true};          ///< Indent output
    int indent_size{2};               ///< Indentation spaces
    bool include_diagnostics{true};   ///< Emit "truncated" and "error"
};

/**
 * @class JsonReporter
 * @brief Result serializer and request parser
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /**
     * @brief Build the JSON value for a result
     */
    nlohmann::json ToJson(const core::ExecutionResult& result) const;

    /**
     * @brief Render a result as text
     */
    std::string Render(const core::ExecutionResult& result) const;

    /**
     * @brief Parse an inbound {"code": ..., "language": ...} document
     * @throws core::InvalidRequestError if the text is not JSON or a field is missing
     */
    static core::ExecutionRequest ParseRequest(const std::string& json_text);

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace coderun
