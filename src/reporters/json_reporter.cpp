/**
 * @file json_reporter.cpp
 * @brief JSON rendering of execution results and request parsing
 *
 * @date 2025
 */

#include "coderun/reporters/json_reporter.hpp"
#include "coderun/core/execution_errors.hpp"

#include <spdlog/spdlog.h>

namespace coderun {
namespace reporters {

using json = nlohmann::json;

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

json JsonReporter::ToJson(const core::ExecutionResult& result) const {
    json j;
    j["status"] = core::StatusToString(result.status);
    j["language"] = result.language;
    j["stdout"] = result.stdout_output;
    j["stderr"] = result.stderr_output;
    j["exit_code"] = result.exit_code ? json(*result.exit_code) : json(nullptr);
    j["elapsed_ms"] = result.elapsed.count();

    if (config_.include_diagnostics) {
        j["truncated"] = {
            {"stdout", result.stdout_truncated},
            {"stderr", result.stderr_truncated}
        };
        if (!result.error_message.empty()) {
            j["error"] = result.error_message;
        }
        if (result.teardown_failed) {
            j["teardown_failed"] = true;
        }
    }

    return j;
}

std::string JsonReporter::Render(const core::ExecutionResult& result) const {
    const auto j = ToJson(result);
    // Program output may contain arbitrary bytes.
    const int indent = config_.pretty_print ? config_.indent_size : -1;
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

core::ExecutionRequest JsonReporter::ParseRequest(const std::string& json_text) {
    json data;
    try {
        data = json::parse(json_text);
    }
    catch (const json::parse_error& e) {
        throw core::InvalidRequestError(std::string("Request is not valid JSON: ") + e.what());
    }

    if (!data.is_object()) {
        throw core::InvalidRequestError("Request must be a JSON object");
    }
    if (!data.contains("code") || !data["code"].is_string()) {
        throw core::InvalidRequestError("Request field 'code' must be a string");
    }
    if (!data.contains("language") || !data["language"].is_string()) {
        throw core::InvalidRequestError("Request field 'language' must be a string");
    }

    core::ExecutionRequest request;
    request.code = data["code"].get<std::string>();
    request.language = data["language"].get<std::string>();

    spdlog::debug("Parsed request: language={}, {} byte(s) of code",
                  request.language, request.code.size());
    return request;
}

} // namespace reporters
} // namespace coderun
