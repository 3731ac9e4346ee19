/**
 * @file main.cpp
 * @brief coderun - execute one untrusted program in a disposable sandbox
 *
 * Reads source code from a file, the command line or stdin, runs it through
 * the execution orchestrator and prints the JSON result on stdout. Logs go
 * to stderr.
 *
 * Exit codes: 0 when the program was executed (whatever its own outcome),
 * 1 when the request failed before or around execution, 2 for usage or
 * configuration errors.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "coderun/core/admission_controller.hpp"
#include "coderun/core/execution_errors.hpp"
#include "coderun/core/execution_orchestrator.hpp"
#include "coderun/core/service_config.hpp"
#include "coderun/reporters/json_reporter.hpp"
#include "coderun/sandbox/docker_sandbox_driver.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

namespace {

constexpr int kExitExecuted = 0;
constexpr int kExitRequestFailed = 1;
constexpr int kExitUsage = 2;

std::string ReadStream(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string ReadFile(const std::string& path) {
    if (path == "-") {
        return ReadStream(std::cin);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw coderun::core::ConfigError("Cannot read " + path);
    }
    return ReadStream(file);
}

void PrintLanguages(const coderun::core::LanguageRegistry& registry) {
    for (const auto& id : registry.ListLanguages()) {
        const auto& profile = registry.Resolve(id);
        std::cout << id << "\t" << profile.image_reference
                  << (profile.RequiresCompilation() ? "\tcompiled" : "\tinterpreted")
                  << "\t" << profile.limits.time_limit.count() << " ms\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{"coderun - run untrusted code in a disposable container"};

    std::string language;
    std::string source_file;
    std::string inline_code;
    std::string request_file;
    std::string config_path;
    bool verbose = false;
    bool list_languages = false;
    bool cleanup_orphans = false;

    app.add_option("-l,--language", language, "Language id (see --list-languages)");
    auto* file_opt = app.add_option("-f,--file", source_file, "Source file to run ('-' for stdin)");
    auto* code_opt = app.add_option("-c,--code", inline_code, "Source code to run");
    auto* request_opt = app.add_option("-r,--request", request_file,
                                       "JSON request {\"code\", \"language\"} ('-' for stdin)");
    file_opt->excludes(code_opt);
    request_opt->excludes(file_opt)->excludes(code_opt);

    app.add_option("--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--list-languages", list_languages, "Print the configured languages and exit");
    app.add_flag("--cleanup-orphans", cleanup_orphans,
                 "Remove containers left behind by earlier runs and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        return code == 0 ? 0 : kExitUsage;
    }

    // stdout carries the result document.
    spdlog::set_default_logger(spdlog::stderr_color_mt("coderun"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    coderun::core::ServiceConfig config;
    std::shared_ptr<const coderun::core::LanguageRegistry> registry;
    try {
        if (!config_path.empty()) {
            config = coderun::core::LoadConfigFile(config_path);
        }
        coderun::core::ApplyEnvironment(config);
        coderun::core::ValidateConfig(config);
        registry = std::make_shared<coderun::core::LanguageRegistry>(
            coderun::core::BuildLanguageRegistry(config));
    } catch (const coderun::core::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitUsage;
    }

    if (list_languages) {
        PrintLanguages(*registry);
        return kExitExecuted;
    }

    coderun::sandbox::DockerDriverConfig driver_config;
    driver_config.runtime_binary = config.runtime_binary;
    auto driver = std::make_shared<coderun::sandbox::DockerSandboxDriver>(driver_config);

    if (cleanup_orphans) {
        if (!driver->IsRuntimeAvailable()) {
            spdlog::error("Container runtime '{}' is not reachable", config.runtime_binary);
            return kExitRequestFailed;
        }
        const auto removed = driver->RemoveOrphans();
        spdlog::info("Removed {} orphaned container(s)", removed);
        return kExitExecuted;
    }

    coderun::core::ExecutionRequest request;
    try {
        if (request_opt->count() > 0) {
            request = coderun::reporters::JsonReporter::ParseRequest(ReadFile(request_file));
        } else {
            if (language.empty()) {
                spdlog::error("--language is required unless --request is given");
                return kExitUsage;
            }
            request.language = language;
            // An explicit -c "" is an empty program, not a request to read stdin.
            if (code_opt->count() > 0) {
                request.code = inline_code;
            } else {
                request.code = ReadFile(source_file.empty() ? "-" : source_file);
            }
        }
    } catch (const coderun::core::ConfigError& e) {
        spdlog::error("{}", e.what());
        return kExitUsage;
    } catch (const coderun::core::InvalidRequestError& e) {
        spdlog::error("{}", e.what());
        return kExitUsage;
    }

    auto admission = std::make_shared<coderun::core::AdmissionController>(
        config.max_concurrent_executions, config.queue_wait_timeout);

    coderun::core::ExecutionOrchestrator orchestrator(
        registry, driver, admission, coderun::core::MakeOrchestratorConfig(config));

    const auto result = orchestrator.Execute(request);

    coderun::reporters::JsonReporter reporter;
    std::cout << reporter.Render(result) << std::endl;

    return coderun::core::IsRequestFailure(result.status)
        ? kExitRequestFailed
        : kExitExecuted;
}
