/**
 * @file main.cpp
 * @brief sealbox-run - run one script in the sandbox from the command line
 *
 * Loads the script and its parameters, builds an engine from the optional
 * configuration file and prints the ExecutionResult as JSON on stdout.
 * Diagnostics go to stderr.
 *
 * Exit codes: 0 on success, 2 when the run ended with any other status,
 * 1 on usage, configuration or I/O errors.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "sealbox/core/engine_config.hpp"
#include "sealbox/core/execution_engine.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailedRun = 2;

std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw sealbox::SealboxError("Cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

json ParseParams(const std::string& text, const std::string& origin) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw sealbox::SealboxError("Invalid JSON in " + origin + ": " + e.what());
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sealbox-run - execute a script in the Sealbox sandbox"};

    std::string script_path;
    std::string params_json;
    std::string params_file;
    std::string config_path;
    std::string secrets_path;
    std::string audit_log;
    std::string function_id = "cli";
    std::string entry_point = "main";
    std::int64_t user_id = 1;
    std::size_t memory_mb = 0;
    std::int64_t timeout_ms = 0;
    bool verbose = false;
    bool pretty = false;

    app.add_option("script", script_path, "Path to the script to execute")
        ->required()
        ->check(CLI::ExistingFile);

    auto* params_opt = app.add_option("--params", params_json, "Parameters as a JSON document");
    app.add_option("--params-file", params_file, "Read parameters from a JSON file")
        ->check(CLI::ExistingFile)
        ->excludes(params_opt);

    app.add_option("--user", user_id, "Tenant user ID")->default_val(1);
    app.add_option("--function", function_id, "Function ID")->default_val("cli");
    app.add_option("--entry", entry_point, "Entry point name")->default_val("main");
    app.add_option("--memory-mb", memory_mb, "Memory ceiling in MB (default from config)");
    app.add_option("--timeout-ms", timeout_ms, "Time ceiling in milliseconds (default from config)");
    app.add_option("--config", config_path, "Engine configuration file (JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("--secrets", secrets_path, "Secrets file for the in-memory store (JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("--audit-log", audit_log, "Append audit entries to this JSON lines file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--pretty", pretty, "Indent the JSON result");

    CLI11_PARSE(app, argc, argv);

    // Keep stdout for the result document
    spdlog::set_default_logger(spdlog::stderr_color_mt("sealbox"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    sealbox::core::ExecutionResult result;
    try {
        sealbox::core::EngineConfig config;
        if (!config_path.empty()) {
            config = sealbox::core::ConfigLoader::LoadFromFile(config_path);
        }
        config.verbose_logging = config.verbose_logging || verbose;
        if (!audit_log.empty()) {
            config.audit.sink = sealbox::core::AuditSinkType::JSONL;
            config.audit.path = audit_log;
        }

        auto store = std::make_shared<sealbox::bridge::InMemorySecretStore>();
        if (!secrets_path.empty()) {
            store->LoadFromFile(secrets_path);
        }

        sealbox::core::ExecutionRequest request;
        request.function_id = function_id;
        request.user_id = user_id;
        request.entry_point = entry_point;
        request.source_code = ReadFile(script_path);
        if (!params_json.empty()) {
            request.parameters = ParseParams(params_json, "--params");
        } else if (!params_file.empty()) {
            request.parameters = ParseParams(ReadFile(params_file), params_file);
        }
        request.memory_ceiling_bytes = memory_mb > 0
            ? sealbox::core::ConfigLoader::MemoryCeilingBytes(memory_mb, config.limits)
            : config.limits.default_memory_bytes;
        request.time_ceiling_ms = timeout_ms > 0 ? timeout_ms : config.limits.default_time_ms;

        auto engine = sealbox::core::EngineBuilder()
            .WithConfig(config)
            .WithSecretStore(store)
            .Build();

        result = engine->Execute(request);
    }
    catch (const sealbox::SealboxError& e) {
        spdlog::error("{}", e.what());
        return kExitUsage;
    }
    catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return kExitUsage;
    }

    std::cout << result.ToJson().dump(pretty ? 2 : -1) << std::endl;
    return result.IsSuccess() ? kExitSuccess : kExitFailedRun;
}
