/**
 * @file main.cpp
 * @brief CODE-SMARTY - Command-line interface
 *
 * Entry point for the CODE-SMARTY code analyzer. Runs the HTTP backend
 * (`serve`) or analyzes a single file (`analyze`) or a remote repository
 * (`analyze-repo`) directly from the command line, writing JSON reports.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "codesmarty/core/analysis_engine.hpp"
#include "codesmarty/core/capability_context.hpp"
#include "codesmarty/core/config.hpp"
#include "codesmarty/core/errors.hpp"
#include "codesmarty/clients/gemini_client.hpp"
#include "codesmarty/reporters/json_reporter.hpp"
#include "codesmarty/server/http_server.hpp"
#include "codesmarty/utils/container_utils.hpp"
#include "codesmarty/utils/process_utils.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>

using namespace codesmarty;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cerr << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║                  C O D E - S M A R T Y                        ║
║          Static analysis, sandboxed runs, suggestions         ║
║                            v1.0.0                             ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void PrintConsoleSummary(const core::AnalysisResult& result) {
    std::cerr << "\n";
    std::cerr << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cerr << "║                     ANALYSIS SUMMARY                          ║\n";
    std::cerr << "╚═══════════════════════════════════════════════════════════════╝\n";
    std::cerr << "  Language:    " << core::LanguageToString(result.language) << "\n";
    std::cerr << "  Tools:       " << result.findings.Size() << "\n";
    std::cerr << "  Execution:   " << core::ExecutionModeToString(result.runtime.mode)
              << (result.runtime.success ? " [OK]" : " [ISSUES]") << "\n";
    std::cerr << "  Suggestions: " << core::ProvenanceToString(result.suggestions.provenance) << "\n";
}

std::string ReadInputFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw core::InputError("Cannot open file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void ConfigureLogging(const std::string& level, bool verbose) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
        return;
    }
    spdlog::set_level(spdlog::level::from_str(level));
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"CODE-SMARTY code analyzer"};
    app.footer("\nSet GEMINI_API_KEY (or the variable named in the config file) before running.");
    app.require_subcommand(1);

    std::string config_path;
    bool verbose = false;
    bool no_sandbox = false;
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--no-sandbox", no_sandbox, "Never run code in containers; use the simulated executor");

    // serve
    auto* serve = app.add_subcommand("serve", "Run the HTTP backend");
    std::string host;
    int port = 0;
    int workers = 0;
    serve->add_option("--host", host, "Bind address");
    serve->add_option("-p,--port", port, "Listen port")->check(CLI::Range(1, 65535));
    serve->add_option("--workers", workers, "Request worker threads")->check(CLI::PositiveNumber);

    // analyze
    auto* analyze = app.add_subcommand("analyze", "Analyze a single source file");
    std::string source_path;
    std::string output_dir = "./reports";
    analyze->add_option("file", source_path, "Source file to analyze")
        ->required()
        ->check(CLI::ExistingFile);
    analyze->add_option("-o,--output", output_dir, "Output directory for reports")
        ->default_val("./reports");

    // analyze-repo
    auto* analyze_repo = app.add_subcommand("analyze-repo", "Clone and analyze a remote repository");
    std::string repo_url;
    analyze_repo->add_option("url", repo_url, "Repository URL or owner/name")->required();
    analyze_repo->add_option("-o,--output", output_dir, "Output directory for reports")
        ->default_val("./reports");

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    PrintBanner();

    try {
        core::AppConfig config;
        if (!config_path.empty()) {
            config = core::LoadConfig(config_path);
        }
        ConfigureLogging(config.log_level, verbose);

        // Command-line flags take precedence over the file
        if (!host.empty()) config.server.host = host;
        if (port > 0) config.server.port = port;
        if (workers > 0) config.server.worker_threads = workers;
        if (no_sandbox) config.sandbox.enabled = false;

        std::string api_key;
        try {
            api_key = core::ResolveApiKey(config.generative);
        }
        catch (const std::runtime_error& e) {
            spdlog::critical("[FATAL] {}", e.what());
            return 1;
        }

        // Initialize collaborators
        spdlog::info("[INIT] Initializing CODE-SMARTY...");
        utils::SystemCommandRunner runner;
        clients::GeminiClient gemini(config.generative.host, config.generative.model,
                                     api_key, config.generative.timeout);
        utils::ContainerUtils docker(runner, config.sandbox.docker_binary);
        const bool sandbox_enabled = config.sandbox.enabled;
        core::CapabilityContext capabilities([&docker, sandbox_enabled] {
            return sandbox_enabled && docker.IsRuntimeAvailable();
        });
        if (capabilities.EngineAvailable()) {
            spdlog::info("[INIT] Container runtime version: {}", docker.GetRuntimeVersion());
        }

        core::AnalysisEngine engine(config, runner, gemini, capabilities);

        if (serve->parsed()) {
            server::HttpServer http(engine, config.server);
            if (!http.Start()) {
                spdlog::error("[ERROR] Failed to bind {}:{}", config.server.host, config.server.port);
                return 1;
            }
            return 0;
        }

        reporters::JsonReporterConfig report_config;
        report_config.output_directory = output_dir;
        reporters::JsonReporter reporter(report_config);

        if (analyze->parsed()) {
            spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
            spdlog::info("[START] Processing file: {}", source_path);

            core::CodeSubmission submission(ReadInputFile(source_path),
                                            core::SubmissionOrigin::LOCAL_FILE,
                                            source_path);
            auto result = engine.AnalyzeSubmission(submission);

            std::cout << reporter.GenerateJsonString(result) << std::endl;

            auto json_path = reporter.GenerateReport(result);
            if (json_path.empty()) {
                spdlog::warn("[WARN] Failed to generate JSON report");
            }
            PrintConsoleSummary(result);
            return 0;
        }

        if (analyze_repo->parsed()) {
            spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
            spdlog::info("[START] Processing repository: {}", repo_url);

            auto result = engine.AnalyzeRepository(repo_url);

            std::cout << reporter.GenerateJsonString(result) << std::endl;

            auto json_path = reporter.GenerateReport(result, repo_url);
            if (json_path.empty()) {
                spdlog::warn("[WARN] Failed to generate JSON report");
            }
            return 0;
        }

        return 0;
    }
    catch (const core::InputError& e) {
        spdlog::error("[ERROR] Invalid input: {}", e.what());
        return 2;
    }
    catch (const core::CloneError& e) {
        spdlog::error("[ERROR] Clone failed: {}", e.what());
        return 2;
    }
    catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    }
    catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
