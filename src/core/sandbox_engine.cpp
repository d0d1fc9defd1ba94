/**
 * @file sandbox_engine.cpp
 * @brief Isolated execution of submissions in resource-capped containers
 *
 * @date 2025
 */

#include "codesmarty/core/sandbox_engine.hpp"
#include "codesmarty/utils/string_utils.hpp"
#include "codesmarty/utils/temp_resource.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <regex>

namespace codesmarty {
namespace core {

using utils::StringUtils;

namespace {

constexpr const char* kContainerSourceDir = "/code";
constexpr const char* kJavaDefaultClass = "Main";

const std::regex kPublicClass(R"(\bpublic\s+(?:(?:final|abstract)\s+)*class\s+(\w+))");
const std::regex kAnyClass(R"(\bclass\s+(\w+))");

std::optional<std::string> FirstClassName(const std::string& code, const std::regex& pattern) {
    for (const auto& line : StringUtils::SplitLines(code)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

/// Java may only put a public class in a file of the same name
std::string JavaFileClass(const std::string& code) {
    return FirstClassName(code, kPublicClass).value_or(kJavaDefaultClass);
}

/// Public top-level class, else the first class, else Main
std::string JavaMainClass(const std::string& code) {
    if (auto name = FirstClassName(code, kPublicClass)) {
        return *name;
    }
    return FirstClassName(code, kAnyClass).value_or(kJavaDefaultClass);
}

} // anonymous namespace

SandboxEngine::SandboxEngine(utils::CommandRunner& runner,
                             CapabilityContext& capabilities,
                             FallbackExecutor& fallback,
                             SandboxConfig config)
    : containers_(runner, config.docker_binary)
    , capabilities_(capabilities)
    , fallback_(fallback)
    , config_(std::move(config)) {
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionOutcome SandboxEngine::Execute(const std::string& code, Language language) {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("SANDBOX EXECUTION ({})", LanguageToString(language));
    spdlog::info("═══════════════════════════════════════════════════════════════");

    if (language == Language::UNKNOWN) {
        return fallback_.Execute(code, language);
    }
    if (!config_.enabled) {
        spdlog::info("Sandbox disabled by configuration");
        return fallback_.Execute(code, language);
    }
    if (!capabilities_.EngineAvailable()) {
        spdlog::warn("Container engine unavailable, simulating execution");
        return fallback_.Execute(code, language);
    }

    auto outcome = RunInContainer(code, language);
    if (outcome.IsOk()) {
        return outcome.Value();
    }

    spdlog::warn("Container run failed: {}", outcome.Reason());
    if (capabilities_.Reprobe()) {
        spdlog::info("Container engine still reachable, retrying once");
        outcome = RunInContainer(code, language);
        if (outcome.IsOk()) {
            return outcome.Value();
        }
        spdlog::warn("Retry failed: {}", outcome.Reason());
    }

    return fallback_.Execute(code, language);
}

ToolOutcome<ExecutionOutcome> SandboxEngine::RunInContainer(const std::string& code, Language language) {
    std::optional<utils::TempDirectory> workspace;
    try {
        workspace.emplace("codesmarty_run_");
        workspace->WriteFile(SourceFileName(code, language), code);
    }
    catch (const std::exception& e) {
        return ToolOutcome<ExecutionOutcome>::Failed(std::string("Cannot prepare container workspace: ") + e.what());
    }

    auto container = BuildContainerConfig(code, language, workspace->Path());
    spdlog::info("Image: {}", container.image);
    spdlog::info("Timeout: {}s", config_.timeout.count());

    auto result = containers_.RunContainer(
        container, std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout));

    if (utils::ContainerUtils::IsEngineFailure(result)) {
        std::string reason = result.launched ? StringUtils::Trim(result.output) : result.error;
        return ToolOutcome<ExecutionOutcome>::Failed(
            "execution engine error (exit " + std::to_string(result.exit_code) + "): " + reason);
    }

    ExecutionOutcome outcome;
    outcome.mode = ExecutionMode::SANDBOXED;
    outcome.output = result.output;
    outcome.exit_code = result.exit_code;
    outcome.timed_out = result.timed_out;
    outcome.success = result.Succeeded();

    if (result.timed_out) {
        outcome.output += "\nExecution timed out after " + std::to_string(config_.timeout.count()) + " seconds";
    }
    if (result.output_truncated) {
        outcome.output += "\n[output truncated]";
    }

    spdlog::info("✓ Container finished (exit code {}, {} ms)", result.exit_code, result.duration.count());
    return ToolOutcome<ExecutionOutcome>::Ok(std::move(outcome));
}

// ============================================================================
// CONTAINER CONFIGURATION
// ============================================================================

std::string SandboxEngine::SourceFileName(const std::string& code, Language language) {
    switch (language) {
        case Language::PYTHON: return "main.py";
        case Language::JAVA: return JavaFileClass(code) + ".java";
        case Language::C: return "main.c";
        case Language::CPP: return "main.cpp";
        case Language::UNKNOWN: return "main.txt";
    }
    return "main.txt";
}

std::vector<std::string> SandboxEngine::BuildContainerCommand(const std::string& code, Language language) {
    const std::string source = std::string(kContainerSourceDir) + "/" + SourceFileName(code, language);

    switch (language) {
        case Language::PYTHON:
            return {"python", "-B", source};
        case Language::JAVA:
            return {"sh", "-c",
                    "javac -d /tmp " + StringUtils::ShellQuote(source) +
                    " && java -cp /tmp " + StringUtils::ShellQuote(JavaMainClass(code))};
        case Language::C:
            return {"sh", "-c",
                    "gcc -o /tmp/a.out " + StringUtils::ShellQuote(source) + " && /tmp/a.out"};
        case Language::CPP:
            return {"sh", "-c",
                    "g++ -std=c++17 -o /tmp/a.out " + StringUtils::ShellQuote(source) + " && /tmp/a.out"};
        case Language::UNKNOWN:
            return {};
    }
    return {};
}

utils::ContainerConfig SandboxEngine::BuildContainerConfig(const std::string& code,
                                                           Language language,
                                                           const std::filesystem::path& workspace) const {
    utils::ContainerConfig container;
    container.name = utils::ContainerUtils::GenerateContainerName("codesmarty_sandbox");

    auto image = config_.images.find(language);
    if (image != config_.images.end()) {
        container.image = image->second;
    }

    container.working_dir = kContainerSourceDir;
    container.command = BuildContainerCommand(code, language);
    container.memory_limit_mb = config_.memory_mb;
    container.cpu_limit = config_.cpus;
    container.pids_limit = config_.pids_limit;
    container.network_disabled = true;
    container.auto_remove = true;
    container.mounts.push_back({workspace, kContainerSourceDir, true});
    return container;
}

} // namespace core
} // namespace codesmarty
