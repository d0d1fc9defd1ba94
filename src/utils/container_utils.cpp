/**
 * @file container_utils.cpp
 * @brief Docker CLI wrapper for short-lived, resource-capped runs
 *
 * @date 2025
 */

#include "codesmarty/utils/container_utils.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <random>
#include <regex>
#include <sstream>

namespace codesmarty {
namespace utils {

namespace {

constexpr int kDockerRunFailure = 125;
constexpr const char* kDockerCliMarkers[] = {
    "docker: ",
    "Error response from daemon",
    "See 'docker run --help'",
};
constexpr std::chrono::seconds kProbeTimeout{15};
constexpr std::chrono::seconds kRemoveTimeout{30};

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

} // anonymous namespace

ContainerUtils::ContainerUtils(CommandRunner& runner, std::string binary)
    : runner_(runner), binary_(std::move(binary)) {
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================
// `docker info` needs the daemon, so a reachable CLI with a stopped daemon
// reports unavailable.

bool ContainerUtils::IsRuntimeAvailable() {
    if (!runner_.IsAvailable(binary_)) {
        spdlog::debug("{} not found on PATH", binary_);
        return false;
    }

    CommandSpec spec;
    spec.argv = {binary_, "info", "--format", "{{.ServerVersion}}"};
    spec.timeout = kProbeTimeout;

    auto result = runner_.Run(spec);
    if (!result.Succeeded()) {
        spdlog::debug("{} info failed ({}): {}", binary_, result.exit_code,
                      StringUtils::Trim(result.error.empty() ? result.output : result.error));
        return false;
    }
    return true;
}

std::string ContainerUtils::GetRuntimeVersion() {
    CommandSpec spec;
    spec.argv = {binary_, "--version"};
    spec.timeout = kProbeTimeout;

    auto result = runner_.Run(spec);
    if (result.Succeeded()) {
        // Extract version number (x.y.z)
        std::regex version_regex(R"((\d+\.\d+\.\d+))");
        std::smatch match;
        if (std::regex_search(result.output, match, version_regex)) {
            return match[1].str();
        }
        return StringUtils::Trim(result.output);
    }

    return "unknown";
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::vector<std::string> ContainerUtils::BuildRunCommand(const ContainerConfig& config) const {
    std::vector<std::string> args;

    args.push_back(binary_);
    args.push_back("run");

    // Auto-remove on exit
    if (config.auto_remove) {
        args.push_back("--rm");
    }

    // Container name
    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Memory limit
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }

    // CPU limit
    if (config.cpu_limit > 0) {
        args.push_back("--cpus");
        args.push_back(FormatCpus(config.cpu_limit));
    }

    // Process limit
    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    // Network
    if (config.network_disabled) {
        args.push_back("--network");
        args.push_back("none");
    }

    // Volume mounts
    for (const auto& mount : config.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path.string() + ":" + mount.container_path +
                       (mount.read_only ? ":ro" : ""));
    }

    // Working directory
    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir);
    }

    // Image, then the command
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

CommandResult ContainerUtils::RunContainer(const ContainerConfig& config,
                                           std::chrono::milliseconds timeout) {
    spdlog::info("Starting container {} ({})", config.name, config.image);

    CommandSpec spec;
    spec.argv = BuildRunCommand(config);
    spec.timeout = timeout;

    auto result = runner_.Run(spec);

    if (result.timed_out && !config.name.empty()) {
        spdlog::warn("Container {} exceeded {} ms, removing", config.name, timeout.count());
        RemoveContainer(config.name, true);
    }

    return result;
}

bool ContainerUtils::RemoveContainer(const std::string& name, bool force) {
    spdlog::debug("Removing container: {} (force: {})", name, force);

    CommandSpec spec;
    spec.argv = {binary_, "rm"};
    if (force) {
        spec.argv.push_back("--force");
    }
    spec.argv.push_back(name);
    spec.timeout = kRemoveTimeout;

    auto result = runner_.Run(spec);
    if (result.Succeeded()) {
        return true;
    }

    spdlog::warn("Failed to remove container {}: {}", name,
                 StringUtils::Trim(result.error.empty() ? result.output : result.error));
    return false;
}

bool ContainerUtils::IsEngineFailure(const CommandResult& result) {
    if (!result.launched) {
        return true;
    }
    if (result.timed_out) {
        return false;
    }
    if (StringUtils::Contains(result.output, "Cannot connect to the Docker daemon") ||
        StringUtils::Contains(result.output, "docker daemon is not running")) {
        return true;
    }

    // The workload's own exit status is passed through, so 125 alone is ambiguous
    if (result.exit_code == kDockerRunFailure) {
        for (const char* marker : kDockerCliMarkers) {
            if (StringUtils::Contains(result.output, marker)) {
                return true;
            }
        }
    }
    return false;
}

std::string ContainerUtils::GenerateContainerName(const std::string& prefix) {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<> dis(1000, 9999);

    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    return prefix + "_" + std::to_string(timestamp) + "_" + std::to_string(dis(gen));
}

} // namespace utils
} // namespace codesmarty
