/**
 * @file container_utils.hpp
 * @brief Docker CLI wrapper for short-lived, resource-capped runs
 *
 * Builds `docker run` argument vectors with memory/CPU/process caps,
 * disabled networking and read-only source mounts, runs them through a
 * CommandRunner with a wall-clock bound and force-removes containers that
 * outlive it.
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/utils/process_utils.hpp"

#include <string>
#include <vector>
#include <filesystem>
#include <chrono>
#include <cstdint>

namespace codesmarty {
namespace utils {

/**
 * @struct MountSpec
 * @brief Host directory bound into the container
 */
struct MountSpec {
    std::filesystem::path host_path;
    std::string container_path;
    bool read_only{true};
};

/**
 * @struct ContainerConfig
 * @brief Complete configuration of one container run
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                               ///< Container name (used for forced removal)
    std::string image;                              ///< Image reference
    std::string working_dir{"/code"};               ///< Working directory inside the container
    std::vector<std::string> command;               ///< Command (after the image)

    // Resource Limits
    uint64_t memory_limit_mb{256};                  ///< --memory
    double cpu_limit{1.0};                          ///< --cpus
    int pids_limit{64};                             ///< --pids-limit

    // Isolation
    bool network_disabled{true};                    ///< --network none
    bool auto_remove{true};                         ///< --rm
    std::vector<MountSpec> mounts;                  ///< -v host:container[:ro]
};

/**
 * @class ContainerUtils
 * @brief Docker operations expressed as CommandRunner invocations
 *
 * **Usage Example**:
 * @code
 * ContainerUtils docker(runner);
 * if (docker.IsRuntimeAvailable()) {
 *     ContainerConfig config;
 *     config.name = ContainerUtils::GenerateContainerName("codesmarty_sandbox");
 *     config.image = "python:3.11-slim";
 *     config.mounts.push_back({workspace, "/code", true});
 *     config.command = {"python", "main.py"};
 *     auto result = docker.RunContainer(config, std::chrono::seconds(30));
 * }
 * @endcode
 */
class ContainerUtils {
public:
    explicit ContainerUtils(CommandRunner& runner, std::string binary = "docker");

    // ========================================================================
    // Runtime Detection
    // ========================================================================

    /**
     * @brief Probe whether the CLI is installed and its daemon answers
     */
    bool IsRuntimeAvailable();

    /**
     * @brief Server version reported by the engine, or "unknown"
     */
    std::string GetRuntimeVersion();

    // ========================================================================
    // Container Lifecycle
    // ========================================================================

    /**
     * @brief Full argv for `docker run` (binary first, command last)
     */
    std::vector<std::string> BuildRunCommand(const ContainerConfig& config) const;

    /**
     * @brief Run a container in the foreground, bounded by @p timeout
     *
     * A container still alive when the bound expires is force-removed by
     * name. The returned result carries the merged output of the run.
     */
    CommandResult RunContainer(const ContainerConfig& config, std::chrono::milliseconds timeout);

    /**
     * @brief `docker rm [--force] <name>`
     * @return True if the engine confirmed the removal
     */
    bool RemoveContainer(const std::string& name, bool force = true);

    /**
     * @brief True when the result points at the engine rather than the workload
     *
     * Covers a CLI that could not be launched, the daemon being
     * unreachable, and `docker run` failing before the container started
     * (exit status 125 together with the CLI's own error text). A
     * workload that itself exits 125 is not an engine failure.
     */
    static bool IsEngineFailure(const CommandResult& result);

    /**
     * @brief prefix + "_" + epoch seconds + "_" + random 4 digits
     */
    static std::string GenerateContainerName(const std::string& prefix);

private:
    CommandRunner& runner_;
    std::string binary_;
};

} // namespace utils
} // namespace codesmarty
