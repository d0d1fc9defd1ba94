/**
 * @file sandbox_engine.hpp
 * @brief Isolated execution of submissions in resource-capped containers
 *
 * Runs code once inside a throwaway container and returns its merged
 * output. Degrades to the FallbackExecutor whenever the container engine
 * is unusable, so an ExecutionOutcome is always produced.
 *
 * **Container Settings**:
 * - `--rm`, `--network none`, `--memory`, `--cpus`, `--pids-limit`
 * - Source directory mounted read-only at /code; build output goes to /tmp
 * - Wall-clock bound (default 30 s); the container is force-removed on expiry
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/analysis_types.hpp"
#include "codesmarty/core/capability_context.hpp"
#include "codesmarty/core/config.hpp"
#include "codesmarty/core/fallback_executor.hpp"
#include "codesmarty/core/tool_outcome.hpp"
#include "codesmarty/utils/container_utils.hpp"
#include "codesmarty/utils/process_utils.hpp"

#include <string>
#include <vector>
#include <filesystem>

namespace codesmarty {
namespace core {

/**
 * @class SandboxEngine
 * @brief Container execution with retry-once-then-degrade
 *
 * **Execution Workflow**:
 * 1. UNKNOWN, sandbox disabled or engine flagged unavailable → fallback
 * 2. Write the code into a fresh workspace under its language file name
 * 3. `docker run` the language image with one compile-then-run command
 * 4. Engine failure → re-probe; still reachable → retry once; else clear
 *    the capability flag
 * 5. Still no container result → fallback
 *
 * **Thread Safety**: Execute() may be called concurrently; every run uses
 * its own workspace and container name.
 *
 * **Usage Example**:
 * @code
 * CapabilityContext capabilities([&] { return docker.IsRuntimeAvailable(); });
 * FallbackExecutor fallback(runner);
 * SandboxEngine sandbox(runner, capabilities, fallback, config.sandbox);
 *
 * auto outcome = sandbox.Execute("print('hi')", Language::PYTHON);
 * // outcome.mode == SANDBOXED, outcome.output == "hi\n"
 * @endcode
 */
class SandboxEngine {
public:
    SandboxEngine(utils::CommandRunner& runner,
                  CapabilityContext& capabilities,
                  FallbackExecutor& fallback,
                  SandboxConfig config = SandboxConfig{});

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    /**
     * @brief Execute @p code (or simulate it when isolation is unavailable)
     */
    ExecutionOutcome Execute(const std::string& code, Language language);

    /**
     * @brief File name the code is written to inside the workspace
     *
     * main.py, main.c, main.cpp; Java uses the public class name
     * (`<Class>.java`) or Main.java.
     */
    static std::string SourceFileName(const std::string& code, Language language);

    /**
     * @brief Command run inside the container (after the image name)
     */
    static std::vector<std::string> BuildContainerCommand(const std::string& code, Language language);

    /**
     * @brief Complete container configuration for one run
     */
    utils::ContainerConfig BuildContainerConfig(const std::string& code,
                                                Language language,
                                                const std::filesystem::path& workspace) const;

private:
    /// One container run; Failed when the engine (not the code) failed
    ToolOutcome<ExecutionOutcome> RunInContainer(const std::string& code, Language language);

    utils::ContainerUtils containers_;
    CapabilityContext& capabilities_;
    FallbackExecutor& fallback_;
    SandboxConfig config_;
};

} // namespace core
} // namespace codesmarty
