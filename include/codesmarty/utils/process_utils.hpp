/**
 * @file process_utils.hpp
 * @brief External command execution with output capture and wall-clock bounds
 *
 * Every external collaborator (linters, compilers, valgrind, docker, git)
 * is reached through a CommandRunner. Commands are passed as argv vectors,
 * never through a shell, so submitted code and file names cannot inject
 * shell syntax. The abstraction also lets tests script tool behavior.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <chrono>

namespace codesmarty {
namespace utils {

/**
 * @struct CommandSpec
 * @brief What to run and under which bounds
 */
struct CommandSpec {
    std::vector<std::string> argv;                    ///< Program followed by its arguments
    std::chrono::milliseconds timeout{60000};         ///< Wall-clock bound (process group killed on expiry)
    std::filesystem::path working_directory;          ///< Empty = inherit
    std::size_t max_output_bytes{1024 * 1024};        ///< Output beyond this is dropped
};

/**
 * @struct CommandResult
 * @brief Outcome of one command
 */
struct CommandResult {
    bool launched{false};                     ///< Process was started (exec succeeded)
    int exit_code{-1};                        ///< Exit status, 128+signal when killed
    std::string output;                       ///< Merged stdout and stderr
    bool timed_out{false};                    ///< Killed because the bound expired
    bool output_truncated{false};             ///< max_output_bytes was reached
    std::string error;                        ///< Launch error description
    std::chrono::milliseconds duration{0};    ///< Wall-clock runtime

    /// Launched, finished in time and exited with status 0
    bool Succeeded() const { return launched && !timed_out && exit_code == 0; }
};

/**
 * @class CommandRunner
 * @brief Seam between the pipeline and the host's executables
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command to completion or until its timeout
     *
     * Never throws for command failures; inspect the result instead.
     */
    virtual CommandResult Run(const CommandSpec& spec) = 0;

    /**
     * @brief Resolve an executable name via the host's PATH
     * @return Absolute path, or nullopt when not found
     */
    virtual std::optional<std::filesystem::path> FindExecutable(const std::string& name) const = 0;

    bool IsAvailable(const std::string& name) const {
        return FindExecutable(name).has_value();
    }
};

/**
 * @class SystemCommandRunner
 * @brief fork/exec implementation with a poll() loop for output and timeout
 *
 * The child runs in its own process group so compilers and the binaries
 * they spawn are killed together when the bound expires.
 *
 * **Thread Safety**: Run() may be called concurrently from several threads.
 */
class SystemCommandRunner : public CommandRunner {
public:
    CommandResult Run(const CommandSpec& spec) override;
    std::optional<std::filesystem::path> FindExecutable(const std::string& name) const override;
};

/**
 * @brief True when compiled for a Windows-family host
 */
constexpr bool IsWindowsHost() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

} // namespace utils
} // namespace codesmarty
