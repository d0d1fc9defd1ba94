/**
 * @file process_utils.cpp
 * @brief fork/exec command execution with merged output capture
 *
 * **Execution Workflow**:
 * 1. Create the output and status pipes close-on-exec, so children
 *    forked concurrently by other workers never inherit them
 * 2. fork(); the child moves into its own process group, redirects
 *    stdout/stderr into the output pipe and execvp()s the program
 * 3. A failed exec writes errno into the status pipe and exits 127
 * 4. The parent polls the output pipe until EOF or the deadline
 * 5. On deadline the whole process group receives SIGKILL
 * 6. waitpid() collects the exit status
 *
 * @date 2025
 */

#include "codesmarty/utils/process_utils.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace codesmarty {
namespace utils {

#ifdef _WIN32

CommandResult SystemCommandRunner::Run(const CommandSpec& spec) {
    CommandResult result;
    result.error = "External command execution is not supported on this platform";
    spdlog::warn("Cannot run {}: {}", spec.argv.empty() ? "<empty>" : spec.argv[0], result.error);
    return result;
}

std::optional<std::filesystem::path> SystemCommandRunner::FindExecutable(const std::string&) const {
    return std::nullopt;
}

#else

namespace {

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // anonymous namespace

CommandResult SystemCommandRunner::Run(const CommandSpec& spec) {
    CommandResult result;
    auto start = std::chrono::steady_clock::now();

    if (spec.argv.empty()) {
        result.error = "Empty command";
        return result;
    }

    spdlog::debug("Executing: {}", StringUtils::Join(spec.argv, " "));

    int output_fds[2] = {-1, -1};
    int status_fds[2] = {-1, -1};
    if (pipe2(output_fds, O_CLOEXEC) < 0) {
        result.error = std::string("Failed to create pipe: ") + strerror(errno);
        return result;
    }
    if (pipe2(status_fds, O_CLOEXEC) < 0) {
        result.error = std::string("Failed to create pipe: ") + strerror(errno);
        CloseFd(output_fds[0]);
        CloseFd(output_fds[1]);
        return result;
    }

    // argv must be prepared before fork(); the child may only call
    // async-signal-safe functions.
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    std::string working_dir = spec.working_directory.string();

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("Failed to fork: ") + strerror(errno);
        CloseFd(output_fds[0]);
        CloseFd(output_fds[1]);
        CloseFd(status_fds[0]);
        CloseFd(status_fds[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        close(output_fds[0]);
        close(status_fds[0]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        // dup2() clears close-on-exec on the copies
        dup2(output_fds[1], STDOUT_FILENO);
        dup2(output_fds[1], STDERR_FILENO);
        close(output_fds[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = write(status_fds[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = write(status_fds[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    CloseFd(output_fds[1]);
    CloseFd(status_fds[1]);

    int exec_errno = 0;
    ssize_t status_bytes = read(status_fds[0], &exec_errno, sizeof(exec_errno));
    CloseFd(status_fds[0]);

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        CloseFd(output_fds[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        result.error = "Failed to launch " + spec.argv[0] + ": " + strerror(exec_errno);
        spdlog::debug("{}", result.error);
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    }

    result.launched = true;
    auto deadline = start + spec.timeout;
    char buffer[4096];

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::warn("Command timed out after {} ms: {}", spec.timeout.count(), spec.argv[0]);
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        struct pollfd pfd{output_fds[0], POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 250)));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error = std::string("poll failed: ") + strerror(errno);
            kill(-pid, SIGKILL);
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(output_fds[0], buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;  // EOF: child closed its end
        }

        if (result.output.size() < spec.max_output_bytes) {
            std::size_t room = spec.max_output_bytes - result.output.size();
            result.output.append(buffer, std::min<std::size_t>(room, static_cast<std::size_t>(n)));
            if (static_cast<std::size_t>(n) > room) {
                result.output_truncated = true;
            }
        } else {
            result.output_truncated = true;
        }
    }

    CloseFd(output_fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.exit_code = DecodeWaitStatus(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::debug("{} exited with {} after {} ms", spec.argv[0], result.exit_code,
                  result.duration.count());
    return result;
}

std::optional<std::filesystem::path> SystemCommandRunner::FindExecutable(const std::string& name) const {
    if (name.empty()) {
        return std::nullopt;
    }

    auto is_executable = [](const std::filesystem::path& candidate) {
        std::error_code ec;
        return std::filesystem::is_regular_file(candidate, ec) &&
               access(candidate.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) {
            return std::filesystem::absolute(name);
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }

    for (const auto& dir : StringUtils::Split(path_env, ':')) {
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        if (is_executable(candidate)) {
            return candidate;
        }
    }

    return std::nullopt;
}

#endif

} // namespace utils
} // namespace codesmarty
