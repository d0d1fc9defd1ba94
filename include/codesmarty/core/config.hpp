/**
 * @file config.hpp
 * @brief Process-wide configuration
 *
 * Precedence: built-in defaults < JSON config file < command-line flags.
 * The generative backend credential is read from the environment at
 * startup; a missing credential is fatal.
 *
 * **Example config file**:
 * @code
 * {
 *   "server":     { "port": 9000 },
 *   "sandbox":    { "memory_mb": 512, "timeout_seconds": 20 },
 *   "logging":    { "level": "debug" },
 *   "detection":  { "unmatched_default": "python" }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/language.hpp"

#include <string>
#include <map>
#include <chrono>
#include <filesystem>
#include <cstdint>

namespace codesmarty {
namespace core {

/**
 * @struct ServerConfig
 * @brief HTTP surface settings
 */
struct ServerConfig {
    std::string host{"0.0.0.0"};     ///< Bind address
    int port{8000};                  ///< Listen port
    int worker_threads{8};           ///< Request worker pool size
};

/**
 * @struct GenerativeConfig
 * @brief Generative backend endpoint and request bounds
 */
struct GenerativeConfig {
    std::string host{"generativelanguage.googleapis.com"};  ///< HTTPS host
    std::string model{"gemini-1.5-flash"};                  ///< Model name in the request path
    std::string api_key_env{"GEMINI_API_KEY"};              ///< Environment variable holding the key
    std::chrono::seconds timeout{60};                       ///< Connect/read timeout
    int max_output_tokens{2048};                            ///< Suggestion length bound
};

/**
 * @struct SandboxConfig
 * @brief Container execution settings
 */
struct SandboxConfig {
    // Execution Settings
    bool enabled{true};                         ///< false = always use the fallback executor
    std::chrono::seconds timeout{30};           ///< Wall-clock bound of one container run

    // Resource Limits
    uint64_t memory_mb{256};                    ///< --memory
    double cpus{1.0};                           ///< --cpus
    int pids_limit{64};                         ///< --pids-limit

    // Docker Settings
    std::string docker_binary{"docker"};        ///< Container CLI
    std::map<Language, std::string> images{     ///< Image per language
        {Language::PYTHON, "python:3.11-slim"},
        {Language::JAVA, "eclipse-temurin:17-jdk"},
        {Language::C, "gcc:13"},
        {Language::CPP, "gcc:13"},
    };
};

/**
 * @struct ToolsConfig
 * @brief Bounds for host-side analysis tools
 */
struct ToolsConfig {
    std::chrono::seconds valgrind_timeout{5};   ///< Memcheck run of the compiled binary
    std::chrono::seconds tool_timeout{60};      ///< Linters, compilers, syntax checks
};

/**
 * @struct RepositoryConfig
 * @brief Repository clone settings
 */
struct RepositoryConfig {
    std::chrono::seconds clone_timeout{300};    ///< `git clone --depth 1` bound
};

/**
 * @struct AppConfig
 * @brief Everything the service reads at startup
 */
struct AppConfig {
    ServerConfig server;
    GenerativeConfig generative;
    SandboxConfig sandbox;
    ToolsConfig tools;
    RepositoryConfig repository;
    std::string log_level{"info"};
    Language unmatched_default{Language::PYTHON};  ///< Detection result when no rule matches
};

/**
 * @brief Load configuration from a JSON file on top of the defaults
 *
 * Missing sections and keys keep their defaults.
 *
 * @throws std::runtime_error if the file cannot be read, is not valid
 *         JSON, or holds a value of the wrong type
 */
AppConfig LoadConfig(const std::filesystem::path& path);

/**
 * @brief Parse configuration from an already loaded JSON text
 * @throws std::runtime_error on invalid JSON or wrongly typed values
 */
AppConfig ParseConfig(const std::string& json_text);

/**
 * @brief Read the generative backend key from the configured variable
 * @throws std::runtime_error if the variable is unset or empty
 */
std::string ResolveApiKey(const GenerativeConfig& config);

} // namespace core
} // namespace codesmarty
