/**
 * @file config.cpp
 * @brief Process-wide configuration loading
 *
 * @date 2025
 */

#include "codesmarty/core/config.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace codesmarty {
namespace core {

namespace {

Language ParseConfiguredLanguage(const std::string& name, const std::string& key) {
    auto language = ParseLanguage(name);
    if (!language) {
        throw std::runtime_error("Unknown language '" + name + "' in " + key);
    }
    return *language;
}

void ApplyServer(const json& j, ServerConfig& server) {
    server.host = j.value("host", server.host);
    server.port = j.value("port", server.port);
    server.worker_threads = j.value("worker_threads", server.worker_threads);

    if (server.port <= 0 || server.port > 65535) {
        throw std::runtime_error("server.port out of range: " + std::to_string(server.port));
    }
    if (server.worker_threads <= 0) {
        throw std::runtime_error("server.worker_threads must be positive");
    }
}

void ApplyGenerative(const json& j, GenerativeConfig& generative) {
    generative.host = j.value("host", generative.host);
    generative.model = j.value("model", generative.model);
    generative.api_key_env = j.value("api_key_env", generative.api_key_env);
    generative.timeout = std::chrono::seconds(
        j.value("timeout_seconds", static_cast<int>(generative.timeout.count())));
    generative.max_output_tokens = j.value("max_output_tokens", generative.max_output_tokens);
}

void ApplySandbox(const json& j, SandboxConfig& sandbox) {
    sandbox.enabled = j.value("enabled", sandbox.enabled);
    sandbox.timeout = std::chrono::seconds(
        j.value("timeout_seconds", static_cast<int>(sandbox.timeout.count())));
    sandbox.memory_mb = j.value("memory_mb", sandbox.memory_mb);
    sandbox.cpus = j.value("cpus", sandbox.cpus);
    sandbox.pids_limit = j.value("pids_limit", sandbox.pids_limit);
    sandbox.docker_binary = j.value("docker_binary", sandbox.docker_binary);

    if (j.contains("images")) {
        for (const auto& [name, image] : j.at("images").items()) {
            sandbox.images[ParseConfiguredLanguage(name, "sandbox.images")] = image.get<std::string>();
        }
    }
}

void ApplyTools(const json& j, ToolsConfig& tools) {
    tools.valgrind_timeout = std::chrono::seconds(
        j.value("valgrind_timeout_seconds", static_cast<int>(tools.valgrind_timeout.count())));
    tools.tool_timeout = std::chrono::seconds(
        j.value("tool_timeout_seconds", static_cast<int>(tools.tool_timeout.count())));
}

} // anonymous namespace

AppConfig ParseConfig(const std::string& json_text) {
    AppConfig config;

    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            throw std::runtime_error("Configuration root must be a JSON object");
        }

        if (j.contains("server")) {
            ApplyServer(j.at("server"), config.server);
        }
        if (j.contains("generative")) {
            ApplyGenerative(j.at("generative"), config.generative);
        }
        if (j.contains("sandbox")) {
            ApplySandbox(j.at("sandbox"), config.sandbox);
        }
        if (j.contains("tools")) {
            ApplyTools(j.at("tools"), config.tools);
        }
        if (j.contains("repository")) {
            const auto& repo = j.at("repository");
            config.repository.clone_timeout = std::chrono::seconds(
                repo.value("clone_timeout_seconds",
                           static_cast<int>(config.repository.clone_timeout.count())));
        }
        if (j.contains("logging")) {
            config.log_level = j.at("logging").value("level", config.log_level);
        }
        if (j.contains("detection")) {
            const auto& detection = j.at("detection");
            if (detection.contains("unmatched_default")) {
                config.unmatched_default = ParseConfiguredLanguage(
                    detection.at("unmatched_default").get<std::string>(),
                    "detection.unmatched_default");
            }
        }
    }
    catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
    }

    return config;
}

AppConfig LoadConfig(const std::filesystem::path& path) {
    spdlog::info("Loading configuration: {}", path.string());

    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseConfig(buffer.str());
}

std::string ResolveApiKey(const GenerativeConfig& config) {
    const char* value = std::getenv(config.api_key_env.c_str());
    if (value == nullptr || utils::StringUtils::Trim(value).empty()) {
        throw std::runtime_error(config.api_key_env +
                                 " is not set; the generative backend needs an API key");
    }
    return utils::StringUtils::Trim(value);
}

} // namespace core
} // namespace codesmarty
