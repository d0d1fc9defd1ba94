/**
 * @file http_server.cpp
 * @brief HTTP surface of the analysis service
 *
 * @date 2025
 */

#include "codesmarty/server/http_server.hpp"
#include "codesmarty/core/errors.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <httplib.h>

namespace codesmarty {
namespace server {

using json = nlohmann::json;
using utils::StringUtils;

namespace {

constexpr const char* kJsonContentType = "application/json";

reporters::JsonReporterConfig CompactReporterConfig() {
    reporters::JsonReporterConfig config;
    config.pretty_print = false;
    return config;
}

bool MentionsExecutionEngine(const std::string& message) {
    return StringUtils::ContainsIgnoreCase(message, "docker") ||
           StringUtils::ContainsIgnoreCase(message, "execution engine") ||
           StringUtils::ContainsIgnoreCase(message, "container");
}

/// Parse a JSON object body and read a required string field
std::string RequireStringField(const json& body, const std::string& field) {
    if (!body.contains(field)) {
        throw core::InputError("Missing field '" + field + "'");
    }
    if (!body.at(field).is_string()) {
        throw core::InputError("Field '" + field + "' must be a string");
    }
    return body.at(field).get<std::string>();
}

json ParseObject(const std::string& body) {
    json parsed;
    try {
        parsed = json::parse(body);
    }
    catch (const json::parse_error& e) {
        throw core::InputError(std::string("Invalid JSON body: ") + e.what());
    }
    if (!parsed.is_object()) {
        throw core::InputError("Request body must be a JSON object");
    }
    return parsed;
}

} // anonymous namespace

HttpServer::HttpServer(core::AnalysisEngine& engine, const core::ServerConfig& config)
    : engine_(engine)
    , config_(config)
    , reporter_(CompactReporterConfig())
    , server_(std::make_unique<httplib::Server>()) {
    RegisterRoutes();
}

HttpServer::~HttpServer() {
    Stop();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool HttpServer::Start() {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("CODE-SMARTY backend listening on {}:{} ({} workers)",
                 config_.host, config_.port, config_.worker_threads);
    spdlog::info("═══════════════════════════════════════════════════════════════");

    return server_->listen(config_.host, config_.port);
}

void HttpServer::Stop() {
    if (server_->is_running()) {
        spdlog::info("Stopping HTTP server");
        server_->stop();
    }
}

void HttpServer::RegisterRoutes() {
    const int workers = config_.worker_threads;
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(static_cast<size_t>(workers)); };

    server_->set_default_headers({
        {"Access-Control-Allow-Origin", "*"}
    });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        spdlog::info("{} {} -> {}", req.method, req.path, res.status);
    });

    auto reply = [](httplib::Response& res, const HttpResponse& response) {
        res.status = response.status;
        res.set_content(response.body, kJsonContentType);
    };

    server_->Get("/", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, HandleRoot());
    });

    server_->Post("/analyze", [this, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, HandleAnalyze(req.body));
    });

    server_->Post("/analyze_repo", [this, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, HandleAnalyzeRepo(req.body));
    });

    server_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "*");
        res.set_header("Access-Control-Max-Age", "600");
        res.status = 204;
    });
}

// ============================================================================
// ROUTE HANDLERS
// ============================================================================

HttpResponse HttpServer::HandleRoot() const {
    json body = {
        {"status", "ok"},
        {"message", "CODE-SMARTY backend is running"}
    };
    return {200, body.dump()};
}

HttpResponse HttpServer::HandleAnalyze(const std::string& body) {
    try {
        auto request = ParseObject(body);
        auto code = RequireStringField(request, "code");

        auto result = engine_.AnalyzeCode(code);
        return {200, reporter_.GenerateJsonString(result)};
    }
    catch (const core::InputError& e) {
        spdlog::warn("Rejected /analyze request: {}", e.what());
        return Detail(400, e.what());
    }
    catch (const std::exception& e) {
        spdlog::error("Analysis failed: {}", e.what());
        std::string message = e.what();
        if (MentionsExecutionEngine(message)) {
            message += " " + std::string(kDockerHint);
        }
        return Detail(500, message);
    }
}

HttpResponse HttpServer::HandleAnalyzeRepo(const std::string& body) {
    try {
        auto request = ParseObject(body);
        auto repo_url = RequireStringField(request, "repo_url");
        if (request.contains("user_id") && request.at("user_id").is_string()) {
            spdlog::info("Repository analysis requested by {}", request.at("user_id").get<std::string>());
        }

        auto result = engine_.AnalyzeRepository(repo_url);
        return {200, reporter_.GenerateJsonString(result)};
    }
    catch (const core::InputError& e) {
        spdlog::warn("Rejected /analyze_repo request: {}", e.what());
        return Detail(400, e.what());
    }
    catch (const core::CloneError& e) {
        spdlog::error("Clone failed: {}", e.what());
        return Detail(400, e.what());
    }
    catch (const std::exception& e) {
        spdlog::error("Repository analysis failed: {}", e.what());
        std::string message = e.what();
        if (MentionsExecutionEngine(message)) {
            message += " " + std::string(kDockerHint);
        }
        return Detail(500, message);
    }
}

HttpResponse HttpServer::Detail(int status, const std::string& message) {
    json body = {{"detail", message}};
    return {status, body.dump(-1, ' ', false, json::error_handler_t::replace)};
}

} // namespace server
} // namespace codesmarty
