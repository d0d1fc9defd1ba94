/**
 * @file http_server.hpp
 * @brief HTTP surface of the analysis service
 *
 * **Routes**:
 * - `GET /`             health check
 * - `OPTIONS *`         CORS pre-flight
 * - `POST /analyze`     body `{"code": "..."}`
 * - `POST /analyze_repo` body `{"repo_url": "...", "user_id": "..."}`
 *
 * **Status Mapping**:
 * - InputError, CloneError, malformed JSON → 400 `{"detail": msg}`
 * - anything else → 500 `{"detail": msg}` (with a Docker hint when the
 *   message concerns the execution engine)
 *
 * Every response carries `Access-Control-Allow-Origin: *`.
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/analysis_engine.hpp"
#include "codesmarty/core/config.hpp"
#include "codesmarty/reporters/json_reporter.hpp"

#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace codesmarty {
namespace server {

/**
 * @struct HttpResponse
 * @brief Status and JSON body produced by a route handler
 */
struct HttpResponse {
    int status{200};
    std::string body;
};

/**
 * @class HttpServer
 * @brief cpp-httplib server bound to an AnalysisEngine
 *
 * Route logic lives in the Handle*() methods so it can be exercised
 * without sockets.
 *
 * **Usage Example**:
 * @code
 * HttpServer server(engine, config.server);
 * if (!server.Start()) {   // blocks until Stop()
 *     spdlog::error("Failed to bind {}:{}", config.server.host, config.server.port);
 * }
 * @endcode
 */
class HttpServer {
public:
    HttpServer(core::AnalysisEngine& engine, const core::ServerConfig& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and serve until Stop() is called
     * @return false if the address could not be bound
     */
    bool Start();

    /// Stop a running server (safe to call from another thread)
    void Stop();

    HttpResponse HandleRoot() const;
    HttpResponse HandleAnalyze(const std::string& body);
    HttpResponse HandleAnalyzeRepo(const std::string& body);

    /// Hint appended to 500 responses caused by the execution engine
    static constexpr const char* kDockerHint = "Ensure Docker is installed and running.";

private:
    void RegisterRoutes();

    static HttpResponse Detail(int status, const std::string& message);

    core::AnalysisEngine& engine_;
    core::ServerConfig config_;
    reporters::JsonReporter reporter_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace server
} // namespace codesmarty
