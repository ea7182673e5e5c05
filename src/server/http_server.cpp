#include "server/http_server.hpp"

#include <algorithm>

#include "nlohmann/json.hpp"
#include "server/execute_response.hpp"
#include "utils/logging.hpp"

namespace hoya::server {
namespace {

constexpr const char* kJson = "application/json";

void Reply(httplib::Response& res, const hoya::sandbox::ExecutionResult& result) {
    res.status = HttpStatusFor(result);
    res.set_content(BuildResponseJson(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), kJson);
}

hoya::sandbox::ExecutionResult BadRequest(std::string message) {
    return hoya::sandbox::ExecutionOrchestrator::Rejected(
        hoya::sandbox::ExecutionError{
            .kind = hoya::sandbox::ErrorKind::kInvalidRequest,
            .message = std::move(message),
            .details = nullptr},
        hoya::sandbox::CodeKind::kUnknown, 0);
}

}  // namespace

HttpServer::HttpServer(const hoya::config::ServerConfig& config, hoya::service::ExecuteService& service)
    : config_(config),
      service_(service) {
    const auto threads = static_cast<std::size_t>(std::max(1, config_.worker_threads));
    server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    RegisterRoutes();
}

void HttpServer::RegisterRoutes() {
    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(nlohmann::json{{"status", "ok"}}.dump(), kJson);
    });
    server_.Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
        HandleExecute(req, res);
    });
}

void HttpServer::HandleExecute(const httplib::Request& req, httplib::Response& res) {
    const auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        Reply(res, BadRequest("request body must be a JSON object"));
        return;
    }
    if (!body.contains("url") || !body["url"].is_string() || body["url"].get<std::string>().empty()) {
        Reply(res, BadRequest("request body requires a non-empty string \"url\""));
        return;
    }
    const auto url = body["url"].get<std::string>();
    const auto result = service_.ExecuteUrl(url);
    Reply(res, result);
}

bool HttpServer::Listen() {
    hoya::utils::Log(hoya::utils::LogLevel::kInfo, "server",
                     "listening on " + config_.host + ":" + std::to_string(config_.port) +
                     " with " + std::to_string(config_.worker_threads) + " workers");
    const bool ok = server_.listen(config_.host, config_.port);
    if (!ok) {
        hoya::utils::Log(hoya::utils::LogLevel::kError, "server",
                         "failed to listen on " + config_.host + ":" + std::to_string(config_.port));
    }
    return ok;
}

int HttpServer::BindToAnyPort() {
    return server_.bind_to_any_port(config_.host);
}

bool HttpServer::ListenAfterBind() {
    return server_.listen_after_bind();
}

void HttpServer::Stop() {
    server_.stop();
}

}  // namespace hoya::server
