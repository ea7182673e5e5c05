#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "httplib.h"
#include "service/execute_service.hpp"

namespace hoya::server {

// POST /execute {"url": "..."} and GET /health on httplib's worker pool.
class HttpServer {
public:
    HttpServer(const hoya::config::ServerConfig& config, hoya::service::ExecuteService& service);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until Stop() is called. Returns false when the address cannot be bound.
    bool Listen();

    // Binds to an ephemeral port and returns it (-1 on failure). Follow with ListenAfterBind().
    int BindToAnyPort();
    bool ListenAfterBind();

    void Stop();
    bool IsRunning() const { return server_.is_running(); }

private:
    void RegisterRoutes();
    void HandleExecute(const httplib::Request& req, httplib::Response& res);

    const hoya::config::ServerConfig& config_;
    hoya::service::ExecuteService& service_;
    httplib::Server server_;
};

}  // namespace hoya::server
