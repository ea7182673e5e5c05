#include "server/http_server.hpp"

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "httplib.h"
#include "nlohmann/json.hpp"

namespace hoya::server {
namespace {

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
            unsetenv(name);
        }

        origin_.Get("/hello.js", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("console.log(\"hi\"); 6 * 7", "application/javascript");
        });
        origin_port_ = origin_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(origin_port_, 0);
        origin_thread_ = std::thread([this]() { origin_.listen_after_bind(); });
        origin_.wait_until_ready();

        port_ = server_.BindToAnyPort();
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_.ListenAfterBind(); });
        for (int i = 0; i < 200 && !server_.IsRunning(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT_TRUE(server_.IsRunning());
    }

    void TearDown() override {
        server_.Stop();
        if (thread_.joinable()) {
            thread_.join();
        }
        origin_.stop();
        if (origin_thread_.joinable()) {
            origin_thread_.join();
        }
    }

    httplib::Result PostExecute(const std::string& body) {
        httplib::Client client("127.0.0.1", port_);
        return client.Post("/execute", body, "application/json");
    }

    std::string OriginUrl(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(origin_port_) + path;
    }

    hoya::config::Config config_;
    hoya::service::ExecuteService service_{config_};
    HttpServer server_{config_.server, service_};
    std::thread thread_;
    int port_ = -1;

    httplib::Server origin_;
    std::thread origin_thread_;
    int origin_port_ = -1;
};

TEST_F(HttpServerTest, HealthReportsOk) {
    httplib::Client client("127.0.0.1", port_);
    const auto res = client.Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(nlohmann::json::parse(res->body)["status"], "ok");
}

TEST_F(HttpServerTest, NonJsonBodyIsInvalidRequest) {
    const auto res = PostExecute("url=http://example.com");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    const auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["status"], "error");
    EXPECT_EQ(body["error"]["code"], "InvalidRequest");
}

TEST_F(HttpServerTest, MissingOrEmptyUrlIsInvalidRequest) {
    for (const char* payload : {R"({})", R"({"url": 7})", R"({"url": ""})", R"(["http://example.com"])"}) {
        const auto res = PostExecute(payload);
        ASSERT_TRUE(res) << payload;
        EXPECT_EQ(res->status, 400) << payload;
        EXPECT_EQ(nlohmann::json::parse(res->body)["error"]["code"], "InvalidRequest") << payload;
    }
}

TEST_F(HttpServerTest, ExecutesDownloadedScript) {
    const auto res = PostExecute(nlohmann::json{{"url", OriginUrl("/hello.js")}}.dump());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    const auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["status"], "success");
    EXPECT_EQ(body["output"], "42");
    EXPECT_EQ(body["stdout"], "hi\n");
    EXPECT_EQ(body["metadata"]["codeType"], "javascript");
}

TEST_F(HttpServerTest, MissingResourceIsDownloadError) {
    const auto res = PostExecute(nlohmann::json{{"url", OriginUrl("/missing.js")}}.dump());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 502);
    const auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], "DownloadError");
    EXPECT_EQ(body["error"]["details"]["status"], 404);
}

}  // namespace
}  // namespace hoya::server
