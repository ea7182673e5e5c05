#include "sandbox/script_sandbox.hpp"

#include <chrono>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "httplib.h"

namespace hoya::sandbox {
namespace {

using namespace std::chrono_literals;

FetchedResource Script(const std::string& source) {
    FetchedResource resource{};
    resource.bytes.assign(source.begin(), source.end());
    resource.size_bytes = resource.bytes.size();
    resource.detected_kind = CodeKind::kScript;
    resource.source_url = "https://example.com/test.js";
    return resource;
}

class ScriptSandboxTest : public ::testing::Test {
protected:
    SandboxResult Run(const std::string& source) {
        HostBridge bridge(HostCallContext{
            .sink = sink_,
            .policy = policy_,
            .deadline = std::chrono::steady_clock::now() + 5s});
        ScriptSandbox sandbox(config_);
        auto result = sandbox.Execute(Script(source), bridge);
        last_state_ = sandbox.CurrentState();
        return result;
    }

    hoya::config::SandboxConfig config_;
    hoya::config::FetchPolicyConfig policy_;
    CaptureSink sink_{64 * 1024};
    ScriptSandbox::State last_state_ = ScriptSandbox::State::kCreated;
};

TEST_F(ScriptSandboxTest, ReturnsLastExpressionAndLogs) {
    const auto result = Run(R"(app_log("INFO", "hi"); 42)");
    ASSERT_FALSE(result.error.has_value()) << result.error->message;
    EXPECT_EQ(result.return_value.value(), "42");
    const auto out = sink_.Drain(Stream::kStdout);
    EXPECT_NE(out.find("INFO"), std::string::npos);
    EXPECT_NE(out.find("hi"), std::string::npos);
    EXPECT_EQ(last_state_, ScriptSandbox::State::kCompleted);
}

TEST_F(ScriptSandboxTest, ConvertsValuesToText) {
    EXPECT_EQ(Run(R"("plain")").return_value.value(), "plain");
    EXPECT_EQ(Run("1 + 1 === 2").return_value.value(), "true");
    EXPECT_EQ(Run("null").return_value.value(), "null");
    EXPECT_EQ(Run("undefined").return_value.value(), "undefined");
    EXPECT_EQ(Run("1.5").return_value.value(), "1.5");
    EXPECT_EQ(Run(R"(({a: 1, b: [1, 2]}))").return_value.value(), R"({"a":1,"b":[1,2]})");
    EXPECT_EQ(Run("[1, 'x']").return_value.value(), R"([1,"x"])");
}

TEST_F(ScriptSandboxTest, ConsoleWritesToBothStreams) {
    const auto result = Run(R"(
        console.log("a", 1, {k: "v"});
        console.info("info");
        console.warn("warned");
        console.error("failed");
        "done"
    )");
    ASSERT_FALSE(result.error.has_value()) << result.error->message;
    EXPECT_EQ(sink_.Drain(Stream::kStdout), "a 1 {\"k\":\"v\"}\ninfo\n");
    EXPECT_EQ(sink_.Drain(Stream::kStderr), "warned\nfailed\n");
}

TEST_F(ScriptSandboxTest, UncaughtThrowKeepsEarlierOutput) {
    const auto result = Run(R"(console.log("before"); throw new Error("boom");)");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kRuntimeError);
    EXPECT_NE(result.error->message.find("boom"), std::string::npos);
    EXPECT_EQ(result.error->details["name"], "Error");
    EXPECT_FALSE(result.return_value.has_value());
    EXPECT_EQ(sink_.Drain(Stream::kStdout), "before\n");
    EXPECT_EQ(last_state_, ScriptSandbox::State::kFailed);
}

TEST_F(ScriptSandboxTest, ThrownNonErrorValue) {
    const auto result = Run(R"(throw {reason: "custom"};)");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kRuntimeError);
    EXPECT_EQ(result.error->details["value"]["reason"], "custom");
}

TEST_F(ScriptSandboxTest, SyntaxErrorBeforeAnyExecution) {
    const auto result = Run("console.log('never');\nlet = ;");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kSyntaxError);
    EXPECT_TRUE(sink_.Drain(Stream::kStdout).empty());
}

TEST_F(ScriptSandboxTest, InvalidUtf8IsSyntaxError) {
    const auto result = Run(std::string("\"ok\"; \xff\xfe"));
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kSyntaxError);
}

TEST_F(ScriptSandboxTest, InterruptStopsRunawayLoop) {
    HostBridge bridge(HostCallContext{
        .sink = sink_,
        .policy = policy_,
        .deadline = std::chrono::steady_clock::now() + 5s});
    ScriptSandbox sandbox(config_);
    std::thread watchdog([&sandbox]() {
        std::this_thread::sleep_for(100ms);
        sandbox.Interrupt();
    });
    const auto started = std::chrono::steady_clock::now();
    const auto result = sandbox.Execute(Script("while (true) {}"), bridge);
    watchdog.join();

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST_F(ScriptSandboxTest, CatchableFetchPolicyViolation) {
    policy_.allowed_domains = {"example.com"};
    const auto result = Run(R"(
        var code = "none";
        try {
            fetch("http://evil.test/");
        } catch (e) {
            code = e.code;
        }
        code
    )");
    ASSERT_FALSE(result.error.has_value()) << result.error->message;
    EXPECT_EQ(result.return_value.value(), "FetchPolicyViolation");
}

TEST_F(ScriptSandboxTest, UncaughtFetchViolationFailsExecution) {
    policy_.allowed_domains = {"example.com"};
    const auto result = Run(R"(fetch({url: "http://evil.test/", method: "GET"}))");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kRuntimeError);
    EXPECT_NE(result.error->message.find("FetchPolicyViolation"), std::string::npos);
}

TEST_F(ScriptSandboxTest, FetchWithoutArgumentsThrowsTypeError) {
    const auto result = Run(R"(
        var name = "none";
        try { fetch(); } catch (e) { name = e.name; }
        name
    )");
    ASSERT_FALSE(result.error.has_value()) << result.error->message;
    EXPECT_EQ(result.return_value.value(), "TypeError");
}

TEST_F(ScriptSandboxTest, UnixTimeIsAvailable) {
    EXPECT_EQ(Run("get_unixtime() > 1600000000").return_value.value(), "true");
}

TEST_F(ScriptSandboxTest, PromiseReactionsRun) {
    const auto result = Run(R"(Promise.resolve(7).then(function (v) { console.log("got", v); }); 1)");
    ASSERT_FALSE(result.error.has_value()) << result.error->message;
    EXPECT_EQ(sink_.Drain(Stream::kStdout), "got 7\n");
}

TEST_F(ScriptSandboxTest, MemoryLimitStopsAllocationLoop) {
    config_.script_memory_limit_bytes = 8 * 1024 * 1024;
    const auto result = Run(R"(
        var chunks = [];
        while (true) { chunks.push(new Array(100000).fill(1)); }
    )");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->kind, ErrorKind::kTimeout);
}

class ScriptFetchTest : public ScriptSandboxTest {
protected:
    void SetUp() override {
        server_.Get("/hello", [](const httplib::Request& req, httplib::Response& res) {
            res.set_header("X-Reply", "yes");
            res.set_content("hello " + req.get_header_value("X-Name"), "text/plain");
        });
        server_.Post("/echo", [](const httplib::Request& req, httplib::Response& res) {
            res.status = 201;
            res.set_content(req.body, "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        server_.wait_until_ready();
        policy_.allow_loopback = true;
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string Url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
};

TEST_F(ScriptFetchTest, ReturnsResponseObject) {
    const auto result = Run(
        "var r = fetch(\"" + Url("/hello") + "\", {headers: {\"X-Name\": \"js\"}});\n"
        "JSON.stringify([r.status, r.headers[\"X-Reply\"], r.body, r.truncated, \"error\" in r])");
    ASSERT_FALSE(result.error.has_value()) << result.error->message;
    EXPECT_EQ(result.return_value.value(), R"([200,"yes","hello js",false,false])");
}

TEST_F(ScriptFetchTest, PostsObjectBodyAsJson) {
    const auto result = Run(
        "var r = fetch({url: \"" + Url("/echo") + "\", method: \"POST\", body: {a: 1}});\n"
        "r.status + \" \" + JSON.parse(r.body).a");
    ASSERT_FALSE(result.error.has_value()) << result.error->message;
    EXPECT_EQ(result.return_value.value(), "201 1");
}

}  // namespace
}  // namespace hoya::sandbox
