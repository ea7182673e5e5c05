#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

#include <gtest/gtest.h>

namespace hoya::config {
namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("hoya_config_test_" + std::to_string(::getpid()) + ".json");
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        for (const char* name : {"HOYA_SERVER__PORT", "HOYA_FETCH__ALLOWED_DOMAINS",
                                 "HOYA_SANDBOX__TIMEOUT_MS", "HOYA_FETCH__ALLOW_LOOPBACK"}) {
            ::unsetenv(name);
        }
    }

    void WriteFile(const std::string& text) {
        std::ofstream output(path_);
        output << text;
    }

    std::filesystem::path path_;
};

TEST_F(ConfigLoaderTest, DefaultsWithoutFile) {
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.sandbox.timeout_ms, 5000);
    EXPECT_TRUE(config.fetch.allowed_domains.empty());
    EXPECT_FALSE(config.fetch.allow_loopback);
}

TEST_F(ConfigLoaderTest, ReadsJsonSections) {
    WriteFile(R"({
        "server": {"host": "0.0.0.0", "port": 8080, "workerThreads": 2},
        "sandbox": {"timeoutMs": 750, "maxOutputBytes": 2048, "moduleMemoryLimitBytes": 1048576},
        "fetch": {"allowedDomains": ["example.com", "api.test"], "timeoutMs": 1500, "allowLoopback": true},
        "download": {"maxBytes": 4096},
        "log": {"level": "debug"}
    })");
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.worker_threads, 2);
    EXPECT_EQ(config.sandbox.timeout_ms, 750);
    EXPECT_EQ(config.sandbox.max_output_bytes, 2048u);
    EXPECT_EQ(config.sandbox.module_memory_limit_bytes, 1048576u);
    EXPECT_EQ(config.fetch.allowed_domains, (std::vector<std::string>{"example.com", "api.test"}));
    EXPECT_EQ(config.fetch.timeout_ms, 1500);
    EXPECT_TRUE(config.fetch.allow_loopback);
    EXPECT_EQ(config.download.max_bytes, 4096u);
    EXPECT_EQ(config.log.min_level, hoya::utils::LogLevel::kDebug);
}

TEST_F(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    WriteFile("{ not json");
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.server.port, 3000);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    WriteFile(R"({"server": {"port": 8080}, "fetch": {"allowedDomains": ["file.test"]}})");
    ::setenv("HOYA_SERVER__PORT", "9090", 1);
    ::setenv("HOYA_FETCH__ALLOWED_DOMAINS", " a.test , b.test ,", 1);
    ::setenv("HOYA_SANDBOX__TIMEOUT_MS", "not-a-number", 1);
    ::setenv("HOYA_FETCH__ALLOW_LOOPBACK", "yes", 1);

    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.fetch.allowed_domains, (std::vector<std::string>{"a.test", "b.test"}));
    EXPECT_EQ(config.sandbox.timeout_ms, 5000);
    EXPECT_TRUE(config.fetch.allow_loopback);
}

}  // namespace
}  // namespace hoya::config
