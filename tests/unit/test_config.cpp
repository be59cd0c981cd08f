#include <gtest/gtest.h>
#include "sandcell/core/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace sandcell {
namespace core {
namespace {

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kVariables) {
            unsetenv(name);
        }
        temp_dir_ = fs::temp_directory_path() /
                    ("sandcell_config_" + std::to_string(::getpid()));
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        for (const char* name : kVariables) {
            unsetenv(name);
        }
        fs::remove_all(temp_dir_);
    }

    fs::path WriteFile(const std::string& content) {
        auto path = temp_dir_ / "config.json";
        std::ofstream(path) << content;
        return path;
    }

    static constexpr const char* kVariables[] = {
        "SANDBOX_BACKEND", "SANDBOX_IMAGE", "DEFAULT_TIMEOUT", "SANDBOX_NETWORK",
        "SANDBOX_MEMORY_LIMIT", "SANDBOX_CPUS", "E2B_API_KEY", "E2B_DOMAIN",
        "DEFAULT_TEMPLATE_ID", "LOGS_DIR"
    };

    fs::path temp_dir_;
};

TEST_F(ConfigTest, Defaults) {
    auto config = ServiceConfig::FromEnvironment();
    EXPECT_EQ(config.backend, BackendType::DOCKER);
    EXPECT_EQ(config.image, "miroflow-sandbox");
    EXPECT_EQ(config.default_timeout, std::chrono::seconds(1800));
    EXPECT_TRUE(config.network_enabled);
    EXPECT_EQ(config.template_id, "all_pip_apt_pkg");
    EXPECT_EQ(config.TmpFilesDir().string(), (fs::path("./logs") / "tmpfiles").string());
    EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("SANDBOX_BACKEND", "E2B", 1);
    setenv("E2B_API_KEY", "e2b_key", 1);
    setenv("DEFAULT_TIMEOUT", "600", 1);
    setenv("SANDBOX_NETWORK", "false", 1);
    setenv("SANDBOX_CPUS", "1.5", 1);
    setenv("LOGS_DIR", "/var/log/agent", 1);
    setenv("SANDBOX_IMAGE", "", 1);

    auto config = ServiceConfig::FromEnvironment();
    EXPECT_EQ(config.backend, BackendType::E2B);
    EXPECT_EQ(config.e2b_api_key, "e2b_key");
    EXPECT_EQ(config.default_timeout, std::chrono::seconds(600));
    EXPECT_FALSE(config.network_enabled);
    EXPECT_DOUBLE_EQ(config.cpu_limit, 1.5);
    EXPECT_EQ(config.logs_dir.string(), "/var/log/agent");
    // Empty values are ignored
    EXPECT_EQ(config.image, "miroflow-sandbox");
}

TEST_F(ConfigTest, BadEnvironmentValuesThrow) {
    setenv("DEFAULT_TIMEOUT", "ten minutes", 1);
    EXPECT_THROW(ServiceConfig::FromEnvironment(), std::invalid_argument);

    unsetenv("DEFAULT_TIMEOUT");
    setenv("SANDBOX_BACKEND", "podman", 1);
    EXPECT_THROW(ServiceConfig::FromEnvironment(), std::invalid_argument);
}

TEST_F(ConfigTest, JsonFileThenEnvironment) {
    auto path = WriteFile(R"({
        "backend": "docker",
        "image": "python:3.12",
        "default_timeout": 90,
        "memory_limit": "1g",
        "refresh_timeout_on_use": false
    })");
    setenv("SANDBOX_IMAGE", "override:latest", 1);

    auto config = ServiceConfig::FromJsonFile(path);
    EXPECT_EQ(config.image, "override:latest");
    EXPECT_EQ(config.default_timeout, std::chrono::seconds(90));
    EXPECT_EQ(config.memory_limit, "1g");
    EXPECT_FALSE(config.refresh_timeout_on_use);
}

TEST_F(ConfigTest, JsonFileErrors) {
    EXPECT_THROW(ServiceConfig::FromJsonFile(temp_dir_ / "missing.json"), std::runtime_error);
    EXPECT_THROW(ServiceConfig::FromJsonFile(WriteFile("{not json")), std::runtime_error);
    EXPECT_THROW(ServiceConfig::FromJsonFile(WriteFile(R"({"default_timeout": "soon"})")),
                 std::runtime_error);
    EXPECT_THROW(ServiceConfig::FromJsonFile(WriteFile(R"({"backend": "vm"})")),
                 std::runtime_error);
}

TEST_F(ConfigTest, ValidateRejectsBadSettings) {
    ServiceConfig config;
    config.default_timeout = std::chrono::seconds(0);
    EXPECT_THROW(config.Validate(), std::invalid_argument);

    config = ServiceConfig{};
    config.retry_backoff_scale = -1.0;
    EXPECT_THROW(config.Validate(), std::invalid_argument);

    config = ServiceConfig{};
    config.backend = BackendType::E2B;
    EXPECT_THROW(config.Validate(), std::invalid_argument);
    config.e2b_api_key = "key";
    EXPECT_NO_THROW(config.Validate());
}

TEST(BackendTypeTest, ParseAndFormat) {
    EXPECT_EQ(ParseBackendType(" Docker "), BackendType::DOCKER);
    EXPECT_EQ(ParseBackendType("e2b"), BackendType::E2B);
    EXPECT_EQ(BackendTypeToString(BackendType::E2B), "e2b");
    EXPECT_THROW(ParseBackendType("lxc"), std::invalid_argument);
}

} // namespace
} // namespace core
} // namespace sandcell
