/**
 * @file config.cpp
 * @brief Configuration loading
 *
 * @date 2025
 */

#include "sandcell/core/config.hpp"
#include "sandcell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace sandcell {
namespace core {

using utils::StringUtils;

namespace {

const char* Env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

long ParseSeconds(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        long seconds = std::stol(value, &consumed);
        if (consumed != StringUtils::Trim(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return seconds;
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " must be an integer number of seconds, got '" +
                                    value + "'");
    }
}

double ParseDouble(const std::string& name, const std::string& value) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " must be a number, got '" + value + "'");
    }
}

} // anonymous namespace

std::string BackendTypeToString(BackendType type) {
    switch (type) {
        case BackendType::DOCKER: return "docker";
        case BackendType::E2B: return "e2b";
        default: return "unknown";
    }
}

BackendType ParseBackendType(const std::string& value) {
    auto lowered = StringUtils::ToLower(StringUtils::Trim(value));
    if (lowered == "docker") return BackendType::DOCKER;
    if (lowered == "e2b") return BackendType::E2B;
    throw std::invalid_argument("Unknown sandbox backend '" + value + "' (expected docker or e2b)");
}

// ============================================================================
// LOADING
// ============================================================================

ServiceConfig ServiceConfig::FromEnvironment() {
    ServiceConfig config;
    config.ApplyEnvironment();
    return config;
}

ServiceConfig ServiceConfig::FromJsonFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }

    ServiceConfig config;
    try {
        if (j.contains("backend")) config.backend = ParseBackendType(j["backend"].get<std::string>());
        config.image = j.value("image", config.image);
        config.default_timeout = std::chrono::seconds(
            j.value("default_timeout", static_cast<long>(config.default_timeout.count())));
        config.network_enabled = j.value("network_enabled", config.network_enabled);
        config.memory_limit = j.value("memory_limit", config.memory_limit);
        config.cpu_limit = j.value("cpu_limit", config.cpu_limit);
        config.e2b_api_key = j.value("e2b_api_key", config.e2b_api_key);
        config.e2b_domain = j.value("e2b_domain", config.e2b_domain);
        config.template_id = j.value("template_id", config.template_id);
        config.logs_dir = j.value("logs_dir", config.logs_dir.string());
        config.refresh_timeout_on_use = j.value("refresh_timeout_on_use",
                                                config.refresh_timeout_on_use);
        config.retry_backoff_scale = j.value("retry_backoff_scale", config.retry_backoff_scale);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid setting in " + path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid setting in " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    config.ApplyEnvironment();
    return config;
}

void ServiceConfig::ApplyEnvironment() {
    if (auto v = Env("SANDBOX_BACKEND")) backend = ParseBackendType(v);
    if (auto v = Env("SANDBOX_IMAGE")) image = v;
    if (auto v = Env("DEFAULT_TIMEOUT")) {
        default_timeout = std::chrono::seconds(ParseSeconds("DEFAULT_TIMEOUT", v));
    }
    if (auto v = Env("SANDBOX_NETWORK")) network_enabled = StringUtils::ParseBool(v, network_enabled);
    if (auto v = Env("SANDBOX_MEMORY_LIMIT")) memory_limit = v;
    if (auto v = Env("SANDBOX_CPUS")) cpu_limit = ParseDouble("SANDBOX_CPUS", v);
    if (auto v = Env("E2B_API_KEY")) e2b_api_key = v;
    if (auto v = Env("E2B_DOMAIN")) e2b_domain = v;
    if (auto v = Env("DEFAULT_TEMPLATE_ID")) template_id = v;
    if (auto v = Env("LOGS_DIR")) logs_dir = v;
}

void ServiceConfig::Validate() const {
    if (default_timeout.count() <= 0) {
        throw std::invalid_argument("default_timeout must be positive");
    }
    if (cpu_limit <= 0.0) {
        throw std::invalid_argument("cpu_limit must be positive");
    }
    if (retry_backoff_scale < 0.0) {
        throw std::invalid_argument("retry_backoff_scale must not be negative");
    }
    if (backend == BackendType::DOCKER && image.empty()) {
        throw std::invalid_argument("SANDBOX_IMAGE must not be empty");
    }
    if (backend == BackendType::E2B && e2b_api_key.empty()) {
        throw std::invalid_argument("E2B_API_KEY is required when SANDBOX_BACKEND=e2b");
    }
}

} // namespace core
} // namespace sandcell
