/**
 * @file config.hpp
 * @brief Service configuration from environment and JSON file
 *
 * **Environment Variables**:
 * | Variable               | Default            |
 * |------------------------|--------------------|
 * | SANDBOX_BACKEND        | docker (or e2b)    |
 * | SANDBOX_IMAGE          | miroflow-sandbox   |
 * | DEFAULT_TIMEOUT        | 1800               |
 * | SANDBOX_NETWORK        | true               |
 * | SANDBOX_MEMORY_LIMIT   | 4g                 |
 * | SANDBOX_CPUS           | 2                  |
 * | E2B_API_KEY            | (none)             |
 * | E2B_DOMAIN             | e2b.app            |
 * | DEFAULT_TEMPLATE_ID    | all_pip_apt_pkg    |
 * | LOGS_DIR               | ./logs             |
 *
 * The JSON file uses the same settings in snake_case
 * (`{"backend": "docker", "default_timeout": 600, ...}`).
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace sandcell {
namespace core {

/**
 * @enum BackendType
 * @brief Backend selected by SANDBOX_BACKEND
 */
enum class BackendType {
    DOCKER,   ///< Local container runtime
    E2B       ///< Remote cloud sandbox provider
};

std::string BackendTypeToString(BackendType type);

/// @throws std::invalid_argument for anything other than docker / e2b
BackendType ParseBackendType(const std::string& value);

/**
 * @struct ServiceConfig
 * @brief Everything the facade and its backend need
 */
struct ServiceConfig {
    BackendType backend{BackendType::DOCKER};              ///< Selected backend
    std::string image{"miroflow-sandbox"};                 ///< Local image
    std::chrono::seconds default_timeout{1800};            ///< Sandbox idle lifetime
    bool network_enabled{true};                            ///< Bridged network vs none
    std::string memory_limit{"4g"};                        ///< Local memory ceiling
    double cpu_limit{2.0};                                 ///< Local CPU ceiling
    std::string e2b_api_key;                               ///< Remote provider API key
    std::string e2b_domain{"e2b.app"};                     ///< Remote sandbox domain
    std::string template_id{"all_pip_apt_pkg"};            ///< Remote template
    std::filesystem::path logs_dir{"./logs"};              ///< Root for downloaded artifacts
    bool refresh_timeout_on_use{true};                     ///< Re-arm the timeout before each operation
    double retry_backoff_scale{1.0};                       ///< Multiplier on retry sleeps (0 disables)

    /**
     * @brief Defaults overridden by environment variables
     * @throws std::invalid_argument on malformed values
     */
    static ServiceConfig FromEnvironment();

    /**
     * @brief Defaults overridden by a JSON file, then by the environment
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static ServiceConfig FromJsonFile(const std::filesystem::path& path);

    /// Apply environment overrides on top of this configuration
    void ApplyEnvironment();

    /// @throws std::invalid_argument describing the first invalid setting
    void Validate() const;

    /// Downloaded artifacts land here
    std::filesystem::path TmpFilesDir() const { return logs_dir / "tmpfiles"; }
};

} // namespace core
} // namespace sandcell
