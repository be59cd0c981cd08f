/**
 * @file sandbox_service.hpp
 * @brief Agent-facing facade over the configured sandbox backend
 *
 * Every operation returns a human-readable string. Failures never escape as
 * exceptions; they come back as text starting with `[ERROR]:` plus a hint
 * telling the agent what to do next.
 *
 * **Retry Policy**:
 * - Create: 5 attempts, sleeping `attempt * 2` seconds between them
 * - Command / code: 5 attempts on execution-layer failures, same backoff
 * - URL download: 3 attempts, sleeping `4^attempt` seconds
 * - Connect: no retry, reported immediately
 *
 * @date 2025
 */

#pragma once

#include "sandcell/core/config.hpp"
#include "sandcell/core/sandbox_backend.hpp"

#include <memory>
#include <string>

namespace sandcell {
namespace core {

/**
 * @class SandboxService
 * @brief Backend-selecting, string-returning sandbox operations
 *
 * **Usage Example**:
 * @code
 * SandboxService service(ServiceConfig::FromEnvironment());
 *
 * std::string created = service.CreateSandbox();
 * // "Sandbox created with sandbox_id: sc-1a2b3c4d5e6f"
 *
 * std::cout << service.RunCommand("sc-1a2b3c4d5e6f", "echo hello");
 * std::cout << service.RunPythonCode("sc-1a2b3c4d5e6f", "print(1+1)");
 * service.KillSandbox("sc-1a2b3c4d5e6f");
 * @endcode
 */
class SandboxService {
public:
    static constexpr int kCreateAttempts = 5;
    static constexpr int kExecuteAttempts = 5;
    static constexpr int kDownloadAttempts = 3;

    /**
     * @brief Build the backend named by the configuration
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit SandboxService(ServiceConfig config);

    /// Use an already constructed backend
    SandboxService(ServiceConfig config, std::shared_ptr<SandboxBackend> backend);

    std::string CreateSandbox();

    std::string RunCommand(const std::string& sandbox_id, const std::string& command);

    std::string RunPythonCode(const std::string& sandbox_id, const std::string& code_block);

    /**
     * @param sandbox_dir Destination directory; empty selects the working directory
     */
    std::string UploadFileFromLocalToSandbox(const std::string& sandbox_id,
                                             const std::string& local_file_path,
                                             const std::string& sandbox_dir = "");

    /**
     * @brief Fetch a URL with wget from inside the sandbox
     * @param sandbox_dir Destination directory; empty selects the working directory
     */
    std::string DownloadFileFromInternetToSandbox(const std::string& sandbox_id,
                                                  const std::string& url,
                                                  const std::string& sandbox_dir = "");

    /**
     * @brief Copy a sandbox file to `<logs_dir>/tmpfiles/sandbox_<id>_<name>`
     * @param local_filename Name to save as; empty keeps the sandbox file name
     */
    std::string DownloadFileFromSandboxToLocal(const std::string& sandbox_id,
                                               const std::string& sandbox_file_path,
                                               const std::string& local_filename = "");

    std::string KillSandbox(const std::string& sandbox_id);

    /// Remove expired managed sandboxes (local backend only)
    std::string Sweep();

    SandboxBackend& Backend() { return *backend_; }
    const ServiceConfig& Config() const { return config_; }

    /// Whether a facade result reports a failure
    static bool IsError(const std::string& result);

private:
    std::shared_ptr<Session> ConnectOrReport(const std::string& sandbox_id, std::string& error);
    void RefreshTimeout(const std::shared_ptr<Session>& session);
    void Backoff(double seconds) const;
    std::string JoinSandboxPath(const std::string& directory, const std::string& name) const;

    ServiceConfig config_;
    std::shared_ptr<SandboxBackend> backend_;
};

} // namespace core
} // namespace sandcell
