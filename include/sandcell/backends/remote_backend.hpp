/**
 * @file remote_backend.hpp
 * @brief Sandbox backend on a remote cloud sandbox provider (E2B API)
 *
 * Two HTTP surfaces are involved:
 * - Control plane (`https://api.<domain>`, `X-API-Key`): create, inspect,
 *   extend and delete sandboxes
 * - Data plane (the in-sandbox agent at `https://49983-<id>.<domain>`):
 *   process start over the Connect streaming protocol, file read/write
 *
 * The provider assigns the sandbox id, which becomes the session id.
 * Timeouts are enforced by the provider as well as by local expiry.
 *
 * @date 2025
 */

#pragma once

#include "sandcell/core/sandbox_backend.hpp"
#include "sandcell/utils/http_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sandcell {
namespace backends {

/**
 * @struct RemoteBackendOptions
 * @brief Provider account and defaults
 */
struct RemoteBackendOptions {
    std::string api_key;                                   ///< Provider API key (required)
    std::string domain{"e2b.app"};                         ///< Sandbox domain
    std::string api_url;                                   ///< Control plane URL (empty = https://api.e2b.dev)
    std::string default_template{"all_pip_apt_pkg"};       ///< Template when Create gets none
    std::chrono::seconds default_timeout{1800};            ///< Idle lifetime
    std::chrono::seconds request_timeout{60};              ///< Control plane / file request budget
    std::chrono::seconds command_timeout{600};             ///< Budget for commands without their own timeout
    int envd_port{49983};                                  ///< In-sandbox agent port
};

/**
 * @class RemoteBackend
 * @brief Remote provider implementation of SandboxBackend
 *
 * **Usage Example**:
 * @code
 * RemoteBackendOptions options;
 * options.api_key = std::getenv("E2B_API_KEY");
 *
 * RemoteBackend backend(std::make_shared<utils::BeastHttpClient>(), options);
 * auto id = backend.Create("", std::chrono::seconds(1800), true);
 * auto result = backend.RunCommand(*backend.Connect(id), "echo hello");
 * @endcode
 */
class RemoteBackend : public core::SandboxBackend {
public:
    static constexpr const char* kSandboxUser = "user";
    static constexpr const char* kWorkingDir = "/home/user";

    /**
     * @throws std::invalid_argument if no API key is configured
     */
    RemoteBackend(std::shared_ptr<utils::HttpClient> http,
                  RemoteBackendOptions options,
                  core::SessionRegistry& registry = core::SessionRegistry::Instance());
    ~RemoteBackend() override;

    std::string WorkingDirectory() const override { return kWorkingDir; }

    // ========================================================================
    // WIRE HELPERS
    // ========================================================================

    /// Frame a payload as a Connect envelope (1 flag byte + 4 byte length)
    static std::string EncodeEnvelope(const std::string& payload, std::uint8_t flags = 0);

    /**
     * @brief Fold a process event stream into a command result
     *
     * Data events are base64 and appended in arrival order; the end event
     * carries the exit code (absent means 0). A trailer carrying an error,
     * or a stream without an end event, sets `error`.
     */
    static core::CommandResult DecodeProcessStream(const std::string& body);

    /// Parse an RFC 3339 UTC timestamp (`2025-01-01T00:00:00.000Z`)
    static std::optional<core::Session::Clock::time_point> ParseTimestamp(const std::string& text);

protected:
    ResourceHandle ProvisionResource(const ProvisionRequest& request) override;
    std::optional<ResourceHandle> LookupResource(const std::string& session_id) override;
    bool ResourceRunning(const core::Session& session) override;
    core::CommandResult ExecuteCommand(const core::Session& session,
                                       const std::string& command,
                                       const CommandContext& context) override;
    void PutFile(const core::Session& session,
                 const std::string& sandbox_path,
                 const std::string& bytes) override;
    std::string FetchFile(const core::Session& session, const std::string& sandbox_path) override;
    void PersistTimeout(const core::Session& session,
                        std::chrono::seconds timeout,
                        core::Session::Clock::time_point deadline) override;
    void DestroyResource(const std::string& session_id) override;
    std::string Interpreter() const override { return "python3"; }

private:
    utils::HttpResponse ControlRequest(const std::string& method,
                                       const std::string& path,
                                       const std::string& body = "");
    std::optional<nlohmann::json> FetchSandboxInfo(const std::string& sandbox_id);
    std::string EndpointFor(const std::string& sandbox_id, const std::string& domain) const;
    void AddDataPlaneAuth(utils::HttpRequest& request,
                          const core::Session& session,
                          const std::string& user) const;

    std::shared_ptr<utils::HttpClient> http_;
    RemoteBackendOptions options_;
};

} // namespace backends
} // namespace sandcell
