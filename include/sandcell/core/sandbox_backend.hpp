/**
 * @file sandbox_backend.hpp
 * @brief Shared contract of every sandbox execution backend
 *
 * Public operations are non-virtual and hold the behavior both backends
 * share: registry lookup, by-name reattachment, liveness checks, the
 * run-code temp-file flow and expiry. Concrete backends only supply the
 * transport hooks declared protected below.
 *
 * @date 2025
 */

#pragma once

#include "sandcell/core/execution_result.hpp"
#include "sandcell/core/expiry_scheduler.hpp"
#include "sandcell/core/session.hpp"
#include "sandcell/core/session_registry.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace sandcell {
namespace core {

/**
 * @class SandboxBackend
 * @brief Abstract sandbox lifecycle, execution and file transfer
 *
 * **Error Contract**:
 * - Create throws ProvisioningError
 * - Connect throws SessionNotFoundError
 * - RunCommand / RunCode never throw; failures land in `error`
 * - UploadFile throws TransportError, DownloadFile throws ExtractionError
 * - Kill never throws
 *
 * **Usage Example**:
 * @code
 * backends::DockerBackend backend(std::make_shared<utils::ContainerUtils>());
 *
 * auto id = backend.Create("miroflow-sandbox", std::chrono::seconds(1800), true);
 * auto session = backend.Connect(id);
 *
 * auto result = backend.RunCommand(*session, "echo hello");
 * std::cout << result.stdout_output;   // "hello\n"
 *
 * backend.Kill(id);
 * @endcode
 *
 * **Thread Safety**: operations may be called concurrently for different
 * sessions. Concrete backends must call StopExpiry() first thing in their
 * destructor so no expiry callback runs against a half-destroyed object.
 */
class SandboxBackend {
public:
    virtual ~SandboxBackend();

    SandboxBackend(const SandboxBackend&) = delete;
    SandboxBackend& operator=(const SandboxBackend&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    /**
     * @brief Provision a new sandbox and register it
     * @param image Image or template; empty selects the backend default
     * @param timeout Idle lifetime; zero selects the backend default
     * @param network_enabled Bridged network when true, none otherwise
     * @return New session identifier
     * @throws ProvisioningError if the runtime refuses
     */
    std::string Create(const std::string& image,
                       std::chrono::seconds timeout,
                       bool network_enabled);

    /**
     * @brief Resolve an identifier to a live session
     *
     * Looks in the registry first and falls back to asking the runtime
     * for a resource with that name, which is how a fresh process picks
     * up a sandbox created by an earlier one.
     *
     * @throws SessionNotFoundError if no running resource exists
     */
    std::shared_ptr<Session> Connect(const std::string& session_id);

    /// Force-remove a sandbox; idempotent and never throws
    void Kill(const std::string& session_id);
    void Kill(const Session& session);

    /// Whether the session's resource is running right now
    bool IsRunning(const Session& session);

    /**
     * @brief Change the idle timeout, counted from now
     *
     * Re-arms the expiry task and persists the new deadline with the
     * resource so a later process honors it.
     *
     * @throws TransportError if the deadline cannot be persisted
     */
    void SetTimeout(const std::shared_ptr<Session>& session, std::chrono::seconds timeout);

    // ========================================================================
    // EXECUTION
    // ========================================================================

    /// Run a shell command as the unprivileged sandbox user
    CommandResult RunCommand(const Session& session,
                             const std::string& command,
                             std::optional<std::chrono::seconds> timeout = std::nullopt);

    /**
     * @brief Run a block of Python source
     *
     * The source travels through the file transport into a uniquely named
     * temp file, so no shell escaping is involved. The temp file is removed
     * on every exit path.
     */
    CodeResult RunCode(const Session& session,
                       const std::string& code,
                       std::optional<std::chrono::seconds> timeout = std::nullopt);

    // ========================================================================
    // FILE TRANSFER
    // ========================================================================

    /**
     * @brief Copy a local file into the sandbox
     * @throws TransportError if the local file is unreadable or the copy fails
     */
    void UploadFile(const Session& session,
                    const std::filesystem::path& local_path,
                    const std::string& sandbox_path);

    /**
     * @brief Write bytes to a sandbox path, creating missing directories
     * @throws TransportError on failure
     */
    void WriteFile(const Session& session,
                   const std::string& sandbox_path,
                   const std::string& bytes);

    /**
     * @brief Read a sandbox file's raw bytes
     * @throws ExtractionError if the path is not a readable file
     */
    std::string DownloadFile(const Session& session, const std::string& sandbox_path);

    // ========================================================================
    // ACCESSORS
    // ========================================================================

    BackendKind Kind() const { return kind_; }
    std::chrono::seconds DefaultTimeout() const { return default_timeout_; }

    /// Pending expiry deadline for a session, if armed in this process
    std::optional<ExpiryScheduler::Clock::time_point> ExpiryDeadline(const std::string& session_id) const;

    /// Working directory commands start in
    virtual std::string WorkingDirectory() const = 0;

protected:
    SandboxBackend(BackendKind kind,
                   std::chrono::seconds default_timeout,
                   SessionRegistry& registry);

    /// What Create asks a backend to provision
    struct ProvisionRequest {
        std::string image;
        std::chrono::seconds timeout{0};
        bool network_enabled{true};
        Session::Clock::time_point deadline;
    };

    /// A provisioned or rediscovered resource
    struct ResourceHandle {
        std::string session_id;
        std::string resource_id;
        std::string endpoint;
        std::string access_token;
        std::optional<Session::Clock::time_point> deadline;   ///< Persisted expiry, if known
    };

    /// Per-command execution settings
    struct CommandContext {
        bool privileged{false};                          ///< Run as root instead of the sandbox user
        std::optional<std::chrono::seconds> timeout;
    };

    // ========================================================================
    // TRANSPORT HOOKS
    // ========================================================================

    /// @throws ProvisioningError
    virtual ResourceHandle ProvisionResource(const ProvisionRequest& request) = 0;

    /// Running resource by name, or nullopt when absent or stopped
    virtual std::optional<ResourceHandle> LookupResource(const std::string& session_id) = 0;

    virtual bool ResourceRunning(const Session& session) = 0;

    /// May throw; RunCommand converts exceptions into result errors
    virtual CommandResult ExecuteCommand(const Session& session,
                                         const std::string& command,
                                         const CommandContext& context) = 0;

    /// @throws TransportError
    virtual void PutFile(const Session& session,
                         const std::string& sandbox_path,
                         const std::string& bytes) = 0;

    /// @throws ExtractionError
    virtual std::string FetchFile(const Session& session, const std::string& sandbox_path) = 0;

    /// @throws TransportError
    virtual void PersistTimeout(const Session& session,
                                std::chrono::seconds timeout,
                                Session::Clock::time_point deadline) = 0;

    /// Remove the resource; may throw, callers log and continue
    virtual void DestroyResource(const std::string& session_id) = 0;

    /// Interpreter used by RunCode
    virtual std::string Interpreter() const = 0;

    // ========================================================================
    // HELPERS FOR DERIVED BACKENDS
    // ========================================================================

    /// Fresh identifier of the form `sc-<12 hex>`
    static std::string GenerateSessionId();

    /// Stop expiry; call at the start of every derived destructor
    void StopExpiry();

private:
    void ArmExpiry(const std::shared_ptr<Session>& session);
    void Expire(const std::shared_ptr<Session>& session);
    void RemoveQuietly(const Session& session, const std::string& sandbox_path);

    const BackendKind kind_;
    const std::chrono::seconds default_timeout_;
    SessionRegistry& registry_;
    ExpiryScheduler scheduler_;
};

} // namespace core
} // namespace sandcell
