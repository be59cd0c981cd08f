/**
 * @file docker_backend.hpp
 * @brief Sandbox backend on a local Docker-compatible container runtime
 *
 * Each session is one long-lived container named after the session id and
 * labelled as managed by sandcell. Commands run through `exec` as the
 * unprivileged `sandbox` user; files travel as tar streams through the
 * runtime's archive copy. The expiry deadline is persisted inside the
 * container so a later process (or `sandcell sweep`) can honor it.
 *
 * @date 2025
 */

#pragma once

#include "sandcell/core/sandbox_backend.hpp"
#include "sandcell/utils/container_utils.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sandcell {
namespace backends {

/**
 * @struct DockerBackendOptions
 * @brief Container defaults applied at create time
 */
struct DockerBackendOptions {
    std::string default_image{"miroflow-sandbox"};         ///< Image when Create gets none
    std::string memory_limit{"4g"};                        ///< Memory ceiling
    double cpu_limit{2.0};                                 ///< CPU ceiling in cores
    std::chrono::seconds default_timeout{1800};            ///< Idle lifetime
};

/**
 * @struct SweepReport
 * @brief Outcome of a sweep over managed containers
 */
struct SweepReport {
    std::size_t inspected{0};                 ///< Managed containers seen
    std::vector<std::string> removed;         ///< Names removed (expired or stopped)
};

/**
 * @class DockerBackend
 * @brief Local container runtime implementation of SandboxBackend
 *
 * **Usage Example**:
 * @code
 * auto docker = std::make_shared<utils::ContainerUtils>();
 * DockerBackend backend(docker);
 *
 * auto id = backend.Create("", std::chrono::seconds(600), false);
 * auto session = backend.Connect(id);
 * auto result = backend.RunCode(*session, "print(1+1)");
 * backend.Kill(id);
 * @endcode
 */
class DockerBackend : public core::SandboxBackend {
public:
    static constexpr const char* kSandboxUser = "sandbox";
    static constexpr const char* kWorkingDir = "/home/sandbox";
    static constexpr const char* kManagedLabel = "sandcell.managed";
    static constexpr const char* kDeadlineFile = "/var/run/sandcell/expires_at";

    explicit DockerBackend(std::shared_ptr<utils::ContainerClient> client,
                           DockerBackendOptions options = {},
                           core::SessionRegistry& registry = core::SessionRegistry::Instance());
    ~DockerBackend() override;

    /**
     * @brief Remove managed containers whose persisted deadline has passed
     *
     * Stopped managed containers are removed too. Running containers with
     * no readable deadline are left alone.
     */
    SweepReport Sweep();

    std::string WorkingDirectory() const override { return kWorkingDir; }

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
    std::string Interpreter() const override { return "python"; }

private:
    /// Check the runtime once per backend; throws ProvisioningError when it is down
    void EnsureRuntime();

    utils::ContainerExecResult RunAsRoot(const std::string& container,
                                         const std::string& command);

    /// Write the deadline file; returns false (and logs) on failure
    bool WriteDeadline(const std::string& container, core::Session::Clock::time_point deadline);
    std::optional<core::Session::Clock::time_point> ReadDeadline(const std::string& container);

    std::shared_ptr<utils::ContainerClient> client_;
    DockerBackendOptions options_;
    std::atomic<bool> runtime_ready_{false};
};

} // namespace backends
} // namespace sandcell
