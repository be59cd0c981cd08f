/**
 * @file docker_backend.cpp
 * @brief Local container runtime backend
 *
 * @date 2025
 */

#include "sandcell/backends/docker_backend.hpp"
#include "sandcell/core/errors.hpp"
#include "sandcell/utils/string_utils.hpp"
#include "sandcell/utils/tar_archive.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sandcell {
namespace backends {

using core::CommandResult;
using core::ExtractionError;
using core::ProvisioningError;
using core::Session;
using core::TransportError;
using utils::StringUtils;
using utils::TarArchive;

namespace {

constexpr std::chrono::seconds kHousekeepingTimeout{30};

std::string ManagedFilter() {
    return std::string(DockerBackend::kManagedLabel) + "=true";
}

} // anonymous namespace

DockerBackend::DockerBackend(std::shared_ptr<utils::ContainerClient> client,
                             DockerBackendOptions options,
                             core::SessionRegistry& registry)
    : SandboxBackend(core::BackendKind::LOCAL, options.default_timeout, registry),
      client_(std::move(client)),
      options_(std::move(options)) {
    if (!client_) {
        throw std::invalid_argument("DockerBackend requires a container client");
    }
}

DockerBackend::~DockerBackend() {
    StopExpiry();
}

// ============================================================================
// LIFECYCLE HOOKS
// ============================================================================

void DockerBackend::EnsureRuntime() {
    if (runtime_ready_) {
        return;
    }
    if (!client_->IsRuntimeAvailable()) {
        throw ProvisioningError("Container runtime is not available; "
                                "check that the docker daemon is running");
    }
    runtime_ready_ = true;
    spdlog::info("Container runtime version {}", client_->GetRuntimeVersion());
}

DockerBackend::ResourceHandle DockerBackend::ProvisionResource(const ProvisionRequest& request) {
    EnsureRuntime();

    utils::ContainerConfig config;
    config.name = GenerateSessionId();
    config.image = request.image.empty() ? options_.default_image : request.image;
    config.memory_limit = options_.memory_limit;
    config.cpu_limit = options_.cpu_limit;
    config.network_mode = request.network_enabled ? utils::NetworkMode::BRIDGE
                                                  : utils::NetworkMode::NONE;
    config.working_dir = kWorkingDir;
    config.labels[kManagedLabel] = "true";

    ResourceHandle handle;
    handle.session_id = config.name;

    try {
        handle.resource_id = client_->RunContainer(config);
    } catch (const std::exception& e) {
        throw ProvisioningError(e.what());
    }

    std::optional<utils::ContainerInfo> info;
    try {
        info = client_->InspectContainer(config.name);
    } catch (const std::exception& e) {
        spdlog::warn("Could not inspect new container {}: {}", config.name, e.what());
    }

    if (!info || !info->IsRunning()) {
        if (!client_->RemoveContainer(config.name, true)) {
            spdlog::warn("Could not remove failed container {}", config.name);
        }
        throw ProvisioningError("Container " + config.name + " did not stay running");
    }

    if (WriteDeadline(config.name, request.deadline)) {
        handle.deadline = request.deadline;
    }

    spdlog::debug("Container {} started from {} ({})", config.name, config.image,
                  handle.resource_id.substr(0, 12));
    return handle;
}

std::optional<DockerBackend::ResourceHandle>
DockerBackend::LookupResource(const std::string& session_id) {
    auto info = client_->InspectContainer(session_id);
    if (!info) {
        spdlog::debug("No container named {}", session_id);
        return std::nullopt;
    }
    if (!info->IsRunning()) {
        spdlog::debug("Container {} exists but is {}", session_id,
                      utils::ContainerStateToString(info->state));
        return std::nullopt;
    }

    ResourceHandle handle;
    handle.session_id = session_id;
    handle.resource_id = info->id;
    handle.deadline = ReadDeadline(session_id);
    return handle;
}

bool DockerBackend::ResourceRunning(const Session& session) {
    auto info = client_->InspectContainer(session.Id());
    return info && info->IsRunning();
}

void DockerBackend::PersistTimeout(const Session& session,
                                   std::chrono::seconds /*timeout*/,
                                   Session::Clock::time_point deadline) {
    if (!WriteDeadline(session.Id(), deadline)) {
        throw TransportError("Failed to persist deadline for " + session.Id());
    }
}

void DockerBackend::DestroyResource(const std::string& session_id) {
    if (!client_->RemoveContainer(session_id, true)) {
        throw TransportError("Runtime refused to remove container " + session_id);
    }
}

// ============================================================================
// EXECUTION
// ============================================================================

CommandResult DockerBackend::ExecuteCommand(const Session& session,
                                            const std::string& command,
                                            const CommandContext& context) {
    utils::ExecOptions options;
    options.user = context.privileged ? "root" : kSandboxUser;
    options.working_dir = kWorkingDir;
    // Every exec is bounded; a drained session falls back to the default
    auto budget = session.Timeout();
    if (budget.count() <= 0) {
        budget = options_.default_timeout;
    }
    options.timeout = context.timeout.value_or(budget);

    auto exec = client_->Exec(session.Id(), {"bash", "-c", command}, options);

    CommandResult result;
    result.stdout_output = std::move(exec.stdout_output);
    result.stderr_output = std::move(exec.stderr_output);
    result.exit_code = exec.exit_code;
    if (exec.runtime_error) {
        result.error = exec.runtime_error;
        if (result.exit_code == 0) {
            result.exit_code = 1;
        }
    }
    return result;
}

utils::ContainerExecResult DockerBackend::RunAsRoot(const std::string& container,
                                                    const std::string& command) {
    utils::ExecOptions options;
    options.user = "root";
    options.timeout = kHousekeepingTimeout;
    return client_->Exec(container, {"sh", "-c", command}, options);
}

// ============================================================================
// FILE TRANSFER
// ============================================================================

void DockerBackend::PutFile(const Session& session,
                            const std::string& sandbox_path,
                            const std::string& bytes) {
    std::string directory = TarArchive::ParentDirectory(sandbox_path);
    std::string name = TarArchive::BaseName(sandbox_path);
    if (name.empty()) {
        throw TransportError("Sandbox path has no file name: " + sandbox_path);
    }

    auto mkdir = RunAsRoot(session.Id(), "mkdir -p " + StringUtils::ShellQuote(directory));
    if (!mkdir.Succeeded()) {
        throw TransportError("Failed to create " + directory + ": " +
                             mkdir.runtime_error.value_or(StringUtils::Trim(mkdir.stderr_output)));
    }

    std::string archive;
    try {
        archive = TarArchive::Pack(name, bytes);
    } catch (const std::invalid_argument& e) {
        throw TransportError(e.what());
    }

    try {
        client_->PutArchive(session.Id(), directory, archive);
    } catch (const utils::ContainerError& e) {
        throw TransportError(e.what());
    }
}

std::string DockerBackend::FetchFile(const Session& session, const std::string& sandbox_path) {
    std::string archive;
    try {
        archive = client_->GetArchive(session.Id(), sandbox_path);
    } catch (const utils::ContainerError& e) {
        throw ExtractionError("Cannot read " + sandbox_path + ": " + e.what());
    }
    return TarArchive::Unpack(archive);
}

// ============================================================================
// DEADLINE PERSISTENCE
// ============================================================================

bool DockerBackend::WriteDeadline(const std::string& container,
                                  Session::Clock::time_point deadline) {
    auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        deadline.time_since_epoch()).count();
    std::string file = kDeadlineFile;
    std::string directory = TarArchive::ParentDirectory(file);

    auto result = RunAsRoot(container,
        "mkdir -p " + directory + " && echo " + std::to_string(epoch) + " > " + file);
    if (!result.Succeeded()) {
        spdlog::warn("Failed to persist deadline for {}: {}", container,
                     result.runtime_error.value_or(StringUtils::Trim(result.stderr_output)));
        return false;
    }
    return true;
}

std::optional<Session::Clock::time_point> DockerBackend::ReadDeadline(const std::string& container) {
    auto result = RunAsRoot(container, std::string("cat ") + kDeadlineFile);
    if (!result.Succeeded()) {
        spdlog::debug("No persisted deadline in {}", container);
        return std::nullopt;
    }

    try {
        long long epoch = std::stoll(StringUtils::Trim(result.stdout_output));
        return Session::Clock::time_point(std::chrono::seconds(epoch));
    } catch (const std::exception&) {
        spdlog::warn("Unparsable deadline in {}: '{}'", container,
                     StringUtils::Trim(result.stdout_output));
        return std::nullopt;
    }
}

// ============================================================================
// SWEEP
// ============================================================================

SweepReport DockerBackend::Sweep() {
    SweepReport report;
    auto containers = client_->ListContainers(ManagedFilter());
    auto now = Session::Clock::now();

    for (const auto& container : containers) {
        ++report.inspected;
        const std::string& name = container.name.empty() ? container.id : container.name;

        if (!container.IsRunning()) {
            spdlog::info("Sweep: removing stopped sandbox {}", name);
            Kill(name);
            report.removed.push_back(name);
            continue;
        }

        auto deadline = ReadDeadline(name);
        if (deadline && *deadline <= now) {
            spdlog::info("Sweep: removing expired sandbox {}", name);
            Kill(name);
            report.removed.push_back(name);
        }
    }

    spdlog::info("Sweep: {} managed sandbox(es) inspected, {} removed",
                 report.inspected, report.removed.size());
    return report;
}

} // namespace backends
} // namespace sandcell
