/**
 * @file sandbox_backend.cpp
 * @brief Backend-independent session lifecycle
 *
 * Implements the behavior shared by every backend on top of the transport
 * hooks:
 * - Registry-first connect with by-name reattachment
 * - Deadline restoration on reattach (expired resources are removed)
 * - Expiry arming, re-arming and firing
 * - The run-code temp-file flow
 *
 * @date 2025
 */

#include "sandcell/core/sandbox_backend.hpp"
#include "sandcell/core/errors.hpp"
#include "sandcell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace sandcell {
namespace core {

using utils::StringUtils;

namespace {

constexpr const char* kSessionPrefix = "sc-";
constexpr std::size_t kSessionHexLength = 12;
constexpr const char* kCodeFilePrefix = "/tmp/_sc_exec_";
constexpr std::size_t kCodeFileHexLength = 8;

// Runs the wrapped cleanup when leaving scope
template <typename Fn>
class ScopeExit {
public:
    explicit ScopeExit(Fn fn) : fn_(std::move(fn)) {}
    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    Fn fn_;
};

template <typename Fn>
ScopeExit<Fn> MakeScopeExit(Fn fn) {
    return ScopeExit<Fn>(std::move(fn));
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

SandboxBackend::SandboxBackend(BackendKind kind,
                               std::chrono::seconds default_timeout,
                               SessionRegistry& registry)
    : kind_(kind),
      default_timeout_(default_timeout),
      registry_(registry) {}

SandboxBackend::~SandboxBackend() {
    scheduler_.Stop();
}

void SandboxBackend::StopExpiry() {
    scheduler_.Stop();
}

std::string SandboxBackend::GenerateSessionId() {
    return kSessionPrefix + StringUtils::RandomHex(kSessionHexLength);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

std::string SandboxBackend::Create(const std::string& image,
                                   std::chrono::seconds timeout,
                                   bool network_enabled) {
    ProvisionRequest request;
    request.image = image;
    request.timeout = timeout.count() > 0 ? timeout : default_timeout_;
    request.network_enabled = network_enabled;
    request.deadline = Session::Clock::now() + request.timeout;

    spdlog::info("Provisioning {} sandbox (image: {}, timeout: {}s, network: {})",
                 BackendKindToString(kind_),
                 image.empty() ? "<default>" : image,
                 request.timeout.count(),
                 network_enabled ? "enabled" : "disabled");

    ResourceHandle handle = ProvisionResource(request);

    auto session = std::make_shared<Session>(handle.session_id, kind_,
                                             handle.resource_id, request.timeout);
    session->endpoint = handle.endpoint;
    session->access_token = handle.access_token;
    session->RestoreDeadline(handle.deadline.value_or(request.deadline));

    registry_.Insert(session);
    ArmExpiry(session);

    spdlog::info("Sandbox {} created", session->Id());
    return session->Id();
}

std::shared_ptr<Session> SandboxBackend::Connect(const std::string& session_id) {
    if (session_id.empty()) {
        throw SessionNotFoundError("Empty sandbox id");
    }

    if (auto cached = registry_.Find(session_id)) {
        if (cached->Backend() != kind_) {
            throw SessionNotFoundError("Sandbox " + session_id + " belongs to the " +
                                       BackendKindToString(cached->Backend()) + " backend");
        }
        if (IsRunning(*cached)) {
            return cached;
        }
        spdlog::warn("Sandbox {} is no longer running, purging stale entry", session_id);
        scheduler_.Cancel(session_id);
        registry_.Remove(session_id);
        throw SessionNotFoundError("Sandbox " + session_id + " is not running");
    }

    std::optional<ResourceHandle> handle;
    try {
        handle = LookupResource(session_id);
    } catch (const SessionNotFoundError&) {
        throw;
    } catch (const std::exception& e) {
        throw SessionNotFoundError("Failed to look up sandbox " + session_id + ": " + e.what());
    }

    if (!handle) {
        throw SessionNotFoundError("Sandbox " + session_id + " not found or not running");
    }

    auto now = Session::Clock::now();
    auto deadline = handle->deadline.value_or(now + default_timeout_);
    if (deadline <= now) {
        spdlog::info("Sandbox {} is past its deadline, removing", session_id);
        try {
            DestroyResource(session_id);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to remove expired sandbox {}: {}", session_id, e.what());
        }
        throw SessionNotFoundError("Sandbox " + session_id + " has expired");
    }

    auto session = std::make_shared<Session>(session_id, kind_, handle->resource_id,
                                             default_timeout_);
    session->endpoint = handle->endpoint;
    session->access_token = handle->access_token;
    session->RestoreDeadline(deadline);

    registry_.Insert(session);
    ArmExpiry(session);

    spdlog::info("Reattached to sandbox {} ({}s remaining)", session_id,
                 session->Timeout().count());
    return session;
}

void SandboxBackend::Kill(const std::string& session_id) {
    scheduler_.Cancel(session_id);

    try {
        DestroyResource(session_id);
        spdlog::info("Sandbox {} removed", session_id);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to remove sandbox {}: {}", session_id, e.what());
    }

    registry_.Remove(session_id);
}

void SandboxBackend::Kill(const Session& session) {
    Kill(session.Id());
}

bool SandboxBackend::IsRunning(const Session& session) {
    try {
        return ResourceRunning(session);
    } catch (const std::exception& e) {
        spdlog::warn("Liveness check for {} failed: {}", session.Id(), e.what());
        return false;
    }
}

void SandboxBackend::SetTimeout(const std::shared_ptr<Session>& session,
                                std::chrono::seconds timeout) {
    if (!session) {
        throw std::invalid_argument("SetTimeout requires a session");
    }

    auto deadline = session->ResetTimeout(timeout);
    PersistTimeout(*session, timeout, deadline);
    ArmExpiry(session);

    spdlog::debug("Sandbox {} timeout set to {}s", session->Id(), timeout.count());
}

std::optional<ExpiryScheduler::Clock::time_point>
SandboxBackend::ExpiryDeadline(const std::string& session_id) const {
    return scheduler_.Deadline(session_id);
}

// ============================================================================
// EXECUTION
// ============================================================================

CommandResult SandboxBackend::RunCommand(const Session& session,
                                         const std::string& command,
                                         std::optional<std::chrono::seconds> timeout) {
    spdlog::debug("[{}] exec: {}", session.Id(), StringUtils::Truncate(command, 200));

    CommandContext context;
    context.timeout = timeout;

    try {
        return ExecuteCommand(session, command, context);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] command failed: {}", session.Id(), e.what());
        return FailedResult<CommandResult>(e.what());
    }
}

CodeResult SandboxBackend::RunCode(const Session& session,
                                   const std::string& code,
                                   std::optional<std::chrono::seconds> timeout) {
    std::string code_path;
    try {
        code_path = kCodeFilePrefix + StringUtils::RandomHex(kCodeFileHexLength) + ".py";
        PutFile(session, code_path, code);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] could not stage code: {}", session.Id(), e.what());
        return FailedResult<CodeResult>(e.what());
    }

    auto cleanup = MakeScopeExit([this, &session, &code_path]() {
        RemoveQuietly(session, code_path);
    });

    CommandContext context;
    context.timeout = timeout;

    CodeResult result;
    try {
        CommandResult run = ExecuteCommand(
            session, Interpreter() + " " + StringUtils::ShellQuote(code_path), context);
        result.stdout_output = std::move(run.stdout_output);
        result.stderr_output = std::move(run.stderr_output);
        result.exit_code = run.exit_code;
        result.error = std::move(run.error);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] code run failed: {}", session.Id(), e.what());
        result = FailedResult<CodeResult>(e.what());
    }
    return result;
}

void SandboxBackend::RemoveQuietly(const Session& session, const std::string& sandbox_path) {
    CommandContext context;
    context.privileged = true;
    context.timeout = std::chrono::seconds(30);

    try {
        auto removed = ExecuteCommand(session, "rm -f " + StringUtils::ShellQuote(sandbox_path),
                                      context);
        if (!removed.Succeeded()) {
            spdlog::warn("[{}] failed to remove {}: {}", session.Id(), sandbox_path,
                         removed.error.value_or(removed.stderr_output));
        }
    } catch (const std::exception& e) {
        spdlog::warn("[{}] failed to remove {}: {}", session.Id(), sandbox_path, e.what());
    }
}

// ============================================================================
// FILE TRANSFER
// ============================================================================

void SandboxBackend::UploadFile(const Session& session,
                                const std::filesystem::path& local_path,
                                const std::string& sandbox_path) {
    std::ifstream input(local_path, std::ios::binary);
    if (!input) {
        throw TransportError("Cannot read local file: " + local_path.string());
    }
    std::string bytes((std::istreambuf_iterator<char>(input)),
                      std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw TransportError("Error while reading local file: " + local_path.string());
    }

    WriteFile(session, sandbox_path, bytes);
    spdlog::info("[{}] uploaded {} -> {} ({} bytes)", session.Id(), local_path.string(),
                 sandbox_path, bytes.size());
}

void SandboxBackend::WriteFile(const Session& session,
                               const std::string& sandbox_path,
                               const std::string& bytes) {
    if (sandbox_path.empty()) {
        throw TransportError("Empty sandbox path");
    }
    PutFile(session, sandbox_path, bytes);
}

std::string SandboxBackend::DownloadFile(const Session& session,
                                         const std::string& sandbox_path) {
    if (sandbox_path.empty()) {
        throw ExtractionError("Empty sandbox path");
    }
    auto bytes = FetchFile(session, sandbox_path);
    spdlog::debug("[{}] downloaded {} ({} bytes)", session.Id(), sandbox_path, bytes.size());
    return bytes;
}

// ============================================================================
// EXPIRY
// ============================================================================

void SandboxBackend::ArmExpiry(const std::shared_ptr<Session>& session) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        session->Deadline() - Session::Clock::now());
    if (remaining.count() < 0) {
        remaining = std::chrono::milliseconds(0);
    }

    scheduler_.Schedule(session->Id(), remaining, [this, session]() {
        Expire(session);
    });
}

void SandboxBackend::Expire(const std::shared_ptr<Session>& session) {
    // An extension may land after the task fired. Re-arming for the current
    // deadline replaces any task the extension scheduled with an identical one.
    auto extended = [this, &session]() {
        if (session->Deadline() <= Session::Clock::now()) {
            return false;
        }
        if (registry_.Find(session->Id()) == session) {
            ArmExpiry(session);
        }
        return true;
    };
    if (extended()) {
        spdlog::debug("Sandbox {} was extended, skipping stale expiry", session->Id());
        return;
    }

    spdlog::info("Sandbox {} reached its timeout, cleaning up", session->Id());

    try {
        bool running = ResourceRunning(*session);
        if (extended()) {
            spdlog::debug("Sandbox {} was extended during cleanup, keeping it", session->Id());
            return;
        }
        if (running) {
            DestroyResource(session->Id());
            spdlog::info("Sandbox {} removed after timeout", session->Id());
        }
    } catch (const std::exception& e) {
        spdlog::warn("Auto-cleanup of sandbox {} failed: {}", session->Id(), e.what());
    }

    registry_.RemoveIfSame(session);
}

} // namespace core
} // namespace sandcell
