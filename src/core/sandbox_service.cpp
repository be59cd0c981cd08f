/**
 * @file sandbox_service.cpp
 * @brief Agent-facing facade
 *
 * @date 2025
 */

#include "sandcell/core/sandbox_service.hpp"
#include "sandcell/backends/docker_backend.hpp"
#include "sandcell/backends/remote_backend.hpp"
#include "sandcell/core/errors.hpp"
#include "sandcell/utils/container_utils.hpp"
#include "sandcell/utils/http_client.hpp"
#include "sandcell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace sandcell {
namespace core {

using utils::StringUtils;

namespace {

constexpr const char* kErrorPrefix = "[ERROR]:";

const char* kPackageInstalledNote =
    "\n\n[PACKAGE INSTALL STATUS]: The system packages and Python packages required "
    "for the task have been installed. No need to install them again unless a missing "
    "package error occurs.";

const char* kPackageMaybeInstalledNote =
    "\n\n[PACKAGE INSTALL STATUS]: Packages may already be installed. Only re-install "
    "if a missing package error occurs.";

const char* kShellHint =
    "\n\n[HINT]: Shell commands can be error-prone. Consider using the "
    "`run_python_code` tool instead.";

const char* kPermissionHint =
    "\n\n[PERMISSION HINT]: You are running as user, not root. Use `sudo` for "
    "commands requiring admin privileges.";

bool IsPackageInstall(const std::string& command) {
    return StringUtils::Contains(command, "pip install") ||
           StringUtils::Contains(command, "apt-get");
}

std::string ConnectFailure(const std::string& sandbox_id) {
    return std::string(kErrorPrefix) + " Failed to connect to sandbox " + sandbox_id +
           ", retry later. Make sure the sandbox is created and the id is correct.";
}

// File name component of a URL, without query or fragment
std::string UrlFileName(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto scheme = path.find("://");
    if (scheme != std::string::npos && path.find('/', scheme + 3) == std::string::npos) {
        return "";
    }
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::shared_ptr<SandboxBackend> MakeBackend(const ServiceConfig& config) {
    config.Validate();

    if (config.backend == BackendType::E2B) {
        backends::RemoteBackendOptions options;
        options.api_key = config.e2b_api_key;
        options.domain = config.e2b_domain;
        options.default_template = config.template_id;
        options.default_timeout = config.default_timeout;
        return std::make_shared<backends::RemoteBackend>(
            std::make_shared<utils::BeastHttpClient>(), options);
    }

    backends::DockerBackendOptions options;
    options.default_image = config.image;
    options.memory_limit = config.memory_limit;
    options.cpu_limit = config.cpu_limit;
    options.default_timeout = config.default_timeout;
    return std::make_shared<backends::DockerBackend>(
        std::make_shared<utils::ContainerUtils>(), options);
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

SandboxService::SandboxService(ServiceConfig config)
    : config_(std::move(config)),
      backend_(MakeBackend(config_)) {
    spdlog::debug("Sandbox service using the {} backend", BackendTypeToString(config_.backend));
}

SandboxService::SandboxService(ServiceConfig config, std::shared_ptr<SandboxBackend> backend)
    : config_(std::move(config)),
      backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("SandboxService requires a backend");
    }
}

bool SandboxService::IsError(const std::string& result) {
    return StringUtils::StartsWith(result, kErrorPrefix);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

std::string SandboxService::CreateSandbox() {
    const std::string& image = config_.backend == BackendType::E2B ? config_.template_id
                                                                   : config_.image;

    for (int attempt = 1; attempt <= kCreateAttempts; ++attempt) {
        try {
            std::string sandbox_id = backend_->Create(image, config_.default_timeout,
                                                      config_.network_enabled);

            std::error_code ec;
            std::filesystem::create_directories(config_.TmpFilesDir(), ec);
            if (ec) {
                spdlog::warn("Could not create {}: {}", config_.TmpFilesDir().string(),
                             ec.message());
            }

            return "Sandbox created with sandbox_id: " + sandbox_id;
        } catch (const std::exception& e) {
            spdlog::warn("Create attempt {}/{} failed: {}", attempt, kCreateAttempts, e.what());
            if (attempt == kCreateAttempts) {
                return std::string(kErrorPrefix) + " Failed to create sandbox after " +
                       std::to_string(kCreateAttempts) + " attempts: " + e.what() +
                       ", please retry later.";
            }
            Backoff(attempt * 2.0);
        }
    }
    return std::string(kErrorPrefix) + " Failed to create sandbox, please retry later.";
}

std::string SandboxService::KillSandbox(const std::string& sandbox_id) {
    backend_->Kill(sandbox_id);
    return "Sandbox " + sandbox_id + " killed";
}

std::string SandboxService::Sweep() {
    auto* docker = dynamic_cast<backends::DockerBackend*>(backend_.get());
    if (!docker) {
        return std::string(kErrorPrefix) + " Sweep is only supported by the docker backend; "
               "remote sandboxes are expired by the provider.";
    }

    try {
        auto report = docker->Sweep();
        std::string message = "Swept " + std::to_string(report.inspected) +
                              " managed sandbox(es), removed " +
                              std::to_string(report.removed.size());
        if (!report.removed.empty()) {
            message += ": " + StringUtils::Join(report.removed, ", ");
        }
        return message;
    } catch (const std::exception& e) {
        return std::string(kErrorPrefix) + " Sweep failed: " + e.what();
    }
}

// ============================================================================
// EXECUTION
// ============================================================================

std::string SandboxService::RunCommand(const std::string& sandbox_id,
                                       const std::string& command) {
    std::string error;
    auto session = ConnectOrReport(sandbox_id, error);
    if (!session) {
        return error;
    }
    RefreshTimeout(session);

    std::string last_error;
    for (int attempt = 1; attempt <= kExecuteAttempts; ++attempt) {
        CommandResult result = backend_->RunCommand(*session, command);
        if (!result.HasError()) {
            std::string output = result.ToString();
            if (IsPackageInstall(command)) {
                output += kPackageInstalledNote;
            }
            return output;
        }

        last_error = *result.error;
        spdlog::warn("[{}] command attempt {}/{} failed: {}", sandbox_id, attempt,
                     kExecuteAttempts, last_error);
        if (attempt < kExecuteAttempts) {
            Backoff(attempt * 2.0);
        }
    }

    std::string message = std::string(kErrorPrefix) + " Failed to run command after " +
                          std::to_string(kExecuteAttempts) + " attempts. Details: " +
                          last_error + "." + kShellHint + kPermissionHint;
    if (IsPackageInstall(command)) {
        message += kPackageMaybeInstalledNote;
    }
    return message;
}

std::string SandboxService::RunPythonCode(const std::string& sandbox_id,
                                          const std::string& code_block) {
    std::string error;
    auto session = ConnectOrReport(sandbox_id, error);
    if (!session) {
        return error;
    }
    RefreshTimeout(session);

    std::string last_error;
    for (int attempt = 1; attempt <= kExecuteAttempts; ++attempt) {
        CodeResult result = backend_->RunCode(*session, code_block);
        if (!result.HasError()) {
            return result.ToString();
        }

        last_error = *result.error;
        spdlog::warn("[{}] code attempt {}/{} failed: {}", sandbox_id, attempt,
                     kExecuteAttempts, last_error);
        if (attempt < kExecuteAttempts) {
            Backoff(attempt * 2.0);
        }
    }

    return std::string(kErrorPrefix) + " Failed to run code in sandbox " + sandbox_id +
           " after " + std::to_string(kExecuteAttempts) + " attempts. Details: " +
           last_error + ".";
}

// ============================================================================
// FILE TRANSFER
// ============================================================================

std::string SandboxService::UploadFileFromLocalToSandbox(const std::string& sandbox_id,
                                                         const std::string& local_file_path,
                                                         const std::string& sandbox_dir) {
    std::string error;
    auto session = ConnectOrReport(sandbox_id, error);
    if (!session) {
        return error;
    }
    RefreshTimeout(session);

    std::string name = std::filesystem::path(local_file_path).filename().string();
    std::string dest = JoinSandboxPath(sandbox_dir, name);

    try {
        backend_->UploadFile(*session, local_file_path, dest);
        return "File uploaded to " + dest +
               "\n\n[INFO]: For directly reading local files without uploading to sandbox, "
               "consider using the `read_file` tool which can read various file types "
               "directly from local paths or URLs.";
    } catch (const std::exception& e) {
        return std::string(kErrorPrefix) + " Failed to upload file " + local_file_path +
               " to sandbox " + sandbox_id + ": " + e.what() +
               "\n\n[INFO]: Consider using the `read_file` tool which can directly read "
               "various file types from local paths or URLs without uploading.";
    }
}

std::string SandboxService::DownloadFileFromInternetToSandbox(const std::string& sandbox_id,
                                                              const std::string& url,
                                                              const std::string& sandbox_dir) {
    std::string error;
    auto session = ConnectOrReport(sandbox_id, error);
    if (!session) {
        return error;
    }
    RefreshTimeout(session);

    std::string name = UrlFileName(url);
    if (name.empty()) {
        name = "download";
    }
    std::string dest = JoinSandboxPath(sandbox_dir, name);
    std::string command = "wget -q " + StringUtils::ShellQuote(url) + " -O " +
                          StringUtils::ShellQuote(dest);

    for (int attempt = 1; attempt <= kDownloadAttempts; ++attempt) {
        CommandResult result = backend_->RunCommand(*session, command);
        if (result.Succeeded()) {
            return "File downloaded to " + dest +
                   "\n\n[INFO]: For directly reading files from URLs without downloading "
                   "to sandbox, consider using the `read_file` tool.";
        }

        spdlog::warn("[{}] download attempt {}/{} of {} failed (exit {}): {}", sandbox_id,
                     attempt, kDownloadAttempts, url, result.exit_code,
                     result.error.value_or(StringUtils::Trim(result.stderr_output)));
        if (attempt < kDownloadAttempts) {
            Backoff(std::pow(4.0, attempt));
        }
    }

    return std::string(kErrorPrefix) + " Failed to download file from " + url + " after " +
           std::to_string(kDownloadAttempts) + " attempts." +
           "\n\n[INFO]: To upload local files, use `upload_file_from_local_to_sandbox`.";
}

std::string SandboxService::DownloadFileFromSandboxToLocal(const std::string& sandbox_id,
                                                           const std::string& sandbox_file_path,
                                                           const std::string& local_filename) {
    std::string error;
    auto session = ConnectOrReport(sandbox_id, error);
    if (!session) {
        return error;
    }
    RefreshTimeout(session);

    if (config_.logs_dir.empty()) {
        return std::string(kErrorPrefix) + " LOGS_DIR environment variable is not set.";
    }

    try {
        std::filesystem::create_directories(config_.TmpFilesDir());

        std::string name = StringUtils::Trim(local_filename);
        if (name.empty()) {
            name = std::filesystem::path(sandbox_file_path).filename().string();
        }
        auto local_path = config_.TmpFilesDir() / ("sandbox_" + sandbox_id + "_" + name);

        std::string bytes = backend_->DownloadFile(*session, sandbox_file_path);

        std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open " + local_path.string() + " for writing");
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw std::runtime_error("failed writing " + local_path.string());
        }

        spdlog::info("[{}] saved {} to {}", sandbox_id, sandbox_file_path, local_path.string());
        return "File downloaded successfully to: " + local_path.string() +
               "\n\n[INFO]: The file can now be accessed by other tools which only support "
               "local files and internet URLs, not sandbox files.";
    } catch (const std::exception& e) {
        return std::string(kErrorPrefix) + " Failed to download file " + sandbox_file_path +
               " from sandbox " + sandbox_id + ": " + e.what() +
               "\n\n[INFO]: To upload local files to the sandbox, use "
               "`upload_file_from_local_to_sandbox` instead.";
    }
}

// ============================================================================
// HELPERS
// ============================================================================

std::shared_ptr<Session> SandboxService::ConnectOrReport(const std::string& sandbox_id,
                                                         std::string& error) {
    try {
        return backend_->Connect(sandbox_id);
    } catch (const std::exception& e) {
        spdlog::warn("Connect to {} failed ({}): {}", sandbox_id, ErrorTypeName(e), e.what());
        error = ConnectFailure(sandbox_id);
        return nullptr;
    }
}

void SandboxService::RefreshTimeout(const std::shared_ptr<Session>& session) {
    if (!config_.refresh_timeout_on_use) {
        return;
    }
    try {
        backend_->SetTimeout(session, config_.default_timeout);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] could not refresh timeout: {}", session->Id(), e.what());
    }
}

void SandboxService::Backoff(double seconds) const {
    double scaled = seconds * config_.retry_backoff_scale;
    if (scaled <= 0.0) {
        return;
    }
    std::this_thread::sleep_for(std::chrono::duration<double>(scaled));
}

std::string SandboxService::JoinSandboxPath(const std::string& directory,
                                            const std::string& name) const {
    std::string dir = directory.empty() ? backend_->WorkingDirectory() : directory;
    while (dir.size() > 1 && dir.back() == '/') {
        dir.pop_back();
    }
    return dir == "/" ? "/" + name : dir + "/" + name;
}

} // namespace core
} // namespace sandcell
