/**
 * @file remote_backend.cpp
 * @brief Remote cloud sandbox backend (E2B control plane + envd)
 *
 * **Process Start Wire Format** (Connect server streaming, JSON codec):
 * ```
 * request:   [0x00][len:4 BE]{"process":{"cmd":"/bin/bash","args":["-l","-c",cmd],...}}
 * response:  [0x00][len]{"event":{"start":{"pid":42}}}
 *            [0x00][len]{"event":{"data":{"stdout":"<base64>"}}}
 *            [0x00][len]{"event":{"end":{"exitCode":1,"status":"exit status 1"}}}
 *            [0x02][len]{}                     # end of stream, may carry "error"
 * ```
 *
 * @date 2025
 */

#include "sandcell/backends/remote_backend.hpp"
#include "sandcell/core/errors.hpp"
#include "sandcell/utils/string_utils.hpp"
#include "sandcell/utils/tar_archive.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace sandcell {
namespace backends {

using core::CommandResult;
using core::ExtractionError;
using core::ProvisioningError;
using core::Session;
using core::TransportError;
using utils::BeastHttpClient;
using utils::HttpRequest;
using utils::HttpResponse;
using utils::StringUtils;

namespace {

constexpr const char* kDefaultApiUrl = "https://api.e2b.dev";
constexpr std::uint8_t kEndStreamFlag = 0x02;
constexpr std::size_t kEnvelopeHeaderSize = 5;

std::string DescribeFailure(const HttpResponse& response) {
    std::string message = "HTTP " + std::to_string(response.status);
    try {
        auto body = json::parse(response.body);
        if (body.is_object() && body.contains("message") && body["message"].is_string()) {
            return message + ": " + body["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // Not JSON; fall through to the raw body
    }
    if (!response.body.empty()) {
        message += ": " + StringUtils::Truncate(StringUtils::Trim(response.body), 300);
    }
    return message;
}

std::string JsonString(const json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

} // anonymous namespace

RemoteBackend::RemoteBackend(std::shared_ptr<utils::HttpClient> http,
                             RemoteBackendOptions options,
                             core::SessionRegistry& registry)
    : SandboxBackend(core::BackendKind::REMOTE, options.default_timeout, registry),
      http_(std::move(http)),
      options_(std::move(options)) {
    if (!http_) {
        throw std::invalid_argument("RemoteBackend requires an HTTP client");
    }
    if (options_.api_key.empty()) {
        throw std::invalid_argument("E2B_API_KEY is required for the remote backend");
    }
    if (options_.api_url.empty()) {
        options_.api_url = kDefaultApiUrl;
    }
}

RemoteBackend::~RemoteBackend() {
    StopExpiry();
}

// ============================================================================
// CONTROL PLANE
// ============================================================================

HttpResponse RemoteBackend::ControlRequest(const std::string& method,
                                           const std::string& path,
                                           const std::string& body) {
    HttpRequest request;
    request.method = method;
    request.url = options_.api_url + path;
    request.headers["X-API-Key"] = options_.api_key;
    if (!body.empty()) {
        request.headers["Content-Type"] = "application/json";
        request.body = body;
    }
    request.timeout = options_.request_timeout;

    try {
        return http_->Send(request);
    } catch (const utils::HttpError& e) {
        throw TransportError(method + " " + path + " failed: " + e.what());
    }
}

std::optional<json> RemoteBackend::FetchSandboxInfo(const std::string& sandbox_id) {
    auto response = ControlRequest("GET", "/sandboxes/" + BeastHttpClient::UrlEncode(sandbox_id));
    if (response.status == 404) {
        return std::nullopt;
    }
    if (!response.Ok()) {
        throw TransportError("Failed to inspect sandbox " + sandbox_id + ": " +
                             DescribeFailure(response));
    }

    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        throw TransportError("Malformed sandbox info for " + sandbox_id + ": " + e.what());
    }
}

std::string RemoteBackend::EndpointFor(const std::string& sandbox_id,
                                       const std::string& domain) const {
    return "https://" + std::to_string(options_.envd_port) + "-" + sandbox_id + "." +
           (domain.empty() ? options_.domain : domain);
}

RemoteBackend::ResourceHandle RemoteBackend::ProvisionResource(const ProvisionRequest& request) {
    json body = {
        {"templateID", request.image.empty() ? options_.default_template : request.image},
        {"timeout", request.timeout.count()},
        {"allow_internet_access", request.network_enabled}
    };

    HttpResponse response;
    try {
        response = ControlRequest("POST", "/sandboxes", body.dump());
    } catch (const TransportError& e) {
        throw ProvisioningError(e.what());
    }
    if (!response.Ok()) {
        throw ProvisioningError("Provider refused to create sandbox: " + DescribeFailure(response));
    }

    json created;
    try {
        created = json::parse(response.body);
    } catch (const json::exception& e) {
        throw ProvisioningError(std::string("Malformed create response: ") + e.what());
    }

    ResourceHandle handle;
    handle.session_id = JsonString(created, "sandboxID");
    if (handle.session_id.empty()) {
        throw ProvisioningError("Create response carries no sandboxID");
    }
    handle.resource_id = handle.session_id;
    handle.endpoint = EndpointFor(handle.session_id, JsonString(created, "domain"));
    handle.access_token = JsonString(created, "envdAccessToken");
    handle.deadline = ParseTimestamp(JsonString(created, "endAt"));

    spdlog::debug("Remote sandbox {} from template {} (envd {})", handle.session_id,
                  body["templateID"].get<std::string>(), JsonString(created, "envdVersion"));
    return handle;
}

std::optional<RemoteBackend::ResourceHandle>
RemoteBackend::LookupResource(const std::string& session_id) {
    auto info = FetchSandboxInfo(session_id);
    if (!info) {
        spdlog::debug("Provider has no sandbox {}", session_id);
        return std::nullopt;
    }

    std::string state = JsonString(*info, "state");
    if (!state.empty() && state != "running") {
        spdlog::debug("Remote sandbox {} is {}", session_id, state);
        return std::nullopt;
    }

    ResourceHandle handle;
    handle.session_id = session_id;
    handle.resource_id = session_id;
    handle.endpoint = EndpointFor(session_id, JsonString(*info, "domain"));
    handle.access_token = JsonString(*info, "envdAccessToken");
    handle.deadline = ParseTimestamp(JsonString(*info, "endAt"));
    return handle;
}

bool RemoteBackend::ResourceRunning(const Session& session) {
    auto info = FetchSandboxInfo(session.ResourceId());
    if (!info) {
        return false;
    }
    std::string state = JsonString(*info, "state");
    return state.empty() || state == "running";
}

void RemoteBackend::PersistTimeout(const Session& session,
                                   std::chrono::seconds timeout,
                                   Session::Clock::time_point /*deadline*/) {
    json body = {{"timeout", timeout.count()}};
    auto response = ControlRequest(
        "POST", "/sandboxes/" + BeastHttpClient::UrlEncode(session.ResourceId()) + "/timeout",
        body.dump());
    if (!response.Ok()) {
        throw TransportError("Failed to set timeout for " + session.Id() + ": " +
                             DescribeFailure(response));
    }
}

void RemoteBackend::DestroyResource(const std::string& session_id) {
    auto response = ControlRequest("DELETE", "/sandboxes/" + BeastHttpClient::UrlEncode(session_id));
    if (response.status == 404) {
        spdlog::debug("Remote sandbox {} already gone", session_id);
        return;
    }
    if (!response.Ok()) {
        throw TransportError("Failed to delete sandbox " + session_id + ": " +
                             DescribeFailure(response));
    }
}

// ============================================================================
// DATA PLANE
// ============================================================================

void RemoteBackend::AddDataPlaneAuth(HttpRequest& request,
                                     const Session& session,
                                     const std::string& user) const {
    request.headers["Authorization"] = "Basic " + StringUtils::ToBase64(user + ":");
    if (!session.access_token.empty()) {
        request.headers["X-Access-Token"] = session.access_token;
    }
}

CommandResult RemoteBackend::ExecuteCommand(const Session& session,
                                            const std::string& command,
                                            const CommandContext& context) {
    json start = {
        {"process", {
            {"cmd", "/bin/bash"},
            {"args", {"-l", "-c", command}},
            {"envs", json::object()},
            {"cwd", kWorkingDir}
        }}
    };

    auto budget = context.timeout.value_or(options_.command_timeout);

    HttpRequest request;
    request.method = "POST";
    request.url = session.endpoint + "/process.Process/Start";
    request.headers["Content-Type"] = "application/connect+json";
    request.headers["Connect-Protocol-Version"] = "1";
    request.headers["Connect-Timeout-Ms"] = std::to_string(budget.count() * 1000);
    request.body = EncodeEnvelope(start.dump());
    request.timeout = budget + std::chrono::seconds(10);
    AddDataPlaneAuth(request, session, context.privileged ? "root" : kSandboxUser);

    HttpResponse response;
    try {
        response = http_->Send(request);
    } catch (const utils::HttpError& e) {
        throw TransportError(std::string("Process start failed: ") + e.what());
    }

    if (!response.Ok()) {
        return core::FailedResult<CommandResult>("Process start failed: " +
                                                 DescribeFailure(response));
    }
    return DecodeProcessStream(response.body);
}

void RemoteBackend::PutFile(const Session& session,
                            const std::string& sandbox_path,
                            const std::string& bytes) {
    std::string boundary = "----sandcell" + StringUtils::RandomHex(16);
    std::string name = utils::TarArchive::BaseName(sandbox_path);

    std::ostringstream body;
    body << "--" << boundary << "\r\n"
         << "Content-Disposition: form-data; name=\"file\"; filename=\"" << name << "\"\r\n"
         << "Content-Type: application/octet-stream\r\n\r\n"
         << bytes << "\r\n"
         << "--" << boundary << "--\r\n";

    HttpRequest request;
    request.method = "POST";
    request.url = session.endpoint + "/files?path=" + BeastHttpClient::UrlEncode(sandbox_path) +
                  "&username=" + kSandboxUser;
    request.headers["Content-Type"] = "multipart/form-data; boundary=" + boundary;
    request.body = body.str();
    request.timeout = options_.request_timeout;
    AddDataPlaneAuth(request, session, kSandboxUser);

    HttpResponse response;
    try {
        response = http_->Send(request);
    } catch (const utils::HttpError& e) {
        throw TransportError("Upload of " + sandbox_path + " failed: " + e.what());
    }
    if (!response.Ok()) {
        throw TransportError("Upload of " + sandbox_path + " failed: " + DescribeFailure(response));
    }
}

std::string RemoteBackend::FetchFile(const Session& session, const std::string& sandbox_path) {
    HttpRequest request;
    request.method = "GET";
    request.url = session.endpoint + "/files?path=" + BeastHttpClient::UrlEncode(sandbox_path) +
                  "&username=" + kSandboxUser;
    request.timeout = options_.request_timeout;
    AddDataPlaneAuth(request, session, kSandboxUser);

    HttpResponse response;
    try {
        response = http_->Send(request);
    } catch (const utils::HttpError& e) {
        throw TransportError("Download of " + sandbox_path + " failed: " + e.what());
    }

    if (response.status >= 400 && response.status < 500) {
        throw ExtractionError("Cannot read " + sandbox_path + ": " + DescribeFailure(response));
    }
    if (!response.Ok()) {
        throw TransportError("Download of " + sandbox_path + " failed: " +
                             DescribeFailure(response));
    }
    return response.body;
}

// ============================================================================
// WIRE HELPERS
// ============================================================================

std::string RemoteBackend::EncodeEnvelope(const std::string& payload, std::uint8_t flags) {
    std::string frame;
    frame.reserve(kEnvelopeHeaderSize + payload.size());

    auto length = static_cast<std::uint32_t>(payload.size());
    frame.push_back(static_cast<char>(flags));
    frame.push_back(static_cast<char>((length >> 24) & 0xFF));
    frame.push_back(static_cast<char>((length >> 16) & 0xFF));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
    frame += payload;
    return frame;
}

CommandResult RemoteBackend::DecodeProcessStream(const std::string& body) {
    CommandResult result;
    bool ended = false;
    std::size_t offset = 0;

    while (offset + kEnvelopeHeaderSize <= body.size()) {
        auto flags = static_cast<std::uint8_t>(body[offset]);
        std::uint32_t length = 0;
        for (std::size_t i = 1; i < kEnvelopeHeaderSize; ++i) {
            length = (length << 8) | static_cast<std::uint8_t>(body[offset + i]);
        }
        offset += kEnvelopeHeaderSize;
        if (offset + length > body.size()) {
            result.error = "Truncated process stream";
            break;
        }

        json message;
        try {
            message = json::parse(body.substr(offset, length));
        } catch (const json::exception& e) {
            result.error = std::string("Malformed process event: ") + e.what();
            break;
        }
        offset += length;

        if (flags & kEndStreamFlag) {
            if (message.contains("error") && message["error"].is_object()) {
                std::string code = JsonString(message["error"], "code");
                std::string text = JsonString(message["error"], "message");
                result.error = code.empty() ? text : code + ": " + text;
            }
            break;
        }

        if (!message.contains("event") || !message["event"].is_object()) {
            continue;
        }
        const auto& event = message["event"];

        if (event.contains("data")) {
            const auto& data = event["data"];
            std::string out = JsonString(data, "stdout");
            std::string err = JsonString(data, "stderr");
            if (!out.empty()) {
                result.stdout_output += StringUtils::FromBase64(out);
            }
            if (!err.empty()) {
                result.stderr_output += StringUtils::FromBase64(err);
            }
        } else if (event.contains("end")) {
            const auto& end = event["end"];
            ended = true;
            result.exit_code = end.value("exitCode", 0);
            // envd also reports a plain non-zero exit ("exit status N") in `error`
            std::string failure = JsonString(end, "error");
            bool exited = end.value("exited", false);
            if (!failure.empty() && !exited && failure != JsonString(end, "status")) {
                result.error = failure;
            }
        }
    }

    if (!ended && !result.error) {
        result.error = "Process stream ended without an exit status";
    }
    if (result.error && result.exit_code == 0) {
        result.exit_code = 1;
    }
    return result;
}

std::optional<Session::Clock::time_point> RemoteBackend::ParseTimestamp(const std::string& text) {
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream stream(text.substr(0, 19));
    stream >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (stream.fail()) {
        return std::nullopt;
    }

    std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Session::Clock::from_time_t(seconds);
}

} // namespace backends
} // namespace sandcell
