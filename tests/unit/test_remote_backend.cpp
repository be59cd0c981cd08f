#include <gtest/gtest.h>
#include "sandcell/backends/remote_backend.hpp"
#include "sandcell/core/errors.hpp"
#include "sandcell/utils/http_client.hpp"
#include "sandcell/utils/string_utils.hpp"
#include "fakes/fake_e2b_server.hpp"

#include <stdexcept>
#include <thread>

namespace sandcell {
namespace backends {
namespace {

using namespace std::chrono_literals;
using core::ExtractionError;
using core::ProvisioningError;
using core::Session;
using core::SessionNotFoundError;
using core::TransportError;
using fakes::FakeE2BServer;
using utils::StringUtils;

class RemoteBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<FakeE2BServer>();
        backend_ = std::make_unique<RemoteBackend>(server_, Options(), registry_);
    }

    void TearDown() override {
        backend_.reset();
    }

    static RemoteBackendOptions Options() {
        RemoteBackendOptions options;
        options.api_key = "e2b_test_key";
        return options;
    }

    template <typename Pred>
    bool WaitFor(Pred pred, std::chrono::milliseconds limit = 4000ms) {
        auto until = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < until) {
            if (pred()) return true;
            std::this_thread::sleep_for(10ms);
        }
        return pred();
    }

    std::shared_ptr<FakeE2BServer> server_;
    core::SessionRegistry registry_;
    std::unique_ptr<RemoteBackend> backend_;
};

TEST_F(RemoteBackendTest, ConstructorValidatesArguments) {
    EXPECT_THROW(std::make_unique<RemoteBackend>(nullptr, Options(), registry_),
                 std::invalid_argument);
    EXPECT_THROW(std::make_unique<RemoteBackend>(server_, RemoteBackendOptions{}, registry_),
                 std::invalid_argument);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(RemoteBackendTest, CreateUsesProviderId) {
    auto id = backend_->Create("", 600s, false);

    EXPECT_EQ(id, "sbx1");
    auto sandbox = server_->Get(id);
    EXPECT_EQ(sandbox.template_id, "all_pip_apt_pkg");
    EXPECT_FALSE(sandbox.internet);

    auto session = backend_->Connect(id);
    EXPECT_EQ(session->Backend(), core::BackendKind::REMOTE);
    EXPECT_EQ(session->endpoint, "https://49983-sbx1.e2b.app");
    EXPECT_EQ(session->access_token, "token-sbx1");

    auto requests = server_->Requests();
    ASSERT_FALSE(requests.empty());
    EXPECT_EQ(requests.front().method, "POST");
    EXPECT_EQ(requests.front().url, "https://api.e2b.dev/sandboxes");
    EXPECT_EQ(requests.front().headers.at("X-API-Key"), "e2b_test_key");
}

TEST_F(RemoteBackendTest, CreateFailuresBecomeProvisioningErrors) {
    server_->fail_next_creates = 1;
    EXPECT_THROW(backend_->Create("", 600s, true), ProvisioningError);

    server_->fail_transport = true;
    EXPECT_THROW(backend_->Create("", 600s, true), ProvisioningError);
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(RemoteBackendTest, KillToleratesMissingSandbox) {
    auto id = backend_->Create("", 600s, true);

    backend_->Kill(id);
    EXPECT_FALSE(server_->Exists(id));
    EXPECT_FALSE(registry_.Contains(id));

    EXPECT_NO_THROW(backend_->Kill(id));
    EXPECT_THROW(backend_->Connect(id), SessionNotFoundError);
}

TEST_F(RemoteBackendTest, ConnectPurgesPausedSandbox) {
    auto id = backend_->Create("", 600s, true);
    server_->SetState(id, "paused");

    EXPECT_THROW(backend_->Connect(id), SessionNotFoundError);
    EXPECT_FALSE(registry_.Contains(id));
}

TEST_F(RemoteBackendTest, ConnectWrapsTransportFailures) {
    server_->fail_transport = true;
    EXPECT_THROW(backend_->Connect("sbx42"), SessionNotFoundError);
}

TEST_F(RemoteBackendTest, MalformedControlUrlUsesDocumentedErrors) {
    auto options = Options();
    options.api_url = "api.e2b.dev";
    RemoteBackend backend(std::make_shared<utils::BeastHttpClient>(std::chrono::seconds(2)),
                          options, registry_);

    EXPECT_THROW(backend.Create("", 60s, true), ProvisioningError);
    EXPECT_THROW(backend.Connect("sbx42"), SessionNotFoundError);
}

TEST_F(RemoteBackendTest, ReattachUsesProviderEndAt) {
    auto id = backend_->Create("", 600s, true);
    server_->SetEndAt(id, Session::Clock::now() + 300s);

    core::SessionRegistry other_registry;
    RemoteBackend other(server_, Options(), other_registry);
    auto session = other.Connect(id);

    EXPECT_GE(session->Timeout().count(), 290);
    EXPECT_LE(session->Timeout().count(), 300);
    EXPECT_EQ(session->access_token, "token-" + id);
    EXPECT_TRUE(other.ExpiryDeadline(id).has_value());
}

TEST_F(RemoteBackendTest, ReattachPastEndAtDeletesSandbox) {
    auto id = backend_->Create("", 600s, true);
    server_->SetEndAt(id, Session::Clock::now() - 60s);

    core::SessionRegistry other_registry;
    RemoteBackend other(server_, Options(), other_registry);

    EXPECT_THROW(other.Connect(id), SessionNotFoundError);
    EXPECT_FALSE(server_->Exists(id));
}

TEST_F(RemoteBackendTest, ExpiryDeletesSandbox) {
    auto id = backend_->Create("", 1s, true);

    EXPECT_TRUE(WaitFor([&] { return !server_->Exists(id) && !registry_.Contains(id); }));
}

TEST_F(RemoteBackendTest, SetTimeoutCallsProvider) {
    auto session = backend_->Connect(backend_->Create("", 60s, true));

    backend_->SetTimeout(session, 900s);
    auto end_at = server_->Get(session->Id()).end_at;
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
        end_at - Session::Clock::now()).count();
    EXPECT_GE(remaining, 890);
    EXPECT_LE(remaining, 900);
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(RemoteBackendTest, RunCommandDecodesStream) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    auto result = backend_->RunCommand(*session, "echo hello");
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.stdout_output, "hello\n");

    auto request = server_->Requests().back();
    EXPECT_EQ(request.url, "https://49983-sbx1.e2b.app/process.Process/Start");
    EXPECT_EQ(request.headers.at("Content-Type"), "application/connect+json");
    EXPECT_EQ(request.headers.at("Authorization"), "Basic " + StringUtils::ToBase64("user:"));
    EXPECT_EQ(request.headers.at("X-Access-Token"), "token-sbx1");

    auto exited = backend_->RunCommand(*session, "exit 7");
    EXPECT_EQ(exited.exit_code, 7);
    EXPECT_FALSE(exited.HasError());
}

TEST_F(RemoteBackendTest, UnreachableSandboxYieldsError) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));
    server_->SetState(session->Id(), "paused");

    auto result = backend_->RunCommand(*session, "echo hello");
    ASSERT_TRUE(result.HasError());
    EXPECT_NE(result.error->find("502"), std::string::npos);
}

TEST_F(RemoteBackendTest, RunCodeRemovesTempFileAsRoot) {
    server_->python_outputs["print(1+1)"] = "2\n";
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    auto result = backend_->RunCode(*session, "print(1+1)");
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.stdout_output, "2\n");
    EXPECT_TRUE(server_->Get(session->Id()).files.empty());

    auto request = server_->Requests().back();
    EXPECT_EQ(request.headers.at("Authorization"), "Basic " + StringUtils::ToBase64("root:"));
}

TEST_F(RemoteBackendTest, RunCodeRemovesTempFileWhenCodeFails) {
    server_->python_exit_codes["raise SystemExit(1)"] = 1;
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    auto result = backend_->RunCode(*session, "raise SystemExit(1)");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.HasError());
    EXPECT_NE(result.stderr_output.find("Traceback"), std::string::npos);
    EXPECT_TRUE(server_->Get(session->Id()).files.empty());

    auto request = server_->Requests().back();
    EXPECT_EQ(request.headers.at("Authorization"), "Basic " + StringUtils::ToBase64("root:"));
}

// ============================================================================
// File transfer
// ============================================================================

TEST_F(RemoteBackendTest, WriteThenDownload) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    std::string payload("binary\0\r\n--data", 15);
    backend_->WriteFile(*session, "/home/user/out/my file.bin", payload);

    EXPECT_EQ(server_->Get(session->Id()).files.at("/home/user/out/my file.bin"), payload);
    EXPECT_EQ(backend_->DownloadFile(*session, "/home/user/out/my file.bin"), payload);
}

TEST_F(RemoteBackendTest, DownloadMissingFileIsExtractionError) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));
    EXPECT_THROW(backend_->DownloadFile(*session, "/home/user/missing.txt"), ExtractionError);
}

TEST_F(RemoteBackendTest, TransportFailureOnUpload) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));
    server_->fail_transport = true;
    EXPECT_THROW(backend_->WriteFile(*session, "/home/user/a.txt", "x"), TransportError);
}

// ============================================================================
// Wire helpers
// ============================================================================

TEST(RemoteWireTest, EnvelopeFraming) {
    auto frame = RemoteBackend::EncodeEnvelope("{}", 0x02);
    ASSERT_EQ(frame.size(), 7u);
    EXPECT_EQ(static_cast<unsigned char>(frame[0]), 0x02);
    EXPECT_EQ(frame.substr(1, 4), std::string("\x00\x00\x00\x02", 4));
    EXPECT_EQ(frame.substr(5), "{}");
}

TEST(RemoteWireTest, DecodeCollectsOutputAndExitCode) {
    std::string body =
        RemoteBackend::EncodeEnvelope(R"({"event":{"start":{"pid":1}}})") +
        RemoteBackend::EncodeEnvelope(R"({"event":{"data":{"stdout":")" +
                                      StringUtils::ToBase64("out") + R"("}}})") +
        RemoteBackend::EncodeEnvelope(R"({"event":{"data":{"stderr":")" +
                                      StringUtils::ToBase64("err") + R"("}}})") +
        RemoteBackend::EncodeEnvelope(R"({"event":{"end":{"exitCode":2,"exited":true}}})") +
        RemoteBackend::EncodeEnvelope("{}", 0x02);

    auto result = RemoteBackend::DecodeProcessStream(body);
    EXPECT_EQ(result.stdout_output, "out");
    EXPECT_EQ(result.stderr_output, "err");
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_FALSE(result.HasError());
}

TEST(RemoteWireTest, DecodeTreatsExitStatusAsResult) {
    std::string body =
        RemoteBackend::EncodeEnvelope(
            R"({"event":{"end":{"exitCode":1,"exited":true,"status":"exit status 1","error":"exit status 1"}}})") +
        RemoteBackend::EncodeEnvelope("{}", 0x02);

    auto result = RemoteBackend::DecodeProcessStream(body);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.HasError());

    auto failed = RemoteBackend::DecodeProcessStream(
        RemoteBackend::EncodeEnvelope(
            R"({"event":{"end":{"exited":false,"status":"","error":"failed to start: no such file"}}})") +
        RemoteBackend::EncodeEnvelope("{}", 0x02));
    ASSERT_TRUE(failed.HasError());
    EXPECT_EQ(*failed.error, "failed to start: no such file");
    EXPECT_EQ(failed.exit_code, 1);
}

TEST(RemoteWireTest, DecodeTrailerError) {
    std::string body = RemoteBackend::EncodeEnvelope(
        R"({"error":{"code":"deadline_exceeded","message":"timed out"}})", 0x02);

    auto result = RemoteBackend::DecodeProcessStream(body);
    ASSERT_TRUE(result.HasError());
    EXPECT_EQ(*result.error, "deadline_exceeded: timed out");
    EXPECT_EQ(result.exit_code, 1);
}

TEST(RemoteWireTest, DecodeIncompleteStreams) {
    auto missing_end = RemoteBackend::DecodeProcessStream(
        RemoteBackend::EncodeEnvelope(R"({"event":{"start":{"pid":1}}})"));
    ASSERT_TRUE(missing_end.HasError());
    EXPECT_EQ(*missing_end.error, "Process stream ended without an exit status");

    auto frame = RemoteBackend::EncodeEnvelope(R"({"event":{"start":{"pid":1}}})");
    auto truncated = RemoteBackend::DecodeProcessStream(frame.substr(0, frame.size() - 3));
    ASSERT_TRUE(truncated.HasError());
    EXPECT_EQ(*truncated.error, "Truncated process stream");

    auto garbage = RemoteBackend::DecodeProcessStream(RemoteBackend::EncodeEnvelope("not json"));
    EXPECT_TRUE(garbage.HasError());
}

TEST(RemoteWireTest, ParseTimestamp) {
    auto parsed = RemoteBackend::ParseTimestamp("2025-01-01T00:00:10.123Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(Session::Clock::to_time_t(*parsed), 1735689610);

    EXPECT_FALSE(RemoteBackend::ParseTimestamp("").has_value());
    EXPECT_FALSE(RemoteBackend::ParseTimestamp("yesterday afternoon").has_value());
}

} // namespace
} // namespace backends
} // namespace sandcell
