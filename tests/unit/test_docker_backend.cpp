#include <gtest/gtest.h>
#include "sandcell/backends/docker_backend.hpp"
#include "sandcell/core/errors.hpp"
#include "fakes/fake_container_client.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace sandcell {
namespace backends {
namespace {

using namespace std::chrono_literals;
using core::ExtractionError;
using core::ProvisioningError;
using core::Session;
using core::SessionNotFoundError;
using core::TransportError;
using fakes::FakeContainerClient;

namespace fs = std::filesystem;

class DockerBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<FakeContainerClient>();
        backend_ = std::make_unique<DockerBackend>(client_, DockerBackendOptions{}, registry_);

        temp_dir_ = fs::temp_directory_path() /
                    ("sandcell_docker_" + std::to_string(::getpid()));
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        backend_.reset();
        fs::remove_all(temp_dir_);
    }

    /// A backend in a "new process": same runtime, empty registry
    std::unique_ptr<DockerBackend> FreshBackend(core::SessionRegistry& registry) {
        return std::make_unique<DockerBackend>(client_, DockerBackendOptions{}, registry);
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

    long long PersistedDeadline(const std::string& id) {
        return std::stoll(client_->Files(id).at(DockerBackend::kDeadlineFile));
    }

    static long long NowEpoch() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            Session::Clock::now().time_since_epoch()).count();
    }

    std::shared_ptr<FakeContainerClient> client_;
    core::SessionRegistry registry_;
    std::unique_ptr<DockerBackend> backend_;
    fs::path temp_dir_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(DockerBackendTest, CreateStartsManagedContainer) {
    auto id = backend_->Create("", 600s, true);

    EXPECT_EQ(id.rfind("sc-", 0), 0u);
    EXPECT_EQ(id.size(), 15u);
    ASSERT_TRUE(client_->Exists(id));

    auto config = client_->ConfigOf(id);
    EXPECT_EQ(config.image, "miroflow-sandbox");
    EXPECT_EQ(config.memory_limit, "4g");
    EXPECT_EQ(config.network_mode, utils::NetworkMode::BRIDGE);
    EXPECT_EQ(config.labels.at(DockerBackend::kManagedLabel), "true");

    EXPECT_TRUE(registry_.Contains(id));
    EXPECT_TRUE(backend_->ExpiryDeadline(id).has_value());
    EXPECT_NEAR(PersistedDeadline(id), NowEpoch() + 600, 5);

    auto session = backend_->Connect(id);
    EXPECT_EQ(session->Id(), id);
    EXPECT_EQ(session->Backend(), core::BackendKind::LOCAL);
    EXPECT_TRUE(backend_->IsRunning(*session));
}

TEST_F(DockerBackendTest, CreateWithoutNetwork) {
    auto id = backend_->Create("python:3.12", 60s, false);
    auto config = client_->ConfigOf(id);
    EXPECT_EQ(config.image, "python:3.12");
    EXPECT_EQ(config.network_mode, utils::NetworkMode::NONE);
}

TEST_F(DockerBackendTest, CreateRefusedByRuntime) {
    client_->fail_next_runs = 1;
    EXPECT_THROW(backend_->Create("", 60s, true), ProvisioningError);
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(DockerBackendTest, CreateFailsFastWithoutRuntime) {
    client_->runtime_available = false;
    EXPECT_THROW(backend_->Create("", 60s, true), ProvisioningError);
    EXPECT_EQ(client_->RunCalls(), 0);

    client_->runtime_available = true;
    backend_->Create("", 60s, true);
    backend_->Create("", 60s, true);
    EXPECT_EQ(client_->AvailabilityChecks(), 2);
    EXPECT_EQ(client_->RunCalls(), 2);
}

TEST_F(DockerBackendTest, CreateRemovesContainerThatExits) {
    client_->start_stopped = true;
    EXPECT_THROW(backend_->Create("", 60s, true), ProvisioningError);
    EXPECT_EQ(client_->ContainerCount(), 0u);
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(DockerBackendTest, ConnectUnknownIdThrows) {
    EXPECT_THROW(backend_->Connect("sc-doesnotexist"), SessionNotFoundError);
    EXPECT_THROW(backend_->Connect(""), SessionNotFoundError);
}

TEST_F(DockerBackendTest, ConnectPurgesStoppedSession) {
    auto id = backend_->Create("", 600s, true);
    client_->Stop(id);

    EXPECT_THROW(backend_->Connect(id), SessionNotFoundError);
    EXPECT_FALSE(registry_.Contains(id));
    EXPECT_FALSE(backend_->ExpiryDeadline(id).has_value());
}

TEST_F(DockerBackendTest, KillIsIdempotent) {
    auto id = backend_->Create("", 600s, true);

    backend_->Kill(id);
    EXPECT_FALSE(client_->Exists(id));
    EXPECT_FALSE(registry_.Contains(id));

    EXPECT_NO_THROW(backend_->Kill(id));
    EXPECT_THROW(backend_->Connect(id), SessionNotFoundError);
}

// ============================================================================
// Reattachment
// ============================================================================

TEST_F(DockerBackendTest, ReattachRestoresPersistedDeadline) {
    auto id = backend_->Create("", 600s, true);

    core::SessionRegistry other_registry;
    auto other = FreshBackend(other_registry);
    auto session = other->Connect(id);

    EXPECT_EQ(session->Id(), id);
    EXPECT_GE(session->Timeout().count(), 590);
    EXPECT_LE(session->Timeout().count(), 600);
    EXPECT_TRUE(other_registry.Contains(id));
    EXPECT_TRUE(other->ExpiryDeadline(id).has_value());

    // Second lookup is served from the registry
    EXPECT_EQ(other->Connect(id), session);
}

TEST_F(DockerBackendTest, ReattachWithoutDeadlineUsesDefaultTimeout) {
    client_->AddContainer("sc-foreign00001", true, {{DockerBackend::kManagedLabel, "true"}});

    auto session = backend_->Connect("sc-foreign00001");
    EXPECT_GE(session->Timeout().count(), 1790);
    EXPECT_LE(session->Timeout().count(), 1800);
}

TEST_F(DockerBackendTest, ReattachPastDeadlineRemovesContainer) {
    auto id = backend_->Create("", 600s, true);
    client_->SetFile(id, DockerBackend::kDeadlineFile, "1000\n");

    core::SessionRegistry other_registry;
    auto other = FreshBackend(other_registry);

    EXPECT_THROW(other->Connect(id), SessionNotFoundError);
    EXPECT_FALSE(client_->Exists(id));
    EXPECT_FALSE(other_registry.Contains(id));
}

// ============================================================================
// Expiry
// ============================================================================

TEST_F(DockerBackendTest, ExpiryRemovesContainer) {
    auto id = backend_->Create("", 1s, true);
    ASSERT_TRUE(client_->Exists(id));

    EXPECT_TRUE(WaitFor([&] { return !client_->Exists(id) && !registry_.Contains(id); }));
    EXPECT_THROW(backend_->Connect(id), SessionNotFoundError);
}

TEST_F(DockerBackendTest, ExtensionDuringExpiryKeepsContainer) {
    auto session = backend_->Connect(backend_->Create("", 1s, true));

    std::atomic<bool> extended{false};
    client_->on_inspect = [&](const std::string&) {
        if (!extended.exchange(true)) {
            backend_->SetTimeout(session, 600s);
        }
    };

    ASSERT_TRUE(WaitFor([&] { return extended.load(); }));
    std::this_thread::sleep_for(200ms);
    client_->on_inspect = nullptr;

    EXPECT_TRUE(client_->Exists(session->Id()));
    EXPECT_TRUE(registry_.Contains(session->Id()));
    auto deadline = backend_->ExpiryDeadline(session->Id());
    ASSERT_TRUE(deadline.has_value());
    EXPECT_GT(*deadline - std::chrono::steady_clock::now(), 500s);
}

TEST_F(DockerBackendTest, StaleExpiryLeavesReplacementRegistryEntry) {
    auto id = backend_->Create("", 1s, true);
    auto first = backend_->Connect(id);

    auto replacement = std::make_shared<Session>(id, core::BackendKind::LOCAL, "id-" + id, 600s);
    registry_.Insert(replacement);

    ASSERT_TRUE(WaitFor([&] { return !client_->Exists(id); }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(registry_.Find(id), replacement);
}

TEST_F(DockerBackendTest, SetTimeoutExtendsAndPersists) {
    auto id = backend_->Create("", 1s, true);
    auto session = backend_->Connect(id);

    backend_->SetTimeout(session, 120s);
    EXPECT_EQ(session->Timeout(), 120s);
    EXPECT_NEAR(PersistedDeadline(id), NowEpoch() + 120, 5);

    std::this_thread::sleep_for(1500ms);
    EXPECT_TRUE(client_->Exists(id));
}

TEST_F(DockerBackendTest, SetTimeoutFailsWhenDeadlineCannotBeWritten) {
    auto id = backend_->Create("", 600s, true);
    auto session = backend_->Connect(id);

    client_->fail_deadline_writes = true;
    EXPECT_THROW(backend_->SetTimeout(session, 120s), TransportError);
}

TEST_F(DockerBackendTest, SweepRemovesStoppedAndExpired) {
    const std::map<std::string, std::string> managed{{DockerBackend::kManagedLabel, "true"}};
    client_->AddContainer("sc-stopped00001", false, managed);
    client_->AddContainer("sc-expired00001", true, managed);
    client_->SetFile("sc-expired00001", DockerBackend::kDeadlineFile, "1000\n");
    client_->AddContainer("unrelated", false);
    auto live = backend_->Create("", 600s, true);

    auto report = backend_->Sweep();

    EXPECT_EQ(report.inspected, 3u);
    ASSERT_EQ(report.removed.size(), 2u);
    EXPECT_FALSE(client_->Exists("sc-stopped00001"));
    EXPECT_FALSE(client_->Exists("sc-expired00001"));
    EXPECT_TRUE(client_->Exists("unrelated"));
    EXPECT_TRUE(client_->Exists(live));
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(DockerBackendTest, RunCommandAsSandboxUser) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    auto result = backend_->RunCommand(*session, "echo hello");
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.stdout_output, "hello\n");
    EXPECT_EQ(result.ToString(), "CommandResult(exit_code=0, stdout=hello\n)");

    auto calls = client_->ExecCalls();
    ASSERT_FALSE(calls.empty());
    EXPECT_EQ(calls.back().script, "echo hello");
    EXPECT_EQ(calls.back().user, DockerBackend::kSandboxUser);
}

TEST_F(DockerBackendTest, NonZeroExitIsNotAnError) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    auto result = backend_->RunCommand(*session, "exit 3");
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.HasError());
}

TEST_F(DockerBackendTest, RuntimeFailureBecomesResultError) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));
    client_->Stop(session->Id());

    auto result = backend_->RunCommand(*session, "echo hello");
    ASSERT_TRUE(result.HasError());
    EXPECT_NE(result.error->find("No such container"), std::string::npos);
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(DockerBackendTest, RunCodeCleansUpTempFile) {
    client_->python_outputs["print(1+1)"] = "2\n";
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    auto result = backend_->RunCode(*session, "print(1+1)");
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.stdout_output, "2\n");

    for (const auto& file : client_->Files(session->Id())) {
        EXPECT_EQ(file.first.find("/tmp/_sc_exec_"), std::string::npos) << file.first;
    }

    bool removed_as_root = false;
    for (const auto& call : client_->ExecCalls()) {
        if (call.script.rfind("rm -f '/tmp/_sc_exec_", 0) == 0) {
            removed_as_root = call.user == "root";
        }
    }
    EXPECT_TRUE(removed_as_root);
}

TEST_F(DockerBackendTest, RunCommandIsBoundedBySessionTimeout) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    backend_->RunCommand(*session, "tail -f /dev/null");
    auto calls = client_->ExecCalls();
    ASSERT_FALSE(calls.empty());
    ASSERT_TRUE(calls.back().timeout.has_value());
    EXPECT_EQ(*calls.back().timeout, 600s);

    backend_->RunCommand(*session, "echo hi", 30s);
    EXPECT_EQ(*client_->ExecCalls().back().timeout, 30s);
}

TEST_F(DockerBackendTest, RunCodeCleansUpTempFileWhenCodeFails) {
    client_->command_handler = [](const std::string& script) {
        utils::ContainerExecResult result;
        if (script.rfind("python ", 0) == 0) {
            result.exit_code = 1;
            result.stderr_output = "ZeroDivisionError: division by zero\n";
        }
        return result;
    };
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    auto result = backend_->RunCode(*session, "1/0");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.HasError());

    for (const auto& file : client_->Files(session->Id())) {
        EXPECT_EQ(file.first.find("/tmp/_sc_exec_"), std::string::npos) << file.first;
    }

    bool removed_as_root = false;
    for (const auto& call : client_->ExecCalls()) {
        if (call.script.rfind("rm -f '/tmp/_sc_exec_", 0) == 0) {
            removed_as_root = call.user == "root";
        }
    }
    EXPECT_TRUE(removed_as_root);
}

TEST_F(DockerBackendTest, RunCodeCleansUpTempFileOnRuntimeFailure) {
    client_->command_handler = [](const std::string& script) {
        utils::ContainerExecResult result;
        if (script.rfind("python ", 0) == 0) {
            result.exit_code = 1;
            result.runtime_error = "Execution timed out after 600s";
        }
        return result;
    };
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    auto result = backend_->RunCode(*session, "while True: pass");
    EXPECT_TRUE(result.HasError());

    for (const auto& file : client_->Files(session->Id())) {
        EXPECT_EQ(file.first.find("/tmp/_sc_exec_"), std::string::npos) << file.first;
    }
}

TEST_F(DockerBackendTest, RunCodeQuotesAndOutputSurviveAsIs) {
    const std::string code = "print('it''s \"quoted\"')";
    client_->python_outputs[code] = "it's \"quoted\"\n";
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    auto result = backend_->RunCode(*session, code);
    EXPECT_EQ(result.stdout_output, "it's \"quoted\"\n");
}

// ============================================================================
// File transfer
// ============================================================================

TEST_F(DockerBackendTest, UploadThenDownload) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    std::string payload("col1,col2\n1,2\n\0binary", 21);
    auto local = temp_dir_ / "in.csv";
    {
        std::ofstream out(local, std::ios::binary);
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    }

    backend_->UploadFile(*session, local, "/home/sandbox/data/in.csv");
    EXPECT_EQ(client_->Files(session->Id()).at("/home/sandbox/data/in.csv"), payload);
    EXPECT_EQ(backend_->DownloadFile(*session, "/home/sandbox/data/in.csv"), payload);
}

TEST_F(DockerBackendTest, UploadErrors) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    EXPECT_THROW(backend_->UploadFile(*session, temp_dir_ / "missing.txt", "/home/sandbox/x"),
                 TransportError);
    EXPECT_THROW(backend_->WriteFile(*session, "", "bytes"), TransportError);
    EXPECT_THROW(backend_->WriteFile(*session, "/home/sandbox/dir/", "bytes"), TransportError);
}

TEST_F(DockerBackendTest, DownloadMissingFileThrows) {
    auto session = backend_->Connect(backend_->Create("", 600s, true));

    EXPECT_THROW(backend_->DownloadFile(*session, "/home/sandbox/nope.txt"), ExtractionError);
    EXPECT_THROW(backend_->DownloadFile(*session, ""), ExtractionError);
}

} // namespace
} // namespace backends
} // namespace sandcell
