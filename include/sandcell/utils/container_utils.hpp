/**
 * @file container_utils.hpp
 * @brief Container runtime client used by the local sandbox backend
 *
 * `ContainerClient` is the capability set the local backend needs from a
 * container runtime: start, inspect, exec, archive copy in/out, remove and
 * list. `ContainerUtils` implements it on top of the Docker-compatible CLI
 * (docker or podman), streaming tar archives through the CLI's stdin and
 * stdout.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandcell {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by the runtime
 */
enum class ContainerState {
    CREATED,     ///< Container created but not started
    RUNNING,     ///< Container is running
    PAUSED,      ///< Container paused
    RESTARTING,  ///< Runtime is restarting the container
    REMOVING,    ///< Removal in progress
    EXITED,      ///< Container exited
    DEAD,        ///< Container is dead
    UNKNOWN      ///< Unknown state
};

/// Runtime status string for a state ("running", "exited", ...)
std::string ContainerStateToString(ContainerState state);

/**
 * @enum NetworkMode
 * @brief Container network modes offered to sandboxes
 */
enum class NetworkMode {
    NONE,    ///< Networking fully disabled
    BRIDGE   ///< Default bridged network
};

/**
 * @struct ContainerConfig
 * @brief Settings for starting one sandbox container
 */
struct ContainerConfig {
    std::string name;                                  ///< Container name
    std::string image{"miroflow-sandbox"};             ///< Image to run
    std::string memory_limit{"4g"};                    ///< Memory ceiling (docker syntax)
    double cpu_limit{2.0};                             ///< CPU ceiling in cores
    NetworkMode network_mode{NetworkMode::BRIDGE};     ///< Network mode
    std::vector<std::string> security_opts{"no-new-privileges"};  ///< --security-opt values
    std::string working_dir{"/home/sandbox"};          ///< Working directory
    std::map<std::string, std::string> labels;         ///< Container labels
    bool interactive{true};                            ///< Keep stdin open (-i)
};

/**
 * @struct ContainerInfo
 * @brief Container runtime information
 */
struct ContainerInfo {
    std::string id;                                    ///< Container ID
    std::string name;                                  ///< Container name (no leading '/')
    std::string image;                                 ///< Image name
    ContainerState state{ContainerState::UNKNOWN};     ///< Current state
    std::map<std::string, std::string> labels;         ///< Container labels

    bool IsRunning() const { return state == ContainerState::RUNNING; }
};

/**
 * @struct ExecOptions
 * @brief Per-exec user, directory, stdin and timeout
 */
struct ExecOptions {
    std::string user;                                  ///< Run as this user (empty = image default)
    std::string working_dir;                           ///< Working directory (empty = container default)
    std::string stdin_data;                            ///< Bytes written to the command's stdin
    std::optional<std::chrono::seconds> timeout;       ///< Stop waiting after this long
};

/**
 * @struct ContainerExecResult
 * @brief Result of command execution in container
 */
struct ContainerExecResult {
    int exit_code{0};                          ///< Exit code of the executed program
    std::string stdout_output;                 ///< Standard output
    std::string stderr_output;                 ///< Standard error
    std::chrono::milliseconds duration{0};     ///< Execution duration
    std::optional<std::string> runtime_error;  ///< Set when the runtime itself failed

    bool Succeeded() const { return !runtime_error && exit_code == 0; }
};

/**
 * @class ContainerError
 * @brief A runtime call failed (daemon unreachable, bad image, copy failed)
 */
class ContainerError : public std::runtime_error {
public:
    explicit ContainerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ContainerClient
 * @brief Container runtime capability set
 *
 * Implementations must be safe to call from several threads at once.
 */
class ContainerClient {
public:
    virtual ~ContainerClient() = default;

    /**
     * @brief Check if the runtime CLI is installed and its daemon answers
     */
    virtual bool IsRuntimeAvailable() const = 0;

    /**
     * @brief Runtime server version, or "unknown"
     */
    virtual std::string GetRuntimeVersion() const = 0;

    /**
     * @brief Create and start a detached container
     * @return Container ID
     * @throws ContainerError if the runtime refuses or fails
     */
    virtual std::string RunContainer(const ContainerConfig& config) = 0;

    /**
     * @brief Look a container up by name or ID
     * @return Container info, or nullopt if the runtime has no such container
     * @throws ContainerError if the runtime cannot be queried
     */
    virtual std::optional<ContainerInfo> InspectContainer(const std::string& name_or_id) = 0;

    /**
     * @brief Run a command inside a running container
     *
     * Runtime failures are reported through `runtime_error`, never thrown.
     */
    virtual ContainerExecResult Exec(const std::string& container,
                                     const std::vector<std::string>& command,
                                     const ExecOptions& options) = 0;

    /**
     * @brief Extract a tar stream into a directory inside the container
     * @throws ContainerError on failure
     */
    virtual void PutArchive(const std::string& container,
                            const std::string& dest_dir,
                            const std::string& tar_stream) = 0;

    /**
     * @brief Fetch a path from the container as a tar stream
     * @throws ContainerError if the path does not exist or the copy fails
     */
    virtual std::string GetArchive(const std::string& container,
                                   const std::string& path) = 0;

    /**
     * @brief Remove a container
     * @return true if removed or already absent
     */
    virtual bool RemoveContainer(const std::string& container, bool force) = 0;

    /**
     * @brief List containers (running or not) carrying a label
     * @param label `key=value` filter
     */
    virtual std::vector<ContainerInfo> ListContainers(const std::string& label) = 0;
};

/**
 * @class ContainerUtils
 * @brief Docker-compatible CLI implementation of ContainerClient
 *
 * **Usage Example**:
 * @code
 * ContainerUtils docker;
 *
 * ContainerConfig config;
 * config.name = "sc-1a2b3c4d5e6f";
 * config.network_mode = NetworkMode::NONE;
 *
 * docker.RunContainer(config);
 * auto result = docker.Exec(config.name, {"bash", "-c", "echo hello"}, {});
 * docker.RemoveContainer(config.name, true);
 * @endcode
 */
class ContainerUtils : public ContainerClient {
public:
    /**
     * @brief Construct client for a runtime binary
     * @param binary CLI to invoke (`docker`, `podman`, or an absolute path)
     */
    explicit ContainerUtils(std::string binary = "docker");

    bool IsRuntimeAvailable() const override;
    std::string GetRuntimeVersion() const override;

    std::string RunContainer(const ContainerConfig& config) override;
    std::optional<ContainerInfo> InspectContainer(const std::string& name_or_id) override;
    ContainerExecResult Exec(const std::string& container,
                             const std::vector<std::string>& command,
                             const ExecOptions& options) override;
    void PutArchive(const std::string& container,
                    const std::string& dest_dir,
                    const std::string& tar_stream) override;
    std::string GetArchive(const std::string& container,
                           const std::string& path) override;
    bool RemoveContainer(const std::string& container, bool force) override;
    std::vector<ContainerInfo> ListContainers(const std::string& label) override;

    /**
     * @brief Arguments for `run` derived from a configuration
     */
    static std::vector<std::string> BuildRunCommand(const ContainerConfig& config);

    /**
     * @brief Arguments for `exec` derived from a command and options
     */
    static std::vector<std::string> BuildExecCommand(const std::string& container,
                                                     const std::vector<std::string>& command,
                                                     const ExecOptions& options);

    /**
     * @brief Parse `inspect` JSON output (array with one object)
     */
    static ContainerInfo ParseInspectOutput(const std::string& json_str);

    /**
     * @brief Map a runtime status string to ContainerState
     */
    static ContainerState ParseState(const std::string& state_str);

    /**
     * @brief Whether CLI stderr describes a missing container
     */
    static bool IsNoSuchContainer(const std::string& stderr_output);

    /**
     * @brief Whether CLI stderr describes a runtime (not program) failure
     */
    static bool IsRuntimeFailure(const std::string& stderr_output);

private:
    std::string binary_;  ///< Runtime CLI

    struct CliResult {
        int exit_code{0};
        std::string stdout_output;
        std::string stderr_output;
        bool timed_out{false};
        std::chrono::milliseconds duration{0};
        bool success{false};
    };

    CliResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                   const std::string& stdin_data = "",
                                   std::optional<std::chrono::seconds> timeout = std::nullopt) const;
};

} // namespace utils
} // namespace sandcell
