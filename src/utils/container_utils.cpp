/**
 * @file container_utils.cpp
 * @brief Docker CLI implementation of the container runtime client
 *
 * Every call shells out to the runtime CLI through ProcessUtils with an
 * argv vector (no shell), so container names, paths and commands are never
 * re-parsed. Archive copies use the CLI's streaming form:
 * ```
 * docker cp - <container>:<dir>      # tar stream on stdin, extracted into dir
 * docker cp <container>:<path> -     # tar stream of path on stdout
 * ```
 *
 * **Sandbox Run Flags**:
 * - `--memory`, `--cpus`: resource ceilings
 * - `--security-opt no-new-privileges`: restricted privilege mode
 * - `--network none|bridge`: single enable/disable switch
 * - `-w`: fixed working directory
 * - `-i`: keep stdin open so the image's default shell stays alive
 *
 * @date 2025
 */

#include "sandcell/utils/container_utils.hpp"
#include "sandcell/utils/process_utils.hpp"
#include "sandcell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace sandcell {
namespace utils {

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ContainerUtils::ContainerUtils(std::string binary)
    : binary_(std::move(binary)) {
    spdlog::debug("Container client using runtime CLI '{}'", binary_);
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool ContainerUtils::IsRuntimeAvailable() const {
    if (!ProcessUtils::IsOnPath(binary_)) {
        spdlog::error("Container runtime CLI '{}' not found on PATH", binary_);
        return false;
    }

    auto result = ExecuteDockerCommand({"info", "--format", "{{.ServerVersion}}"},
                                       "", std::chrono::seconds(30));
    if (!result.success) {
        spdlog::error("Container runtime daemon not reachable: {}",
                      StringUtils::Trim(result.stderr_output));
    }
    return result.success;
}

std::string ContainerUtils::GetRuntimeVersion() const {
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"},
                                       "", std::chrono::seconds(30));
    if (result.success) {
        return StringUtils::Trim(result.stdout_output);
    }
    return "unknown";
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::string ContainerUtils::RunContainer(const ContainerConfig& config) {
    if (config.image.empty()) {
        throw ContainerError("Container image not specified");
    }

    spdlog::info("Starting container {} from image {}", config.name, config.image);

    auto result = ExecuteDockerCommand(BuildRunCommand(config));
    if (!result.success) {
        throw ContainerError("Failed to start container " + config.name + ": " +
                             StringUtils::Trim(result.stderr_output));
    }

    std::string container_id = StringUtils::Trim(result.stdout_output);
    spdlog::info("Container started: {} ({})", config.name,
                 container_id.substr(0, 12));
    return container_id;
}

// ============================================================================
// CONTAINER INFORMATION RETRIEVAL
// ============================================================================

std::optional<ContainerInfo> ContainerUtils::InspectContainer(const std::string& name_or_id) {
    auto result = ExecuteDockerCommand({"inspect", "--type", "container", name_or_id});

    if (!result.success) {
        if (IsNoSuchContainer(result.stderr_output)) {
            spdlog::debug("Container {} does not exist", name_or_id);
            return std::nullopt;
        }
        throw ContainerError("Failed to inspect container " + name_or_id + ": " +
                             StringUtils::Trim(result.stderr_output));
    }

    try {
        return ParseInspectOutput(result.stdout_output);
    }
    catch (const json::exception& e) {
        throw ContainerError("Failed to parse inspect output for " + name_or_id +
                             ": " + e.what());
    }
}

std::vector<ContainerInfo> ContainerUtils::ListContainers(const std::string& label) {
    auto result = ExecuteDockerCommand({
        "ps", "--all", "--no-trunc",
        "--filter", "label=" + label,
        "--format", "{{json .}}"
    });

    if (!result.success) {
        throw ContainerError("Failed to list containers: " +
                             StringUtils::Trim(result.stderr_output));
    }

    std::vector<ContainerInfo> containers;
    std::istringstream stream(result.stdout_output);
    std::string line;

    // One JSON object per line
    while (std::getline(stream, line)) {
        if (StringUtils::Trim(line).empty()) continue;

        try {
            json j = json::parse(line);

            ContainerInfo info;
            info.id = j.value("ID", "");
            info.name = j.value("Names", "");
            info.image = j.value("Image", "");
            info.state = ParseState(j.value("State", ""));

            for (const auto& pair : StringUtils::Split(j.value("Labels", ""), ',')) {
                auto eq = pair.find('=');
                if (eq != std::string::npos) {
                    info.labels[pair.substr(0, eq)] = pair.substr(eq + 1);
                }
            }

            containers.push_back(info);
        }
        catch (const json::exception& e) {
            spdlog::warn("Failed to parse container info: {}", e.what());
        }
    }

    return containers;
}

// ============================================================================
// CONTAINER COMMAND EXECUTION
// ============================================================================

ContainerExecResult ContainerUtils::Exec(const std::string& container,
                                         const std::vector<std::string>& command,
                                         const ExecOptions& options) {
    ContainerExecResult exec_result;

    CliResult result;
    try {
        result = ExecuteDockerCommand(BuildExecCommand(container, command, options),
                                      options.stdin_data, options.timeout);
    }
    catch (const std::exception& e) {
        exec_result.exit_code = 1;
        exec_result.runtime_error = std::string("Failed to launch runtime CLI: ") + e.what();
        return exec_result;
    }

    exec_result.exit_code = result.exit_code;
    exec_result.stdout_output = result.stdout_output;
    exec_result.stderr_output = result.stderr_output;
    exec_result.duration = result.duration;

    if (result.timed_out) {
        exec_result.exit_code = 1;
        exec_result.runtime_error = "Execution timed out after " +
            std::to_string(options.timeout ? options.timeout->count() : 0) + "s";
    } else if (result.exit_code != 0 && IsRuntimeFailure(result.stderr_output)) {
        exec_result.exit_code = 1;
        exec_result.runtime_error = StringUtils::Trim(result.stderr_output);
        exec_result.stderr_output.clear();
    }

    return exec_result;
}

// ============================================================================
// ARCHIVE OPERATIONS
// ============================================================================

void ContainerUtils::PutArchive(const std::string& container,
                                const std::string& dest_dir,
                                const std::string& tar_stream) {
    spdlog::debug("Copying {} byte archive into {}:{}",
                  tar_stream.size(), container, dest_dir);

    auto result = ExecuteDockerCommand({"cp", "-", container + ":" + dest_dir}, tar_stream);
    if (!result.success) {
        throw ContainerError("Failed to copy archive into " + container + ":" + dest_dir +
                             ": " + StringUtils::Trim(result.stderr_output));
    }
}

std::string ContainerUtils::GetArchive(const std::string& container,
                                       const std::string& path) {
    spdlog::debug("Copying {}:{} out as archive", container, path);

    auto result = ExecuteDockerCommand({"cp", container + ":" + path, "-"});
    if (!result.success) {
        throw ContainerError("Failed to copy " + path + " out of " + container +
                             ": " + StringUtils::Trim(result.stderr_output));
    }
    return result.stdout_output;
}

// ============================================================================
// REMOVAL
// ============================================================================

bool ContainerUtils::RemoveContainer(const std::string& container, bool force) {
    spdlog::info("Removing container: {} (force: {})", container, force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container);

    auto result = ExecuteDockerCommand(args);

    if (result.success) {
        spdlog::info("Container removed successfully");
        return true;
    }
    if (IsNoSuchContainer(result.stderr_output)) {
        spdlog::debug("Container {} already removed", container);
        return true;
    }

    spdlog::error("Failed to remove container: {}", StringUtils::Trim(result.stderr_output));
    return false;
}

// ============================================================================
// COMMAND BUILDERS AND PARSERS
// ============================================================================

std::vector<std::string> ContainerUtils::BuildRunCommand(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");  // Detached mode

    if (config.interactive) {
        args.push_back("-i");
    }

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    if (!config.memory_limit.empty()) {
        args.push_back("--memory");
        args.push_back(config.memory_limit);
    }

    if (config.cpu_limit > 0) {
        std::ostringstream cpus;
        cpus << std::fixed << std::setprecision(2) << config.cpu_limit;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }

    for (const auto& opt : config.security_opts) {
        args.push_back("--security-opt");
        args.push_back(opt);
    }

    args.push_back("--network");
    args.push_back(config.network_mode == NetworkMode::NONE ? "none" : "bridge");

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir);
    }

    // Image (must be last; the image's default command keeps it running)
    args.push_back(config.image);

    return args;
}

std::vector<std::string> ContainerUtils::BuildExecCommand(const std::string& container,
                                                          const std::vector<std::string>& command,
                                                          const ExecOptions& options) {
    std::vector<std::string> args = {"exec"};

    if (!options.stdin_data.empty()) {
        args.push_back("-i");
    }
    if (!options.user.empty()) {
        args.push_back("-u");
        args.push_back(options.user);
    }
    if (!options.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(options.working_dir);
    }

    args.push_back(container);
    args.insert(args.end(), command.begin(), command.end());
    return args;
}

ContainerInfo ContainerUtils::ParseInspectOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    // Docker inspect returns array with single object
    if (j.is_array()) {
        if (j.empty()) {
            throw ContainerError("Empty inspect output");
        }
        j = j[0];
    }

    ContainerInfo info;
    info.id = j.value("Id", "");
    info.name = j.value("Name", "");
    if (StringUtils::StartsWith(info.name, "/")) {
        info.name.erase(0, 1);
    }

    if (j.contains("Config") && j["Config"].is_object()) {
        const auto& cfg = j["Config"];
        info.image = cfg.value("Image", "");
        if (cfg.contains("Labels") && cfg["Labels"].is_object()) {
            for (const auto& [key, value] : cfg["Labels"].items()) {
                if (value.is_string()) {
                    info.labels[key] = value.get<std::string>();
                }
            }
        }
    }

    if (j.contains("State") && j["State"].is_object()) {
        info.state = ParseState(j["State"].value("Status", ""));
    }

    return info;
}

std::string ContainerStateToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED: return "created";
        case ContainerState::RUNNING: return "running";
        case ContainerState::PAUSED: return "paused";
        case ContainerState::RESTARTING: return "restarting";
        case ContainerState::REMOVING: return "removing";
        case ContainerState::EXITED: return "exited";
        case ContainerState::DEAD: return "dead";
        default: return "unknown";
    }
}

ContainerState ContainerUtils::ParseState(const std::string& state_str) {
    const auto state = StringUtils::ToLower(StringUtils::Trim(state_str));
    if (state == "created") return ContainerState::CREATED;
    if (state == "running") return ContainerState::RUNNING;
    if (state == "paused") return ContainerState::PAUSED;
    if (state == "restarting") return ContainerState::RESTARTING;
    if (state == "removing") return ContainerState::REMOVING;
    if (state == "exited") return ContainerState::EXITED;
    if (state == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

bool ContainerUtils::IsNoSuchContainer(const std::string& stderr_output) {
    const auto lowered = StringUtils::ToLower(stderr_output);
    return StringUtils::Contains(lowered, "no such container") ||
           StringUtils::Contains(lowered, "no such object");
}

bool ContainerUtils::IsRuntimeFailure(const std::string& stderr_output) {
    const auto lowered = StringUtils::ToLower(stderr_output);
    return StringUtils::StartsWith(lowered, "error response from daemon") ||
           StringUtils::StartsWith(lowered, "error: no such container") ||
           StringUtils::Contains(lowered, "cannot connect to the docker daemon");
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ContainerUtils::CliResult ContainerUtils::ExecuteDockerCommand(
    const std::vector<std::string>& args,
    const std::string& stdin_data,
    std::optional<std::chrono::seconds> timeout) const {

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {} {}", binary_,
                  StringUtils::Truncate(StringUtils::Join(args, " "), 200));

    ProcessOptions options;
    options.stdin_data = stdin_data;
    if (timeout) {
        options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*timeout);
    }

    auto process_result = ProcessUtils::Run(argv, options);

    CliResult result;
    result.exit_code = process_result.exit_code;
    result.stdout_output = std::move(process_result.stdout_output);
    result.stderr_output = std::move(process_result.stderr_output);
    result.timed_out = process_result.timed_out;
    result.duration = process_result.duration;
    result.success = process_result.Succeeded();

    return result;
}

} // namespace utils
} // namespace sandcell
