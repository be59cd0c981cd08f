/**
 * @file process_utils.hpp
 * @brief Child process execution with separated output capture
 *
 * Runs an argv vector directly (no intermediate shell), optionally feeding
 * bytes to stdin, and captures stdout and stderr on separate pipes so they
 * are never interleaved. Used to drive the container runtime CLI, whose
 * archive copy calls stream tar data through stdin and stdout.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sandcell {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Input and limits for one child process
 */
struct ProcessOptions {
    std::string stdin_data;                               ///< Bytes written to stdin, then closed
    std::optional<std::chrono::milliseconds> timeout;     ///< Kill the child after this long
};

/**
 * @struct ProcessResult
 * @brief Outcome of a finished child process
 */
struct ProcessResult {
    int exit_code{-1};                        ///< Exit status, or 128 + signal number
    std::string stdout_output;                ///< Raw standard output bytes
    std::string stderr_output;                ///< Raw standard error bytes
    bool timed_out{false};                    ///< Child was killed by the timeout
    std::chrono::milliseconds duration{0};    ///< Wall-clock runtime

    bool Succeeded() const { return !timed_out && exit_code == 0; }
};

/**
 * @class ProcessUtils
 * @brief POSIX fork/exec wrapper
 *
 * **Usage Example**:
 * @code
 * ProcessOptions options;
 * options.stdin_data = tar_stream;
 * auto result = ProcessUtils::Run({"docker", "cp", "-", "sc-1a2b:/tmp"}, options);
 * if (!result.Succeeded()) {
 *     spdlog::error("copy failed: {}", result.stderr_output);
 * }
 * @endcode
 */
class ProcessUtils {
public:
    /**
     * @brief Run a program and wait for it
     *
     * @param argv Program followed by its arguments, resolved through PATH
     * @param options Stdin payload and timeout
     * @return Captured result; a program that cannot be executed exits 127
     *
     * @throws std::runtime_error if pipes cannot be created or fork fails
     * @throws std::invalid_argument if argv is empty
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const ProcessOptions& options = ProcessOptions{});

    /**
     * @brief Check whether a program can be found on PATH
     */
    static bool IsOnPath(const std::string& program);
};

} // namespace utils
} // namespace sandcell
