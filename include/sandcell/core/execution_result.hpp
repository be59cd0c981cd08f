/**
 * @file execution_result.hpp
 * @brief Value objects returned from command and code execution
 *
 * `exit_code` reflects the executed program. `error` is set only when the
 * execution layer itself failed (sandbox unreachable, archive copy failed),
 * in which case `exit_code` defaults to 1.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>

namespace sandcell {
namespace core {

/**
 * @struct ExecutionResult
 * @brief Captured output of one execution inside a sandbox
 */
struct ExecutionResult {
    std::string stdout_output;            ///< Captured standard output
    std::string stderr_output;            ///< Captured standard error
    int exit_code{0};                     ///< Exit code of the executed program
    std::optional<std::string> error;     ///< Execution-layer failure, if any

    bool HasError() const { return error.has_value(); }
    bool Succeeded() const { return !error && exit_code == 0; }
};

/**
 * @struct CommandResult
 * @brief Result of a shell command
 */
struct CommandResult : ExecutionResult {
    /// Renders `CommandResult(exit_code=0, stdout=...)`, empty fields omitted
    std::string ToString() const;
};

/**
 * @struct CodeResult
 * @brief Result of a code block run through the sandbox interpreter
 */
struct CodeResult : ExecutionResult {
    /// Renders `CodeResult(exit_code=0, stdout=...)`, empty fields omitted
    std::string ToString() const;
};

/// Build a failed result carrying only an execution-layer error
template <typename Result>
Result FailedResult(const std::string& error) {
    Result result;
    result.exit_code = 1;
    result.error = error;
    return result;
}

} // namespace core
} // namespace sandcell
