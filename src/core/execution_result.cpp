/**
 * @file execution_result.cpp
 * @brief Text rendering of execution results and error type names
 *
 * The agent consumes results as text, so the rendering format is part of
 * the external contract:
 * ```
 * CommandResult(exit_code=0, stdout=hello
 * )
 * ```
 *
 * @date 2025
 */

#include "sandcell/core/execution_result.hpp"
#include "sandcell/core/errors.hpp"

#include <sstream>
#include <vector>

namespace sandcell {
namespace core {

namespace {

std::string Render(const std::string& type_name, const ExecutionResult& result) {
    std::vector<std::string> parts;
    parts.push_back("exit_code=" + std::to_string(result.exit_code));

    if (!result.stdout_output.empty()) {
        parts.push_back("stdout=" + result.stdout_output);
    }
    if (!result.stderr_output.empty()) {
        parts.push_back("stderr=" + result.stderr_output);
    }
    if (result.error && !result.error->empty()) {
        parts.push_back("error=" + *result.error);
    }

    std::ostringstream oss;
    oss << type_name << "(";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << parts[i];
    }
    oss << ")";
    return oss.str();
}

} // anonymous namespace

std::string CommandResult::ToString() const {
    return Render("CommandResult", *this);
}

std::string CodeResult::ToString() const {
    return Render("CodeResult", *this);
}

std::string ErrorTypeName(const std::exception& e) {
    if (dynamic_cast<const ProvisioningError*>(&e)) return "ProvisioningError";
    if (dynamic_cast<const SessionNotFoundError*>(&e)) return "SessionNotFoundError";
    if (dynamic_cast<const TransportError*>(&e)) return "TransportError";
    if (dynamic_cast<const ExtractionError*>(&e)) return "ExtractionError";
    if (dynamic_cast<const SandboxError*>(&e)) return "SandboxError";
    if (dynamic_cast<const std::invalid_argument*>(&e)) return "InvalidArgument";
    if (dynamic_cast<const std::runtime_error*>(&e)) return "RuntimeError";
    return "Exception";
}

} // namespace core
} // namespace sandcell
