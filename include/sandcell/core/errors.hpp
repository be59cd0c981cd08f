/**
 * @file errors.hpp
 * @brief Exception taxonomy shared by all sandbox backends
 *
 * Provisioning and lookup failures propagate as exceptions up to the
 * facade. Command and code execution never throw; they fold transport
 * failures into the returned result instead.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sandcell {
namespace core {

/**
 * @class SandboxError
 * @brief Base class for every sandbox failure
 */
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ProvisioningError
 * @brief The runtime could not start a new sandbox resource
 */
class ProvisioningError : public SandboxError {
public:
    explicit ProvisioningError(const std::string& message)
        : SandboxError(message) {}
};

/**
 * @class SessionNotFoundError
 * @brief Identifier unresolved, or the resource exists but is not running
 */
class SessionNotFoundError : public SandboxError {
public:
    explicit SessionNotFoundError(const std::string& message)
        : SandboxError(message) {}
};

/**
 * @class TransportError
 * @brief An operation could not reach or complete against a live sandbox
 */
class TransportError : public SandboxError {
public:
    explicit TransportError(const std::string& message)
        : SandboxError(message) {}
};

/**
 * @class ExtractionError
 * @brief An archive or download held no usable file
 */
class ExtractionError : public SandboxError {
public:
    explicit ExtractionError(const std::string& message)
        : SandboxError(message) {}
};

/// Short type name for a caught exception, used in agent-facing messages
std::string ErrorTypeName(const std::exception& e);

} // namespace core
} // namespace sandcell
