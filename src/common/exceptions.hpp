/*
 * exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Exception types shared by the fleet components

**************************************************/

#ifndef NETFLEET_COMMON_EXCEPTIONS_HPP
#define NETFLEET_COMMON_EXCEPTIONS_HPP

#include <source_location>
#include <string>

#include "atom/error/exception.hpp"

namespace netfleet {

/**
 * @brief Base class for all fleet exceptions.
 *
 * Keeps the undecorated reason next to the located message so callers that
 * report per-device failures can surface the plain text.
 */
class FleetException : public atom::error::Exception {
public:
    explicit FleetException(
        std::string reason,
        const std::source_location& loc = std::source_location::current())
        : Exception(loc.file_name(), loc.line(), loc.function_name(), reason),
          reason_(std::move(reason)) {}

    [[nodiscard]] auto reason() const noexcept -> const std::string& {
        return reason_;
    }

private:
    std::string reason_;
};

/**
 * @brief A device session could not be opened, probed or reused.
 */
class ConnectionException : public FleetException {
public:
    using FleetException::FleetException;
};

#define THROW_CONNECTION_ERROR(reason) \
    throw netfleet::ConnectionException(reason)

/**
 * @brief No pool slot became free within the acquire timeout.
 */
class PoolExhaustedException : public FleetException {
public:
    using FleetException::FleetException;
};

#define THROW_POOL_EXHAUSTED(reason) \
    throw netfleet::PoolExhaustedException(reason)

/**
 * @brief Device rejected the login or spoke an unexpected protocol.
 */
class AuthenticationException : public FleetException {
public:
    using FleetException::FleetException;
};

#define THROW_AUTHENTICATION_ERROR(reason) \
    throw netfleet::AuthenticationException(reason)

/**
 * @brief Transport credentials could not be resolved for a device.
 */
class CredentialException : public FleetException {
public:
    using FleetException::FleetException;
};

#define THROW_CREDENTIAL_ERROR(reason) \
    throw netfleet::CredentialException(reason)

/**
 * @brief Inventory data is malformed or inconsistent.
 */
class InventoryException : public FleetException {
public:
    using FleetException::FleetException;
};

#define THROW_INVENTORY_ERROR(reason) \
    throw netfleet::InventoryException(reason)

/**
 * @brief Settings file is unreadable or malformed.
 */
class ConfigException : public FleetException {
public:
    using FleetException::FleetException;
};

#define THROW_CONFIG_ERROR(reason) throw netfleet::ConfigException(reason)

/**
 * @brief A deadline-wrapped batch did not finish in time.
 */
class BatchDeadlineException : public FleetException {
public:
    using FleetException::FleetException;
};

#define THROW_BATCH_DEADLINE(reason) \
    throw netfleet::BatchDeadlineException(reason)

/**
 * @brief Tool string could not be parsed into devices and a command.
 */
class ToolInputException : public FleetException {
public:
    using FleetException::FleetException;
};

#define THROW_TOOL_INPUT_ERROR(reason) \
    throw netfleet::ToolInputException(reason)

/**
 * @brief Task payload is missing a required field or has the wrong type.
 */
class TaskPayloadException : public FleetException {
public:
    using FleetException::FleetException;
};

#define THROW_TASK_PAYLOAD_ERROR(reason) \
    throw netfleet::TaskPayloadException(reason)

}  // namespace netfleet

#endif  // NETFLEET_COMMON_EXCEPTIONS_HPP
