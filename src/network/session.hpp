/*
 * session.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Device session interfaces

**************************************************/

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "device/device.hpp"

namespace netfleet::network {

/**
 * @brief Session failure kinds
 */
enum class SessionErrorKind : uint8_t {
    Timeout,
    ConnectionRefused,
    HostUnreachable,
    Disconnected,
    AuthenticationFailed,
    CommandRejected,
    ProtocolError
};

/**
 * @brief Failure reported by a session operation
 */
struct SessionError {
    SessionErrorKind kind{SessionErrorKind::ProtocolError};
    std::string message;

    /**
     * @brief Whether the failure came from the transport itself.
     *
     * Transport failures make the session unusable and qualify for the single
     * retry on a fresh connection.
     */
    [[nodiscard]] auto isTransport() const noexcept -> bool {
        switch (kind) {
            case SessionErrorKind::Timeout:
            case SessionErrorKind::ConnectionRefused:
            case SessionErrorKind::HostUnreachable:
            case SessionErrorKind::Disconnected:
                return true;
            default:
                return false;
        }
    }
};

[[nodiscard]] auto sessionErrorKindName(SessionErrorKind kind)
    -> std::string_view;

/**
 * @brief Live CLI session with one device
 */
class Session {
public:
    virtual ~Session() = default;

    /**
     * @brief Run a command and return its raw output
     * @param command Command text
     * @param timeout Read timeout for the full response
     */
    virtual auto execute(std::string_view command,
                         std::chrono::milliseconds timeout)
        -> std::expected<std::string, SessionError> = 0;

    /**
     * @brief Cheap liveness check
     */
    virtual auto probe() -> bool = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual auto isOpen() const -> bool = 0;
};

/**
 * @brief Opens sessions for the connection pool
 */
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual auto open(const device::Device& device,
                      const device::Credentials& credentials,
                      std::chrono::milliseconds connectTimeout)
        -> std::expected<std::unique_ptr<Session>, SessionError> = 0;
};

}  // namespace netfleet::network
