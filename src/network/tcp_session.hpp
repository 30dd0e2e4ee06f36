/*
 * tcp_session.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Line-oriented CLI session over a plain TCP socket

**************************************************/

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "config/settings.hpp"
#include "session.hpp"

namespace netfleet::network {

/**
 * @brief CLI session over TCP (telnet-style management port).
 *
 * Logs in by answering username/password prompts, disables paging, then
 * runs commands by reading until the shell prompt reappears. Telnet option
 * negotiation is refused. Device-side error markers ("% Invalid input", ...)
 * are reported as CommandRejected.
 */
class TcpSession : public Session {
public:
    TcpSession(std::string address, config::TransportConfig config);
    ~TcpSession() override;

    TcpSession(const TcpSession&) = delete;
    TcpSession& operator=(const TcpSession&) = delete;

    /**
     * @brief Connect and log in
     */
    auto open(const device::Credentials& credentials,
              std::chrono::milliseconds timeout)
        -> std::expected<void, SessionError>;

    auto execute(std::string_view command, std::chrono::milliseconds timeout)
        -> std::expected<std::string, SessionError> override;

    auto probe() -> bool override;

    void close() override;

    [[nodiscard]] auto isOpen() const -> bool override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Opens TcpSession instances
 */
class TcpSessionFactory : public SessionFactory {
public:
    explicit TcpSessionFactory(config::TransportConfig config = {});

    auto open(const device::Device& device,
              const device::Credentials& credentials,
              std::chrono::milliseconds connectTimeout)
        -> std::expected<std::unique_ptr<Session>, SessionError> override;

private:
    config::TransportConfig config_;
};

}  // namespace netfleet::network
