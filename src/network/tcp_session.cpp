/*
 * tcp_session.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: TCP CLI session implementation

*************************************************/

#include "tcp_session.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <spdlog/spdlog.h>

namespace netfleet::network {

namespace {

using socket_t = int;
constexpr socket_t INVALID_SOCK = -1;
constexpr std::chrono::milliseconds PROBE_TIMEOUT{5000};

// Telnet protocol bytes
constexpr unsigned char IAC = 255;
constexpr unsigned char DONT = 254;
constexpr unsigned char DO = 253;
constexpr unsigned char WONT = 252;
constexpr unsigned char WILL = 251;
constexpr unsigned char SB = 250;
constexpr unsigned char SE = 240;

constexpr std::array<std::string_view, 3> kRejectionMarkers{
    "% Invalid input", "% Incomplete command", "% Ambiguous command"};

auto setNonBlocking(socket_t sock, bool nonBlocking) -> bool {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0)
        return false;
    if (nonBlocking) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }
    return fcntl(sock, F_SETFL, flags) == 0;
}

auto setSocketOption(socket_t sock, int level, int optname, bool value)
    -> bool {
    int val = value ? 1 : 0;
    return setsockopt(sock, level, optname, &val, sizeof(val)) == 0;
}

auto kindForErrno(int err) -> SessionErrorKind {
    switch (err) {
        case ECONNREFUSED: return SessionErrorKind::ConnectionRefused;
        case EHOSTUNREACH:
        case ENETUNREACH: return SessionErrorKind::HostUnreachable;
        case ETIMEDOUT: return SessionErrorKind::Timeout;
        default: return SessionErrorKind::Disconnected;
    }
}

auto lastLine(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.back() == ' ' || text.back() == '\r' ||
                             text.back() == '\n')) {
        text.remove_suffix(1);
    }
    auto pos = text.find_last_of('\n');
    return pos == std::string_view::npos ? text : text.substr(pos + 1);
}

auto remainingUntil(std::chrono::steady_clock::time_point deadline)
    -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
}

}  // namespace

// ============================================================================
// TcpSession::Impl
// ============================================================================

class TcpSession::Impl {
public:
    Impl(std::string address, config::TransportConfig config)
        : address_(std::move(address)), config_(std::move(config)) {}

    ~Impl() { close(); }

    auto connect(std::chrono::milliseconds timeout)
        -> std::expected<void, SessionError> {
        struct addrinfo hints {};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;

        struct addrinfo* result = nullptr;
        std::string portStr = std::to_string(config_.port);
        int ret = getaddrinfo(address_.c_str(), portStr.c_str(), &hints,
                              &result);
        if (ret != 0) {
            return std::unexpected(SessionError{
                SessionErrorKind::HostUnreachable,
                std::format("Host unreachable: cannot resolve {} ({})",
                            address_, gai_strerror(ret))});
        }

        int lastErr = 0;
        for (auto* rp = result; rp != nullptr; rp = rp->ai_next) {
            socket_ = socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
            if (socket_ == INVALID_SOCK) {
                lastErr = errno;
                continue;
            }

            setNonBlocking(socket_, true);
            ret = ::connect(socket_, rp->ai_addr, rp->ai_addrlen);
            if (ret == 0) {
                break;
            }

            if (errno == EINPROGRESS) {
                pollfd pfd{socket_, POLLOUT, 0};
                ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
                if (ret > 0) {
                    int error = 0;
                    socklen_t len = sizeof(error);
                    getsockopt(socket_, SOL_SOCKET, SO_ERROR, &error, &len);
                    if (error == 0) {
                        break;
                    }
                    lastErr = error;
                } else if (ret == 0) {
                    lastErr = ETIMEDOUT;
                } else {
                    lastErr = errno;
                }
            } else {
                lastErr = errno;
            }

            ::close(socket_);
            socket_ = INVALID_SOCK;
        }
        freeaddrinfo(result);

        if (socket_ == INVALID_SOCK) {
            auto kind = kindForErrno(lastErr);
            std::string message;
            switch (kind) {
                case SessionErrorKind::Timeout:
                    message = std::format(
                        "Connection to {}:{} timed out after {} ms", address_,
                        config_.port, timeout.count());
                    break;
                case SessionErrorKind::ConnectionRefused:
                    message = std::format("Connection refused by {}:{}",
                                          address_, config_.port);
                    break;
                case SessionErrorKind::HostUnreachable:
                    message = std::format("Host unreachable: {} ({})",
                                          address_, std::strerror(lastErr));
                    break;
                default:
                    message = std::format("Connection to {}:{} failed: {}",
                                          address_, config_.port,
                                          std::strerror(lastErr));
                    break;
            }
            return std::unexpected(SessionError{kind, message});
        }

        setSocketOption(socket_, SOL_SOCKET, SO_KEEPALIVE, true);
        setSocketOption(socket_, IPPROTO_TCP, TCP_NODELAY, true);
        setNonBlocking(socket_, false);
        spdlog::debug("Connected to {}:{}", address_, config_.port);
        return {};
    }

    auto login(const device::Credentials& credentials,
               std::chrono::milliseconds timeout)
        -> std::expected<void, SessionError> {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        bool sentUser = false;
        bool sentPassword = false;

        while (true) {
            auto remaining = remainingUntil(deadline);
            if (remaining.count() <= 0) {
                return std::unexpected(SessionError{
                    SessionErrorKind::Timeout,
                    std::format("Login to {} timed out after {} ms", address_,
                                timeout.count())});
            }

            auto chunk = readSome(remaining);
            if (!chunk) {
                return std::unexpected(chunk.error());
            }
            buffer_ += *chunk;

            auto tail = lastLine(buffer_);
            if (tail.find(config_.usernamePrompt) != std::string_view::npos) {
                if (sentUser) {
                    return authFailure();
                }
                buffer_.clear();
                sentUser = true;
                if (auto sent = sendLine(credentials.username); !sent) {
                    return std::unexpected(sent.error());
                }
            } else if (tail.find(config_.passwordPrompt) !=
                       std::string_view::npos) {
                if (sentPassword) {
                    return authFailure();
                }
                buffer_.clear();
                sentPassword = true;
                if (auto sent = sendLine(credentials.password); !sent) {
                    return std::unexpected(sent.error());
                }
            } else if (endsWithPrompt(buffer_)) {
                buffer_.clear();
                break;
            }
        }

        if (!config_.paginationCommand.empty()) {
            auto result = execute(config_.paginationCommand, timeout);
            if (!result) {
                return std::unexpected(result.error());
            }
        }
        return {};
    }

    auto execute(std::string_view command, std::chrono::milliseconds timeout)
        -> std::expected<std::string, SessionError> {
        if (!isOpen()) {
            return std::unexpected(SessionError{
                SessionErrorKind::Disconnected,
                std::format("Session to {} is closed", address_)});
        }

        buffer_.clear();
        if (auto sent = sendLine(command); !sent) {
            return std::unexpected(sent.error());
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!endsWithPrompt(buffer_)) {
            auto remaining = remainingUntil(deadline);
            if (remaining.count() <= 0) {
                // Partial output leaves the stream out of sync
                close();
                return std::unexpected(SessionError{
                    SessionErrorKind::Timeout,
                    std::format("Command '{}' on {} timed out after {} ms",
                                command, address_, timeout.count())});
            }
            auto chunk = readSome(remaining);
            if (!chunk) {
                return std::unexpected(chunk.error());
            }
            buffer_ += *chunk;
        }

        auto output = stripEchoAndPrompt(buffer_, command);
        buffer_.clear();

        for (auto marker : kRejectionMarkers) {
            if (auto pos = output.find(marker); pos != std::string::npos) {
                auto end = output.find('\n', pos);
                auto line = output.substr(pos + 2, end == std::string::npos
                                                       ? std::string::npos
                                                       : end - pos - 2);
                while (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return std::unexpected(
                    SessionError{SessionErrorKind::CommandRejected,
                                 std::format("{} (command '{}' on {})", line,
                                             command, address_)});
            }
        }
        return output;
    }

    auto probe() -> bool {
        if (!isOpen()) {
            return false;
        }
        auto result = execute("", PROBE_TIMEOUT);
        return result.has_value();
    }

    void close() {
        if (socket_ != INVALID_SOCK) {
            ::close(socket_);
            socket_ = INVALID_SOCK;
            spdlog::debug("Closed session to {}", address_);
        }
    }

    [[nodiscard]] auto isOpen() const -> bool {
        return socket_ != INVALID_SOCK;
    }

private:
    auto authFailure() -> std::expected<void, SessionError> {
        close();
        return std::unexpected(
            SessionError{SessionErrorKind::AuthenticationFailed,
                         std::format("Authentication failed for {}", address_)});
    }

    auto sendLine(std::string_view line) -> std::expected<void, SessionError> {
        std::string data(line);
        data += "\r\n";
        return sendRaw(data);
    }

    auto sendRaw(std::string_view data) -> std::expected<void, SessionError> {
        size_t totalSent = 0;
        while (totalSent < data.size()) {
            auto sent = ::send(socket_, data.data() + totalSent,
                               data.size() - totalSent, MSG_NOSIGNAL);
            if (sent <= 0) {
                int err = errno;
                close();
                return std::unexpected(SessionError{
                    SessionErrorKind::Disconnected,
                    std::format("Send to {} failed: {}", address_,
                                std::strerror(err))});
            }
            totalSent += static_cast<size_t>(sent);
        }
        return {};
    }

    /**
     * @brief Wait for data, strip telnet negotiation and return the text
     */
    auto readSome(std::chrono::milliseconds timeout)
        -> std::expected<std::string, SessionError> {
        pollfd pfd{socket_, POLLIN, 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ret == 0) {
            return std::string{};
        }
        if (ret < 0) {
            if (errno == EINTR) {
                return std::string{};
            }
            int err = errno;
            close();
            return std::unexpected(SessionError{
                kindForErrno(err), std::format("Receive from {} failed: {}",
                                               address_, std::strerror(err))});
        }

        std::array<char, 4096> chunk{};
        auto received = ::recv(socket_, chunk.data(), chunk.size(), 0);
        if (received == 0) {
            close();
            return std::unexpected(
                SessionError{SessionErrorKind::Disconnected,
                             std::format("Connection closed by {}", address_)});
        }
        if (received < 0) {
            int err = errno;
            close();
            return std::unexpected(SessionError{
                kindForErrno(err), std::format("Receive from {} failed: {}",
                                               address_, std::strerror(err))});
        }
        return filterTelnet(std::string_view(chunk.data(),
                                             static_cast<size_t>(received)));
    }

    auto filterTelnet(std::string_view raw)
        -> std::expected<std::string, SessionError> {
        std::string text;
        std::string reply;
        for (size_t i = 0; i < raw.size(); ++i) {
            auto c = static_cast<unsigned char>(raw[i]);
            if (c != IAC) {
                text.push_back(raw[i]);
                continue;
            }
            if (i + 1 >= raw.size()) {
                break;
            }
            auto verb = static_cast<unsigned char>(raw[++i]);
            if (verb == IAC) {
                text.push_back(raw[i]);
            } else if ((verb == DO || verb == DONT || verb == WILL ||
                        verb == WONT) &&
                       i + 1 < raw.size()) {
                auto option = raw[++i];
                if (verb == DO) {
                    reply += {static_cast<char>(IAC), static_cast<char>(WONT),
                              option};
                } else if (verb == WILL) {
                    reply += {static_cast<char>(IAC), static_cast<char>(DONT),
                              option};
                }
            } else if (verb == SB) {
                while (i + 1 < raw.size() &&
                       !(static_cast<unsigned char>(raw[i]) == IAC &&
                         static_cast<unsigned char>(raw[i + 1]) == SE)) {
                    ++i;
                }
                ++i;
            }
        }
        if (!reply.empty()) {
            if (auto sent = sendRaw(reply); !sent) {
                return std::unexpected(sent.error());
            }
        }
        return text;
    }

    [[nodiscard]] auto endsWithPrompt(std::string_view text) const -> bool {
        auto tail = lastLine(text);
        if (tail.empty()) {
            return false;
        }
        return std::any_of(config_.promptSuffixes.begin(),
                           config_.promptSuffixes.end(),
                           [&](const std::string& suffix) {
                               return !suffix.empty() && tail.ends_with(suffix);
                           });
    }

    static auto stripEchoAndPrompt(std::string_view text,
                                   std::string_view command) -> std::string {
        // Drop the trailing prompt line
        auto trimmed = text;
        while (!trimmed.empty() &&
               (trimmed.back() == ' ' || trimmed.back() == '\r' ||
                trimmed.back() == '\n')) {
            trimmed.remove_suffix(1);
        }
        auto promptStart = trimmed.find_last_of('\n');
        trimmed = promptStart == std::string_view::npos
                      ? std::string_view{}
                      : trimmed.substr(0, promptStart);

        // Drop the echoed command line
        auto firstBreak = trimmed.find('\n');
        auto firstLine = trimmed.substr(0, firstBreak);
        if (!command.empty() &&
            firstLine.find(command) != std::string_view::npos) {
            trimmed = firstBreak == std::string_view::npos
                          ? std::string_view{}
                          : trimmed.substr(firstBreak + 1);
        }

        std::string output;
        output.reserve(trimmed.size());
        for (char c : trimmed) {
            if (c != '\r') {
                output.push_back(c);
            }
        }
        return output;
    }

    std::string address_;
    config::TransportConfig config_;
    socket_t socket_{INVALID_SOCK};
    std::string buffer_;
};

// ============================================================================
// TcpSession
// ============================================================================

TcpSession::TcpSession(std::string address, config::TransportConfig config)
    : impl_(std::make_unique<Impl>(std::move(address), std::move(config))) {}

TcpSession::~TcpSession() = default;

auto TcpSession::open(const device::Credentials& credentials,
                      std::chrono::milliseconds timeout)
    -> std::expected<void, SessionError> {
    if (auto connected = impl_->connect(timeout); !connected) {
        return connected;
    }
    return impl_->login(credentials, timeout);
}

auto TcpSession::execute(std::string_view command,
                         std::chrono::milliseconds timeout)
    -> std::expected<std::string, SessionError> {
    return impl_->execute(command, timeout);
}

auto TcpSession::probe() -> bool { return impl_->probe(); }

void TcpSession::close() { impl_->close(); }

auto TcpSession::isOpen() const -> bool { return impl_->isOpen(); }

// ============================================================================
// TcpSessionFactory
// ============================================================================

TcpSessionFactory::TcpSessionFactory(config::TransportConfig config)
    : config_(std::move(config)) {}

auto TcpSessionFactory::open(const device::Device& device,
                             const device::Credentials& credentials,
                             std::chrono::milliseconds connectTimeout)
    -> std::expected<std::unique_ptr<Session>, SessionError> {
    auto session = std::make_unique<TcpSession>(device.address, config_);
    if (auto opened = session->open(credentials, connectTimeout); !opened) {
        return std::unexpected(opened.error());
    }
    spdlog::info("Logged in to {} ({})", device.address, device.platform);
    return session;
}

}  // namespace netfleet::network
