/*
 * session.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "session.hpp"

namespace netfleet::network {

auto sessionErrorKindName(SessionErrorKind kind) -> std::string_view {
    switch (kind) {
        case SessionErrorKind::Timeout: return "timeout";
        case SessionErrorKind::ConnectionRefused: return "connection_refused";
        case SessionErrorKind::HostUnreachable: return "host_unreachable";
        case SessionErrorKind::Disconnected: return "disconnected";
        case SessionErrorKind::AuthenticationFailed:
            return "authentication_failed";
        case SessionErrorKind::CommandRejected: return "command_rejected";
        case SessionErrorKind::ProtocolError: return "protocol_error";
    }
    return "protocol_error";
}

}  // namespace netfleet::network
