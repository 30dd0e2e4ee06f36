/*
 * error_classifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "error_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace netfleet::network {

namespace {

struct Rule {
    std::string_view type;
    std::string_view category;
    ErrorSeverity severity;
    std::string_view description;
    std::string_view suggestion;
    std::vector<std::string_view> patterns;
};

// Order matters: a timed-out login must report the timeout, not the login.
const std::array<Rule, 12> kRules{{
    {"connection_timeout", "connection", ErrorSeverity::High,
     "Connection or command timed out",
     "Check device reachability and load, or raise the command timeout",
     {"timed out", "timeout"}},
    {"authentication_failed", "authentication", ErrorSeverity::High,
     "Device rejected the login",
     "Verify the username and password configured for the device",
     {"authentication", "login incorrect", "login invalid", "bad password"}},
    {"connection_refused", "connection", ErrorSeverity::High,
     "Device refused the connection",
     "Confirm the management service is enabled and the port is correct",
     {"connection refused"}},
    {"host_unreachable", "connection", ErrorSeverity::High,
     "Device address is unreachable",
     "Check routing, ACLs and that the device is powered on",
     {"host unreachable", "no route to host", "network is unreachable",
      "unreachable", "name or service not known"}},
    {"invalid_command", "command", ErrorSeverity::Medium,
     "Device rejected the command syntax",
     "Check the command spelling against the device platform",
     {"invalid command", "invalid input"}},
    {"incomplete_command", "command", ErrorSeverity::Medium,
     "Command is missing required arguments",
     "Complete the command with the required keywords or values",
     {"incomplete command"}},
    {"ambiguous_command", "command", ErrorSeverity::Medium,
     "Command abbreviation is ambiguous",
     "Spell out the command keywords in full",
     {"ambiguous command"}},
    {"permission_denied", "permission", ErrorSeverity::Medium,
     "Account lacks the privilege for this command",
     "Use an account with a higher privilege level",
     {"permission denied", "not authorized", "authorization failed"}},
    {"resource_busy", "resource", ErrorSeverity::Medium,
     "Device or pool is busy",
     "Retry later or lower the number of concurrent workers",
     {"resource busy", "device busy", "pool exhausted"}},
    {"memory_insufficient", "resource", ErrorSeverity::High,
     "Device reported insufficient memory",
     "Free device memory before retrying",
     {"insufficient memory", "out of memory", "memory insufficient"}},
    {"security_violation", "security", ErrorSeverity::Medium,
     "Command blocked by the read-only policy",
     "Use a read-only command such as show, ping or traceroute",
     {"policy violation", "security policy"}},
    {"no_matching_devices", "filter", ErrorSeverity::Medium,
     "No devices matched the requested targets",
     "Check the device list, group name and execution scope",
     {"no matching devices", "no devices in group"}},
}};

auto toLower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

}  // namespace

auto severityToString(ErrorSeverity severity) -> std::string {
    switch (severity) {
        case ErrorSeverity::Info: return "info";
        case ErrorSeverity::Medium: return "medium";
        case ErrorSeverity::High: return "high";
    }
    return "medium";
}

auto ClassifiedError::toJson() const -> nlohmann::json {
    return {{"type", type},
            {"category", category},
            {"severity", severityToString(severity)},
            {"description", description},
            {"suggestion", suggestion}};
}

auto ErrorClassifier::classify(std::string_view message) -> ClassifiedError {
    auto lower = toLower(message);

    for (const auto& rule : kRules) {
        for (auto pattern : rule.patterns) {
            if (lower.find(pattern) != std::string::npos) {
                return {std::string(rule.type), std::string(rule.category),
                        rule.severity, std::string(rule.description),
                        std::string(rule.suggestion)};
            }
        }
    }

    return {"unknown_error", "unknown", ErrorSeverity::Medium,
            "Unrecognized failure",
            "Inspect the raw error message and the device logs"};
}

}  // namespace netfleet::network
