/*
 * command_validator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_validator.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace netfleet::network {

namespace {

auto normalize(std::string_view command) -> std::string {
    auto begin = std::find_if_not(command.begin(), command.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c));
    });
    auto end = std::find_if_not(command.rbegin(), command.rend(), [](char c) {
                   return std::isspace(static_cast<unsigned char>(c));
               }).base();
    if (begin >= end) {
        return {};
    }
    std::string result(begin, end);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

auto joined(const std::vector<std::string>& items) -> std::string {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

}  // namespace

CommandValidator::CommandValidator(config::SecurityConfig config)
    : config_(std::move(config)) {}

auto CommandValidator::validate(std::string_view command) const
    -> ValidationResult {
    auto normalized = normalize(command);

    if (normalized.empty()) {
        return {false, "Security policy violation: command is empty"};
    }

    if (normalized.size() > config_.maxCommandLength) {
        return {false,
                std::format("Security policy violation: command exceeds the "
                            "{} character limit",
                            config_.maxCommandLength)};
    }

    for (const auto& keyword : config_.dangerousKeywords) {
        if (!keyword.empty() && normalized.find(normalize(keyword)) !=
                                    std::string::npos) {
            return {false, std::format("Security policy violation: command "
                                       "contains forbidden keyword '{}'",
                                       keyword)};
        }
    }

    if (config_.strictValidation) {
        bool allowed = std::any_of(
            config_.allowedPrefixes.begin(), config_.allowedPrefixes.end(),
            [&](const std::string& prefix) {
                auto p = normalize(prefix);
                return !p.empty() &&
                       (normalized == p || normalized.starts_with(p + " "));
            });
        if (!allowed) {
            return {false, std::format("Security policy violation: only "
                                       "commands starting with {} are "
                                       "permitted",
                                       joined(config_.allowedPrefixes))};
        }
    }

    return {true, ""};
}

}  // namespace netfleet::network
