/*
 * output_limiter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "output_limiter.hpp"

#include <format>

#include <spdlog/spdlog.h>

namespace netfleet::network {

OutputLimiter::OutputLimiter(config::OutputConfig config)
    : config_(config) {}

auto OutputLimiter::apply(std::string_view command, std::string output) const
    -> std::string {
    const auto original = output.size();
    if (original <= config_.summaryThreshold) {
        return output;
    }

    if (original > config_.maxLength) {
        spdlog::warn("Output of '{}' is {} chars, truncating to {}", command,
                     original, config_.maxLength);
        output.resize(config_.maxLength);
        output += std::format(
            "\n\n[Output truncated: showing first {} of {} characters]",
            config_.maxLength, original);
        return output;
    }

    spdlog::debug("Output of '{}' is {} chars, shortening to {}", command,
                  original, config_.summaryThreshold);
    output.resize(config_.summaryThreshold);
    output += std::format(
        "\n\n[Output shortened: showing first {} of {} characters]",
        config_.summaryThreshold, original);
    return output;
}

}  // namespace netfleet::network
