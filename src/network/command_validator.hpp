/*
 * command_validator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef NETFLEET_NETWORK_COMMAND_VALIDATOR_HPP
#define NETFLEET_NETWORK_COMMAND_VALIDATOR_HPP

#include <string>
#include <string_view>

#include "config/settings.hpp"

namespace netfleet::network {

/**
 * @brief Outcome of a command policy check
 */
struct ValidationResult {
    bool ok{true};
    std::string reason;

    explicit operator bool() const noexcept { return ok; }
};

/**
 * @brief Read-only command policy.
 *
 * Rules are checked in order: empty command, length limit, forbidden
 * keywords, then the allowed prefix list. The first violation wins.
 */
class CommandValidator {
public:
    explicit CommandValidator(config::SecurityConfig config = {});

    [[nodiscard]] auto validate(std::string_view command) const
        -> ValidationResult;

    [[nodiscard]] auto config() const noexcept
        -> const config::SecurityConfig& {
        return config_;
    }

private:
    config::SecurityConfig config_;
};

}  // namespace netfleet::network

#endif  // NETFLEET_NETWORK_COMMAND_VALIDATOR_HPP
