/*
 * scope.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef NETFLEET_BATCH_SCOPE_HPP
#define NETFLEET_BATCH_SCOPE_HPP

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "atom/type/json.hpp"

#include "common/exceptions.hpp"

namespace netfleet::batch {

/**
 * @brief Devices a single request may touch.
 *
 * Passed by value into each batch call. An unrestricted scope allows every
 * device; a restricted scope only ever narrows the requested targets.
 */
class ExecutionScope {
public:
    ExecutionScope() = default;

    [[nodiscard]] static auto restrictedTo(
        const std::vector<std::string>& addresses) -> ExecutionScope {
        ExecutionScope scope;
        scope.allowed_.emplace(addresses.begin(), addresses.end());
        return scope;
    }

    [[nodiscard]] auto isRestricted() const noexcept -> bool {
        return allowed_.has_value();
    }

    [[nodiscard]] auto allows(const std::string& address) const -> bool {
        return !allowed_ || allowed_->contains(address);
    }

    /**
     * @brief null for unrestricted, otherwise an array of addresses
     * @throws TaskPayloadException for any other shape
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> ExecutionScope {
        if (j.is_null()) {
            return {};
        }
        if (!j.is_array()) {
            THROW_TASK_PAYLOAD_ERROR(
                "'scope' must be null or a list of device addresses");
        }
        std::vector<std::string> addresses;
        for (const auto& item : j) {
            if (!item.is_string()) {
                THROW_TASK_PAYLOAD_ERROR(
                    "'scope' must be null or a list of device addresses");
            }
            addresses.push_back(item.get<std::string>());
        }
        return restrictedTo(addresses);
    }

private:
    std::optional<std::unordered_set<std::string>> allowed_;
};

}  // namespace netfleet::batch

#endif  // NETFLEET_BATCH_SCOPE_HPP
