/*
 * device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Network device record

**************************************************/

#ifndef NETFLEET_DEVICE_DEVICE_HPP
#define NETFLEET_DEVICE_DEVICE_HPP

#include <optional>
#include <string>
#include <vector>

#include "atom/type/json.hpp"

namespace netfleet::device {

/**
 * @brief Static description of one managed device.
 *
 * Built once when the inventory is loaded and never mutated afterwards.
 */
struct Device {
    std::string address;                  ///< Unique key (IP or hostname)
    std::string name;                     ///< Display name
    std::string platform{"cisco_xe"};     ///< Platform/type tag
    std::string model;
    std::string description;
    std::vector<std::string> groups;      ///< Groups named by the device itself
    std::string credentialRef;            ///< Named credential set, optional
    std::optional<std::string> username;  ///< Inline credentials
    std::optional<std::string> password;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Build from a devices.json entry; throws InventoryException
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> Device;
};

/**
 * @brief Transport credentials for a single device
 */
struct Credentials {
    std::string username;
    std::string password;
};

}  // namespace netfleet::device

#endif  // NETFLEET_DEVICE_DEVICE_HPP
