/*
 * inventory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Read-only device inventory and group membership

**************************************************/

#ifndef NETFLEET_DEVICE_INVENTORY_HPP
#define NETFLEET_DEVICE_INVENTORY_HPP

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "atom/type/json.hpp"

#include "device.hpp"

namespace netfleet::device {

/**
 * @brief Named device group
 */
struct DeviceGroup {
    std::string name;
    std::string description;
    std::string platform;              ///< Members by platform, optional
    std::vector<std::string> devices;  ///< Explicit member addresses
};

/**
 * @brief Immutable device inventory.
 *
 * Devices keep their load order; lookups by address are O(1).
 */
class Inventory {
public:
    Inventory() = default;

    /**
     * @brief Build from devices and groups documents.
     *
     * @param devicesDoc {"devices": [...]}
     * @param groupsDoc  {"groups": [...]}, may be null
     * @throws InventoryException on malformed entries or duplicate addresses
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& devicesDoc,
                                       const nlohmann::json& groupsDoc =
                                           nlohmann::json())
        -> Inventory;

    /**
     * @brief Load devices.json and, if present, groups.json
     */
    [[nodiscard]] static auto loadFromFiles(const std::string& devicesFile,
                                            const std::string& groupsFile)
        -> Inventory;

    [[nodiscard]] auto all() const -> const std::vector<Device>&;

    [[nodiscard]] auto find(const std::string& address) const
        -> const Device*;

    [[nodiscard]] auto contains(const std::string& address) const -> bool;

    [[nodiscard]] auto addresses() const -> std::vector<std::string>;

    [[nodiscard]] auto groupNames() const -> std::vector<std::string>;

    [[nodiscard]] auto group(const std::string& name) const
        -> std::optional<DeviceGroup>;

    /**
     * @brief Addresses of a group's members in inventory order.
     *
     * Empty for an unknown group.
     */
    [[nodiscard]] auto membersOf(const std::string& groupName) const
        -> std::vector<std::string>;

    [[nodiscard]] auto size() const noexcept -> size_t {
        return devices_.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return devices_.empty();
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

private:
    void addDevice(Device device);

    std::vector<Device> devices_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<DeviceGroup> groups_;
};

}  // namespace netfleet::device

#endif  // NETFLEET_DEVICE_INVENTORY_HPP
