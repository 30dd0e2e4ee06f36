/*
 * inventory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "inventory.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

#include "common/exceptions.hpp"

namespace netfleet::device {

namespace {

auto readJsonFile(const std::string& path) -> nlohmann::json {
    std::ifstream input(path);
    if (!input.is_open()) {
        THROW_INVENTORY_ERROR("Cannot open inventory file: " + path);
    }
    try {
        return nlohmann::json::parse(input);
    } catch (const nlohmann::json::exception& e) {
        THROW_INVENTORY_ERROR("Malformed inventory file " + path + ": " +
                              e.what());
    }
}

auto groupFromJson(const nlohmann::json& j) -> DeviceGroup {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        THROW_INVENTORY_ERROR("Group entry is missing the 'name' field: " +
                              j.dump());
    }
    DeviceGroup group;
    group.name = j["name"].get<std::string>();
    group.description = j.value("description", "");
    group.platform = j.value("platform", "");
    group.devices = j.value("devices", std::vector<std::string>{});
    return group;
}

}  // namespace

void Inventory::addDevice(Device device) {
    if (index_.contains(device.address)) {
        THROW_INVENTORY_ERROR("Duplicate device address in inventory: " +
                              device.address);
    }
    index_.emplace(device.address, devices_.size());
    devices_.push_back(std::move(device));
}

auto Inventory::fromJson(const nlohmann::json& devicesDoc,
                         const nlohmann::json& groupsDoc) -> Inventory {
    Inventory inventory;

    const nlohmann::json* deviceList = &devicesDoc;
    if (devicesDoc.is_object()) {
        if (!devicesDoc.contains("devices")) {
            THROW_INVENTORY_ERROR(
                "Inventory document has no 'devices' array");
        }
        deviceList = &devicesDoc["devices"];
    }
    if (!deviceList->is_array()) {
        THROW_INVENTORY_ERROR("Inventory 'devices' must be an array");
    }
    for (const auto& entry : *deviceList) {
        inventory.addDevice(Device::fromJson(entry));
    }

    if (groupsDoc.is_object() && groupsDoc.contains("groups")) {
        const auto& groupList = groupsDoc["groups"];
        if (!groupList.is_array()) {
            THROW_INVENTORY_ERROR("Inventory 'groups' must be an array");
        }
        for (const auto& entry : groupList) {
            inventory.groups_.push_back(groupFromJson(entry));
        }
    }

    for (const auto& group : inventory.groups_) {
        for (const auto& address : group.devices) {
            if (!inventory.contains(address)) {
                spdlog::warn("Group '{}' references unknown device {}",
                             group.name, address);
            }
        }
    }

    return inventory;
}

auto Inventory::loadFromFiles(const std::string& devicesFile,
                              const std::string& groupsFile) -> Inventory {
    auto devicesDoc = readJsonFile(devicesFile);
    nlohmann::json groupsDoc;
    if (!groupsFile.empty() && std::filesystem::exists(groupsFile)) {
        groupsDoc = readJsonFile(groupsFile);
    }

    auto inventory = fromJson(devicesDoc, groupsDoc);
    spdlog::info("Loaded {} devices and {} groups from {}", inventory.size(),
                 inventory.groups_.size(), devicesFile);
    return inventory;
}

auto Inventory::all() const -> const std::vector<Device>& { return devices_; }

auto Inventory::find(const std::string& address) const -> const Device* {
    auto it = index_.find(address);
    if (it == index_.end()) {
        return nullptr;
    }
    return &devices_[it->second];
}

auto Inventory::contains(const std::string& address) const -> bool {
    return index_.contains(address);
}

auto Inventory::addresses() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(devices_.size());
    for (const auto& device : devices_) {
        result.push_back(device.address);
    }
    return result;
}

auto Inventory::groupNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& group : groups_) {
        names.push_back(group.name);
    }
    // Groups declared only by devices
    for (const auto& device : devices_) {
        for (const auto& name : device.groups) {
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(name);
            }
        }
    }
    return names;
}

auto Inventory::group(const std::string& name) const
    -> std::optional<DeviceGroup> {
    auto it = std::find_if(groups_.begin(), groups_.end(),
                           [&](const auto& g) { return g.name == name; });
    if (it != groups_.end()) {
        return *it;
    }
    for (const auto& device : devices_) {
        if (std::find(device.groups.begin(), device.groups.end(), name) !=
            device.groups.end()) {
            return DeviceGroup{name, "", "", {}};
        }
    }
    return std::nullopt;
}

auto Inventory::membersOf(const std::string& groupName) const
    -> std::vector<std::string> {
    auto definition = group(groupName);
    if (!definition) {
        return {};
    }

    std::vector<std::string> members;
    for (const auto& device : devices_) {
        bool explicitMember =
            std::find(definition->devices.begin(), definition->devices.end(),
                      device.address) != definition->devices.end();
        bool platformMember = !definition->platform.empty() &&
                              device.platform == definition->platform;
        bool selfDeclared =
            std::find(device.groups.begin(), device.groups.end(),
                      groupName) != device.groups.end();
        if (explicitMember || platformMember || selfDeclared) {
            members.push_back(device.address);
        }
    }
    return members;
}

auto Inventory::toJson() const -> nlohmann::json {
    nlohmann::json devices = nlohmann::json::array();
    for (const auto& device : devices_) {
        devices.push_back(device.toJson());
    }
    nlohmann::json groups = nlohmann::json::array();
    for (const auto& name : groupNames()) {
        groups.push_back({{"name", name}, {"members", membersOf(name)}});
    }
    return {{"devices", devices}, {"groups", groups}};
}

}  // namespace netfleet::device
