/*
 * device.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device.hpp"

#include "common/exceptions.hpp"

namespace netfleet::device {

auto Device::toJson() const -> nlohmann::json {
    // Secrets never leave the process through this projection
    nlohmann::json j = {{"ip", address},
                        {"name", name},
                        {"platform", platform},
                        {"model", model},
                        {"description", description},
                        {"groups", groups}};
    if (!credentialRef.empty()) {
        j["credential_ref"] = credentialRef;
    }
    return j;
}

auto Device::fromJson(const nlohmann::json& j) -> Device {
    if (!j.is_object()) {
        THROW_INVENTORY_ERROR("Device entry must be a JSON object");
    }
    if (!j.contains("ip") || !j["ip"].is_string() ||
        j["ip"].get<std::string>().empty()) {
        THROW_INVENTORY_ERROR("Device entry is missing the 'ip' field: " +
                              j.dump());
    }

    Device device;
    device.address = j["ip"].get<std::string>();
    device.name = j.value("name", device.address);
    device.platform =
        j.value("platform", j.value("device_type", device.platform));
    device.model = j.value("model", "");
    device.description = j.value("description", "");
    device.groups = j.value("groups", std::vector<std::string>{});
    device.credentialRef = j.value("credential_ref", "");

    if (auto user = j.value("username", std::string{}); !user.empty()) {
        device.username = user;
        device.password = j.value("password", std::string{});
    }
    return device;
}

}  // namespace netfleet::device
