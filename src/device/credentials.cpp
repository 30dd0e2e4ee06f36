/*
 * credentials.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "credentials.hpp"

#include <cstdlib>

#include "common/exceptions.hpp"

namespace netfleet::device {

CredentialResolver::CredentialResolver(
    std::map<std::string, config::CredentialSet> namedSets)
    : namedSets_(std::move(namedSets)) {}

auto CredentialResolver::resolve(const Device& device) const -> Credentials {
    if (device.username && !device.username->empty()) {
        return {*device.username, device.password.value_or("")};
    }

    if (!device.credentialRef.empty()) {
        auto it = namedSets_.find(device.credentialRef);
        if (it == namedSets_.end()) {
            THROW_CREDENTIAL_ERROR(
                "Authentication credentials unavailable for " +
                device.address + ": unknown credential set '" +
                device.credentialRef + "'");
        }
        return {it->second.username, it->second.password};
    }

    const char* user = std::getenv("DEVICE_USERNAME");
    const char* pass = std::getenv("DEVICE_PASSWORD");
    if (user != nullptr && *user != '\0' && pass != nullptr) {
        return {user, pass};
    }

    THROW_CREDENTIAL_ERROR(
        "Authentication credentials unavailable for " + device.address +
        ": set username/password, credential_ref or DEVICE_USERNAME and "
        "DEVICE_PASSWORD");
}

}  // namespace netfleet::device
