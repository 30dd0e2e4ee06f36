/*
 * credentials.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef NETFLEET_DEVICE_CREDENTIALS_HPP
#define NETFLEET_DEVICE_CREDENTIALS_HPP

#include <map>
#include <string>

#include "config/settings.hpp"
#include "device.hpp"

namespace netfleet::device {

/**
 * @brief Resolves transport credentials for a device.
 *
 * Lookup order: inline device credentials, the named credential set given by
 * the device's credential_ref, then DEVICE_USERNAME / DEVICE_PASSWORD from
 * the environment.
 */
class CredentialResolver {
public:
    CredentialResolver() = default;
    explicit CredentialResolver(
        std::map<std::string, config::CredentialSet> namedSets);

    /**
     * @throws CredentialException when nothing matches
     */
    [[nodiscard]] auto resolve(const Device& device) const -> Credentials;

private:
    std::map<std::string, config::CredentialSet> namedSets_;
};

}  // namespace netfleet::device

#endif  // NETFLEET_DEVICE_CREDENTIALS_HPP
