/*
 * error_classifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Failure taxonomy for per-device errors

**************************************************/

#ifndef NETFLEET_NETWORK_ERROR_CLASSIFIER_HPP
#define NETFLEET_NETWORK_ERROR_CLASSIFIER_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"

namespace netfleet::network {

enum class ErrorSeverity : uint8_t { Info, Medium, High };

[[nodiscard]] auto severityToString(ErrorSeverity severity) -> std::string;

/**
 * @brief Taxonomy entry attached to a failure
 */
struct ClassifiedError {
    std::string type;      ///< e.g. connection_timeout
    std::string category;  ///< e.g. connection, command, security
    ErrorSeverity severity{ErrorSeverity::Medium};
    std::string description;
    std::string suggestion;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Maps raw failure text to a taxonomy entry.
 *
 * Matching is case-insensitive substring search over a priority-ordered
 * rule table; the first matching rule wins. Messages matching nothing map to
 * unknown_error with medium severity.
 */
class ErrorClassifier {
public:
    [[nodiscard]] static auto classify(std::string_view message)
        -> ClassifiedError;
};

}  // namespace netfleet::network

#endif  // NETFLEET_NETWORK_ERROR_CLASSIFIER_HPP
