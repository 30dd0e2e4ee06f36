/*
 * batch_result.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "batch_result.hpp"

#include <cmath>

namespace netfleet::batch {

auto BatchResult::rejected(const std::string& command, const std::string& key,
                           const std::string& message) -> BatchResult {
    BatchResult result;
    result.command = command;
    result.errors.emplace(
        key, DeviceFailure{message, network::ErrorClassifier::classify(message)});
    return result;
}

auto BatchResult::toJson() const -> nlohmann::json {
    nlohmann::json successful = nlohmann::json::array();
    for (const auto& [device, output] : results) {
        successful.push_back({{"device", device}, {"output", output}});
    }

    nlohmann::json failed = nlohmann::json::array();
    for (const auto& [device, failure] : errors) {
        failed.push_back(
            {{"device", device},
             {"error_message", failure.message},
             {"error_details",
              {{"type", failure.details.type},
               {"category", failure.details.category},
               {"suggestion", failure.details.suggestion}}}});
    }

    return {{"summary",
             {{"command", command},
              {"total_devices", totalDevices},
              {"successful_devices", successfulDevices},
              {"failed_devices", failedDevices},
              {"execution_time_seconds",
               std::round(executionTimeSeconds * 100.0) / 100.0},
              {"cache_stats", {{"hits", cacheHits}, {"misses", cacheMisses}}}}},
            {"successful_results", successful},
            {"failed_results", failed}};
}

}  // namespace netfleet::batch
