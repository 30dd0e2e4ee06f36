/*
 * batch_result.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Aggregated outcome of one batch invocation

**************************************************/

#ifndef NETFLEET_BATCH_BATCH_RESULT_HPP
#define NETFLEET_BATCH_BATCH_RESULT_HPP

#include <map>
#include <string>

#include "atom/type/json.hpp"

#include "network/error_classifier.hpp"

namespace netfleet::batch {

/**
 * @brief Failure recorded for one device or for the batch as a whole
 */
struct DeviceFailure {
    std::string message;
    network::ClassifiedError details;
};

/**
 * @brief Result of running one command across a device set.
 *
 * Every targeted device appears in exactly one of results or errors. A
 * batch rejected before dispatch has totalDevices == 0 and a single errors
 * entry keyed by the reason ("security", "filter", "group", "pool").
 */
struct BatchResult {
    std::string command;
    size_t totalDevices{0};
    size_t successfulDevices{0};
    size_t failedDevices{0};
    double executionTimeSeconds{0.0};
    size_t cacheHits{0};
    size_t cacheMisses{0};
    std::map<std::string, std::string> results;   ///< device -> output
    std::map<std::string, DeviceFailure> errors;  ///< device -> failure

    /**
     * @brief Zero-device result carrying one classified batch-level error
     */
    [[nodiscard]] static auto rejected(const std::string& command,
                                       const std::string& key,
                                       const std::string& message)
        -> BatchResult;

    [[nodiscard]] auto isRejected() const noexcept -> bool {
        return totalDevices == 0 && !errors.empty();
    }

    /**
     * @brief Machine-readable projection
     *
     * {summary:{command,total_devices,successful_devices,failed_devices,
     *  execution_time_seconds,cache_stats:{hits,misses}},
     *  successful_results:[{device,output}],
     *  failed_results:[{device,error_message,
     *                   error_details:{type,category,suggestion}}]}
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace netfleet::batch

#endif  // NETFLEET_BATCH_BATCH_RESULT_HPP
