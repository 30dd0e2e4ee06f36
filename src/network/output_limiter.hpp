/*
 * output_limiter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef NETFLEET_NETWORK_OUTPUT_LIMITER_HPP
#define NETFLEET_NETWORK_OUTPUT_LIMITER_HPP

#include <string>
#include <string_view>

#include "config/settings.hpp"

namespace netfleet::network {

/**
 * @brief Bounds the size of device output kept in results and the cache.
 *
 * Output up to the summary threshold passes unchanged. Output above the hard
 * maximum is cut at the maximum; anything in between is cut at the
 * threshold. Both cuts append a note naming the original length.
 */
class OutputLimiter {
public:
    explicit OutputLimiter(config::OutputConfig config = {});

    [[nodiscard]] auto apply(std::string_view command,
                             std::string output) const -> std::string;

private:
    config::OutputConfig config_;
};

}  // namespace netfleet::network

#endif  // NETFLEET_NETWORK_OUTPUT_LIMITER_HPP
