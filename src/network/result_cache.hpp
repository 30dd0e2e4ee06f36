/*
 * result_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Short-lived cache of idempotent command output

**************************************************/

#ifndef NETFLEET_NETWORK_RESULT_CACHE_HPP
#define NETFLEET_NETWORK_RESULT_CACHE_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "atom/type/json.hpp"

#include "config/settings.hpp"

namespace netfleet::network {

/**
 * @brief Cache statistics
 */
struct CacheStatistics {
    size_t hits{0};
    size_t misses{0};
    size_t inserts{0};
    size_t rejectedStale{0};  ///< Puts dropped after an invalidation
    size_t expirations{0};
    size_t invalidations{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Output cache keyed by (device, command).
 *
 * Only commands containing one of the cacheable keywords are stored.
 * Entries expire after the TTL and are dropped for a device whenever its
 * connection is evicted. Each device carries a generation counter bumped by
 * invalidate(); a put tagged with an older generation is rejected so output
 * read from an evicted connection never re-enters the cache.
 */
class ResultCache {
public:
    explicit ResultCache(config::CacheConfig config = {});

    [[nodiscard]] auto isCacheable(std::string_view command) const -> bool;

    /**
     * @brief Current generation of a device's entries
     */
    [[nodiscard]] auto generation(const std::string& device) const
        -> uint64_t;

    auto get(const std::string& device, const std::string& command)
        -> std::optional<std::string>;

    /**
     * @brief Store output for a cacheable command.
     *
     * @param generation Value of generation() observed before the output was
     *                   fetched; nullopt skips the staleness check
     * @return true if the entry was stored
     */
    auto put(const std::string& device, const std::string& command,
             const std::string& output,
             std::optional<uint64_t> generation = std::nullopt) -> bool;

    /**
     * @brief Drop all entries for a device and bump its generation
     */
    void invalidate(const std::string& device);

    void clear();

    [[nodiscard]] auto size() const -> size_t;

    [[nodiscard]] auto statistics() const -> CacheStatistics;

private:
    struct Entry {
        std::string device;
        std::string output;
        std::chrono::steady_clock::time_point insertedAt;
    };

    static auto makeKey(const std::string& device, const std::string& command)
        -> std::string;
    void evictOldestLocked();

    config::CacheConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, uint64_t> generations_;
    CacheStatistics stats_;
};

}  // namespace netfleet::network

#endif  // NETFLEET_NETWORK_RESULT_CACHE_HPP
