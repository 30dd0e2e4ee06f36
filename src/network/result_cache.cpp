/*
 * result_cache.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "result_cache.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace netfleet::network {

auto CacheStatistics::toJson() const -> nlohmann::json {
    return {{"hits", hits},
            {"misses", misses},
            {"inserts", inserts},
            {"rejected_stale", rejectedStale},
            {"expirations", expirations},
            {"invalidations", invalidations}};
}

ResultCache::ResultCache(config::CacheConfig config)
    : config_(std::move(config)) {}

auto ResultCache::makeKey(const std::string& device,
                          const std::string& command) -> std::string {
    std::string key;
    key.reserve(device.size() + command.size() + 1);
    key += device;
    key += '\x1f';
    key += command;
    return key;
}

auto ResultCache::isCacheable(std::string_view command) const -> bool {
    std::string lower(command);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return std::any_of(config_.cacheableKeywords.begin(),
                       config_.cacheableKeywords.end(),
                       [&](const std::string& keyword) {
                           return !keyword.empty() &&
                                  lower.find(keyword) != std::string::npos;
                       });
}

auto ResultCache::generation(const std::string& device) const -> uint64_t {
    std::lock_guard lock(mutex_);
    auto it = generations_.find(device);
    return it == generations_.end() ? 0 : it->second;
}

auto ResultCache::get(const std::string& device, const std::string& command)
    -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(makeKey(device, command));
    if (it == entries_.end()) {
        stats_.misses++;
        return std::nullopt;
    }

    auto age = std::chrono::steady_clock::now() - it->second.insertedAt;
    if (age >= config_.ttl()) {
        entries_.erase(it);
        stats_.expirations++;
        stats_.misses++;
        return std::nullopt;
    }

    stats_.hits++;
    return it->second.output;
}

auto ResultCache::put(const std::string& device, const std::string& command,
                      const std::string& output,
                      std::optional<uint64_t> generation) -> bool {
    if (config_.maxEntries == 0 || !isCacheable(command)) {
        return false;
    }

    std::lock_guard lock(mutex_);
    if (generation) {
        auto it = generations_.find(device);
        uint64_t current = it == generations_.end() ? 0 : it->second;
        if (current != *generation) {
            stats_.rejectedStale++;
            spdlog::debug("Dropping stale output of '{}' for {}", command,
                          device);
            return false;
        }
    }

    auto key = makeKey(device, command);
    if (!entries_.contains(key) && entries_.size() >= config_.maxEntries) {
        evictOldestLocked();
    }
    entries_[key] = Entry{device, output, std::chrono::steady_clock::now()};
    stats_.inserts++;
    return true;
}

void ResultCache::evictOldestLocked() {
    auto oldest = std::min_element(
        entries_.begin(), entries_.end(), [](const auto& a, const auto& b) {
            return a.second.insertedAt < b.second.insertedAt;
        });
    if (oldest != entries_.end()) {
        entries_.erase(oldest);
    }
}

void ResultCache::invalidate(const std::string& device) {
    std::lock_guard lock(mutex_);
    generations_[device]++;
    auto removed = std::erase_if(entries_, [&](const auto& item) {
        return item.second.device == device;
    });
    stats_.invalidations++;
    if (removed > 0) {
        spdlog::debug("Invalidated {} cached outputs for {}", removed, device);
    }
}

void ResultCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

auto ResultCache::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

auto ResultCache::statistics() const -> CacheStatistics {
    std::lock_guard lock(mutex_);
    return stats_;
}

}  // namespace netfleet::network
