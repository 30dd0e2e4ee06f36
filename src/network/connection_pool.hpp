/*
 * connection_pool.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Bounded per-device session pool

**************************************************/

#ifndef NETFLEET_NETWORK_CONNECTION_POOL_HPP
#define NETFLEET_NETWORK_CONNECTION_POOL_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "atom/type/json.hpp"

#include "config/settings.hpp"
#include "device/credentials.hpp"
#include "device/device.hpp"
#include "session.hpp"

namespace netfleet::network {

/**
 * @brief Pool statistics
 */
struct PoolStatistics {
    size_t acquires{0};
    size_t created{0};
    size_t reused{0};
    size_t evictions{0};
    size_t probeFailures{0};
    size_t openFailures{0};
    size_t activeHandles{0};
    size_t idleHandles{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

class ConnectionPool;

/**
 * @brief Exclusive use of one device session.
 *
 * Returns the session to the pool on destruction. A lease marked broken
 * evicts its handle instead.
 */
class ConnectionLease {
public:
    ConnectionLease() = default;
    ~ConnectionLease();

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;
    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;

    [[nodiscard]] auto session() const -> Session&;

    [[nodiscard]] auto device() const noexcept -> const std::string& {
        return device_;
    }

    /**
     * @brief True when acquire() opened this session rather than reusing one
     */
    [[nodiscard]] auto isFresh() const noexcept -> bool { return fresh_; }

    /**
     * @brief Evict the handle when the lease is released
     */
    void markBroken() noexcept { broken_ = true; }

    void release() noexcept;

    explicit operator bool() const noexcept { return pool_ != nullptr; }

private:
    friend class ConnectionPool;

    ConnectionLease(ConnectionPool* pool, std::string device,
                    std::shared_ptr<Session> session, uint64_t handleId,
                    bool fresh);

    ConnectionPool* pool_{nullptr};
    std::string device_;
    std::shared_ptr<Session> session_;
    uint64_t handleId_{0};
    bool broken_{false};
    bool fresh_{false};
};

/**
 * @brief Pool of device sessions, at most one pooled handle per device.
 *
 * The total number of pooled handles is bounded by maxConnections; when full,
 * the least recently used idle handle is evicted to make room. A reused
 * handle is probed before it is handed out. Network I/O never runs under the
 * pool lock, but the eviction listener does, so invalidation of dependent
 * state is atomic with the eviction itself.
 */
class ConnectionPool {
public:
    using EvictionListener = std::function<void(const std::string& device)>;

    ConnectionPool(std::shared_ptr<SessionFactory> factory,
                   device::CredentialResolver resolver,
                   config::PoolConfig config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Get exclusive use of a session for a device.
     *
     * Waits while the device's handle is leased elsewhere or the pool is full
     * of busy handles, up to the acquire timeout.
     *
     * @throws CredentialException if credentials cannot be resolved
     * @throws ConnectionException if the session cannot be opened
     * @throws AuthenticationException if the device rejects the login
     * @throws PoolExhaustedException if no slot frees up in time
     */
    [[nodiscard]] auto acquire(const device::Device& device)
        -> ConnectionLease;

    /**
     * @brief Drop a device's handle; a no-op if none is pooled
     */
    void evict(const std::string& address);

    /**
     * @brief Probe a device's pooled handle, evicting it on failure.
     *
     * @return false if no handle is pooled or the probe fails; true if the
     * probe passes or the handle is currently leased
     */
    auto healthCheck(const std::string& address) -> bool;

    /**
     * @brief Evict idle handles unused for longer than the idle timeout
     * @return Number of evicted handles
     */
    auto cleanupExpired() -> size_t;

    [[nodiscard]] auto contains(const std::string& address) const -> bool;

    [[nodiscard]] auto size() const -> size_t;

    void setEvictionListener(EvictionListener listener);

    [[nodiscard]] auto statistics() const -> PoolStatistics;

    [[nodiscard]] auto config() const -> const config::PoolConfig&;

    /**
     * @brief Close idle handles and refuse further acquires
     */
    void shutdown();

    [[nodiscard]] auto isAccepting() const -> bool;

private:
    friend class ConnectionLease;

    void release(const std::string& address, uint64_t handleId,
                 std::shared_ptr<Session> session, bool broken) noexcept;

    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

}  // namespace netfleet::network

#endif  // NETFLEET_NETWORK_CONNECTION_POOL_HPP
