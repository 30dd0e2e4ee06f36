/*
 * connection_pool.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Bounded per-device session pool implementation

**************************************************/

#include "connection_pool.hpp"

#include <chrono>
#include <condition_variable>
#include <format>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/exceptions.hpp"

namespace netfleet::network {

using Clock = std::chrono::steady_clock;

auto PoolStatistics::toJson() const -> nlohmann::json {
    return {{"acquires", acquires},
            {"created", created},
            {"reused", reused},
            {"evictions", evictions},
            {"probe_failures", probeFailures},
            {"open_failures", openFailures},
            {"active_handles", activeHandles},
            {"idle_handles", idleHandles}};
}

// ============================================================================
// ConnectionLease
// ============================================================================

ConnectionLease::ConnectionLease(ConnectionPool* pool, std::string device,
                                 std::shared_ptr<Session> session,
                                 uint64_t handleId, bool fresh)
    : pool_(pool),
      device_(std::move(device)),
      session_(std::move(session)),
      handleId_(handleId),
      fresh_(fresh) {}

ConnectionLease::~ConnectionLease() { release(); }

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)),
      device_(std::move(other.device_)),
      session_(std::move(other.session_)),
      handleId_(other.handleId_),
      broken_(other.broken_),
      fresh_(other.fresh_) {}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        device_ = std::move(other.device_);
        session_ = std::move(other.session_);
        handleId_ = other.handleId_;
        broken_ = other.broken_;
        fresh_ = other.fresh_;
    }
    return *this;
}

auto ConnectionLease::session() const -> Session& { return *session_; }

void ConnectionLease::release() noexcept {
    if (pool_ == nullptr) {
        return;
    }
    auto* pool = std::exchange(pool_, nullptr);
    pool->release(device_, handleId_, std::move(session_), broken_);
}

// ============================================================================
// ConnectionPool::Impl
// ============================================================================

class ConnectionPool::Impl {
public:
    struct Handle {
        uint64_t id{0};
        std::shared_ptr<Session> session;  ///< Null while opening
        bool inUse{false};
        Clock::time_point createdAt;
        Clock::time_point lastUsed;
        size_t usageCount{0};
    };

    Impl(std::shared_ptr<SessionFactory> factory,
         device::CredentialResolver resolver, config::PoolConfig config)
        : factory_(std::move(factory)),
          resolver_(std::move(resolver)),
          config_(config) {
        if (config_.maxConnections == 0) {
            spdlog::warn("Pool maxConnections of 0 raised to 1");
            config_.maxConnections = 1;
        }
    }

    std::shared_ptr<SessionFactory> factory_;
    device::CredentialResolver resolver_;
    config::PoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::unordered_map<std::string, Handle> handles_;
    EvictionListener listener_;
    PoolStatistics stats_;
    uint64_t nextId_{1};
    bool accepting_{true};

    /**
     * @brief Remove a handle; caller holds mutex_.
     *
     * Returns the session to close once the lock is dropped, or null when
     * the handle is leased and its holder will close it on release.
     */
    auto evictLocked(const std::string& address) -> std::shared_ptr<Session> {
        auto it = handles_.find(address);
        if (it == handles_.end()) {
            return nullptr;
        }
        std::shared_ptr<Session> toClose;
        if (!it->second.inUse) {
            toClose = std::move(it->second.session);
        }
        handles_.erase(it);
        stats_.evictions++;
        if (listener_) {
            listener_(address);
        }
        released_.notify_all();
        spdlog::warn("Evicted connection for {}", address);
        return toClose;
    }

    auto evictLruIdleLocked() -> std::shared_ptr<Session> {
        auto victim = handles_.end();
        for (auto it = handles_.begin(); it != handles_.end(); ++it) {
            if (it->second.inUse || !it->second.session) {
                continue;
            }
            if (victim == handles_.end() ||
                it->second.lastUsed < victim->second.lastUsed) {
                victim = it;
            }
        }
        if (victim == handles_.end()) {
            return nullptr;
        }
        spdlog::info("Pool full ({}), evicting least recently used {}",
                     config_.maxConnections, victim->first);
        // Copy: evictLocked erases the node that owns the key
        std::string address = victim->first;
        return evictLocked(address);
    }

    static void closeQuietly(const std::shared_ptr<Session>& session) {
        if (!session) {
            return;
        }
        try {
            session->close();
        } catch (const std::exception& e) {
            spdlog::warn("Error while closing session: {}", e.what());
        }
    }

    static auto probeQuietly(Session& session) -> bool {
        try {
            return session.isOpen() && session.probe();
        } catch (const std::exception& e) {
            spdlog::warn("Probe raised: {}", e.what());
            return false;
        }
    }
};

// ============================================================================
// ConnectionPool
// ============================================================================

ConnectionPool::ConnectionPool(std::shared_ptr<SessionFactory> factory,
                               device::CredentialResolver resolver,
                               config::PoolConfig config)
    : pimpl_(std::make_unique<Impl>(std::move(factory), std::move(resolver),
                                    config)) {
    if (!pimpl_->factory_) {
        THROW_INVALID_ARGUMENT("Connection pool requires a session factory");
    }
    spdlog::info("Connection pool created (max {} connections)",
                 pimpl_->config_.maxConnections);
}

ConnectionPool::~ConnectionPool() { shutdown(); }

auto ConnectionPool::acquire(const device::Device& device) -> ConnectionLease {
    const auto& address = device.address;
    // Resolve before taking a slot; a credential failure is terminal
    auto credentials = pimpl_->resolver_.resolve(device);
    const auto deadline = Clock::now() + pimpl_->config_.acquireTimeout();

    std::unique_lock lock(pimpl_->mutex_);
    pimpl_->stats_.acquires++;

    while (true) {
        if (!pimpl_->accepting_) {
            THROW_CONNECTION_ERROR("Connection pool is shut down");
        }

        auto it = pimpl_->handles_.find(address);
        if (it != pimpl_->handles_.end() && it->second.inUse) {
            if (pimpl_->released_.wait_until(lock, deadline) ==
                std::cv_status::timeout) {
                THROW_POOL_EXHAUSTED(std::format(
                    "Connection pool exhausted: session for {} still busy "
                    "after {} ms",
                    address, pimpl_->config_.acquireTimeoutMs));
            }
            continue;
        }

        if (it != pimpl_->handles_.end()) {
            auto& handle = it->second;
            handle.inUse = true;
            auto session = handle.session;
            auto id = handle.id;

            lock.unlock();
            bool alive = Impl::probeQuietly(*session);
            lock.lock();

            auto current = pimpl_->handles_.find(address);
            bool stillPooled = current != pimpl_->handles_.end() &&
                               current->second.id == id;
            if (alive) {
                if (stillPooled) {
                    current->second.lastUsed = Clock::now();
                    current->second.usageCount++;
                }
                pimpl_->stats_.reused++;
                spdlog::debug("Reusing connection for {}", address);
                return ConnectionLease(this, address, std::move(session), id,
                                       false);
            }

            pimpl_->stats_.probeFailures++;
            spdlog::warn("Liveness probe failed for {}, reconnecting",
                         address);
            if (stillPooled) {
                current->second.inUse = false;
                pimpl_->evictLocked(address);
            }
            lock.unlock();
            Impl::closeQuietly(session);
            lock.lock();
            continue;
        }

        if (pimpl_->handles_.size() >= pimpl_->config_.maxConnections) {
            auto victim = pimpl_->evictLruIdleLocked();
            if (victim) {
                lock.unlock();
                Impl::closeQuietly(victim);
                lock.lock();
                continue;
            }
            if (pimpl_->released_.wait_until(lock, deadline) ==
                std::cv_status::timeout) {
                THROW_POOL_EXHAUSTED(std::format(
                    "Connection pool exhausted: all {} sessions busy, no "
                    "free slot for {} after {} ms",
                    pimpl_->config_.maxConnections, address,
                    pimpl_->config_.acquireTimeoutMs));
            }
            continue;
        }
        break;
    }

    // Reserve the slot so concurrent acquires for this device queue
    const auto id = pimpl_->nextId_++;
    auto now = Clock::now();
    pimpl_->handles_[address] = Impl::Handle{id, nullptr, true, now, now, 0};
    lock.unlock();

    std::expected<std::unique_ptr<Session>, SessionError> opened;
    try {
        opened = pimpl_->factory_->open(device, credentials,
                                        pimpl_->config_.connectTimeout());
    } catch (const std::exception& e) {
        opened = std::unexpected(
            SessionError{SessionErrorKind::ProtocolError,
                         std::format("Session open for {} raised: {}",
                                     address, e.what())});
    }

    lock.lock();
    auto it = pimpl_->handles_.find(address);
    bool stillReserved =
        it != pimpl_->handles_.end() && it->second.id == id;

    if (!opened) {
        if (stillReserved) {
            pimpl_->handles_.erase(it);
        }
        pimpl_->stats_.openFailures++;
        pimpl_->released_.notify_all();
        lock.unlock();

        const auto& error = opened.error();
        spdlog::warn("Failed to open session for {}: {}", address,
                     error.message);
        if (error.isTransport()) {
            THROW_CONNECTION_ERROR(error.message);
        }
        THROW_AUTHENTICATION_ERROR(error.message);
    }

    std::shared_ptr<Session> session(std::move(*opened));
    if (stillReserved) {
        it->second.session = session;
        it->second.usageCount = 1;
    }
    pimpl_->stats_.created++;
    spdlog::info("Opened new connection for {} ({} pooled)", address,
                 pimpl_->handles_.size());
    return ConnectionLease(this, address, std::move(session), id, true);
}

void ConnectionPool::release(const std::string& address, uint64_t handleId,
                             std::shared_ptr<Session> session,
                             bool broken) noexcept {
    std::shared_ptr<Session> toClose;
    {
        std::lock_guard lock(pimpl_->mutex_);
        auto it = pimpl_->handles_.find(address);
        if (it == pimpl_->handles_.end() || it->second.id != handleId) {
            // Evicted while leased
            toClose = std::move(session);
        } else if (broken || !pimpl_->accepting_) {
            it->second.inUse = false;
            pimpl_->evictLocked(address);
            toClose = std::move(session);
        } else {
            it->second.inUse = false;
            it->second.lastUsed = Clock::now();
            pimpl_->released_.notify_all();
        }
    }
    Impl::closeQuietly(toClose);
}

void ConnectionPool::evict(const std::string& address) {
    std::shared_ptr<Session> toClose;
    {
        std::lock_guard lock(pimpl_->mutex_);
        toClose = pimpl_->evictLocked(address);
    }
    Impl::closeQuietly(toClose);
}

auto ConnectionPool::healthCheck(const std::string& address) -> bool {
    std::shared_ptr<Session> session;
    uint64_t id = 0;
    {
        std::lock_guard lock(pimpl_->mutex_);
        auto it = pimpl_->handles_.find(address);
        if (it == pimpl_->handles_.end()) {
            return false;
        }
        if (it->second.inUse) {
            return true;
        }
        it->second.inUse = true;
        session = it->second.session;
        id = it->second.id;
    }

    bool alive = Impl::probeQuietly(*session);

    std::shared_ptr<Session> toClose;
    {
        std::lock_guard lock(pimpl_->mutex_);
        auto it = pimpl_->handles_.find(address);
        bool stillPooled = it != pimpl_->handles_.end() && it->second.id == id;
        if (!stillPooled) {
            toClose = session;
        } else if (alive) {
            it->second.inUse = false;
            it->second.lastUsed = Clock::now();
            pimpl_->released_.notify_all();
        } else {
            pimpl_->stats_.probeFailures++;
            it->second.inUse = false;
            toClose = pimpl_->evictLocked(address);
        }
    }
    Impl::closeQuietly(toClose);

    if (!alive) {
        spdlog::warn("Health check failed for {}", address);
    }
    return alive;
}

auto ConnectionPool::cleanupExpired() -> size_t {
    std::vector<std::shared_ptr<Session>> toClose;
    {
        std::lock_guard lock(pimpl_->mutex_);
        auto cutoff = Clock::now() - pimpl_->config_.idleTimeout();
        std::vector<std::string> expired;
        for (const auto& [address, handle] : pimpl_->handles_) {
            if (!handle.inUse && handle.session && handle.lastUsed < cutoff) {
                expired.push_back(address);
            }
        }
        for (const auto& address : expired) {
            toClose.push_back(pimpl_->evictLocked(address));
        }
    }
    for (const auto& session : toClose) {
        Impl::closeQuietly(session);
    }
    if (!toClose.empty()) {
        spdlog::info("Cleaned up {} expired connections", toClose.size());
    }
    return toClose.size();
}

auto ConnectionPool::contains(const std::string& address) const -> bool {
    std::lock_guard lock(pimpl_->mutex_);
    return pimpl_->handles_.contains(address);
}

auto ConnectionPool::size() const -> size_t {
    std::lock_guard lock(pimpl_->mutex_);
    return pimpl_->handles_.size();
}

void ConnectionPool::setEvictionListener(EvictionListener listener) {
    std::lock_guard lock(pimpl_->mutex_);
    pimpl_->listener_ = std::move(listener);
}

auto ConnectionPool::statistics() const -> PoolStatistics {
    std::lock_guard lock(pimpl_->mutex_);
    auto stats = pimpl_->stats_;
    stats.activeHandles = 0;
    stats.idleHandles = 0;
    for (const auto& [address, handle] : pimpl_->handles_) {
        if (handle.inUse) {
            stats.activeHandles++;
        } else {
            stats.idleHandles++;
        }
    }
    return stats;
}

auto ConnectionPool::config() const -> const config::PoolConfig& {
    return pimpl_->config_;
}

void ConnectionPool::shutdown() {
    std::vector<std::shared_ptr<Session>> toClose;
    {
        std::lock_guard lock(pimpl_->mutex_);
        if (!pimpl_->accepting_) {
            return;
        }
        pimpl_->accepting_ = false;
        std::vector<std::string> addresses;
        for (const auto& [address, handle] : pimpl_->handles_) {
            addresses.push_back(address);
        }
        for (const auto& address : addresses) {
            toClose.push_back(pimpl_->evictLocked(address));
        }
        pimpl_->released_.notify_all();
    }
    for (const auto& session : toClose) {
        Impl::closeQuietly(session);
    }
    spdlog::info("Connection pool shut down, closed {} sessions",
                 toClose.size());
}

auto ConnectionPool::isAccepting() const -> bool {
    std::lock_guard lock(pimpl_->mutex_);
    return pimpl_->accepting_;
}

}  // namespace netfleet::network
