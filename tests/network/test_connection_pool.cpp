/*
 * test_connection_pool.cpp - Tests for the device session pool
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "common/exceptions.hpp"
#include "fakes/fake_session.hpp"
#include "network/connection_pool.hpp"

using namespace netfleet;
using namespace netfleet::network;
using namespace std::chrono_literals;
using netfleet::testing::FakeScript;
using netfleet::testing::FakeSessionFactory;

namespace {

auto makeDevice(const std::string& address) -> device::Device {
    device::Device device;
    device.address = address;
    device.name = "sw-" + address;
    device.username = "admin";
    device.password = "secret";
    return device;
}

}  // namespace

class ConnectionPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<FakeSessionFactory>();
        config_.maxConnections = 2;
        config_.acquireTimeoutMs = 200;
    }

    auto makePool() -> std::unique_ptr<ConnectionPool> {
        return std::make_unique<ConnectionPool>(
            factory_, device::CredentialResolver{}, config_);
    }

    auto script() -> FakeScript& { return factory_->script(); }

    std::shared_ptr<FakeSessionFactory> factory_;
    config::PoolConfig config_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(ConnectionPoolTest, RequiresFactory) {
    EXPECT_THROW(ConnectionPool(nullptr, device::CredentialResolver{}, config_),
                 atom::error::Exception);
}

// ============================================================================
// Acquire / Release
// ============================================================================

TEST_F(ConnectionPoolTest, AcquireOpensSession) {
    auto pool = makePool();
    {
        auto lease = pool->acquire(makeDevice("10.0.0.1"));
        ASSERT_TRUE(lease);
        EXPECT_EQ(lease.device(), "10.0.0.1");
        auto output = lease.session().execute("show clock", 1s);
        ASSERT_TRUE(output.has_value());
    }
    EXPECT_TRUE(pool->contains("10.0.0.1"));
    EXPECT_EQ(pool->size(), 1u);
    EXPECT_EQ(script().opens("10.0.0.1"), 1);
}

TEST_F(ConnectionPoolTest, ReleasedSessionIsReused) {
    auto pool = makePool();
    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }
    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }

    EXPECT_EQ(script().opens("10.0.0.1"), 1);
    auto stats = pool->statistics();
    EXPECT_EQ(stats.created, 1u);
    EXPECT_EQ(stats.reused, 1u);
    EXPECT_EQ(stats.acquires, 2u);
}

TEST_F(ConnectionPoolTest, FailedProbeReconnects) {
    auto pool = makePool();
    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }

    script().setProbeResult("10.0.0.1", false);
    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }

    EXPECT_EQ(script().opens("10.0.0.1"), 2);
    EXPECT_EQ(pool->statistics().probeFailures, 1u);
}

TEST_F(ConnectionPoolTest, LeaseReportsFreshSession) {
    auto pool = makePool();
    {
        auto lease = pool->acquire(makeDevice("10.0.0.1"));
        EXPECT_TRUE(lease.isFresh());
    }
    {
        auto lease = pool->acquire(makeDevice("10.0.0.1"));
        EXPECT_FALSE(lease.isFresh());
    }

    script().setProbeResult("10.0.0.1", false);
    auto lease = pool->acquire(makeDevice("10.0.0.1"));
    EXPECT_TRUE(lease.isFresh());

    auto moved = std::move(lease);
    EXPECT_TRUE(moved.isFresh());
}

TEST_F(ConnectionPoolTest, ZeroCapacityRaisedToOne) {
    config_.maxConnections = 0;
    auto pool = makePool();
    EXPECT_EQ(pool->config().maxConnections, 1u);

    auto start = std::chrono::steady_clock::now();
    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 150ms);
    EXPECT_EQ(pool->size(), 1u);
}

TEST_F(ConnectionPoolTest, BrokenLeaseEvictsHandle) {
    auto pool = makePool();
    {
        auto lease = pool->acquire(makeDevice("10.0.0.1"));
        lease.markBroken();
    }
    EXPECT_FALSE(pool->contains("10.0.0.1"));
    EXPECT_EQ(script().closes(), 1);
}

TEST_F(ConnectionPoolTest, LeaseIsMovable) {
    auto pool = makePool();
    auto first = pool->acquire(makeDevice("10.0.0.1"));
    ConnectionLease second = std::move(first);
    EXPECT_FALSE(first);
    EXPECT_TRUE(second);
    second.release();
    EXPECT_FALSE(second);
    EXPECT_TRUE(pool->contains("10.0.0.1"));
}

// ============================================================================
// Capacity
// ============================================================================

TEST_F(ConnectionPoolTest, FullPoolEvictsLeastRecentlyUsed) {
    auto pool = makePool();
    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }
    std::this_thread::sleep_for(2ms);
    { auto lease = pool->acquire(makeDevice("10.0.0.2")); }
    std::this_thread::sleep_for(2ms);
    { auto lease = pool->acquire(makeDevice("10.0.0.3")); }

    EXPECT_EQ(pool->size(), 2u);
    EXPECT_FALSE(pool->contains("10.0.0.1"));
    EXPECT_TRUE(pool->contains("10.0.0.2"));
    EXPECT_TRUE(pool->contains("10.0.0.3"));
}

TEST_F(ConnectionPoolTest, ExhaustedWhenAllHandlesBusy) {
    auto pool = makePool();
    auto a = pool->acquire(makeDevice("10.0.0.1"));
    auto b = pool->acquire(makeDevice("10.0.0.2"));

    EXPECT_THROW((void)pool->acquire(makeDevice("10.0.0.3")),
                 PoolExhaustedException);
}

TEST_F(ConnectionPoolTest, WaiterProceedsWhenSlotFrees) {
    config_.acquireTimeoutMs = 2000;
    auto pool = makePool();
    auto a = pool->acquire(makeDevice("10.0.0.1"));
    auto b = pool->acquire(makeDevice("10.0.0.2"));

    auto waiter = std::async(std::launch::async, [&] {
        auto lease = pool->acquire(makeDevice("10.0.0.3"));
        return lease.device();
    });
    std::this_thread::sleep_for(50ms);
    a.release();

    EXPECT_EQ(waiter.get(), "10.0.0.3");
}

TEST_F(ConnectionPoolTest, SecondAcquireForSameDeviceQueues) {
    config_.acquireTimeoutMs = 2000;
    auto pool = makePool();
    auto first = pool->acquire(makeDevice("10.0.0.1"));

    std::atomic<bool> acquired{false};
    auto waiter = std::async(std::launch::async, [&] {
        auto lease = pool->acquire(makeDevice("10.0.0.1"));
        acquired = true;
    });
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());

    first.release();
    waiter.get();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(script().opens("10.0.0.1"), 1);
}

// ============================================================================
// Open Failures
// ============================================================================

TEST_F(ConnectionPoolTest, TransportOpenFailureThrowsConnectionError) {
    script().failOpen("10.0.0.1",
                      {SessionErrorKind::ConnectionRefused,
                       "Connection refused by 10.0.0.1:23"});
    auto pool = makePool();

    try {
        (void)pool->acquire(makeDevice("10.0.0.1"));
        FAIL() << "expected ConnectionException";
    } catch (const ConnectionException& e) {
        EXPECT_EQ(e.reason(), "Connection refused by 10.0.0.1:23");
    }
    EXPECT_FALSE(pool->contains("10.0.0.1"));
    EXPECT_EQ(pool->statistics().openFailures, 1u);
}

TEST_F(ConnectionPoolTest, LoginFailureThrowsAuthenticationError) {
    script().failOpen("10.0.0.1", {SessionErrorKind::AuthenticationFailed,
                                   "Authentication failed for 10.0.0.1"});
    auto pool = makePool();
    EXPECT_THROW((void)pool->acquire(makeDevice("10.0.0.1")),
                 AuthenticationException);
}

TEST_F(ConnectionPoolTest, MissingCredentialsFailBeforeOpening) {
    auto pool = makePool();
    device::Device device;
    device.address = "10.0.0.9";
    unsetenv("DEVICE_USERNAME");
    unsetenv("DEVICE_PASSWORD");

    EXPECT_THROW((void)pool->acquire(device), CredentialException);
    EXPECT_EQ(script().totalOpens(), 0);
}

// ============================================================================
// Eviction
// ============================================================================

TEST_F(ConnectionPoolTest, EvictNotifiesListener) {
    auto pool = makePool();
    std::vector<std::string> evicted;
    pool->setEvictionListener(
        [&](const std::string& device) { evicted.push_back(device); });

    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }
    pool->evict("10.0.0.1");

    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "10.0.0.1");
}

TEST_F(ConnectionPoolTest, EvictIsIdempotent) {
    auto pool = makePool();
    int calls = 0;
    pool->setEvictionListener([&](const std::string&) { ++calls; });

    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }
    pool->evict("10.0.0.1");
    pool->evict("10.0.0.1");
    pool->evict("10.0.0.2");

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(pool->statistics().evictions, 1u);
}

TEST_F(ConnectionPoolTest, EvictWhileLeasedClosesOnRelease) {
    auto pool = makePool();
    auto lease = pool->acquire(makeDevice("10.0.0.1"));
    pool->evict("10.0.0.1");
    EXPECT_FALSE(pool->contains("10.0.0.1"));
    EXPECT_EQ(script().closes(), 0);

    lease.release();
    EXPECT_EQ(script().closes(), 1);
    EXPECT_FALSE(pool->contains("10.0.0.1"));
}

// ============================================================================
// Health
// ============================================================================

TEST_F(ConnectionPoolTest, HealthCheckOfUnknownDeviceIsFalse) {
    auto pool = makePool();
    EXPECT_FALSE(pool->healthCheck("10.0.0.1"));
}

TEST_F(ConnectionPoolTest, HealthCheckEvictsDeadHandle) {
    auto pool = makePool();
    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }
    EXPECT_TRUE(pool->healthCheck("10.0.0.1"));

    script().setProbeResult("10.0.0.1", false);
    EXPECT_FALSE(pool->healthCheck("10.0.0.1"));
    EXPECT_FALSE(pool->contains("10.0.0.1"));
}

TEST_F(ConnectionPoolTest, CleanupExpiredDropsIdleHandles) {
    config_.idleTimeoutSeconds = 0;
    auto pool = makePool();
    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }
    std::this_thread::sleep_for(5ms);

    EXPECT_EQ(pool->cleanupExpired(), 1u);
    EXPECT_EQ(pool->size(), 0u);
}

TEST_F(ConnectionPoolTest, ShutdownRefusesAcquire) {
    auto pool = makePool();
    { auto lease = pool->acquire(makeDevice("10.0.0.1")); }
    pool->shutdown();

    EXPECT_FALSE(pool->isAccepting());
    EXPECT_EQ(pool->size(), 0u);
    EXPECT_THROW((void)pool->acquire(makeDevice("10.0.0.1")),
                 ConnectionException);
}
