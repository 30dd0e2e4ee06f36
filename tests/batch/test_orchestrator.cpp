/*
 * test_orchestrator.cpp - Tests for the batch orchestrator
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "batch/orchestrator.hpp"
#include "common/exceptions.hpp"
#include "fakes/fake_fleet.hpp"

using namespace netfleet;
using namespace netfleet::batch;
using namespace netfleet::testing;

class BatchOrchestratorTest : public ::testing::Test {
protected:
    FakeFleet fleet_;

    auto orchestrator() -> BatchOrchestrator& { return *fleet_.orchestrator; }
    auto script() -> FakeScript& { return fleet_.script(); }
};

// ============================================================================
// Result Invariants
// ============================================================================

TEST_F(BatchOrchestratorTest, EveryTargetAccountedExactlyOnce) {
    script().failExecute(kDeviceB, rejectedError());

    auto result = orchestrator().runBatch("show ip route");

    EXPECT_EQ(result.totalDevices, 3u);
    EXPECT_EQ(result.successfulDevices + result.failedDevices,
              result.totalDevices);

    std::set<std::string> seen;
    for (const auto& [device, output] : result.results) {
        EXPECT_TRUE(seen.insert(device).second);
    }
    for (const auto& [device, failure] : result.errors) {
        EXPECT_TRUE(seen.insert(device).second);
    }
    EXPECT_EQ(seen, (std::set<std::string>{kDeviceA, kDeviceB, kDeviceC}));
    EXPECT_TRUE(result.errors.contains(kDeviceB));
}

TEST_F(BatchOrchestratorTest, OutputComesFromSession) {
    script().setReply(kDeviceA, "show clock", "*10:00:00.000 UTC Mon Mar 3");

    auto result = orchestrator().runBatch(
        "show clock", std::vector<std::string>{kDeviceA});

    ASSERT_EQ(result.successfulDevices, 1u);
    EXPECT_EQ(result.results.at(kDeviceA), "*10:00:00.000 UTC Mon Mar 3");
}

TEST_F(BatchOrchestratorTest, DuplicateTargetsRunOnce) {
    auto result = orchestrator().runBatch(
        "show clock",
        std::vector<std::string>{kDeviceA, " 10.0.0.1 ", kDeviceA});

    EXPECT_EQ(result.totalDevices, 1u);
    EXPECT_EQ(script().executes(kDeviceA), 1);
}

TEST_F(BatchOrchestratorTest, UnknownTargetsAreDropped) {
    auto result = orchestrator().runBatch(
        "show clock", std::vector<std::string>{kDeviceA, "192.168.99.99"});

    EXPECT_EQ(result.totalDevices, 1u);
    EXPECT_TRUE(result.results.contains(kDeviceA));
}

// ============================================================================
// Scope Restriction
// ============================================================================

TEST_F(BatchOrchestratorTest, ScopeOnlyNarrowsTargets) {
    auto scope = ExecutionScope::restrictedTo({kDeviceB, kDeviceC});

    auto result = orchestrator().runBatch(
        "show clock", std::vector<std::string>{kDeviceA, kDeviceB}, scope);

    EXPECT_EQ(result.totalDevices, 1u);
    ASSERT_EQ(result.results.size(), 1u);
    EXPECT_TRUE(result.results.contains(kDeviceB));
    EXPECT_EQ(script().totalExecutes(), 1);
}

TEST_F(BatchOrchestratorTest, ScopeAppliesToFullInventory) {
    auto scope = ExecutionScope::restrictedTo({kDeviceC});
    auto result = orchestrator().runBatch("show clock", std::nullopt, scope);

    EXPECT_EQ(result.totalDevices, 1u);
    EXPECT_TRUE(result.results.contains(kDeviceC));
}

TEST_F(BatchOrchestratorTest, DisjointScopeYieldsFilterError) {
    auto scope = ExecutionScope::restrictedTo({kDeviceC});
    auto result = orchestrator().runBatch(
        "show clock", std::vector<std::string>{kDeviceA}, scope);

    EXPECT_EQ(result.totalDevices, 0u);
    ASSERT_TRUE(result.errors.contains("filter"));
    EXPECT_EQ(result.errors.at("filter").details.category, "filter");
}

TEST(BatchOrchestratorEmptyInventoryTest, EmptyInventoryYieldsFilterError) {
    FakeFleet fleet(nlohmann::json{{"devices", nlohmann::json::array()}},
                    nlohmann::json());
    auto scope = ExecutionScope::restrictedTo({kDeviceA});

    BatchResult result;
    EXPECT_NO_THROW(result = fleet.orchestrator->runBatch(
                        "show version", std::nullopt, scope));
    EXPECT_EQ(result.totalDevices, 0u);
    EXPECT_TRUE(result.isRejected());
    ASSERT_TRUE(result.errors.contains("filter"));
    EXPECT_EQ(result.errors.at("filter").details.type, "no_matching_devices");
}

TEST_F(BatchOrchestratorTest, EmptyExplicitListYieldsFilterError) {
    auto result =
        orchestrator().runBatch("show clock", std::vector<std::string>{});
    EXPECT_EQ(result.totalDevices, 0u);
    EXPECT_TRUE(result.errors.contains("filter"));
}

// ============================================================================
// Security
// ============================================================================

TEST_F(BatchOrchestratorTest, RejectedCommandNeverTouchesPool) {
    auto result = orchestrator().runBatch("configure terminal");

    EXPECT_EQ(result.totalDevices, 0u);
    ASSERT_TRUE(result.errors.contains("security"));
    EXPECT_EQ(result.errors.at("security").details.type, "security_violation");
    EXPECT_EQ(fleet_.pool->statistics().acquires, 0u);
    EXPECT_EQ(script().totalOpens(), 0);
}

// ============================================================================
// Retry
// ============================================================================

TEST_F(BatchOrchestratorTest, TransportFailureRetriedOnFreshSession) {
    script().failExecute(kDeviceA,
                         timeoutError("Command 'show version' on 10.0.0.1 "
                                      "timed out after 2000 ms"));

    auto result = orchestrator().runBatch(
        "show version", std::vector<std::string>{kDeviceA});

    EXPECT_EQ(result.successfulDevices, 1u);
    EXPECT_TRUE(result.results.contains(kDeviceA));
    EXPECT_EQ(result.cacheMisses, 1u);
    EXPECT_EQ(result.cacheHits, 0u);
    EXPECT_EQ(script().opens(kDeviceA), 2);
    EXPECT_EQ(script().executes(kDeviceA), 2);
}

TEST_F(BatchOrchestratorTest, SecondTransportFailureIsFinal) {
    script().failExecute(kDeviceA, timeoutError(), 2);

    auto result = orchestrator().runBatch(
        "show clock", std::vector<std::string>{kDeviceA});

    EXPECT_EQ(result.failedDevices, 1u);
    EXPECT_EQ(result.errors.at(kDeviceA).details.type, "connection_timeout");
    EXPECT_EQ(script().executes(kDeviceA), 2);
}

TEST_F(BatchOrchestratorTest, OpenFailureIsRetriedOnce) {
    script().failOpen(kDeviceA, {network::SessionErrorKind::ConnectionRefused,
                                 "Connection refused by 10.0.0.1:23"});

    auto result = orchestrator().runBatch(
        "show clock", std::vector<std::string>{kDeviceA});

    EXPECT_EQ(result.successfulDevices, 1u);
    EXPECT_EQ(script().opens(kDeviceA), 2);
}

TEST_F(BatchOrchestratorTest, CommandRejectionIsNotRetried) {
    script().failExecute(kDeviceA, rejectedError());

    auto result = orchestrator().runBatch(
        "show bogus", std::vector<std::string>{kDeviceA});

    EXPECT_EQ(result.failedDevices, 1u);
    EXPECT_EQ(result.errors.at(kDeviceA).details.type, "invalid_command");
    EXPECT_EQ(script().executes(kDeviceA), 1);
    EXPECT_TRUE(fleet_.pool->contains(kDeviceA));
}

TEST_F(BatchOrchestratorTest, LoginFailureIsNotRetried) {
    script().failOpen(kDeviceA, {network::SessionErrorKind::AuthenticationFailed,
                                 "Authentication failed for 10.0.0.1"});

    auto result = orchestrator().runBatch(
        "show clock", std::vector<std::string>{kDeviceA});

    EXPECT_EQ(result.errors.at(kDeviceA).details.type,
              "authentication_failed");
    EXPECT_EQ(script().opens(kDeviceA), 1);
}

TEST(BatchOrchestratorCredentialTest, MissingCredentialsFailDevice) {
    unsetenv("DEVICE_USERNAME");
    unsetenv("DEVICE_PASSWORD");
    FakeFleet fleet(
        nlohmann::json{{"devices", nlohmann::json::array(
                                       {nlohmann::json{{"ip", "10.9.9.9"}}})}},
        nlohmann::json());

    auto result = fleet.orchestrator->runBatch("show clock");

    ASSERT_EQ(result.failedDevices, 1u);
    const auto& failure = result.errors.at("10.9.9.9");
    EXPECT_EQ(failure.message.rfind(
                  "Authentication credentials unavailable for 10.9.9.9", 0),
              0u);
    EXPECT_EQ(failure.details.type, "authentication_failed");
    EXPECT_EQ(fleet.script().totalOpens(), 0);
}

// ============================================================================
// Cache
// ============================================================================

TEST_F(BatchOrchestratorTest, RepeatedCacheableCommandHitsCache) {
    std::vector<std::string> targets{kDeviceA};
    auto first = orchestrator().runBatch("show version", targets);
    auto second = orchestrator().runBatch("show version", targets);

    EXPECT_EQ(first.cacheMisses, 1u);
    EXPECT_EQ(second.cacheHits, 1u);
    EXPECT_EQ(second.cacheMisses, 0u);
    EXPECT_EQ(first.results.at(kDeviceA), second.results.at(kDeviceA));
    EXPECT_EQ(script().executes(kDeviceA), 1);
}

TEST_F(BatchOrchestratorTest, NonCacheableCommandNeverHits) {
    std::vector<std::string> targets{kDeviceA};
    auto first = orchestrator().runBatch("show ip route", targets);
    auto second = orchestrator().runBatch("show ip route", targets);

    EXPECT_EQ(first.cacheHits, 0u);
    EXPECT_EQ(second.cacheHits, 0u);
    EXPECT_EQ(second.cacheMisses, 1u);
    EXPECT_EQ(script().executes(kDeviceA), 2);
}

TEST_F(BatchOrchestratorTest, EvictionDropsCachedOutput) {
    std::vector<std::string> targets{kDeviceA};
    orchestrator().runBatch("show version", targets);
    ASSERT_EQ(fleet_.cache->size(), 1u);

    fleet_.pool->evict(kDeviceA);
    EXPECT_EQ(fleet_.cache->size(), 0u);

    auto again = orchestrator().runBatch("show version", targets);
    EXPECT_EQ(again.cacheHits, 0u);
    EXPECT_EQ(script().executes(kDeviceA), 2);
}

TEST_F(BatchOrchestratorTest, FailedOutputIsNotCached) {
    script().failExecute(kDeviceA, rejectedError());
    orchestrator().runBatch("show version", std::vector<std::string>{kDeviceA});
    EXPECT_EQ(fleet_.cache->size(), 0u);
}

TEST_F(BatchOrchestratorTest, OutputFromReconnectedSessionIsCached) {
    std::vector<std::string> targets{kDeviceA};
    orchestrator().runBatch("show clock", targets);
    ASSERT_TRUE(fleet_.pool->contains(kDeviceA));

    // The pooled session dies; acquire evicts it and opens a new one
    script().setProbeResult(kDeviceA, false);
    auto first = orchestrator().runBatch("show version", targets);
    ASSERT_EQ(first.successfulDevices, 1u);
    EXPECT_EQ(script().opens(kDeviceA), 2);
    EXPECT_EQ(fleet_.cache->size(), 1u);

    auto second = orchestrator().runBatch("show version", targets);
    EXPECT_EQ(second.cacheHits, 1u);
    EXPECT_EQ(script().executes(kDeviceA), 2);
}

// ============================================================================
// Groups
// ============================================================================

TEST_F(BatchOrchestratorTest, GroupCommandTargetsMembers) {
    auto result = orchestrator().runGroupCommand("show clock", "core");

    EXPECT_EQ(result.totalDevices, 2u);
    EXPECT_TRUE(result.results.contains(kDeviceA));
    EXPECT_TRUE(result.results.contains(kDeviceB));
}

TEST_F(BatchOrchestratorTest, SelfDeclaredGroupMembership) {
    auto result = orchestrator().runGroupCommand("show clock", "access");
    EXPECT_EQ(result.totalDevices, 1u);
    EXPECT_TRUE(result.results.contains(kDeviceC));
}

TEST_F(BatchOrchestratorTest, UnknownGroupYieldsGroupError) {
    auto result = orchestrator().runGroupCommand("show clock", "edge");

    EXPECT_EQ(result.totalDevices, 0u);
    ASSERT_TRUE(result.errors.contains("group"));
    EXPECT_EQ(result.errors.at("group").message, "No devices in group 'edge'");
}

// ============================================================================
// Progress and Health
// ============================================================================

TEST_F(BatchOrchestratorTest, ProgressReportedPerDevice) {
    std::mutex mutex;
    std::vector<size_t> completed;
    size_t reportedTotal = 0;

    orchestrator().runBatch(
        "show clock", std::nullopt, {},
        [&](size_t done, size_t total, const std::string&) {
            std::lock_guard lock(mutex);
            completed.push_back(done);
            reportedTotal = total;
        });

    ASSERT_EQ(completed.size(), 3u);
    EXPECT_EQ(reportedTotal, 3u);
    std::sort(completed.begin(), completed.end());
    EXPECT_EQ(completed, (std::vector<size_t>{1, 2, 3}));
}

TEST_F(BatchOrchestratorTest, HealthCheckReportsEachDevice) {
    script().setProbeResult(kDeviceB, false);

    auto health = orchestrator().healthCheckDevices();

    ASSERT_EQ(health.size(), 3u);
    EXPECT_TRUE(health.at(kDeviceA));
    EXPECT_FALSE(health.at(kDeviceB));
    EXPECT_TRUE(health.at(kDeviceC));
    EXPECT_FALSE(fleet_.pool->contains(kDeviceB));
}

TEST_F(BatchOrchestratorTest, PreflightEvictsDeadSessions) {
    orchestrator().runBatch("show clock",
                            std::vector<std::string>{kDeviceA, kDeviceB});
    script().setProbeResult(kDeviceA, false);

    EXPECT_EQ(orchestrator().cleanupFailedConnections({kDeviceA, kDeviceB}),
              1u);
    EXPECT_FALSE(fleet_.pool->contains(kDeviceA));
    EXPECT_TRUE(fleet_.pool->contains(kDeviceB));
}

TEST_F(BatchOrchestratorTest, ShutdownPoolRejectsBatch) {
    fleet_.pool->shutdown();
    auto result = orchestrator().runBatch("show clock");

    EXPECT_EQ(result.totalDevices, 0u);
    EXPECT_TRUE(result.errors.contains("pool"));
}

// ============================================================================
// JSON Projection
// ============================================================================

TEST_F(BatchOrchestratorTest, JsonProjectionShape) {
    script().failExecute(kDeviceB, rejectedError());
    auto j = orchestrator()
                 .runBatch("show clock",
                           std::vector<std::string>{kDeviceA, kDeviceB})
                 .toJson();

    EXPECT_EQ(j["summary"]["command"], "show clock");
    EXPECT_EQ(j["summary"]["total_devices"], 2);
    EXPECT_EQ(j["summary"]["successful_devices"], 1);
    EXPECT_EQ(j["summary"]["failed_devices"], 1);
    EXPECT_TRUE(j["summary"]["cache_stats"].contains("hits"));
    ASSERT_EQ(j["successful_results"].size(), 1u);
    EXPECT_EQ(j["successful_results"][0]["device"], kDeviceA);
    ASSERT_EQ(j["failed_results"].size(), 1u);
    EXPECT_EQ(j["failed_results"][0]["error_details"]["type"],
              "invalid_command");
}

// ============================================================================
// Execution Scope
// ============================================================================

TEST(ExecutionScopeTest, NullIsUnrestricted) {
    auto scope = ExecutionScope::fromJson(nlohmann::json(nullptr));
    EXPECT_FALSE(scope.isRestricted());
    EXPECT_TRUE(scope.allows(kDeviceA));
}

TEST(ExecutionScopeTest, ArrayRestricts) {
    auto scope = ExecutionScope::fromJson(nlohmann::json::array({kDeviceB}));
    EXPECT_TRUE(scope.isRestricted());
    EXPECT_TRUE(scope.allows(kDeviceB));
    EXPECT_FALSE(scope.allows(kDeviceA));
}

TEST(ExecutionScopeTest, EmptyArrayAllowsNothing) {
    auto scope = ExecutionScope::fromJson(nlohmann::json::array());
    EXPECT_TRUE(scope.isRestricted());
    EXPECT_FALSE(scope.allows(kDeviceA));
}

TEST(ExecutionScopeTest, OtherShapesRejected) {
    EXPECT_THROW((void)ExecutionScope::fromJson(nlohmann::json(kDeviceB)),
                 TaskPayloadException);
    EXPECT_THROW((void)ExecutionScope::fromJson(nlohmann::json{
                     {"devices", nlohmann::json::array({kDeviceB})}}),
                 TaskPayloadException);
    EXPECT_THROW((void)ExecutionScope::fromJson(nlohmann::json(true)),
                 TaskPayloadException);
    EXPECT_THROW(
        (void)ExecutionScope::fromJson(nlohmann::json::array({kDeviceB, 7})),
        TaskPayloadException);
}
