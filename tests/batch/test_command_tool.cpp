/*
 * test_command_tool.cpp - Tests for the tool input parser
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "batch/command_tool.hpp"
#include "common/exceptions.hpp"
#include "fakes/fake_fleet.hpp"

using namespace netfleet;
using namespace netfleet::batch;
using namespace netfleet::testing;

// ============================================================================
// Parsing
// ============================================================================

TEST(ParseToolInputTest, BareCommandTargetsAllDevices) {
    auto request = parseToolInput("  show version ");
    EXPECT_EQ(request.command, "show version");
    EXPECT_FALSE(request.devices.has_value());
}

TEST(ParseToolInputTest, DevicesBeforeColon) {
    auto request = parseToolInput("10.0.0.1, 10.0.0.2 : show ip int brief");
    EXPECT_EQ(request.command, "show ip int brief");
    ASSERT_TRUE(request.devices.has_value());
    EXPECT_EQ(*request.devices,
              (std::vector<std::string>{"10.0.0.1", "10.0.0.2"}));
}

TEST(ParseToolInputTest, EmptyItemsDropped) {
    auto request = parseToolInput("10.0.0.1,, ,10.0.0.3:show clock");
    ASSERT_TRUE(request.devices.has_value());
    EXPECT_EQ(request.devices->size(), 2u);
}

TEST(ParseToolInputTest, SplitsOnFirstColonOnly) {
    auto request = parseToolInput("10.0.0.1: show bgp rd 65000:1");
    EXPECT_EQ(request.command, "show bgp rd 65000:1");
}

TEST(ParseToolInputTest, RejectsMalformedInput) {
    EXPECT_THROW((void)parseToolInput("   "), ToolInputException);
    EXPECT_THROW((void)parseToolInput("10.0.0.1:  "), ToolInputException);
    EXPECT_THROW((void)parseToolInput(" , : show clock"), ToolInputException);
}

TEST(ParseHealthTargetsTest, EmptyInputMeansAllDevices) {
    EXPECT_FALSE(parseHealthTargets("").has_value());
    EXPECT_FALSE(parseHealthTargets("   ").has_value());
}

TEST(ParseHealthTargetsTest, AddressListIsSplit) {
    auto targets = parseHealthTargets(" 10.0.0.1 , 10.0.0.2 ,");
    ASSERT_TRUE(targets.has_value());
    EXPECT_EQ(*targets,
              (std::vector<std::string>{"10.0.0.1", "10.0.0.2"}));
}

TEST(ParseHealthTargetsTest, CommandPartIgnored) {
    auto targets = parseHealthTargets("10.0.0.3: show clock");
    ASSERT_TRUE(targets.has_value());
    EXPECT_EQ(*targets, (std::vector<std::string>{"10.0.0.3"}));
}

TEST(ParseHealthTargetsTest, NoAddressesRejected) {
    EXPECT_THROW((void)parseHealthTargets(" , "), ToolInputException);
    EXPECT_THROW((void)parseHealthTargets(": show clock"), ToolInputException);
}

TEST(SplitAddressListTest, TrimsAndDropsEmptyItems) {
    EXPECT_EQ(splitAddressList("a, ,b ,, c"),
              (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(splitAddressList("").empty());
}

TEST(HealthTargetsTest, OnlyListedDevicesAreChecked) {
    FakeFleet fleet;
    auto results = fleet.orchestrator->healthCheckDevices(
        parseHealthTargets(std::string(kDeviceA) + "," + kDeviceC));

    EXPECT_EQ(results.size(), 2u);
    EXPECT_TRUE(results.contains(kDeviceA));
    EXPECT_TRUE(results.contains(kDeviceC));
    EXPECT_EQ(fleet.script().opens(kDeviceB), 0);
}

// ============================================================================
// Running
// ============================================================================

TEST(RunToolCommandTest, ReturnsBatchProjection) {
    FakeFleet fleet;
    auto j = runToolCommand(*fleet.orchestrator, "10.0.0.1: show clock");

    EXPECT_EQ(j["summary"]["total_devices"], 1);
    EXPECT_EQ(j["successful_results"][0]["device"], kDeviceA);
}

TEST(RunToolCommandTest, ParseErrorBecomesErrorObject) {
    FakeFleet fleet;
    auto j = runToolCommand(*fleet.orchestrator, "10.0.0.1:");

    ASSERT_TRUE(j.contains("error"));
    EXPECT_EQ(j["error"], "Tool input has no command after ':'");
    EXPECT_EQ(fleet.pool->statistics().acquires, 0u);
}

TEST(RunToolCommandTest, ScopeIsApplied) {
    FakeFleet fleet;
    auto j = runToolCommand(*fleet.orchestrator, "show clock",
                            ExecutionScope::restrictedTo({kDeviceB}));
    EXPECT_EQ(j["summary"]["total_devices"], 1);
    EXPECT_EQ(j["successful_results"][0]["device"], kDeviceB);
}
