/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "batch/command_tool.hpp"
#include "batch/orchestrator.hpp"
#include "common/exceptions.hpp"
#include "config/settings.hpp"
#include "device/credentials.hpp"
#include "device/inventory.hpp"
#include "logging/logging_manager.hpp"
#include "network/command_validator.hpp"
#include "network/connection_pool.hpp"
#include "network/result_cache.hpp"
#include "network/tcp_session.hpp"
#include "server/batch_tasks.hpp"
#include "server/eventloop.hpp"
#include "server/task_registry.hpp"

using namespace std::string_literals;
using json = nlohmann::json;

namespace {

/**
 * @brief Submit a task and wait for it to leave the active states
 */
auto waitForTask(netfleet::server::TaskRegistry& registry,
                 const std::string& taskId) -> json {
    while (true) {
        auto task = registry.getTask(taskId);
        if (!task) {
            return {{"error", "Task " + taskId + " disappeared"}};
        }
        if (task->isTerminal()) {
            return task->toJson();
        }
        spdlog::debug("Task {} at {:.2f}% ({})", taskId,
                      task->progress.percentage, task->progress.stage);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    atom::utils::ArgumentParser program("NetFleet"s);

    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "config/settings.json"s,
                        "Path to the settings file", {"c"});
    program.addArgument("devices", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Override the device inventory file",
                        {"d"});
    program.addArgument("groups", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Override the group inventory file",
                        {"g"});
    program.addArgument("command", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s,
                        "Tool input: \"addr1,addr2: command\" or \"command\"; "
                        "with --health, the addresses to check",
                        {"x"});
    program.addArgument("group", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Run the command on an inventory group",
                        {});
    program.addArgument("scope", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s,
                        "Comma separated addresses the request may touch",
                        {"s"});
    program.addArgument("health", atom::utils::ArgumentParser::ArgType::BOOLEAN,
                        false, false, "Health check the targeted devices", {});
    program.addArgument("async", atom::utils::ArgumentParser::ArgType::BOOLEAN,
                        false, false, "Run through the task registry", {});

    program.addDescription("NetFleet batch command runner:");
    program.addEpilog("End.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    // Keep stdout clean for the JSON result until logging is configured
    netfleet::logging::LoggingManager::installConsoleLogger();

    // Settings: file, then environment
    netfleet::config::Settings settings;
    try {
        settings = netfleet::config::Settings::loadFromFile(
            program.get<std::string>("config").value_or(
                "config/settings.json"s));
        settings.applyEnvironment();
    } catch (const netfleet::ConfigException& e) {
        std::cerr << "Configuration error: " << e.reason() << std::endl;
        return 1;
    }

    auto& logging = netfleet::logging::LoggingManager::getInstance();
    logging.initialize(settings.logging);

    auto devicesFile = program.get<std::string>("devices").value_or(""s);
    auto groupsFile = program.get<std::string>("groups").value_or(""s);
    if (!devicesFile.empty()) {
        settings.inventory.devicesFile = devicesFile;
    }
    if (!groupsFile.empty()) {
        settings.inventory.groupsFile = groupsFile;
    }

    std::shared_ptr<const netfleet::device::Inventory> inventory;
    try {
        inventory = std::make_shared<const netfleet::device::Inventory>(
            netfleet::device::Inventory::loadFromFiles(
                settings.inventory.devicesFile, settings.inventory.groupsFile));
    } catch (const netfleet::InventoryException& e) {
        spdlog::critical("Failed to load inventory: {}", e.reason());
        logging.shutdown();
        return 1;
    }
    spdlog::info("Loaded {} devices", inventory->size());

    auto factory =
        std::make_shared<netfleet::network::TcpSessionFactory>(settings.transport);
    auto pool = std::make_shared<netfleet::network::ConnectionPool>(
        factory, netfleet::device::CredentialResolver(settings.credentials),
        settings.pool);
    auto cache = std::make_shared<netfleet::network::ResultCache>(settings.cache);
    auto orchestrator = std::make_shared<netfleet::batch::BatchOrchestrator>(
        inventory, pool, cache,
        netfleet::network::CommandValidator(settings.security),
        settings.dispatch, settings.output);

    netfleet::batch::ExecutionScope scope;
    auto scopeText = program.get<std::string>("scope").value_or(""s);
    if (!scopeText.empty()) {
        scope = netfleet::batch::ExecutionScope::restrictedTo(
            netfleet::batch::splitAddressList(scopeText));
    }

    auto toolInput = program.get<std::string>("command").value_or(""s);
    auto group = program.get<std::string>("group").value_or(""s);
    bool health = program.get<bool>("health").value_or(false);
    bool async = program.get<bool>("async").value_or(false);

    json output;
    int status = 0;
    try {
        if (async) {
            auto loop =
                std::make_shared<netfleet::server::EventLoop>(settings.tasks.workers);
            netfleet::server::TaskRegistry registry(loop, settings.tasks);
            netfleet::server::registerBatchHandlers(registry, orchestrator);

            json payload = json::object();
            if (scope.isRestricted()) {
                payload["scope"] = netfleet::batch::splitAddressList(scopeText);
            }
            std::string kind;
            if (health) {
                kind = netfleet::server::kHealthCheckTask;
                if (auto targets =
                        netfleet::batch::parseHealthTargets(toolInput)) {
                    payload["devices"] = *targets;
                }
            } else {
                kind = netfleet::server::kBatchExecuteTask;
                auto request = netfleet::batch::parseToolInput(toolInput);
                payload["command"] = request.command;
                if (request.devices) {
                    payload["devices"] = *request.devices;
                }
                if (!group.empty()) {
                    payload["group"] = group;
                }
            }
            output = waitForTask(registry, registry.createTask(kind, payload));
            loop->stop();
        } else if (health) {
            json results = json::object();
            for (const auto& [address, ok] :
                 orchestrator->healthCheckDevices(
                     netfleet::batch::parseHealthTargets(toolInput), scope)) {
                results[address] = ok;
            }
            output = {{"results", results}};
        } else if (!group.empty()) {
            auto request = netfleet::batch::parseToolInput(toolInput);
            output = orchestrator->runGroupCommand(request.command, group, scope)
                         .toJson();
        } else {
            output =
                netfleet::batch::runToolCommand(*orchestrator, toolInput, scope);
        }
    } catch (const netfleet::ToolInputException& e) {
        output = {{"error", e.reason()}};
        status = 2;
    }

    std::cout << output.dump(2) << std::endl;

    pool->shutdown();
    spdlog::info("Pool statistics: {}", pool->statistics().toJson().dump());
    spdlog::info("Cache statistics: {}", cache->statistics().toJson().dump());
    logging.shutdown();
    return status;
}
