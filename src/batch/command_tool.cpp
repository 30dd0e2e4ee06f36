/*
 * command_tool.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_tool.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "common/exceptions.hpp"

namespace netfleet::batch {

namespace {

auto trimView(std::string_view text) -> std::string_view {
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

auto splitAddressList(std::string_view list) -> std::vector<std::string> {
    std::vector<std::string> addresses;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto item = trimView(list.substr(0, comma));
        if (!item.empty()) {
            addresses.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }
    return addresses;
}

auto parseHealthTargets(std::string_view input)
    -> std::optional<std::vector<std::string>> {
    auto text = trimView(input);
    if (text.empty()) {
        return std::nullopt;
    }
    // A trailing command part is ignored
    auto addresses = splitAddressList(text.substr(0, text.find(':')));
    if (addresses.empty()) {
        THROW_TOOL_INPUT_ERROR("Health check input names no device addresses");
    }
    return addresses;
}

auto parseToolInput(std::string_view input) -> ToolRequest {
    auto text = trimView(input);
    if (text.empty()) {
        THROW_TOOL_INPUT_ERROR("Tool input is empty");
    }

    ToolRequest request;
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        request.command = std::string(text);
        return request;
    }

    request.command = std::string(trimView(text.substr(colon + 1)));
    if (request.command.empty()) {
        THROW_TOOL_INPUT_ERROR("Tool input has no command after ':'");
    }

    auto devices = splitAddressList(text.substr(0, colon));
    if (devices.empty()) {
        THROW_TOOL_INPUT_ERROR("Tool input has no device addresses before ':'");
    }

    request.devices = std::move(devices);
    return request;
}

auto runToolCommand(BatchOrchestrator& orchestrator, std::string_view input,
                    const ExecutionScope& scope) -> nlohmann::json {
    ToolRequest request;
    try {
        request = parseToolInput(input);
    } catch (const ToolInputException& e) {
        spdlog::warn("Rejected tool input '{}': {}", input, e.reason());
        return {{"error", e.reason()}};
    }

    return orchestrator.runBatch(request.command, request.devices, scope)
        .toJson();
}

}  // namespace netfleet::batch
