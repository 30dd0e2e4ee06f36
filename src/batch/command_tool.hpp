/*
 * command_tool.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-2

Description: Single-string command interface for agent callers

**************************************************/

#ifndef NETFLEET_BATCH_COMMAND_TOOL_HPP
#define NETFLEET_BATCH_COMMAND_TOOL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "atom/type/json.hpp"

#include "orchestrator.hpp"

namespace netfleet::batch {

/**
 * @brief Parsed tool input
 */
struct ToolRequest {
    std::optional<std::vector<std::string>> devices;  ///< nullopt = all
    std::string command;
};

/**
 * @brief Split a comma separated address list; items are trimmed and empty
 * ones dropped
 */
[[nodiscard]] auto splitAddressList(std::string_view list)
    -> std::vector<std::string>;

/**
 * @brief Addresses for a health check: "addr1, addr2" or the address part of
 * a tool string.
 *
 * @return nullopt for empty input, meaning every device
 * @throws ToolInputException when non-empty input names no address
 */
[[nodiscard]] auto parseHealthTargets(std::string_view input)
    -> std::optional<std::vector<std::string>>;

/**
 * @brief Parse "addr1, addr2: command" or a bare "command".
 *
 * Splits on the first ':'; addresses are comma separated and trimmed, empty
 * items are dropped.
 *
 * @throws ToolInputException on empty input, an empty command, or an
 *         address list that names no device
 */
[[nodiscard]] auto parseToolInput(std::string_view input) -> ToolRequest;

/**
 * @brief Parse and run a tool string, returning the JSON projection.
 *
 * Parse failures come back as {"error": message} instead of throwing.
 */
auto runToolCommand(BatchOrchestrator& orchestrator, std::string_view input,
                    const ExecutionScope& scope = {}) -> nlohmann::json;

}  // namespace netfleet::batch

#endif  // NETFLEET_BATCH_COMMAND_TOOL_HPP
