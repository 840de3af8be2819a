#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/search.hpp"

namespace slsk::client {

using Json = nlohmann::json;

/**
 * @brief "512 B", "1.5 KB", "3.2 MB"
 */
auto format_size(uint64_t bytes) -> std::string;

/**
 * @brief "m:ss", "unknown" without a duration
 */
auto format_duration(std::optional<uint32_t> seconds) -> std::string;

/**
 * @brief Multi-line listing entry, index counted from zero
 */
auto format_result(const SearchResult& result, std::size_t index) -> std::string;

auto to_json(const SearchResult& result) -> Json;
auto to_json(const std::vector<SearchResult>& results) -> Json;

}  // namespace slsk::client
