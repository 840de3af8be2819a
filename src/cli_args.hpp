#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "client/client.hpp"

namespace slsk::cli {

constexpr static auto SEARCH_USAGE =
  "search [--json] [-n <limit>] [-w <seconds>] <query...>";
constexpr static auto DOWNLOAD_USAGE = "download <username> <file_path>";

struct SearchArgs
{
    std::string query;
    int limit = client::Client::DEFAULT_SEARCH_LIMIT;
    std::optional<std::chrono::milliseconds> window;
    bool json = false;
};

/**
 * @brief Arguments of the search command, nullopt when the query is empty
 * or a limit/window value is not a non-negative integer
 */
auto parse_search_args(const std::vector<std::string>& words)
  -> std::optional<SearchArgs>;

}  // namespace slsk::cli
