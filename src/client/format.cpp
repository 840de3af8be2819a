#include "client/format.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace slsk::client {

constexpr static uint64_t KB = 1024;
constexpr static uint64_t MB = 1024 * 1024;

auto format_size(uint64_t bytes) -> std::string
{
    if (bytes < KB) {
        return fmt::format("{} B", bytes);
    }

    if (bytes < MB) {
        return fmt::format("{:.1f} KB", double(bytes) / KB);
    }

    return fmt::format("{:.1f} MB", double(bytes) / MB);
}

auto format_duration(std::optional<uint32_t> seconds) -> std::string
{
    if (not seconds) {
        return "unknown";
    }

    return fmt::format("{}:{:02}", *seconds / 60, *seconds % 60);
}

auto format_result(const SearchResult& result, std::size_t index) -> std::string
{
    std::vector<std::string> lines{
      fmt::format("{}. {}", index + 1, result.filename),
      fmt::format("   User: {}", result.username),
      fmt::format("   Size: {}", format_size(result.size)),
    };

    if (result.bitrate and *result.bitrate != 0) {
        lines.push_back(fmt::format("   Bitrate: {} kbps", *result.bitrate));
    }
    if (result.duration and *result.duration != 0) {
        lines.push_back(
          fmt::format("   Duration: {}", format_duration(result.duration))
        );
    }

    lines.push_back(
      fmt::format("   Slots: {}", result.slots_free ? "Available" : "Busy")
    );
    lines.push_back(fmt::format("   Speed: {}/s", format_size(result.avg_speed)));

    return fmt::format("{}", fmt::join(lines, "\n"));
}

auto to_json(const SearchResult& result) -> Json
{
    auto optional = [](const std::optional<uint32_t>& value) -> Json {
        return value ? Json(*value) : Json(nullptr);
    };

    return Json{
      {"username", result.username},
      {"filename", result.filename},
      {"size", result.size},
      {"bitrate", optional(result.bitrate)},
      {"duration", optional(result.duration)},
      {"slotsFree", result.slots_free},
      {"speed", result.avg_speed},
      {"queueLength", result.queue_length},
    };
}

auto to_json(const std::vector<SearchResult>& results) -> Json
{
    auto array = Json::array();

    for (auto&& result : results) {
        array.push_back(to_json(result));
    }

    return array;
}

}  // namespace slsk::client
