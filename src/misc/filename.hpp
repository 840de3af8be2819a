#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

namespace slsk::utils {

/**
 * @brief Local name for a file reported by a peer
 *
 * Peers report paths in their own platform's form, usually with backslash
 * separators. Only the last segment is kept so a download can never land
 * outside the output directory.
 */
inline auto saved_filename(std::string_view peer_path)
  -> std::optional<std::string>
{
    std::string normalized(peer_path);
    std::ranges::replace(normalized, '\\', '/');

    const auto separator = normalized.find_last_of('/');
    auto name = separator == std::string::npos ? normalized
                                               : normalized.substr(separator + 1);

    if (name.empty() or name == "." or name == "..") {
        return std::nullopt;
    }

    return name;
}

}  // namespace slsk::utils
