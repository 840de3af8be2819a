#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <tl/expected.hpp>

#include "proto/types.hpp"

namespace slsk::proto {

/**
 * @brief zlib-deflate a message body (search responses travel compressed)
 */
auto compress(std::span<const uint8_t> data) -> std::vector<uint8_t>;

/**
 * @brief zlib-inflate a message body, MALFORMED_MESSAGE on corrupt input or
 * when the output would exceed MAX_FRAME_LENGTH
 */
auto decompress(std::span<const uint8_t> data)
  -> tl::expected<std::vector<uint8_t>, Error>;

}  // namespace slsk::proto
