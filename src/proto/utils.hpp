#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "proto/types.hpp"

#define SLSK_READ(var, expr)                                                   \
    auto var = (expr);                                                         \
    if (not var) {                                                             \
        return tl::make_unexpected(var.error());                               \
    }

namespace slsk::proto::utils {

using Buffer = std::vector<uint8_t>;

inline auto pack_u8(Buffer& packed, uint8_t value) -> void
{
    packed.push_back(value);
}

inline auto pack_u32(Buffer& packed, uint32_t value) -> void
{
    packed.push_back(value & 0xFF);  // Least significant byte
    packed.push_back((value >> 8) & 0xFF);
    packed.push_back((value >> 16) & 0xFF);
    packed.push_back((value >> 24) & 0xFF);
}

inline auto pack_u64(Buffer& packed, uint64_t value) -> void
{
    pack_u32(packed, uint32_t(value & 0xFFFFFFFF));
    pack_u32(packed, uint32_t(value >> 32));
}

inline auto pack_bool(Buffer& packed, bool value) -> void
{
    pack_u8(packed, value ? 1 : 0);
}

inline auto pack_string(Buffer& packed, std::string_view value) -> void
{
    pack_u32(packed, uint32_t(value.size()));
    packed.insert(packed.end(), value.begin(), value.end());
}

inline auto unpack_u32(std::span<const uint8_t> msg) -> uint32_t
{
    return (uint32_t)msg[0] | ((uint32_t)msg[1] << 8) |
           ((uint32_t)msg[2] << 16) | ((uint32_t)msg[3] << 24);
}

inline auto unpack_u64(std::span<const uint8_t> msg) -> uint64_t
{
    return (uint64_t)unpack_u32(msg.first(4)) |
           ((uint64_t)unpack_u32(msg.subspan(4, 4)) << 32);
}

/**
 * @brief Sequential little-endian reader over a complete frame body
 *
 * Every read fails with MALFORMED_MESSAGE when the field runs past the end
 * of the body: the frame was already length-checked, so a short field means
 * the sender lied about its contents.
 */
class Reader
{
 public:
    inline explicit Reader(std::span<const uint8_t> data) : _data(data) {}

    inline auto u8() -> tl::expected<uint8_t, Error>
    {
        SLSK_READ(bytes, _take(1));
        return (*bytes)[0];
    }

    inline auto boolean() -> tl::expected<bool, Error>
    {
        SLSK_READ(value, u8());
        return *value != 0;
    }

    inline auto u32() -> tl::expected<uint32_t, Error>
    {
        SLSK_READ(bytes, _take(4));
        return unpack_u32(*bytes);
    }

    inline auto u64() -> tl::expected<uint64_t, Error>
    {
        SLSK_READ(bytes, _take(8));
        return unpack_u64(*bytes);
    }

    inline auto string() -> tl::expected<std::string, Error>
    {
        SLSK_READ(length, u32());
        SLSK_READ(bytes, _take(*length));
        return std::string(bytes->begin(), bytes->end());
    }

    inline auto remaining() const noexcept -> std::size_t
    {
        return _data.size() - _offset;
    }

 private:
    inline auto _take(std::size_t count)
      -> tl::expected<std::span<const uint8_t>, Error>
    {
        if (count > remaining()) {
            return tl::make_unexpected(Error::MALFORMED_MESSAGE);
        }

        auto bytes = _data.subspan(_offset, count);
        _offset += count;
        return bytes;
    }

    std::span<const uint8_t> _data;
    std::size_t _offset = 0;
};

}  // namespace slsk::proto::utils
