#include "proto/compress.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>
#include <zlib.h>

namespace slsk::proto {

constexpr static std::size_t CHUNK_SIZE = 16 * 1024;

auto compress(std::span<const uint8_t> data) -> std::vector<uint8_t>
{
    z_stream stream{};

    if (deflateInit(&stream, Z_DEFAULT_COMPRESSION) != Z_OK) {
        throw std::runtime_error("Can not initialize zlib deflate stream");
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = uInt(data.size());

    std::vector<uint8_t> compressed;
    std::array<uint8_t, CHUNK_SIZE> chunk;

    int code = Z_OK;
    do {
        stream.next_out = chunk.data();
        stream.avail_out = uInt(chunk.size());

        code = ::deflate(&stream, Z_FINISH);
        if (code == Z_STREAM_ERROR) {
            deflateEnd(&stream);
            throw std::runtime_error("zlib deflate failed");
        }

        compressed.insert(
          compressed.end(), chunk.begin(),
          chunk.begin() + (chunk.size() - stream.avail_out)
        );
    } while (code != Z_STREAM_END);

    deflateEnd(&stream);
    return compressed;
}

auto decompress(std::span<const uint8_t> data)
  -> tl::expected<std::vector<uint8_t>, Error>
{
    z_stream stream{};

    if (inflateInit(&stream) != Z_OK) {
        throw std::runtime_error("Can not initialize zlib inflate stream");
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = uInt(data.size());

    std::vector<uint8_t> inflated;
    std::array<uint8_t, CHUNK_SIZE> chunk;

    int code = Z_OK;
    do {
        stream.next_out = chunk.data();
        stream.avail_out = uInt(chunk.size());

        code = ::inflate(&stream, Z_NO_FLUSH);

        if (code != Z_OK and code != Z_STREAM_END) {
            inflateEnd(&stream);
            return tl::make_unexpected(Error::MALFORMED_MESSAGE);
        }

        inflated.insert(
          inflated.end(), chunk.begin(),
          chunk.begin() + (chunk.size() - stream.avail_out)
        );

        if (inflated.size() > MAX_FRAME_LENGTH) {
            inflateEnd(&stream);
            return tl::make_unexpected(Error::MALFORMED_MESSAGE);
        }

        // input ran out before the end of the zlib stream: truncated body
        if (code == Z_OK and stream.avail_in == 0 and stream.avail_out != 0) {
            inflateEnd(&stream);
            return tl::make_unexpected(Error::MALFORMED_MESSAGE);
        }
    } while (code != Z_STREAM_END);

    inflateEnd(&stream);
    return inflated;
}

}  // namespace slsk::proto
