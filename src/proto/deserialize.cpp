#include "proto/deserialize.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <vector>

#include <magic_enum.hpp>
#include <tl/expected.hpp>

#include "proto/compress.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"


namespace slsk::proto {

using utils::Reader;

constexpr static std::size_t LENGTH_PREFIX_SIZE = 4;

namespace {

auto code_size(FrameKind kind) -> std::size_t
{
    return kind == FrameKind::PeerInit ? 1 : 4;
}

auto is_known_code(FrameKind kind, uint32_t code) -> bool
{
    switch (kind) {
        case FrameKind::Server:
            return magic_enum::enum_cast<ServerCode>(code).has_value();
        case FrameKind::Peer:
            return magic_enum::enum_cast<PeerCode>(code).has_value();
        case FrameKind::PeerInit:
            return magic_enum::enum_cast<PeerInitCode>(uint8_t(code))
              .has_value();
    }

    return false;
}

auto unpack_shared_file(Reader& reader) -> tl::expected<SharedFile, Error>
{
    SLSK_READ(code, reader.u8());
    SLSK_READ(filename, reader.string());
    SLSK_READ(size, reader.u64());
    SLSK_READ(extension, reader.string());
    SLSK_READ(attributes_count, reader.u32());

    SharedFile file{.filename = *filename, .size = *size, .extension = *extension};

    // every attribute takes 8 bytes, reject counts the body can not hold
    if (std::size_t(*attributes_count) * 8 > reader.remaining()) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    for (uint32_t i = 0; i < *attributes_count; i++) {
        SLSK_READ(attr_code, reader.u32());
        SLSK_READ(attr_value, reader.u32());
        file.attributes.emplace_back(*attr_code, *attr_value);
    }

    return file;
}

auto unpack_shared_files(Reader& reader)
  -> tl::expected<std::vector<SharedFile>, Error>
{
    SLSK_READ(count, reader.u32());

    std::vector<SharedFile> files;
    files.reserve(std::min<std::size_t>(*count, reader.remaining()));

    for (uint32_t i = 0; i < *count; i++) {
        SLSK_READ(file, unpack_shared_file(reader));
        files.push_back(std::move(*file));
    }

    return files;
}

}  // namespace

auto SharedFile::attribute(FileAttribute code) const -> std::optional<uint32_t>
{
    auto found = std::ranges::find_if(attributes, [code](auto&& attr) {
        return attr.first == uint32_t(code);
    });

    if (found == attributes.end()) {
        return std::nullopt;
    }

    return found->second;
}

auto unpack_frame(std::vector<uint8_t>& buffer, FrameKind kind)
  -> tl::expected<Frame, Error>
{
    if (buffer.size() < LENGTH_PREFIX_SIZE) {
        return tl::make_unexpected(Error::INCOMPLETE_MESSAGE);
    }

    const auto length = utils::unpack_u32(buffer);

    if (length > MAX_FRAME_LENGTH) {
        return tl::make_unexpected(Error::FRAME_TOO_LARGE);
    }

    if (buffer.size() < LENGTH_PREFIX_SIZE + length) {
        return tl::make_unexpected(Error::INCOMPLETE_MESSAGE);
    }

    const auto frame_begin = buffer.begin();
    const auto frame_end = std::next(frame_begin, LENGTH_PREFIX_SIZE + length);
    const auto code_begin = std::next(frame_begin, LENGTH_PREFIX_SIZE);

    if (length < code_size(kind)) {
        buffer.erase(frame_begin, frame_end);
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    const uint32_t code =
      kind == FrameKind::PeerInit
        ? uint32_t(*code_begin)
        : utils::unpack_u32({code_begin, std::next(code_begin, 4)});

    if (not is_known_code(kind, code)) {
        buffer.erase(frame_begin, frame_end);
        return tl::make_unexpected(Error::UNKNOWN_MESSAGE_CODE);
    }

    Frame frame{
      .kind = kind,
      .code = code,
      .body = std::vector<uint8_t>(
        std::next(code_begin, code_size(kind)), frame_end
      )
    };

    buffer.erase(frame_begin, frame_end);
    return frame;
}

auto unpack_login_response(std::span<const uint8_t> body)
  -> tl::expected<LoginResponse, Error>
{
    Reader reader(body);
    SLSK_READ(success, reader.boolean());

    if (not *success) {
        SLSK_READ(reason, reader.string());
        return LoginResponse{.success = false, .reason = *reason};
    }

    SLSK_READ(greeting, reader.string());
    SLSK_READ(ip, reader.u32());

    // password hash and supporter flag follow, nothing here needs them
    return LoginResponse{.success = true, .greeting = *greeting, .ip = *ip};
}

auto unpack_peer_address(std::span<const uint8_t> body)
  -> tl::expected<PeerAddress, Error>
{
    Reader reader(body);
    SLSK_READ(username, reader.string());
    SLSK_READ(ip, reader.u32());
    SLSK_READ(port, reader.u32());

    return PeerAddress{.username = *username, .ip = *ip, .port = *port};
}

auto unpack_connect_to_peer(std::span<const uint8_t> body)
  -> tl::expected<ConnectToPeer, Error>
{
    Reader reader(body);
    SLSK_READ(username, reader.string());
    SLSK_READ(type, reader.string());
    SLSK_READ(ip, reader.u32());
    SLSK_READ(port, reader.u32());
    SLSK_READ(token, reader.u32());

    // older servers stop before the privileged flag
    bool privileged = false;
    if (reader.remaining() > 0) {
        SLSK_READ(flag, reader.boolean());
        privileged = *flag;
    }

    return ConnectToPeer{
      .username = *username,
      .type = *type,
      .ip = *ip,
      .port = *port,
      .token = *token,
      .privileged = privileged
    };
}

auto unpack_cant_connect_to_peer(std::span<const uint8_t> body)
  -> tl::expected<uint32_t, Error>
{
    Reader reader(body);
    return reader.u32();
}

auto unpack_login(std::span<const uint8_t> body)
  -> tl::expected<LoginRequest, Error>
{
    Reader reader(body);
    SLSK_READ(username, reader.string());
    SLSK_READ(password, reader.string());
    SLSK_READ(version, reader.u32());
    SLSK_READ(hash, reader.string());
    SLSK_READ(minor_version, reader.u32());

    return LoginRequest{
      .username = *username,
      .password = *password,
      .version = *version,
      .minor_version = *minor_version
    };
}

auto unpack_file_search(std::span<const uint8_t> body)
  -> tl::expected<FileSearch, Error>
{
    Reader reader(body);
    SLSK_READ(token, reader.u32());
    SLSK_READ(query, reader.string());

    return FileSearch{.token = *token, .query = *query};
}

auto unpack_set_wait_port(std::span<const uint8_t> body)
  -> tl::expected<uint32_t, Error>
{
    Reader reader(body);
    return reader.u32();
}

auto unpack_get_peer_address(std::span<const uint8_t> body)
  -> tl::expected<std::string, Error>
{
    Reader reader(body);
    return reader.string();
}

auto unpack_connect_to_peer_request(std::span<const uint8_t> body)
  -> tl::expected<ConnectToPeer, Error>
{
    Reader reader(body);
    SLSK_READ(token, reader.u32());
    SLSK_READ(username, reader.string());
    SLSK_READ(type, reader.string());

    return ConnectToPeer{.username = *username, .type = *type, .token = *token};
}

auto unpack_peer_init(std::span<const uint8_t> body)
  -> tl::expected<PeerInit, Error>
{
    Reader reader(body);
    SLSK_READ(username, reader.string());
    SLSK_READ(type, reader.string());
    SLSK_READ(token, reader.u32());

    return PeerInit{.username = *username, .type = *type, .token = *token};
}

auto unpack_pierce_firewall(std::span<const uint8_t> body)
  -> tl::expected<PierceFirewall, Error>
{
    Reader reader(body);
    SLSK_READ(token, reader.u32());
    return PierceFirewall{.token = *token};
}

auto unpack_file_search_response(std::span<const uint8_t> body)
  -> tl::expected<FileSearchResponse, Error>
{
    SLSK_READ(inflated, decompress(body));

    Reader reader(*inflated);
    SLSK_READ(username, reader.string());
    SLSK_READ(token, reader.u32());
    SLSK_READ(files, unpack_shared_files(reader));
    SLSK_READ(slots_free, reader.boolean());
    SLSK_READ(avg_speed, reader.u32());
    SLSK_READ(queue_length, reader.u32());

    FileSearchResponse response{
      .username = *username,
      .token = *token,
      .files = std::move(*files),
      .slots_free = *slots_free,
      .avg_speed = *avg_speed,
      .queue_length = *queue_length
    };

    // Locked files were added later, older clients end the message here
    if (reader.remaining() >= 8) {
        SLSK_READ(reserved, reader.u32());
        SLSK_READ(locked, unpack_shared_files(reader));
        response.locked_files = std::move(*locked);
    }

    return response;
}

auto unpack_transfer_request(std::span<const uint8_t> body)
  -> tl::expected<TransferRequest, Error>
{
    Reader reader(body);
    SLSK_READ(direction, reader.u32());
    SLSK_READ(token, reader.u32());
    SLSK_READ(filename, reader.string());

    auto parsed_direction = magic_enum::enum_cast<TransferDirection>(*direction);
    if (not parsed_direction) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    TransferRequest request{
      .direction = *parsed_direction, .token = *token, .filename = *filename
    };

    if (request.direction == TransferDirection::Upload) {
        SLSK_READ(size, reader.u64());
        request.size = *size;
    }

    return request;
}

auto unpack_transfer_response(std::span<const uint8_t> body)
  -> tl::expected<TransferResponse, Error>
{
    Reader reader(body);
    SLSK_READ(token, reader.u32());
    SLSK_READ(allowed, reader.boolean());

    TransferResponse response{.token = *token, .allowed = *allowed};

    if (response.allowed and reader.remaining() >= 8) {
        SLSK_READ(size, reader.u64());
        response.size = *size;
    }
    else if (not response.allowed and reader.remaining() > 0) {
        SLSK_READ(reason, reader.string());
        response.reason = *reason;
    }

    return response;
}

auto unpack_filename(std::span<const uint8_t> body)
  -> tl::expected<std::string, Error>
{
    Reader reader(body);
    return reader.string();
}

auto unpack_place_in_queue_response(std::span<const uint8_t> body)
  -> tl::expected<PlaceInQueueResponse, Error>
{
    Reader reader(body);
    SLSK_READ(filename, reader.string());
    SLSK_READ(place, reader.u32());

    return PlaceInQueueResponse{.filename = *filename, .place = *place};
}

auto unpack_upload_denied(std::span<const uint8_t> body)
  -> tl::expected<UploadDenied, Error>
{
    Reader reader(body);
    SLSK_READ(filename, reader.string());
    SLSK_READ(reason, reader.string());

    return UploadDenied{.filename = *filename, .reason = *reason};
}

auto unpack_file_transfer_init(std::span<const uint8_t> bytes)
  -> tl::expected<FileTransferInit, Error>
{
    if (bytes.size() < FileTransferInit::SIZE) {
        return tl::make_unexpected(Error::INCOMPLETE_MESSAGE);
    }

    return FileTransferInit{.token = utils::unpack_u32(bytes)};
}

auto unpack_file_offset(std::span<const uint8_t> bytes)
  -> tl::expected<FileOffset, Error>
{
    if (bytes.size() < FileOffset::SIZE) {
        return tl::make_unexpected(Error::INCOMPLETE_MESSAGE);
    }

    return FileOffset{.offset = utils::unpack_u64(bytes)};
}

}  // namespace slsk::proto
