#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <tl/expected.hpp>

#include "proto/types.hpp"

namespace slsk::proto {

/**
 * @brief Take one complete frame from the front of a receive buffer
 *
 * Returns INCOMPLETE_MESSAGE and leaves the buffer untouched while the frame
 * is still partial. Complete frames are always removed from the buffer, even
 * when they fail with MALFORMED_MESSAGE or UNKNOWN_MESSAGE_CODE, so a single
 * bad frame never blocks the ones behind it. FRAME_TOO_LARGE is the only
 * error the stream can not recover from.
 */
auto unpack_frame(std::vector<uint8_t>& buffer, FrameKind kind)
  -> tl::expected<Frame, Error>;

// Server messages, server -> client
auto unpack_login_response(std::span<const uint8_t> body)
  -> tl::expected<LoginResponse, Error>;
auto unpack_peer_address(std::span<const uint8_t> body)
  -> tl::expected<PeerAddress, Error>;
auto unpack_connect_to_peer(std::span<const uint8_t> body)
  -> tl::expected<ConnectToPeer, Error>;
auto unpack_cant_connect_to_peer(std::span<const uint8_t> body)
  -> tl::expected<uint32_t, Error>;

// Server messages, client -> server
auto unpack_login(std::span<const uint8_t> body)
  -> tl::expected<LoginRequest, Error>;
auto unpack_file_search(std::span<const uint8_t> body)
  -> tl::expected<FileSearch, Error>;
auto unpack_set_wait_port(std::span<const uint8_t> body)
  -> tl::expected<uint32_t, Error>;
auto unpack_get_peer_address(std::span<const uint8_t> body)
  -> tl::expected<std::string, Error>;
auto unpack_connect_to_peer_request(std::span<const uint8_t> body)
  -> tl::expected<ConnectToPeer, Error>;

// Peer init messages
auto unpack_peer_init(std::span<const uint8_t> body)
  -> tl::expected<PeerInit, Error>;
auto unpack_pierce_firewall(std::span<const uint8_t> body)
  -> tl::expected<PierceFirewall, Error>;

// Peer messages
auto unpack_file_search_response(std::span<const uint8_t> body)
  -> tl::expected<FileSearchResponse, Error>;
auto unpack_transfer_request(std::span<const uint8_t> body)
  -> tl::expected<TransferRequest, Error>;
auto unpack_transfer_response(std::span<const uint8_t> body)
  -> tl::expected<TransferResponse, Error>;
auto unpack_filename(std::span<const uint8_t> body)
  -> tl::expected<std::string, Error>;
auto unpack_place_in_queue_response(std::span<const uint8_t> body)
  -> tl::expected<PlaceInQueueResponse, Error>;
auto unpack_upload_denied(std::span<const uint8_t> body)
  -> tl::expected<UploadDenied, Error>;

// File connection handshake (raw, unframed)
auto unpack_file_transfer_init(std::span<const uint8_t> bytes)
  -> tl::expected<FileTransferInit, Error>;
auto unpack_file_offset(std::span<const uint8_t> bytes)
  -> tl::expected<FileOffset, Error>;

}  // namespace slsk::proto
