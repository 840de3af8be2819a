#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "proto/types.hpp"

namespace slsk::proto {

// Server messages, client -> server
auto pack_login(const LoginRequest& msg) -> std::vector<uint8_t>;
auto pack_set_wait_port(uint32_t port) -> std::vector<uint8_t>;
auto pack_get_peer_address(std::string_view username) -> std::vector<uint8_t>;
auto pack_connect_to_peer(
  uint32_t token, std::string_view username, std::string_view type
) -> std::vector<uint8_t>;
auto pack_file_search(const FileSearch& msg) -> std::vector<uint8_t>;
auto pack_set_status(UserStatus status) -> std::vector<uint8_t>;
auto pack_server_ping() -> std::vector<uint8_t>;
auto pack_shared_folders_files(uint32_t folders, uint32_t files)
  -> std::vector<uint8_t>;
auto pack_have_no_parent(bool have_no_parent) -> std::vector<uint8_t>;

// Server messages, server -> client
auto pack_login_response(const LoginResponse& msg) -> std::vector<uint8_t>;
auto pack_peer_address(const PeerAddress& msg) -> std::vector<uint8_t>;
auto pack_connect_to_peer_request(const ConnectToPeer& msg)
  -> std::vector<uint8_t>;
auto pack_cant_connect_to_peer(uint32_t token) -> std::vector<uint8_t>;
auto pack_relogged() -> std::vector<uint8_t>;

// Peer init messages
auto pack_peer_init(const PeerInit& msg) -> std::vector<uint8_t>;
auto pack_pierce_firewall(uint32_t token) -> std::vector<uint8_t>;

// Peer messages
auto pack_file_search_response(const FileSearchResponse& msg)
  -> std::vector<uint8_t>;
auto pack_transfer_request(const TransferRequest& msg) -> std::vector<uint8_t>;
auto pack_transfer_response(const TransferResponse& msg)
  -> std::vector<uint8_t>;
auto pack_queue_upload(std::string_view filename) -> std::vector<uint8_t>;
auto pack_place_in_queue_request(std::string_view filename)
  -> std::vector<uint8_t>;
auto pack_place_in_queue_response(const PlaceInQueueResponse& msg)
  -> std::vector<uint8_t>;
auto pack_upload_denied(const UploadDenied& msg) -> std::vector<uint8_t>;
auto pack_upload_failed(std::string_view filename) -> std::vector<uint8_t>;

// File connection handshake (raw, unframed)
auto pack_file_transfer_init(uint32_t token) -> std::vector<uint8_t>;
auto pack_file_offset(uint64_t offset) -> std::vector<uint8_t>;


namespace internal {

/**
 * @brief Prepend the length prefix and message code of the given kind
 */
auto pack_frame(FrameKind kind, uint32_t code, std::vector<uint8_t> body)
  -> std::vector<uint8_t>;

}  // namespace internal

}  // namespace slsk::proto
