#include "proto/serialize.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include "misc/md5.hpp"
#include "proto/compress.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"

namespace slsk::proto {

using namespace internal;
using utils::Buffer;

namespace {

auto server_frame(ServerCode code, Buffer body = {}) -> Buffer
{
    return pack_frame(FrameKind::Server, uint32_t(code), std::move(body));
}

auto peer_frame(PeerCode code, Buffer body = {}) -> Buffer
{
    return pack_frame(FrameKind::Peer, uint32_t(code), std::move(body));
}

auto init_frame(PeerInitCode code, Buffer body) -> Buffer
{
    return pack_frame(FrameKind::PeerInit, uint32_t(code), std::move(body));
}

auto pack_shared_file(Buffer& body, const SharedFile& file) -> void
{
    utils::pack_u8(body, 1);
    utils::pack_string(body, file.filename);
    utils::pack_u64(body, file.size);
    utils::pack_string(body, file.extension);
    utils::pack_u32(body, uint32_t(file.attributes.size()));

    for (auto&& [code, value] : file.attributes) {
        utils::pack_u32(body, code);
        utils::pack_u32(body, value);
    }
}

}  // namespace

auto pack_login(const LoginRequest& msg) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, msg.username);
    utils::pack_string(body, msg.password);
    utils::pack_u32(body, msg.version);
    utils::pack_string(body, misc::md5_hex(msg.username + msg.password));
    utils::pack_u32(body, msg.minor_version);

    return server_frame(ServerCode::Login, std::move(body));
}

auto pack_set_wait_port(uint32_t port) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_u32(body, port);
    return server_frame(ServerCode::SetWaitPort, std::move(body));
}

auto pack_get_peer_address(std::string_view username) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, username);
    return server_frame(ServerCode::GetPeerAddress, std::move(body));
}

auto pack_connect_to_peer(
  uint32_t token, std::string_view username, std::string_view type
) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_u32(body, token);
    utils::pack_string(body, username);
    utils::pack_string(body, type);
    return server_frame(ServerCode::ConnectToPeer, std::move(body));
}

auto pack_file_search(const FileSearch& msg) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_u32(body, msg.token);
    utils::pack_string(body, msg.query);
    return server_frame(ServerCode::FileSearch, std::move(body));
}

auto pack_set_status(UserStatus status) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_u32(body, uint32_t(status));
    return server_frame(ServerCode::SetStatus, std::move(body));
}

auto pack_server_ping() -> std::vector<uint8_t>
{
    return server_frame(ServerCode::ServerPing);
}

auto pack_shared_folders_files(uint32_t folders, uint32_t files)
  -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_u32(body, folders);
    utils::pack_u32(body, files);
    return server_frame(ServerCode::SharedFoldersFiles, std::move(body));
}

auto pack_have_no_parent(bool have_no_parent) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_bool(body, have_no_parent);
    return server_frame(ServerCode::HaveNoParent, std::move(body));
}

auto pack_login_response(const LoginResponse& msg) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_bool(body, msg.success);

    if (msg.success) {
        utils::pack_string(body, msg.greeting);
        utils::pack_u32(body, msg.ip);
        utils::pack_string(body, "");  // password hash, unused by clients
        utils::pack_bool(body, false);
    }
    else {
        utils::pack_string(body, msg.reason);
    }

    return server_frame(ServerCode::Login, std::move(body));
}

auto pack_peer_address(const PeerAddress& msg) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, msg.username);
    utils::pack_u32(body, msg.ip);
    utils::pack_u32(body, msg.port);
    return server_frame(ServerCode::GetPeerAddress, std::move(body));
}

auto pack_connect_to_peer_request(const ConnectToPeer& msg)
  -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, msg.username);
    utils::pack_string(body, msg.type);
    utils::pack_u32(body, msg.ip);
    utils::pack_u32(body, msg.port);
    utils::pack_u32(body, msg.token);
    utils::pack_bool(body, msg.privileged);
    return server_frame(ServerCode::ConnectToPeer, std::move(body));
}

auto pack_cant_connect_to_peer(uint32_t token) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_u32(body, token);
    return server_frame(ServerCode::CantConnectToPeer, std::move(body));
}

auto pack_relogged() -> std::vector<uint8_t>
{
    return server_frame(ServerCode::Relogged);
}

auto pack_peer_init(const PeerInit& msg) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, msg.username);
    utils::pack_string(body, msg.type);
    utils::pack_u32(body, msg.token);
    return init_frame(PeerInitCode::PeerInit, std::move(body));
}

auto pack_pierce_firewall(uint32_t token) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_u32(body, token);
    return init_frame(PeerInitCode::PierceFirewall, std::move(body));
}

auto pack_file_search_response(const FileSearchResponse& msg)
  -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, msg.username);
    utils::pack_u32(body, msg.token);

    utils::pack_u32(body, uint32_t(msg.files.size()));
    for (auto&& file : msg.files) {
        pack_shared_file(body, file);
    }

    utils::pack_bool(body, msg.slots_free);
    utils::pack_u32(body, msg.avg_speed);
    utils::pack_u32(body, msg.queue_length);
    utils::pack_u32(body, 0);

    utils::pack_u32(body, uint32_t(msg.locked_files.size()));
    for (auto&& file : msg.locked_files) {
        pack_shared_file(body, file);
    }

    return peer_frame(PeerCode::FileSearchResponse, compress(body));
}

auto pack_transfer_request(const TransferRequest& msg) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_u32(body, uint32_t(msg.direction));
    utils::pack_u32(body, msg.token);
    utils::pack_string(body, msg.filename);

    if (msg.direction == TransferDirection::Upload) {
        utils::pack_u64(body, msg.size.value_or(0));
    }

    return peer_frame(PeerCode::TransferRequest, std::move(body));
}

auto pack_transfer_response(const TransferResponse& msg)
  -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_u32(body, msg.token);
    utils::pack_bool(body, msg.allowed);

    if (msg.allowed and msg.size) {
        utils::pack_u64(body, *msg.size);
    }
    else if (not msg.allowed) {
        utils::pack_string(body, msg.reason);
    }

    return peer_frame(PeerCode::TransferResponse, std::move(body));
}

auto pack_queue_upload(std::string_view filename) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, filename);
    return peer_frame(PeerCode::QueueUpload, std::move(body));
}

auto pack_place_in_queue_request(std::string_view filename)
  -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, filename);
    return peer_frame(PeerCode::PlaceInQueueRequest, std::move(body));
}

auto pack_place_in_queue_response(const PlaceInQueueResponse& msg)
  -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, msg.filename);
    utils::pack_u32(body, msg.place);
    return peer_frame(PeerCode::PlaceInQueueResponse, std::move(body));
}

auto pack_upload_denied(const UploadDenied& msg) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, msg.filename);
    utils::pack_string(body, msg.reason);
    return peer_frame(PeerCode::UploadDenied, std::move(body));
}

auto pack_upload_failed(std::string_view filename) -> std::vector<uint8_t>
{
    Buffer body;
    utils::pack_string(body, filename);
    return peer_frame(PeerCode::UploadFailed, std::move(body));
}

auto pack_file_transfer_init(uint32_t token) -> std::vector<uint8_t>
{
    Buffer packed;
    utils::pack_u32(packed, token);
    return packed;
}

auto pack_file_offset(uint64_t offset) -> std::vector<uint8_t>
{
    Buffer packed;
    utils::pack_u64(packed, offset);
    return packed;
}

}  // namespace slsk::proto


namespace slsk::proto::internal {

auto pack_frame(FrameKind kind, uint32_t code, std::vector<uint8_t> body)
  -> std::vector<uint8_t>
{
    const std::size_t code_size = kind == FrameKind::PeerInit ? 1 : 4;

    std::vector<uint8_t> packed;
    packed.reserve(4 + code_size + body.size());

    utils::pack_u32(packed, uint32_t(code_size + body.size()));

    if (kind == FrameKind::PeerInit) {
        utils::pack_u8(packed, uint8_t(code));
    }
    else {
        utils::pack_u32(packed, code);
    }

    packed.insert(packed.end(), body.begin(), body.end());
    return packed;
}

}  // namespace slsk::proto::internal
