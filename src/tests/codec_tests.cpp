#include <algorithm>
#include <cassert>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "misc/filename.hpp"
#include "misc/md5.hpp"
#include "proto/compress.hpp"
#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"
#include "tests/tests.hpp"

using namespace slsk;

void test_pack_integers();
void test_frame_reassembly();
void test_unknown_code_is_skipped();
void test_frame_too_large();
void test_truncated_body();
void test_login_messages();
void test_peer_init_frames();
void test_search_response();
void test_transfer_messages();
void test_md5();
void test_saved_filename();

void codec_tests()
{
    test_pack_integers();
    test_frame_reassembly();
    test_unknown_code_is_skipped();
    test_frame_too_large();
    test_truncated_body();
    test_login_messages();
    test_peer_init_frames();
    test_search_response();
    test_transfer_messages();
    test_md5();
    test_saved_filename();

    spdlog::debug("Codec tests passed");
}

void test_pack_integers()
{
    using namespace proto::utils;

    {
        Buffer packed;
        pack_u32(packed, 0x01020304);
        assert((packed == Buffer{0x04, 0x03, 0x02, 0x01}));
        assert(unpack_u32(packed) == 0x01020304);
    }

    {  // 127.0.0.1 travels as a little-endian integer
        Buffer packed;
        pack_u32(packed, testing::LOCALHOST);
        assert((packed == Buffer{0x01, 0x00, 0x00, 0x7F}));
    }

    {
        Buffer packed;
        pack_u64(packed, 0x0000000100000002);
        assert((packed == Buffer{2, 0, 0, 0, 1, 0, 0, 0}));
        assert(unpack_u64(packed) == 0x0000000100000002);
    }

    {
        Buffer packed;
        pack_string(packed, "abc");
        assert((packed == Buffer{3, 0, 0, 0, 'a', 'b', 'c'}));
    }

    {  // the keep-alive ping is a bare code
        auto ping = proto::pack_server_ping();
        assert((ping == Buffer{4, 0, 0, 0, 32, 0, 0, 0}));
    }
}

void test_frame_reassembly()
{
    using namespace proto;

    auto message = pack_login_response(
      LoginResponse{.success = true, .greeting = "hi", .ip = testing::LOCALHOST}
    );

    std::vector<uint8_t> buffer(message.begin(), message.begin() + 3);

    {  // shorter than the length prefix
        auto frame = unpack_frame(buffer, FrameKind::Server);
        assert(not frame);
        assert(frame.error() == Error::INCOMPLETE_MESSAGE);
        assert(buffer.size() == 3);
    }

    buffer.insert(buffer.end(), message.begin() + 3, message.end() - 1);

    {  // one byte missing
        auto frame = unpack_frame(buffer, FrameKind::Server);
        assert(not frame);
        assert(frame.error() == Error::INCOMPLETE_MESSAGE);
        assert(buffer.size() == message.size() - 1);
    }

    buffer.push_back(message.back());

    // the next frame starts right behind
    auto ping = pack_server_ping();
    buffer.insert(buffer.end(), ping.begin(), ping.end());

    {
        auto frame = unpack_frame(buffer, FrameKind::Server);
        assert(frame);
        assert(frame->is(ServerCode::Login));
        assert(buffer.size() == ping.size());

        auto response = unpack_login_response(frame->body);
        assert(response);
        assert(response->success);
        assert(response->greeting == "hi");
        assert(response->ip == testing::LOCALHOST);
    }

    {
        auto frame = unpack_frame(buffer, FrameKind::Server);
        assert(frame);
        assert(frame->is(ServerCode::ServerPing));
        assert(frame->body.empty());
        assert(buffer.empty());
    }
}

void test_unknown_code_is_skipped()
{
    using namespace proto;

    auto buffer = internal::pack_frame(FrameKind::Peer, 9999, {1, 2, 3});
    auto next = pack_upload_failed("music/song.mp3");
    buffer.insert(buffer.end(), next.begin(), next.end());

    {
        auto frame = unpack_frame(buffer, FrameKind::Peer);
        assert(not frame);
        assert(frame.error() == Error::UNKNOWN_MESSAGE_CODE);
        assert(buffer.size() == next.size());
    }

    {
        auto frame = unpack_frame(buffer, FrameKind::Peer);
        assert(frame);
        assert(frame->is(PeerCode::UploadFailed));

        auto filename = unpack_filename(frame->body);
        assert(filename);
        assert(*filename == "music/song.mp3");
    }

    {  // a length too short for the code is malformed, and dropped as well
        std::vector<uint8_t> buffer{2, 0, 0, 0, 40, 0};
        auto frame = unpack_frame(buffer, FrameKind::Peer);
        assert(not frame);
        assert(frame.error() == Error::MALFORMED_MESSAGE);
        assert(buffer.empty());
    }
}

void test_frame_too_large()
{
    using namespace proto;

    std::vector<uint8_t> buffer;
    utils::pack_u32(buffer, uint32_t(MAX_FRAME_LENGTH + 1));
    utils::pack_u32(buffer, uint32_t(PeerCode::TransferRequest));

    auto frame = unpack_frame(buffer, FrameKind::Peer);
    assert(not frame);
    assert(frame.error() == Error::FRAME_TOO_LARGE);
}

void test_truncated_body()
{
    using namespace proto;

    // direction and token, no filename
    auto buffer = internal::pack_frame(
      FrameKind::Peer, uint32_t(PeerCode::TransferRequest),
      {1, 0, 0, 0, 5, 0, 0, 0}
    );

    auto frame = unpack_frame(buffer, FrameKind::Peer);
    assert(frame);

    auto request = unpack_transfer_request(frame->body);
    assert(not request);
    assert(request.error() == Error::MALFORMED_MESSAGE);

    {  // a string length larger than the body
        std::vector<uint8_t> body{0xFF, 0xFF, 0, 0, 'a'};
        auto filename = unpack_filename(body);
        assert(not filename);
        assert(filename.error() == Error::MALFORMED_MESSAGE);
    }

    {  // unknown transfer direction
        std::vector<uint8_t> body;
        utils::pack_u32(body, 7);
        utils::pack_u32(body, 1);
        utils::pack_string(body, "a.mp3");
        auto request = unpack_transfer_request(body);
        assert(not request);
        assert(request.error() == Error::MALFORMED_MESSAGE);
    }
}

void test_login_messages()
{
    using namespace proto;

    {
        auto message =
          pack_login(LoginRequest{.username = "tester", .password = "secret"});

        auto frame = unpack_frame(message, FrameKind::Server);
        assert(frame);
        assert(frame->is(ServerCode::Login));

        auto login = unpack_login(frame->body);
        assert(login);
        assert(login->username == "tester");
        assert(login->password == "secret");
        assert(login->version == CLIENT_VERSION);
        assert(login->minor_version == CLIENT_MINOR_VERSION);
    }

    {  // the digest sits between version and minor version
        auto message =
          pack_login(LoginRequest{.username = "tester", .password = "secret"});
        const auto digest = misc::md5_hex("testersecret");

        auto found = std::search(
          message.begin(), message.end(), digest.begin(), digest.end()
        );
        assert(found != message.end());
    }

    {
        auto message = pack_login_response(
          LoginResponse{.success = false, .reason = "INVALIDPASS"}
        );
        auto frame = unpack_frame(message, FrameKind::Server);
        assert(frame);

        auto response = unpack_login_response(frame->body);
        assert(response);
        assert(not response->success);
        assert(response->reason == "INVALIDPASS");
    }

    {
        auto message = pack_peer_address(
          PeerAddress{.username = "alice", .ip = testing::LOCALHOST, .port = 2234}
        );
        auto frame = unpack_frame(message, FrameKind::Server);
        assert(frame);

        auto address = unpack_peer_address(frame->body);
        assert(address);
        assert(address->username == "alice");
        assert(address->ip == testing::LOCALHOST);
        assert(address->port == 2234);
    }

    {  // without the trailing privileged flag
        std::vector<uint8_t> body;
        utils::pack_string(body, "alice");
        utils::pack_string(body, "F");
        utils::pack_u32(body, testing::LOCALHOST);
        utils::pack_u32(body, 5000);
        utils::pack_u32(body, 42);

        auto request = unpack_connect_to_peer(body);
        assert(request);
        assert(request->username == "alice");
        assert(request->type == "F");
        assert(request->port == 5000);
        assert(request->token == 42);
        assert(not request->privileged);
    }
}

void test_peer_init_frames()
{
    using namespace proto;

    auto buffer =
      pack_peer_init(PeerInit{.username = "alice", .type = "P", .token = 0});
    auto pierce = pack_pierce_firewall(77);
    buffer.insert(buffer.end(), pierce.begin(), pierce.end());

    // one byte code after the length
    assert(buffer[4] == uint8_t(PeerInitCode::PeerInit));

    {
        auto frame = unpack_frame(buffer, FrameKind::PeerInit);
        assert(frame);
        assert(frame->is(PeerInitCode::PeerInit));

        auto init = unpack_peer_init(frame->body);
        assert(init);
        assert(init->username == "alice");
        assert(init->type == connection_type::PEER);
        assert(init->token == 0);
    }

    {
        auto frame = unpack_frame(buffer, FrameKind::PeerInit);
        assert(frame);
        assert(frame->is(PeerInitCode::PierceFirewall));

        auto token = unpack_pierce_firewall(frame->body);
        assert(token);
        assert(token->token == 77);
        assert(buffer.empty());
    }
}

void test_search_response()
{
    using namespace proto;

    FileSearchResponse response{
      .username = "alice",
      .token = 1234,
      .files = {SharedFile{
        .filename = "Music\\Artist - Song.mp3",
        .size = 5'000'000,
        .extension = "mp3",
        .attributes =
          {{uint32_t(FileAttribute::Bitrate), 320},
           {uint32_t(FileAttribute::Duration), 215}},
      }},
      .slots_free = true,
      .avg_speed = 1000,
      .queue_length = 3,
    };

    auto message = pack_file_search_response(response);
    auto frame = unpack_frame(message, FrameKind::Peer);
    assert(frame);
    assert(frame->is(PeerCode::FileSearchResponse));

    {
        auto decoded = unpack_file_search_response(frame->body);
        assert(decoded);
        assert(decoded->username == "alice");
        assert(decoded->token == 1234);
        assert(decoded->files.size() == 1);
        assert(decoded->files[0].filename == "Music\\Artist - Song.mp3");
        assert(decoded->files[0].size == 5'000'000);
        assert(decoded->files[0].attribute(FileAttribute::Bitrate) == 320u);
        assert(decoded->files[0].attribute(FileAttribute::Duration) == 215u);
        assert(not decoded->files[0].attribute(FileAttribute::SampleRate));
        assert(decoded->slots_free);
        assert(decoded->avg_speed == 1000);
        assert(decoded->queue_length == 3);
        assert(decoded->locked_files.empty());
    }

    {  // the body is deflated on the wire
        auto inflated = decompress(frame->body);
        assert(inflated);
        assert(inflated->size() > 9);
        assert(std::string(inflated->begin() + 4, inflated->begin() + 9) == "alice");
    }

    {
        std::vector<uint8_t> garbage{0x78, 0x9C, 0xFF, 0x00, 0x13};
        auto decoded = unpack_file_search_response(garbage);
        assert(not decoded);
        assert(decoded.error() == Error::MALFORMED_MESSAGE);
    }

    {  // a well formed stream with a body cut short
        std::vector<uint8_t> body;
        utils::pack_string(body, "alice");
        auto decoded = unpack_file_search_response(compress(body));
        assert(not decoded);
        assert(decoded.error() == Error::MALFORMED_MESSAGE);
    }
}

void test_transfer_messages()
{
    using namespace proto;

    {
        auto message = pack_transfer_request(TransferRequest{
          .direction = TransferDirection::Upload,
          .token = 9,
          .filename = "a.flac",
          .size = 1ull << 33,
        });
        auto frame = unpack_frame(message, FrameKind::Peer);
        assert(frame);

        auto request = unpack_transfer_request(frame->body);
        assert(request);
        assert(request->direction == TransferDirection::Upload);
        assert(request->token == 9);
        assert(request->filename == "a.flac");
        assert(request->size == (1ull << 33));
    }

    {
        auto message = pack_transfer_response(TransferResponse{
          .token = 9, .allowed = false, .size = std::nullopt, .reason = "Cancelled"
        });
        auto frame = unpack_frame(message, FrameKind::Peer);
        assert(frame);

        auto response = unpack_transfer_response(frame->body);
        assert(response);
        assert(response->token == 9);
        assert(not response->allowed);
        assert(response->reason == "Cancelled");
    }

    {  // the raw file connection handshake
        auto init = pack_file_transfer_init(0x0A0B0C0D);
        assert(init.size() == FileTransferInit::SIZE);
        assert(unpack_file_transfer_init(init)->token == 0x0A0B0C0D);

        auto short_init = unpack_file_transfer_init(std::span(init).first(3));
        assert(not short_init);
        assert(short_init.error() == Error::INCOMPLETE_MESSAGE);

        auto offset = pack_file_offset(0);
        assert((offset == std::vector<uint8_t>(8, 0)));
        assert(unpack_file_offset(offset)->offset == 0);
    }
}

void test_md5()
{
    assert(misc::md5_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
    assert(misc::md5_hex("abc") == "900150983cd24fb0d6963f7d28e17f72");
}

void test_saved_filename()
{
    using utils::saved_filename;

    assert(saved_filename(R"(C:\music\Artist - Song.mp3)") == "Artist - Song.mp3");
    assert(saved_filename("music/album/01.flac") == "01.flac");
    assert(saved_filename("plain.ogg") == "plain.ogg");
    assert(saved_filename(R"(..\..\etc\passwd)") == "passwd");

    assert(not saved_filename(".."));
    assert(not saved_filename("music\\"));
    assert(not saved_filename(""));
}
