#include "tests/fake_network.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <asio/post.hpp>

#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"
#include "proto/utils.hpp"

namespace slsk::testing {

auto FrameLog::record(uint32_t code) -> void
{
    {
        std::lock_guard lock(_mutex);
        _counts[code] += 1;
    }
    _changed.notify_all();
}

auto FrameLog::count(uint32_t code) const -> std::size_t
{
    std::lock_guard lock(_mutex);
    auto found = _counts.find(code);
    return found == _counts.end() ? 0 : found->second;
}

auto FrameLog::wait_for(
  uint32_t code, std::size_t n, std::chrono::milliseconds timeout
) const -> bool
{
    std::unique_lock lock(_mutex);
    return _changed.wait_for(lock, timeout, [&] {
        auto found = _counts.find(code);
        return found != _counts.end() and found->second >= n;
    });
}


FakeServer::FakeServer() :
  _work(asio::make_work_guard(_io)), _connections(_io)
{
    _connections.on_accept([this](ConnectionPtr client) {
        std::weak_ptr<net::Connection> weak = client;

        client->set_frame_kind(proto::FrameKind::Server);
        client->on_frame([this, weak](const proto::Frame& frame) {
            auto client = weak.lock();
            if (not client) {
                return tl::expected<void, proto::Error>{};
            }
            return _on_frame(client, frame);
        });

        {
            std::lock_guard lock(_mutex);
            _client = client;
        }

        client->start();
    });

    _port = _connections.listen(0);
    _loop = std::jthread([this] { _io.run(); });
}

FakeServer::~FakeServer()
{
    _work.reset();
    _io.stop();
    _loop.join();
}

auto FakeServer::set_login_reply(LoginReply reply) -> void
{
    std::lock_guard lock(_mutex);
    _login_reply = reply;
}

auto FakeServer::add_peer(const std::string& username, uint16_t port) -> void
{
    std::lock_guard lock(_mutex);
    _peers[username] = port;
}

auto FakeServer::on_search(SearchHandler handler) -> void
{
    std::lock_guard lock(_mutex);
    _on_search = std::move(handler);
}

auto FakeServer::on_connect_to_peer(ConnectToPeerHandler handler) -> void
{
    std::lock_guard lock(_mutex);
    _on_connect_to_peer = std::move(handler);
}

auto FakeServer::send_to_client(std::vector<uint8_t> frame) -> void
{
    std::shared_ptr<net::Connection> client;
    {
        std::lock_guard lock(_mutex);
        client = _client.lock();
    }

    if (client) {
        (void)client->send(std::move(frame));
    }
}

auto FakeServer::count(proto::ServerCode code) const -> std::size_t
{
    return _log.count(uint32_t(code));
}

auto FakeServer::wait_for(
  proto::ServerCode code, std::size_t n, std::chrono::milliseconds timeout
) const -> bool
{
    return _log.wait_for(uint32_t(code), n, timeout);
}

auto FakeServer::last_login() const -> std::optional<proto::LoginRequest>
{
    std::lock_guard lock(_mutex);
    return _last_login;
}

auto FakeServer::last_search() const -> std::optional<proto::FileSearch>
{
    std::lock_guard lock(_mutex);
    return _last_search;
}

auto FakeServer::_on_frame(const ConnectionPtr& client, const proto::Frame& frame)
  -> tl::expected<void, proto::Error>
{
    using proto::ServerCode;

    _log.record(frame.code);

    if (frame.is(ServerCode::Login)) {
        SLSK_READ(login, proto::unpack_login(frame.body));

        LoginReply reply;
        {
            std::lock_guard lock(_mutex);
            _last_login = *login;
            reply = _login_reply;
        }

        if (reply == LoginReply::Accept) {
            (void)client->send(proto::pack_login_response(proto::LoginResponse{
              .success = true, .greeting = "Welcome", .ip = LOCALHOST
            }));
        }
        else if (reply == LoginReply::Reject) {
            (void)client->send(proto::pack_login_response(
              proto::LoginResponse{.success = false, .reason = "INVALIDPASS"}
            ));
        }
    }
    else if (frame.is(ServerCode::GetPeerAddress)) {
        SLSK_READ(username, proto::unpack_get_peer_address(frame.body));

        proto::PeerAddress address{.username = *username};
        {
            std::lock_guard lock(_mutex);
            if (auto peer = _peers.find(*username); peer != _peers.end()) {
                address.ip = LOCALHOST;
                address.port = peer->second;
            }
        }

        (void)client->send(proto::pack_peer_address(address));
    }
    else if (frame.is(ServerCode::FileSearch)) {
        SLSK_READ(search, proto::unpack_file_search(frame.body));

        SearchHandler handler;
        {
            std::lock_guard lock(_mutex);
            _last_search = *search;
            handler = _on_search;
        }

        if (handler) {
            handler(search->token, search->query);
        }
    }
    else if (frame.is(ServerCode::ConnectToPeer)) {
        SLSK_READ(request, proto::unpack_connect_to_peer_request(frame.body));

        ConnectToPeerHandler handler;
        {
            std::lock_guard lock(_mutex);
            handler = _on_connect_to_peer;
        }

        if (handler) {
            handler(*request);
        }
    }

    return {};
}


FakePeer::FakePeer(std::string username, std::string content, Behaviour behaviour) :
  _username(std::move(username)),
  _content(std::move(content)),
  _behaviour(behaviour),
  _work(asio::make_work_guard(_io)),
  _connections(_io)
{
    _connections.on_accept([this](ConnectionPtr client) {
        std::weak_ptr<net::Connection> weak = client;

        client->on_frame([this, weak](const proto::Frame& frame) {
            auto client = weak.lock();
            if (not client) {
                return tl::expected<void, proto::Error>{};
            }
            return _on_frame(client, frame);
        });

        client->start();
    });

    _port = _connections.listen(0);
    _loop = std::jthread([this] { _io.run(); });
}

FakePeer::~FakePeer()
{
    _work.reset();
    _io.stop();
    _loop.join();
}

auto FakePeer::set_client_port(uint16_t port) -> void
{
    std::lock_guard lock(_mutex);
    _client_port = port;
}

auto FakePeer::break_after(std::size_t bytes) -> void
{
    std::lock_guard lock(_mutex);
    _break_after = bytes;
}

auto FakePeer::send_search_results(
  uint32_t token,
  std::vector<proto::SharedFile> files,
  bool slots_free,
  uint32_t avg_speed
) -> void
{
    proto::FileSearchResponse response{
      .username = _username,
      .token = token,
      .files = std::move(files),
      .slots_free = slots_free,
      .avg_speed = avg_speed,
      .queue_length = 0,
    };

    _open_to_client([response = std::move(response)](const ConnectionPtr& client) {
        (void)client->send(proto::pack_peer_init(
          proto::PeerInit{.username = response.username, .type = "P", .token = 0}
        ));
        (void)client->send(proto::pack_file_search_response(response));
    });
}

auto FakePeer::pierce_firewall(uint32_t token) -> void
{
    _open_to_client([token](const ConnectionPtr& client) {
        (void)client->send(proto::pack_pierce_firewall(token));
    });
}

auto FakePeer::request_upload(std::string filename) -> void
{
    _open_to_client([this, filename = std::move(filename)](const ConnectionPtr& client) {
        (void)client->send(proto::pack_peer_init(
          proto::PeerInit{.username = _username, .type = "P", .token = 0}
        ));
        (void)client->send(proto::pack_queue_upload(filename));
    });
}

auto FakePeer::count(proto::PeerCode code) const -> std::size_t
{
    return _log.count(uint32_t(code));
}

auto FakePeer::wait_for(
  proto::PeerCode code, std::size_t n, std::chrono::milliseconds timeout
) const -> bool
{
    return _log.wait_for(uint32_t(code), n, timeout);
}

auto FakePeer::last_denial() const -> std::optional<proto::UploadDenied>
{
    std::lock_guard lock(_mutex);
    return _last_denial;
}

auto FakePeer::open_connections() const -> std::size_t
{
    return _connections.open_count();
}

auto FakePeer::_open_to_client(std::function<void(const ConnectionPtr&)> then)
  -> void
{
    asio::post(_io, [this, then = std::move(then)] {
        uint16_t port;
        {
            std::lock_guard lock(_mutex);
            port = _client_port;
        }

        _connections.open(
          "127.0.0.1", port, proto::FrameKind::Peer, 5s,
          [this, then](auto opened) {
              if (not opened) {
                  return;
              }

              auto client = *opened;
              std::weak_ptr<net::Connection> weak = client;

              client->on_frame([this, weak](const proto::Frame& frame) {
                  auto client = weak.lock();
                  if (not client) {
                      return tl::expected<void, proto::Error>{};
                  }
                  return _on_frame(client, frame);
              });

              then(client);
              client->start();
          }
        );
    });
}

auto FakePeer::_on_frame(const ConnectionPtr& client, const proto::Frame& frame)
  -> tl::expected<void, proto::Error>
{
    using proto::PeerCode;

    if (frame.kind == proto::FrameKind::PeerInit) {
        SLSK_READ(init, proto::unpack_peer_init(frame.body));
        client->set_frame_kind(proto::FrameKind::Peer);
        return {};
    }

    _log.record(frame.code);

    if (frame.is(PeerCode::QueueUpload)) {
        SLSK_READ(filename, proto::unpack_filename(frame.body));

        switch (_behaviour) {
        case Behaviour::Serve: {
            uint32_t token;
            {
                std::lock_guard lock(_mutex);
                token = _next_token++;
                _offered[token] = *filename;
            }

            (void)client->send(proto::pack_place_in_queue_response(
              proto::PlaceInQueueResponse{.filename = *filename, .place = 1}
            ));
            (void)client->send(proto::pack_transfer_request(proto::TransferRequest{
              .direction = proto::TransferDirection::Upload,
              .token = token,
              .filename = *filename,
              .size = _content.size(),
            }));
            break;
        }
        case Behaviour::Deny:
            (void)client->send(proto::pack_upload_denied(proto::UploadDenied{
              .filename = *filename, .reason = "File not shared."
            }));
            break;
        case Behaviour::Fail:
            (void)client->send(proto::pack_upload_failed(*filename));
            break;
        case Behaviour::Silent:
            break;
        }
    }
    else if (frame.is(PeerCode::TransferResponse)) {
        SLSK_READ(response, proto::unpack_transfer_response(frame.body));

        bool offered;
        {
            std::lock_guard lock(_mutex);
            offered = _offered.contains(response->token);
        }

        if (response->allowed and offered) {
            _send_file(response->token);
        }
    }
    else if (frame.is(PeerCode::UploadDenied)) {
        SLSK_READ(denied, proto::unpack_upload_denied(frame.body));

        std::lock_guard lock(_mutex);
        _last_denial = *denied;
    }

    return {};
}

auto FakePeer::_send_file(uint32_t token) -> void
{
    _open_to_client([this, token](const ConnectionPtr& client) {
        auto received = std::make_shared<std::vector<uint8_t>>();
        std::weak_ptr<net::Connection> weak = client;

        (void)client->send(proto::pack_peer_init(
          proto::PeerInit{.username = _username, .type = "F", .token = 0}
        ));
        (void)client->send(proto::pack_file_transfer_init(token));

        // the downloader answers with the offset to start from
        client->set_raw_mode();
        client->on_data([this, weak, received](std::span<const uint8_t> data) {
            auto client = weak.lock();
            if (not client or received->size() >= proto::FileOffset::SIZE) {
                return;
            }

            received->insert(received->end(), data.begin(), data.end());

            auto offset = proto::unpack_file_offset(*received);
            if (not offset) {
                return;
            }

            std::size_t end = _content.size();
            {
                std::lock_guard lock(_mutex);
                if (_break_after) {
                    end = std::min(end, *_break_after);
                }
            }
            const auto begin = std::min<std::size_t>(offset->offset, end);

            (void)client->send(std::vector<uint8_t>(
              std::next(_content.begin(), std::ptrdiff_t(begin)),
              std::next(_content.begin(), std::ptrdiff_t(end))
            ));
            client->finish();
        });
    });
}

}  // namespace slsk::testing
