#include "client/peers.hpp"

#include <utility>

#include <asio/error.hpp>
#include <asio/ip/address_v4.hpp>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>

#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"
#include "proto/utils.hpp"

namespace slsk::client {

namespace {

auto to_host(uint32_t ip) -> std::string
{
    return asio::ip::address_v4(ip).to_string();
}

}  // namespace

PeerConnections::PeerConnections(
  asio::io_context& io,
  net::ConnectionManager& connections,
  Session& session,
  TokenGenerator& tokens,
  const Config& config
) :
  _io(io),
  _connections(connections),
  _session(session),
  _tokens(tokens),
  _config(config)
{
    _session.subscribe(proto::ServerCode::GetPeerAddress, [this](auto& frame) {
        return _on_peer_address(frame);
    });
    _session.subscribe(proto::ServerCode::ConnectToPeer, [this](auto& frame) {
        return _on_connect_to_peer(frame);
    });
    _session.subscribe(proto::ServerCode::CantConnectToPeer, [this](auto& frame) {
        return _on_cant_connect_to_peer(frame);
    });

    _connections.on_accept([this](ConnectionPtr connection) {
        _on_accept(std::move(connection));
    });
}

auto PeerConnections::connect(
  const std::string& username, Completion<ConnectionPtr> done
) -> void
{
    if (auto peer = _peers.find(username); peer != _peers.end()) {
        if (peer->second->is_open()) {
            spdlog::debug("Reusing connection to {}", username);
            done(peer->second);
            return;
        }
        _peers.erase(peer);
    }

    if (auto pending = _pending.find(username); pending != _pending.end()) {
        pending->second->waiters.push_back(std::move(done));
        return;
    }

    auto pending = std::make_shared<PendingPeer>(_io);
    pending->waiters.push_back(std::move(done));
    _pending.emplace(username, pending);

    spdlog::debug("Looking up address of {}", username);

    if (auto sent = _session.send(proto::pack_get_peer_address(username));
        not sent) {
        _complete(
          username, tl::make_unexpected(make_error(
                      ErrorKind::PeerUnreachable, "Can't look up {}: {}",
                      username, sent.error().message()
                    ))
        );
        return;
    }

    _arm_timer(username, "address lookup");
}

auto PeerConnections::subscribe(proto::PeerCode code, MessageHandler handler)
  -> void
{
    _handlers[static_cast<uint32_t>(code)] = std::move(handler);
}

auto PeerConnections::on_file_connection(FileConnectionHandler handler) -> void
{
    _on_file = std::move(handler);
}

auto PeerConnections::reset() -> void
{
    auto pending = std::move(_pending);
    auto peers = std::move(_peers);
    _pending.clear();
    _indirect.clear();
    _peers.clear();

    for (auto& [username, connection] : peers) {
        connection->close(asio::error::operation_aborted);
    }

    for (auto& [username, peer] : pending) {
        peer->timer.cancel();

        for (auto& waiter : peer->waiters) {
            waiter(tl::make_unexpected(make_error(
              ErrorKind::Connection, "Disconnected while connecting to {}",
              username
            )));
        }
    }
}

auto PeerConnections::_on_accept(ConnectionPtr connection) -> void
{
    std::weak_ptr<net::Connection> weak = connection;

    connection->on_frame([this, weak](const proto::Frame& frame)
                           -> tl::expected<void, proto::Error> {
        if (auto connection = weak.lock()) {
            return _on_init_frame(connection, frame);
        }
        return {};
    });
    connection->start();
}

auto PeerConnections::_on_init_frame(
  const ConnectionPtr& connection, const proto::Frame& frame
) -> tl::expected<void, proto::Error>
{
    if (frame.is(proto::PeerInitCode::PeerInit)) {
        SLSK_READ(init, proto::unpack_peer_init(frame.body));

        spdlog::debug(
          "[{}] {} connected to us, type {}", connection->id(), init->username,
          init->type
        );

        if (init->type == proto::connection_type::PEER) {
            _attach_peer(init->username, connection);
        }
        else if (init->type == proto::connection_type::FILE) {
            _attach_file(init->username, connection);
        }
        else {
            spdlog::debug(
              "Connection type {} from {} not supported", init->type,
              init->username
            );
            connection->close();
        }

        return {};
    }

    SLSK_READ(pierce, proto::unpack_pierce_firewall(frame.body));

    auto indirect = _indirect.find(pierce->token);
    if (indirect == _indirect.end()) {
        spdlog::debug(
          "[{}] Firewall pierce with unknown token {}", connection->id(),
          pierce->token
        );
        connection->close();
        return {};
    }

    auto username = indirect->second;
    spdlog::debug("[{}] {} pierced our firewall", connection->id(), username);

    _attach_peer(username, connection);
    _complete(username, connection);

    return {};
}

auto PeerConnections::_on_peer_address(const proto::Frame& frame)
  -> tl::expected<void, proto::Error>
{
    SLSK_READ(address, proto::unpack_peer_address(frame.body));

    auto pending = _pending.find(address->username);
    if (pending == _pending.end() or pending->second->address_known) {
        return {};
    }
    pending->second->address_known = true;

    if (address->ip == 0 and address->port == 0) {
        _complete(
          address->username,
          tl::make_unexpected(make_error(
            ErrorKind::PeerUnreachable, "{} is offline", address->username
          ))
        );
        return {};
    }

    pending->second->timer.cancel();
    _connect_direct(address->username, address->ip, address->port);

    return {};
}

auto PeerConnections::_on_connect_to_peer(const proto::Frame& frame)
  -> tl::expected<void, proto::Error>
{
    SLSK_READ(request, proto::unpack_connect_to_peer(frame.body));

    if (request->type != proto::connection_type::PEER and
        request->type != proto::connection_type::FILE) {
        spdlog::debug(
          "Connection type {} requested by {} not supported", request->type,
          request->username
        );
        return {};
    }

    spdlog::debug(
      "{} asks for a {} connection to {}:{}", request->username, request->type,
      to_host(request->ip), request->port
    );

    _connections.open(
      to_host(request->ip), uint16_t(request->port), proto::FrameKind::Peer,
      _config.connect_timeout,
      [this, peer = std::move(*request)](auto&& result) {
          if (not result) {
              spdlog::debug(
                "Can't reach {} for its {} connection: {}", peer.username,
                peer.type, result.error().message()
              );
              return;
          }

          const auto& connection = *result;
          if (auto sent = connection->send(proto::pack_pierce_firewall(peer.token));
              not sent) {
              connection->close();
              return;
          }

          if (peer.type == proto::connection_type::PEER) {
              _attach_peer(peer.username, connection);
          }
          else {
              _attach_file(peer.username, connection);
          }

          connection->start();
      }
    );

    return {};
}

auto PeerConnections::_on_cant_connect_to_peer(const proto::Frame& frame)
  -> tl::expected<void, proto::Error>
{
    SLSK_READ(token, proto::unpack_cant_connect_to_peer(frame.body));

    auto indirect = _indirect.find(*token);
    if (indirect == _indirect.end()) {
        return {};
    }

    auto username = indirect->second;
    _complete(
      username, tl::make_unexpected(make_error(
                  ErrorKind::PeerUnreachable, "Can't connect to {}", username
                ))
    );

    return {};
}

auto PeerConnections::_connect_direct(
  const std::string& username, uint32_t ip, uint32_t port
) -> void
{
    spdlog::debug("Connecting to {} at {}:{}", username, to_host(ip), port);

    _connections.open(
      to_host(ip), uint16_t(port), proto::FrameKind::Peer,
      _config.connect_timeout,
      [this, username](auto&& result) {
          if (not _pending.contains(username)) {
              if (result) {
                  (*result)->close();
              }
              return;
          }

          if (not result) {
              spdlog::debug(
                "Direct connection to {} failed: {}", username,
                result.error().message()
              );
              _connect_indirect(username);
              return;
          }

          const auto& connection = *result;
          auto sent = connection->send(proto::pack_peer_init(proto::PeerInit{
            .username = _own_username(),
            .type = std::string(proto::connection_type::PEER),
            .token = 0,
          }));
          if (not sent) {
              connection->close();
              _connect_indirect(username);
              return;
          }

          _attach_peer(username, connection);
          connection->start();
          _complete(username, connection);
      }
    );
}

auto PeerConnections::_connect_indirect(const std::string& username) -> void
{
    auto pending = _pending.find(username);
    if (pending == _pending.end()) {
        return;
    }

    const auto token = _tokens.next_unused([this](uint32_t token) {
        return _indirect.contains(token);
    });
    pending->second->indirect_token = token;
    _indirect.emplace(token, username);

    spdlog::debug("Asking the server for an indirect connection to {}", username);

    auto sent = _session.send(proto::pack_connect_to_peer(
      token, username, proto::connection_type::PEER
    ));
    if (not sent) {
        _complete(
          username, tl::make_unexpected(make_error(
                      ErrorKind::PeerUnreachable, "Can't reach {}: {}",
                      username, sent.error().message()
                    ))
        );
        return;
    }

    _arm_timer(username, "indirect connection");
}

auto PeerConnections::_arm_timer(const std::string& username, const char* phase)
  -> void
{
    auto pending = _pending.at(username);
    std::weak_ptr<PendingPeer> weak = pending;

    pending->timer.expires_after(_config.connect_timeout);
    pending->timer.async_wait([this, username, weak, phase](auto ec) {
        auto pending = weak.lock();
        if (ec or not pending) {
            return;
        }

        if (auto current = _pending.find(username);
            current == _pending.end() or current->second != pending) {
            return;
        }

        _complete(
          username, tl::make_unexpected(make_error(
                      ErrorKind::PeerUnreachable, "No connection to {}: {} timed out",
                      username, phase
                    ))
        );
    });
}

auto PeerConnections::_attach_peer(
  const std::string& username, const ConnectionPtr& connection
) -> void
{
    std::weak_ptr<net::Connection> weak = connection;
    const auto* raw = connection.get();

    connection->set_frame_kind(proto::FrameKind::Peer);
    connection->on_frame([this, username, weak](const proto::Frame& frame)
                           -> tl::expected<void, proto::Error> {
        if (auto connection = weak.lock()) {
            return _on_peer_frame(username, connection, frame);
        }
        return {};
    });
    connection->on_close([this, username, raw](auto) {
        if (auto peer = _peers.find(username);
            peer != _peers.end() and peer->second.get() == raw) {
            _peers.erase(peer);
        }
    });

    _peers[username] = connection;
}

auto PeerConnections::_attach_file(
  const std::string& username, const ConnectionPtr& connection
) -> void
{
    connection->set_raw_mode();

    if (not _on_file) {
        connection->close();
        return;
    }

    _on_file(username, connection);
}

auto PeerConnections::_on_peer_frame(
  const std::string& username,
  const ConnectionPtr& connection,
  const proto::Frame& frame
) -> tl::expected<void, proto::Error>
{
    auto handler = _handlers.find(frame.code);

    if (handler == _handlers.end()) {
        spdlog::trace(
          "{} sent {}, ignored", username,
          magic_enum::enum_name(static_cast<proto::PeerCode>(frame.code))
        );
        return {};
    }

    return handler->second(username, connection, frame);
}

auto PeerConnections::_complete(
  const std::string& username, Result<ConnectionPtr> result
) -> void
{
    auto pending = _pending.find(username);
    if (pending == _pending.end()) {
        return;
    }

    auto peer = pending->second;
    _pending.erase(pending);

    if (peer->indirect_token != 0) {
        _indirect.erase(peer->indirect_token);
    }
    peer->timer.cancel();

    if (not result) {
        spdlog::debug("Connection to {} failed", username);
    }

    for (auto& waiter : peer->waiters) {
        waiter(result);
    }
}

auto PeerConnections::_own_username() const -> std::string
{
    return _session.status().username.value_or("");
}

}  // namespace slsk::client
