#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <tl/expected.hpp>

#include "client/config.hpp"
#include "client/errors.hpp"
#include "client/session.hpp"
#include "client/token.hpp"
#include "net/connection.hpp"
#include "net/connection_manager.hpp"
#include "proto/types.hpp"

namespace slsk::client {

/**
 * @brief Peer message ("P") and file ("F") connections to other users
 *
 * Outbound P connections are direct when the peer is reachable, otherwise
 * the server is asked to make the peer connect to us (the peer then pierces
 * our firewall with the request token). One P connection per peer is kept
 * and reused. Everything runs on the event loop.
 */
class PeerConnections
{
 public:
    using ConnectionPtr = std::shared_ptr<net::Connection>;
    using MessageHandler = std::function<tl::expected<void, proto::Error>(
      const std::string& /* username */,
      const ConnectionPtr& /* connection */,
      const proto::Frame& /* frame */
    )>;

    /**
     * @brief Receives file connections, already in raw mode. Install the
     * data handler before returning: buffered bytes follow right away.
     */
    using FileConnectionHandler = std::function<void(
      const std::string& /* username */, const ConnectionPtr& /* connection */
    )>;

    PeerConnections(
      asio::io_context& io,
      net::ConnectionManager& connections,
      Session& session,
      TokenGenerator& tokens,
      const Config& config
    );

    PeerConnections(const PeerConnections&) = delete;
    auto operator=(const PeerConnections&) -> PeerConnections& = delete;

    /**
     * @brief Open (or reuse) the P connection to a peer, PeerUnreachable
     * when the peer is offline or no connection path works in time
     */
    auto connect(const std::string& username, Completion<ConnectionPtr> done)
      -> void;

    auto subscribe(proto::PeerCode code, MessageHandler handler) -> void;
    auto on_file_connection(FileConnectionHandler handler) -> void;

    /**
     * @brief Fail pending connects and close every P connection
     */
    auto reset() -> void;

 private:
    struct PendingPeer
    {
        explicit PendingPeer(asio::io_context& io) : timer(io) {}

        std::vector<Completion<ConnectionPtr>> waiters;
        asio::steady_timer timer;
        bool address_known = false;
        uint32_t indirect_token = 0;
    };

    auto _on_accept(ConnectionPtr connection) -> void;
    auto _on_init_frame(const ConnectionPtr& connection, const proto::Frame& frame)
      -> tl::expected<void, proto::Error>;

    auto _on_peer_address(const proto::Frame& frame)
      -> tl::expected<void, proto::Error>;
    auto _on_connect_to_peer(const proto::Frame& frame)
      -> tl::expected<void, proto::Error>;
    auto _on_cant_connect_to_peer(const proto::Frame& frame)
      -> tl::expected<void, proto::Error>;

    auto _connect_direct(const std::string& username, uint32_t ip, uint32_t port)
      -> void;
    auto _connect_indirect(const std::string& username) -> void;
    auto _arm_timer(const std::string& username, const char* phase) -> void;

    auto _attach_peer(const std::string& username, const ConnectionPtr& connection)
      -> void;
    auto _attach_file(const std::string& username, const ConnectionPtr& connection)
      -> void;
    auto _on_peer_frame(
      const std::string& username,
      const ConnectionPtr& connection,
      const proto::Frame& frame
    ) -> tl::expected<void, proto::Error>;

    auto _complete(const std::string& username, Result<ConnectionPtr> result)
      -> void;
    auto _own_username() const -> std::string;

    asio::io_context& _io;
    net::ConnectionManager& _connections;
    Session& _session;
    TokenGenerator& _tokens;
    const Config& _config;

    std::unordered_map<std::string, ConnectionPtr> _peers;
    std::unordered_map<std::string, std::shared_ptr<PendingPeer>> _pending;
    std::unordered_map<uint32_t, std::string> _indirect;  // token -> username

    std::unordered_map<uint32_t, MessageHandler> _handlers;
    FileConnectionHandler _on_file;
};

}  // namespace slsk::client
