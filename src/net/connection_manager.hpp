#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <asio/error_code.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <spdlog/logger.h>
#include <tl/expected.hpp>

#include "net/connection.hpp"
#include "proto/types.hpp"

namespace slsk::net {

/**
 * @brief Owns every TCP connection of the process: the server connection,
 * outbound peer connections and the ones accepted on the listen port
 */
class ConnectionManager
{
 public:
    using ConnectionPtr = std::shared_ptr<Connection>;
    using ConnectCallback =
      std::function<void(tl::expected<ConnectionPtr, asio::error_code>)>;
    using AcceptCallback = std::function<void(ConnectionPtr)>;

    explicit ConnectionManager(asio::io_context& io);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    auto operator=(const ConnectionManager&) -> ConnectionManager& = delete;

    /**
     * @brief Resolve and connect within timeout. The callback gets an
     * unstarted connection: install handlers, then call start().
     */
    auto open(
      std::string host,
      uint16_t port,
      proto::FrameKind kind,
      std::chrono::milliseconds timeout,
      ConnectCallback callback
    ) -> void;

    /**
     * @brief Start accepting peer connections, return the bound port
     */
    auto listen(uint16_t port) -> uint16_t;
    auto listening_port() const -> std::optional<uint16_t>;

    /**
     * @brief Accepted connections are handed over unstarted, framed as
     * peer init messages
     */
    auto on_accept(AcceptCallback callback) -> void;

    auto close_all() -> void;
    auto open_count() const -> std::size_t;

 private:
    auto _do_accept() -> void;
    auto _adopt(asio::ip::tcp::socket socket, proto::FrameKind kind)
      -> ConnectionPtr;

    asio::io_context& _io;
    asio::ip::tcp::acceptor _acceptor;
    std::optional<uint16_t> _listening_port;
    AcceptCallback _on_accept;

    mutable std::mutex _mutex;  // guards the registry
    std::unordered_map<uint64_t, std::weak_ptr<Connection>> _connections;
    std::atomic<uint64_t> _next_id{1};

    std::shared_ptr<spdlog::logger> _logger;
};

}  // namespace slsk::net
