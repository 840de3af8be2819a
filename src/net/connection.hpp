#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

#include <asio/error_code.hpp>
#include <asio/ip/tcp.hpp>
#include <spdlog/logger.h>
#include <tl/expected.hpp>

#include "proto/types.hpp"

namespace slsk::net {

/**
 * @brief One TCP connection to the server or a peer
 *
 * Reads continuously into a per-connection buffer and hands every complete
 * frame to the frame handler, or every chunk to the data handler once the
 * connection is switched to raw mode (file transfers). Reads, handlers and
 * mode switches happen on the io_context thread; send() and close() may be
 * called from any thread.
 */
class Connection : public std::enable_shared_from_this<Connection>
{
 public:
    using Buffer = std::vector<uint8_t>;
    using FrameHandler =
      std::function<tl::expected<void, proto::Error>(const proto::Frame&)>;
    using DataHandler = std::function<void(std::span<const uint8_t>)>;
    using CloseHandler = std::function<void(asio::error_code)>;

    constexpr static std::size_t READ_CHUNK_SIZE = 64 * 1024;
    constexpr static std::size_t MAX_CONSECUTIVE_MALFORMED = 3;

    Connection(
      asio::ip::tcp::socket socket, proto::FrameKind kind, uint64_t id
    );
    ~Connection();

    Connection(const Connection&) = delete;
    auto operator=(const Connection&) -> Connection& = delete;

    auto id() const noexcept -> uint64_t { return _id; }
    auto remote() const -> const std::string& { return _remote; }
    auto is_open() const -> bool;
    auto is_raw() const noexcept -> bool { return _raw; }

    auto start() -> void;

    auto set_frame_kind(proto::FrameKind kind) -> void;
    auto set_raw_mode() -> void;

    auto on_frame(FrameHandler handler) -> void;
    auto on_data(DataHandler handler) -> void;
    auto on_close(CloseHandler handler) -> void;

    /**
     * @brief Queue bytes for writing, not_connected once the connection is
     * closed or finishing
     */
    auto send(Buffer bytes) -> tl::expected<void, asio::error_code>;

    /**
     * @brief Close now, dropping queued writes
     */
    auto close(asio::error_code reason = {}) -> void;

    /**
     * @brief Close once every queued write went out
     */
    auto finish() -> void;

 private:
    auto _do_read() -> void;
    auto _on_read(asio::error_code ec, std::size_t bytes_read) -> void;
    auto _process_buffer() -> void;
    auto _report_malformed(proto::Error error) -> void;

    auto _do_write() -> void;
    auto _on_write(asio::error_code ec, std::size_t bytes_written) -> void;

    auto _close_now(asio::error_code reason) -> void;

    asio::ip::tcp::socket _socket;
    const uint64_t _id;
    std::string _remote;

    mutable std::mutex _mutex;  // guards state flags and the write queue
    bool _open = true;
    bool _finishing = false;
    bool _writing = false;
    std::deque<Buffer> _write_queue;

    std::array<uint8_t, READ_CHUNK_SIZE> _read_chunk{};
    Buffer _read_buffer;
    proto::FrameKind _kind;
    bool _raw = false;
    bool _closed = false;  // close handler already fired
    std::size_t _consecutive_malformed = 0;

    FrameHandler _on_frame;
    DataHandler _on_data;
    CloseHandler _on_close;

    std::shared_ptr<spdlog::logger> _logger;
};

}  // namespace slsk::net
