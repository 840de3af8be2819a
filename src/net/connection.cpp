#include "net/connection.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <mutex>
#include <utility>

#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/write.hpp>
#include <fmt/core.h>
#include <magic_enum.hpp>

#include "net/log.hpp"
#include "proto/deserialize.hpp"

namespace slsk::net {

Connection::Connection(
  asio::ip::tcp::socket socket, proto::FrameKind kind, uint64_t id
) :
  _socket(std::move(socket)), _id(id), _kind(kind), _logger(internal_logger())
{
    asio::error_code ec;
    const auto endpoint = _socket.remote_endpoint(ec);

    _remote = ec ? std::string("unknown")
                 : fmt::format(
                     "{}:{}", endpoint.address().to_string(), endpoint.port()
                   );
}

Connection::~Connection()
{
    asio::error_code ignored;
    _socket.close(ignored);
}

auto Connection::is_open() const -> bool
{
    std::lock_guard lock(_mutex);
    return _open;
}

auto Connection::start() -> void
{
    _logger->debug("[{}] {} connection started", _id, _remote);
    _do_read();
}

auto Connection::set_frame_kind(proto::FrameKind kind) -> void
{
    _kind = kind;
    _raw = false;
}

auto Connection::set_raw_mode() -> void
{
    _raw = true;
}

auto Connection::on_frame(FrameHandler handler) -> void
{
    _on_frame = std::move(handler);
}

auto Connection::on_data(DataHandler handler) -> void
{
    _on_data = std::move(handler);
}

auto Connection::on_close(CloseHandler handler) -> void
{
    _on_close = std::move(handler);
}

auto Connection::send(Buffer bytes) -> tl::expected<void, asio::error_code>
{
    std::lock_guard lock(_mutex);

    if (not _open or _finishing) {
        return tl::make_unexpected(asio::error::not_connected);
    }

    _write_queue.push_back(std::move(bytes));

    if (not _writing) {
        _writing = true;
        asio::post(_socket.get_executor(), [self = shared_from_this()] {
            self->_do_write();
        });
    }

    return {};
}

auto Connection::close(asio::error_code reason) -> void
{
    {
        std::lock_guard lock(_mutex);
        if (not _open) {
            return;
        }
        _open = false;
    }

    asio::post(_socket.get_executor(), [self = shared_from_this(), reason] {
        self->_close_now(reason);
    });
}

auto Connection::finish() -> void
{
    {
        std::lock_guard lock(_mutex);
        if (not _open) {
            return;
        }

        _finishing = true;
        if (_writing) {
            return;  // the last write completion closes
        }
    }

    close();
}

auto Connection::_do_read() -> void
{
    _socket.async_read_some(
      asio::buffer(_read_chunk),
      [self = shared_from_this()](asio::error_code ec, std::size_t bytes_read) {
          self->_on_read(ec, bytes_read);
      }
    );
}

auto Connection::_on_read(asio::error_code ec, std::size_t bytes_read) -> void
{
    if (ec) {
        if (ec != asio::error::operation_aborted) {
            _logger->debug("[{}] {} read finished: {}", _id, _remote, ec.message());
        }

        _close_now(ec);
        return;
    }

    if (not is_open()) {
        return;
    }

    _read_buffer.insert(
      _read_buffer.end(), _read_chunk.begin(),
      std::next(_read_chunk.begin(), bytes_read)
    );

    _process_buffer();

    if (is_open()) {
        _do_read();
    }
}

auto Connection::_process_buffer() -> void
{
    while (is_open() and not _read_buffer.empty()) {
        if (_raw) {
            Buffer chunk;
            chunk.swap(_read_buffer);

            if (auto handler = _on_data) {
                handler(chunk);
            }

            continue;
        }

        auto frame = proto::unpack_frame(_read_buffer, _kind);

        if (not frame) {
            if (frame.error() == proto::Error::INCOMPLETE_MESSAGE) {
                return;
            }

            if (frame.error() == proto::Error::FRAME_TOO_LARGE) {
                _logger->error(
                  "[{}] {} sent an oversized frame, closing", _id, _remote
                );
                _close_now(asio::error::message_size);
                return;
            }

            _report_malformed(frame.error());
            continue;
        }

        // copy: the handler may replace itself (e.g. after a peer init)
        auto handler = _on_frame;
        if (not handler) {
            _logger->debug(
              "[{}] {} frame {} dropped: no handler", _id, _remote, frame->code
            );
            continue;
        }

        auto handled = handler(*frame);
        if (not handled) {
            _report_malformed(handled.error());
        }
        else {
            _consecutive_malformed = 0;
        }
    }
}

auto Connection::_report_malformed(proto::Error error) -> void
{
    _consecutive_malformed += 1;

    _logger->warn(
      "[{}] {} dropped a bad frame: {} ({} in a row)", _id, _remote,
      magic_enum::enum_name(error), _consecutive_malformed
    );

    if (_consecutive_malformed >= MAX_CONSECUTIVE_MALFORMED) {
        _logger->error("[{}] {} keeps sending bad frames, closing", _id, _remote);
        _close_now(asio::error::invalid_argument);
    }
}

auto Connection::_do_write() -> void
{
    std::lock_guard lock(_mutex);

    if (not _open or _write_queue.empty()) {
        _write_queue.clear();
        _writing = false;
        return;
    }

    asio::async_write(
      _socket, asio::buffer(_write_queue.front()),
      [self = shared_from_this()](asio::error_code ec, std::size_t written) {
          self->_on_write(ec, written);
      }
    );
}

auto Connection::_on_write(asio::error_code ec, std::size_t bytes_written)
  -> void
{
    bool write_next = false;
    bool close_now = false;

    {
        std::lock_guard lock(_mutex);

        if (not _write_queue.empty()) {
            _write_queue.pop_front();
        }

        if (ec or not _open) {
            _write_queue.clear();
            _writing = false;
        }
        else if (_write_queue.empty()) {
            _writing = false;
            close_now = _finishing;
        }
        else {
            write_next = true;
        }
    }

    if (ec) {
        if (ec != asio::error::operation_aborted) {
            _logger->debug("[{}] {} write failed: {}", _id, _remote, ec.message());
        }
        _close_now(ec);
        return;
    }

    _logger->trace("[{}] {} wrote {} bytes", _id, _remote, bytes_written);

    if (write_next) {
        _do_write();
    }
    else if (close_now) {
        _close_now({});
    }
}

auto Connection::_close_now(asio::error_code reason) -> void
{
    {
        std::lock_guard lock(_mutex);
        _open = false;

        if (not _writing) {
            _write_queue.clear();
        }
    }

    if (_closed) {
        return;
    }
    _closed = true;

    asio::error_code ignored;
    _socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    _socket.close(ignored);

    _read_buffer.clear();
    _read_buffer.shrink_to_fit();

    auto handler = std::move(_on_close);
    _on_close = nullptr;
    _on_frame = nullptr;
    _on_data = nullptr;

    _logger->debug(
      "[{}] {} connection closed: {}", _id, _remote,
      reason ? reason.message() : "done"
    );

    if (handler) {
        handler(reason);
    }
}

}  // namespace slsk::net
