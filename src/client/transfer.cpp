#include "client/transfer.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

#include <asio/error.hpp>
#include <fmt/core.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>

#include "misc/filename.hpp"
#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"
#include "proto/utils.hpp"

namespace slsk::client {

namespace fs = std::filesystem;

constexpr static auto DECLINE_UPLOAD_REASON = "File not shared.";
constexpr static auto DECLINE_TRANSFER_REASON = "Cancelled";

FileSink::FileSink(const fs::path& path) :
  _stream(path, std::ios::binary | std::ios::trunc)
{
    if (not _stream.is_open()) {
        throw Error(
          ErrorKind::StreamError,
          fmt::format("Can't open {} for writing", path.string())
        );
    }
}

FileSink::~FileSink()
{
    _stream.flush();
}

auto FileSink::write(std::span<const uint8_t> data) -> bool
{
    _stream.write(reinterpret_cast<const char*>(data.data()), data.size());

    if (not _stream) {
        return false;
    }

    _written += data.size();
    return true;
}

TransferManager::TransferManager(
  asio::io_context& io, PeerConnections& peers, const Config& config
) :
  _io(io), _peers(peers), _config(config)
{
    _peers.subscribe(
      proto::PeerCode::TransferRequest,
      [this](const auto& username, const auto& peer, const auto& frame) {
          return _on_transfer_request(username, peer, frame);
      }
    );
    _peers.subscribe(
      proto::PeerCode::PlaceInQueueResponse,
      [this](const auto& username, const auto&, const auto& frame) {
          return _on_place_in_queue(username, frame);
      }
    );
    _peers.subscribe(
      proto::PeerCode::UploadFailed,
      [this](const auto& username, const auto&, const auto& frame) {
          return _on_upload_failed(username, frame);
      }
    );
    _peers.subscribe(
      proto::PeerCode::UploadDenied,
      [this](const auto& username, const auto&, const auto& frame) {
          return _on_upload_denied(username, frame);
      }
    );
    _peers.subscribe(
      proto::PeerCode::QueueUpload,
      [this](const auto& username, const auto& peer, const auto& frame) {
          return _on_queue_upload(username, peer, frame);
      }
    );

    _peers.on_file_connection([this](const auto& username, const auto& connection) {
        _on_file_connection(username, connection);
    });
}

auto TransferManager::download(
  std::string username,
  std::string filename,
  ProgressCb progress,
  Completion<DownloadResult> done
) -> void
{
    auto name = utils::saved_filename(filename);
    if (not name) {
        done(tl::make_unexpected(make_error(
          ErrorKind::InvalidArgument, "No file name in \"{}\"", filename
        )));
        return;
    }

    std::error_code ec;
    fs::create_directories(_config.download_path, ec);
    if (ec) {
        done(tl::make_unexpected(make_error(
          ErrorKind::Configuration, "Can't create {}: {}",
          _config.download_path.string(), ec.message()
        )));
        return;
    }

    auto download = std::make_shared<Download>(_io);
    download->ticket.username = std::move(username);
    download->ticket.filename = std::move(filename);
    download->saved_path = _config.download_path / *name;
    download->progress = std::move(progress);
    download->done = std::move(done);

    _downloads.push_back(download);

    spdlog::info(
      "Requesting {} from {}", download->ticket.filename,
      download->ticket.username
    );

    if (_config.transfer_timeout.count() > 0) {
        download->negotiation_timer.expires_after(_config.transfer_timeout);
        download->negotiation_timer.async_wait([this, download](auto ec) {
            if (ec or download->finished or download->file_connection) {
                return;
            }

            _fail(
              download, make_error(
                          ErrorKind::TransferRejected,
                          "{} queued past timeout at {}",
                          download->ticket.filename, download->ticket.username
                        )
            );
        });
    }

    _peers.connect(
      download->ticket.username,
      [this, download](Result<ConnectionPtr> peer) {
          if (download->finished) {
              return;
          }

          if (not peer) {
              _fail(download, peer.error());
              return;
          }

          _request(download, *peer);
      }
    );
}

auto TransferManager::abort_negotiations(const std::string& reason) -> void
{
    auto waiting = _downloads;
    std::erase_if(waiting, [](const auto& download) {
        return download->file_connection != nullptr;
    });

    for (const auto& download : waiting) {
        _fail(
          download, make_error(
                      ErrorKind::Connection, "Download of {} from {} dropped: {}",
                      download->ticket.filename, download->ticket.username,
                      reason
                    )
        );
    }
}

auto TransferManager::_request(
  const DownloadPtr& download, const ConnectionPtr& peer
) -> void
{
    const auto& filename = download->ticket.filename;

    auto queued = peer->send(proto::pack_queue_upload(filename));
    auto asked = queued.and_then([&] {
        return peer->send(proto::pack_place_in_queue_request(filename));
    });

    if (not asked) {
        _fail(
          download, make_error(
                      ErrorKind::PeerUnreachable, "Can't queue {} at {}: {}",
                      filename, download->ticket.username,
                      asked.error().message()
                    )
        );
        return;
    }

    spdlog::debug("{} queued at {}", filename, download->ticket.username);
}

auto TransferManager::_on_transfer_request(
  const std::string& username,
  const ConnectionPtr& peer,
  const proto::Frame& frame
) -> tl::expected<void, proto::Error>
{
    SLSK_READ(request, proto::unpack_transfer_request(frame.body));

    auto download = request->direction == proto::TransferDirection::Upload
                      ? _find(username, request->filename)
                      : nullptr;

    if (not download or download->ticket.state != TicketState::Queued) {
        spdlog::debug(
          "{} offers {} ({}), declined", username, request->filename,
          magic_enum::enum_name(request->direction)
        );

        (void)peer->send(proto::pack_transfer_response(proto::TransferResponse{
          .token = request->token,
          .allowed = false,
          .size = std::nullopt,
          .reason = DECLINE_TRANSFER_REASON,
        }));
        return {};
    }

    download->ticket.id = request->token;
    download->ticket.size = request->size.value_or(0);
    download->ticket.state = TicketState::Active;

    spdlog::info(
      "{} is ready to send {} ({} bytes)", username, request->filename,
      download->ticket.size
    );

    auto sent = peer->send(proto::pack_transfer_response(proto::TransferResponse{
      .token = request->token,
      .allowed = true,
      .size = std::nullopt,
      .reason = {},
    }));
    if (not sent) {
        _fail(
          download, make_error(
                      ErrorKind::PeerUnreachable, "{} went away: {}", username,
                      sent.error().message()
                    )
        );
    }

    return {};
}

auto TransferManager::_on_place_in_queue(
  const std::string& username, const proto::Frame& frame
) -> tl::expected<void, proto::Error>
{
    SLSK_READ(place, proto::unpack_place_in_queue_response(frame.body));

    if (auto download = _find(username, place->filename)) {
        download->ticket.queue_place = place->place;
        spdlog::info(
          "{} is number {} in the queue of {}", place->filename, place->place,
          username
        );
    }

    return {};
}

auto TransferManager::_on_upload_failed(
  const std::string& username, const proto::Frame& frame
) -> tl::expected<void, proto::Error>
{
    SLSK_READ(filename, proto::unpack_filename(frame.body));

    if (auto download = _find(username, *filename)) {
        _fail(
          download, make_error(
                      ErrorKind::TransferRejected, "{} failed to upload {}",
                      username, *filename
                    )
        );
    }

    return {};
}

auto TransferManager::_on_upload_denied(
  const std::string& username, const proto::Frame& frame
) -> tl::expected<void, proto::Error>
{
    SLSK_READ(denied, proto::unpack_upload_denied(frame.body));

    if (auto download = _find(username, denied->filename)) {
        _fail(
          download, make_error(
                      ErrorKind::TransferRejected, "{} denied {}: {}", username,
                      denied->filename, denied->reason
                    )
        );
    }

    return {};
}

auto TransferManager::_on_queue_upload(
  const std::string& username,
  const ConnectionPtr& peer,
  const proto::Frame& frame
) -> tl::expected<void, proto::Error>
{
    SLSK_READ(filename, proto::unpack_filename(frame.body));

    spdlog::debug("{} wants {} from us, declined", username, *filename);

    (void)peer->send(proto::pack_upload_denied(proto::UploadDenied{
      .filename = *filename, .reason = DECLINE_UPLOAD_REASON
    }));

    return {};
}

auto TransferManager::_on_file_connection(
  const std::string& username, const ConnectionPtr& connection
) -> void
{
    // the uploader opens with the transfer token, unframed
    auto handshake = std::make_shared<std::vector<uint8_t>>();
    std::weak_ptr<net::Connection> weak = connection;

    connection->on_data([this, username, weak, handshake](auto data) {
        auto connection = weak.lock();
        if (not connection) {
            return;
        }

        handshake->insert(handshake->end(), data.begin(), data.end());

        auto init = proto::unpack_file_transfer_init(*handshake);
        if (not init) {
            return;  // need more bytes
        }

        auto download = _find_by_ticket(username, init->token);
        if (not download or download->file_connection) {
            spdlog::debug(
              "File connection from {} with unknown token {}", username,
              init->token
            );
            connection->close();
            return;
        }

        auto leftover = std::span<const uint8_t>(*handshake).subspan(
          proto::FileTransferInit::SIZE
        );
        _start_stream(download, connection, leftover);
    });
}

auto TransferManager::_start_stream(
  const DownloadPtr& download,
  const ConnectionPtr& connection,
  std::span<const uint8_t> leftover
) -> void
{
    download->file_connection = connection;
    download->negotiation_timer.cancel();

    try {
        download->sink = std::make_unique<FileSink>(download->saved_path);
    } catch (const Error& e) {
        _fail(download, std::make_exception_ptr(e));
        return;
    }

    if (auto sent = connection->send(proto::pack_file_offset(0)); not sent) {
        _fail(
          download, std::make_exception_ptr(Error(
                      ErrorKind::StreamError,
                      fmt::format("File connection lost: {}", sent.error().message())
                    ))
        );
        return;
    }

    spdlog::debug(
      "Streaming {} into {}", download->ticket.filename,
      download->saved_path.string()
    );

    std::weak_ptr<Download> weak = download;

    connection->on_data([this, weak](auto data) {
        if (auto download = weak.lock()) {
            _on_chunk(download, data);
        }
    });
    connection->on_close([this, weak](asio::error_code ec) {
        if (auto download = weak.lock()) {
            _on_stream_closed(download, ec);
        }
    });

    _arm_stall_timer(download);

    if (download->ticket.size == 0) {
        _complete(download);
        return;
    }

    if (not leftover.empty()) {
        _on_chunk(download, leftover);
    }
}

auto TransferManager::_on_chunk(
  const DownloadPtr& download, std::span<const uint8_t> data
) -> void
{
    if (download->finished) {
        return;
    }

    auto& ticket = download->ticket;
    const auto remaining = ticket.size - ticket.bytes_transferred;
    const auto chunk = data.first(std::min<uint64_t>(data.size(), remaining));

    if (not download->sink->write(chunk)) {
        _fail(
          download, std::make_exception_ptr(Error(
                      ErrorKind::StreamError,
                      fmt::format(
                        "Can't write {} after {} bytes",
                        download->saved_path.string(), ticket.bytes_transferred
                      ),
                      ticket.bytes_transferred
                    ))
        );
        return;
    }

    ticket.bytes_transferred += chunk.size();

    if (download->progress) {
        try {
            download->progress(ticket.bytes_transferred, ticket.size);
        } catch (const std::exception&) {
            _fail(download, std::current_exception());
            return;
        }
    }

    if (ticket.bytes_transferred == ticket.size) {
        _complete(download);
        return;
    }

    _arm_stall_timer(download);
}

auto TransferManager::_on_stream_closed(
  const DownloadPtr& download, asio::error_code ec
) -> void
{
    if (download->finished) {
        return;
    }

    const auto& ticket = download->ticket;

    _fail(
      download, std::make_exception_ptr(Error(
                  ErrorKind::StreamError,
                  fmt::format(
                    "Transfer of {} broke after {} of {} bytes: {}",
                    ticket.filename, ticket.bytes_transferred, ticket.size,
                    ec ? ec.message() : "connection closed"
                  ),
                  ticket.bytes_transferred
                ))
    );
}

auto TransferManager::_arm_stall_timer(const DownloadPtr& download) -> void
{
    std::weak_ptr<Download> weak = download;

    download->stall_timer.expires_after(_config.stall_timeout);
    download->stall_timer.async_wait([this, weak](asio::error_code ec) {
        auto download = weak.lock();
        if (ec or not download or download->finished) {
            return;
        }

        const auto& ticket = download->ticket;
        _fail(
          download, std::make_exception_ptr(Error(
                      ErrorKind::StreamError,
                      fmt::format(
                        "Transfer of {} stalled after {} bytes", ticket.filename,
                        ticket.bytes_transferred
                      ),
                      ticket.bytes_transferred
                    ))
        );
    });
}

auto TransferManager::_find(
  const std::string& username, const std::string& filename
) -> DownloadPtr
{
    auto found = std::ranges::find_if(_downloads, [&](const auto& download) {
        return download->ticket.username == username and
               download->ticket.filename == filename;
    });

    return found == _downloads.end() ? nullptr : *found;
}

auto TransferManager::_find_by_ticket(const std::string& username, uint32_t id)
  -> DownloadPtr
{
    auto found = std::ranges::find_if(_downloads, [&](const auto& download) {
        return download->ticket.state == TicketState::Active and
               download->ticket.id == id and
               download->ticket.username == username;
    });

    return found == _downloads.end() ? nullptr : *found;
}

auto TransferManager::_complete(const DownloadPtr& download) -> void
{
    if (download->finished) {
        return;
    }

    download->ticket.state = TicketState::Complete;
    _finish(download);

    spdlog::info(
      "Downloaded {} ({} bytes)", download->saved_path.string(),
      download->ticket.bytes_transferred
    );

    download->done(DownloadResult{
      .saved_path = download->saved_path,
      .filename = download->saved_path.filename().string(),
      .byte_count = download->ticket.bytes_transferred,
    });
}

auto TransferManager::_fail(
  const DownloadPtr& download, std::exception_ptr error
) -> void
{
    if (download->finished) {
        return;
    }

    download->ticket.state = TicketState::Failed;
    _finish(download);

    download->done(tl::make_unexpected(std::move(error)));
}

auto TransferManager::_finish(const DownloadPtr& download) -> void
{
    download->finished = true;
    download->negotiation_timer.cancel();
    download->stall_timer.cancel();

    // flush and close the output file before anyone looks at it
    download->sink.reset();

    if (download->file_connection) {
        download->file_connection->close();
    }

    std::erase(_downloads, download);
}

}  // namespace slsk::client
