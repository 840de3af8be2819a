#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <tl/expected.hpp>

#include "client/config.hpp"
#include "client/errors.hpp"
#include "client/peers.hpp"
#include "net/connection.hpp"
#include "proto/types.hpp"

namespace slsk::client {

enum class TicketState
{
    Queued,
    Active,
    Complete,
    Failed,
};

/**
 * @brief One download as negotiated with the uploading peer
 */
struct TransferTicket
{
    std::string username;
    std::string filename;
    uint32_t id = 0;  // the peer's transfer token, once it offers the file
    TicketState state = TicketState::Queued;
    std::optional<uint32_t> queue_place;
    uint64_t size = 0;
    uint64_t bytes_transferred = 0;
};

struct DownloadResult
{
    std::filesystem::path saved_path;
    std::string filename;
    uint64_t byte_count = 0;
};

using ProgressCb =
  std::function<void(uint64_t /* received */, uint64_t /* total */)>;

/**
 * @brief Output file of a download, open for as long as the sink lives
 */
class FileSink
{
 public:
    explicit FileSink(const std::filesystem::path& path);
    ~FileSink();

    FileSink(const FileSink&) = delete;
    auto operator=(const FileSink&) -> FileSink& = delete;

    auto write(std::span<const uint8_t> data) -> bool;
    auto written() const noexcept -> uint64_t { return _written; }

 private:
    std::ofstream _stream;
    uint64_t _written = 0;
};

/**
 * @brief Downloads files from peers and declines every upload request
 */
class TransferManager
{
 public:
    TransferManager(
      asio::io_context& io, PeerConnections& peers, const Config& config
    );

    TransferManager(const TransferManager&) = delete;
    auto operator=(const TransferManager&) -> TransferManager& = delete;

    /**
     * @brief Queue the file at the peer and stream it to the download path
     * once the peer offers it. The session must be Ready.
     */
    auto download(
      std::string username,
      std::string filename,
      ProgressCb progress,
      Completion<DownloadResult> done
    ) -> void;

    /**
     * @brief Fail every download whose file stream has not started yet.
     * Running streams do not depend on the server and carry on.
     */
    auto abort_negotiations(const std::string& reason) -> void;

    auto active() const -> std::size_t { return _downloads.size(); }

 private:
    struct Download
    {
        explicit Download(asio::io_context& io) :
          negotiation_timer(io), stall_timer(io)
        {
        }

        TransferTicket ticket;
        std::filesystem::path saved_path;
        std::unique_ptr<FileSink> sink;
        std::shared_ptr<net::Connection> file_connection;
        asio::steady_timer negotiation_timer;
        asio::steady_timer stall_timer;
        ProgressCb progress;
        Completion<DownloadResult> done;
        bool finished = false;
    };

    using DownloadPtr = std::shared_ptr<Download>;
    using ConnectionPtr = PeerConnections::ConnectionPtr;

    auto _request(const DownloadPtr& download, const ConnectionPtr& peer) -> void;

    auto _on_transfer_request(
      const std::string& username,
      const ConnectionPtr& peer,
      const proto::Frame& frame
    ) -> tl::expected<void, proto::Error>;
    auto _on_place_in_queue(const std::string& username, const proto::Frame& frame)
      -> tl::expected<void, proto::Error>;
    auto _on_upload_failed(const std::string& username, const proto::Frame& frame)
      -> tl::expected<void, proto::Error>;
    auto _on_upload_denied(const std::string& username, const proto::Frame& frame)
      -> tl::expected<void, proto::Error>;
    auto _on_queue_upload(
      const std::string& username,
      const ConnectionPtr& peer,
      const proto::Frame& frame
    ) -> tl::expected<void, proto::Error>;

    auto _on_file_connection(
      const std::string& username, const ConnectionPtr& connection
    ) -> void;
    auto _start_stream(
      const DownloadPtr& download,
      const ConnectionPtr& connection,
      std::span<const uint8_t> leftover
    ) -> void;
    auto _on_chunk(const DownloadPtr& download, std::span<const uint8_t> data)
      -> void;
    auto _on_stream_closed(const DownloadPtr& download, asio::error_code ec)
      -> void;
    auto _arm_stall_timer(const DownloadPtr& download) -> void;

    auto _find(const std::string& username, const std::string& filename)
      -> DownloadPtr;
    auto _find_by_ticket(const std::string& username, uint32_t id) -> DownloadPtr;

    auto _complete(const DownloadPtr& download) -> void;
    auto _fail(const DownloadPtr& download, std::exception_ptr error) -> void;
    auto _finish(const DownloadPtr& download) -> void;

    asio::io_context& _io;
    PeerConnections& _peers;
    const Config& _config;

    std::vector<DownloadPtr> _downloads;
};

}  // namespace slsk::client
