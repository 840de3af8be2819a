#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <magic_enum.hpp>

namespace slsk::proto {

constexpr static uint32_t CLIENT_VERSION = 160;
constexpr static uint32_t CLIENT_MINOR_VERSION = 1;

constexpr static std::size_t MAX_FRAME_LENGTH = 128 * 1024 * 1024;

enum class ServerCode : uint32_t
{
    Login = 1,
    SetWaitPort = 2,
    GetPeerAddress = 3,
    WatchUser = 5,
    UnwatchUser = 6,
    GetUserStatus = 7,
    SayChatroom = 13,
    JoinRoom = 14,
    LeaveRoom = 15,
    UserJoinedRoom = 16,
    UserLeftRoom = 17,
    ConnectToPeer = 18,
    MessageUser = 22,
    MessageAcked = 23,
    FileSearch = 26,
    SetStatus = 28,
    ServerPing = 32,
    SharedFoldersFiles = 35,
    GetUserStats = 36,
    Relogged = 41,
    UserSearch = 42,
    RoomList = 64,
    GlobalAdminMessage = 66,
    PrivilegedUsers = 69,
    HaveNoParent = 71,
    ParentMinSpeed = 83,
    ParentSpeedRatio = 84,
    CheckPrivileges = 92,
    EmbeddedMessage = 93,
    AcceptChildren = 100,
    PossibleParents = 102,
    WishlistSearch = 103,
    WishlistInterval = 104,
    RoomTickerState = 113,
    RoomTickerAdd = 114,
    RoomTickerRemove = 115,
    RoomSearch = 120,
    ResetDistributed = 130,
    PrivateRoomUsers = 133,
    PrivateRoomAddUser = 134,
    PrivateRoomRemoveUser = 135,
    PrivateRoomAdded = 139,
    PrivateRoomRemoved = 140,
    PrivateRoomToggle = 141,
    PrivateRoomAddOperator = 143,
    PrivateRoomRemoveOperator = 144,
    PrivateRoomOperatorAdded = 145,
    PrivateRoomOperatorRemoved = 146,
    PrivateRoomOwned = 148,
    ExcludedSearchPhrases = 160,
    CantConnectToPeer = 1001,
    CantCreateRoom = 1003,
};

enum class PeerInitCode : uint8_t
{
    PierceFirewall = 0,
    PeerInit = 1,
};

enum class PeerCode : uint32_t
{
    SharedFileListRequest = 4,
    SharedFileListResponse = 5,
    FileSearchRequest = 8,
    FileSearchResponse = 9,
    UserInfoRequest = 15,
    UserInfoResponse = 16,
    FolderContentsRequest = 36,
    FolderContentsResponse = 37,
    TransferRequest = 40,
    TransferResponse = 41,
    QueueUpload = 43,
    PlaceInQueueResponse = 44,
    UploadFailed = 46,
    UploadDenied = 50,
    PlaceInQueueRequest = 51,
    UploadQueueNotification = 52,
};

enum class FrameKind
{
    Server,
    PeerInit,
    Peer,
};

enum class Error
{
    INCOMPLETE_MESSAGE,
    MALFORMED_MESSAGE,
    UNKNOWN_MESSAGE_CODE,
    FRAME_TOO_LARGE,
};

/**
 * @brief One complete length-prefixed frame with its prefix stripped
 */
struct Frame
{
    FrameKind kind;
    uint32_t code;
    std::vector<uint8_t> body;

    template<typename CodeT>
    auto is(CodeT value) const -> bool
    {
        return code == static_cast<uint32_t>(value);
    }
};

namespace connection_type {

constexpr std::string_view PEER = "P";
constexpr std::string_view FILE = "F";
constexpr std::string_view DISTRIBUTED = "D";

}  // namespace connection_type

enum class UserStatus : uint32_t
{
    Offline = 0,
    Away = 1,
    Online = 2,
};

enum class TransferDirection : uint32_t
{
    Download = 0,
    Upload = 1,
};

enum class FileAttribute : uint32_t
{
    Bitrate = 0,
    Duration = 1,
    Vbr = 2,
    Encoder = 3,
    SampleRate = 4,
    BitDepth = 5,
};

struct LoginRequest
{
    std::string username;
    std::string password;
    uint32_t version = CLIENT_VERSION;
    uint32_t minor_version = CLIENT_MINOR_VERSION;
};

struct LoginResponse
{
    bool success = false;
    std::string greeting;
    uint32_t ip = 0;
    std::string reason;
};

struct PeerAddress
{
    std::string username;
    uint32_t ip = 0;
    uint32_t port = 0;
};

/**
 * @brief Server -> client request to connect to a peer
 */
struct ConnectToPeer
{
    std::string username;
    std::string type;
    uint32_t ip = 0;
    uint32_t port = 0;
    uint32_t token = 0;
    bool privileged = false;
};

struct FileSearch
{
    uint32_t token;
    std::string query;
};

struct PeerInit
{
    std::string username;
    std::string type;
    uint32_t token = 0;
};

struct PierceFirewall
{
    uint32_t token;
};

struct SharedFile
{
    std::string filename;
    uint64_t size = 0;
    std::string extension;
    std::vector<std::pair<uint32_t, uint32_t>> attributes;

    auto attribute(FileAttribute code) const -> std::optional<uint32_t>;
};

struct FileSearchResponse
{
    std::string username;
    uint32_t token = 0;
    std::vector<SharedFile> files;
    bool slots_free = false;
    uint32_t avg_speed = 0;
    uint32_t queue_length = 0;
    std::vector<SharedFile> locked_files;
};

struct TransferRequest
{
    TransferDirection direction;
    uint32_t token;
    std::string filename;
    std::optional<uint64_t> size;
};

struct TransferResponse
{
    uint32_t token;
    bool allowed;
    std::optional<uint64_t> size;
    std::string reason;
};

struct PlaceInQueueResponse
{
    std::string filename;
    uint32_t place;
};

struct UploadDenied
{
    std::string filename;
    std::string reason;
};

/**
 * @brief First bytes on a file connection, sent by the uploader
 */
struct FileTransferInit
{
    constexpr static std::size_t SIZE = 4;
    uint32_t token;
};

struct FileOffset
{
    constexpr static std::size_t SIZE = 8;
    uint64_t offset;
};

}  // namespace slsk::proto

template<>
struct magic_enum::customize::enum_range<slsk::proto::ServerCode>
{
    static constexpr int min = 0;
    static constexpr int max = 1010;
};
