#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <magic_enum.hpp>
#include <tl/expected.hpp>

namespace slsk {

enum class ErrorKind
{
    Configuration,
    Connection,
    AuthenticationFailed,
    MalformedMessage,
    SearchFailed,
    PeerUnreachable,
    TransferRejected,
    StreamError,
    InvalidArgument,
};

/**
 * @brief Error surfaced by every public client operation
 *
 * `what()` is the human readable message, `kind()` the machine checkable
 * category. Stream errors also carry the number of bytes already written.
 */
class Error : public std::runtime_error
{
 public:
    Error(ErrorKind kind, const std::string& message, uint64_t bytes = 0) :
      std::runtime_error(message), _kind(kind), _bytes_transferred(bytes)
    {
    }

    auto kind() const noexcept -> ErrorKind { return _kind; }
    auto kind_name() const -> std::string_view
    {
        return magic_enum::enum_name(_kind);
    }

    auto bytes_transferred() const noexcept -> uint64_t
    {
        return _bytes_transferred;
    }

 private:
    ErrorKind _kind;
    uint64_t _bytes_transferred;
};

template<typename... Args>
auto make_error(
  ErrorKind kind, fmt::format_string<Args...> format, Args&&... args
) -> std::exception_ptr
{
    return std::make_exception_ptr(
      Error(kind, fmt::format(format, std::forward<Args>(args)...))
    );
}

namespace client {

/**
 * @brief Outcome of an asynchronous operation, delivered on the event loop
 */
template<typename T>
using Result = tl::expected<T, std::exception_ptr>;

template<typename T>
using Completion = std::function<void(Result<T>)>;

}  // namespace client

}  // namespace slsk
