#pragma once

#include <charconv>
#include <optional>
#include <string_view>

namespace slsk::utils {

template<typename IntegerT = long long>
inline auto to_integer(std::string_view s) -> std::optional<IntegerT>
{
    IntegerT value{};
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);

    if (result.ec != std::errc{} or result.ptr != s.end()) {
        return std::nullopt;
    }

    return value;
};

}  // namespace slsk::utils
