#pragma once

#include <cstdint>
#include <regex>
#include <stdexcept>
#include <string>
#include <tuple>

#include <fmt/core.h>

#include "misc/tools.hpp"

namespace slsk::utils {

/**
 * @brief Split "<host>:<port>", host being a name or a dotted quad
 */
inline auto parse_host_port(std::string host_port_str)
  -> std::tuple<std::string, uint16_t>
{
    std::regex host_port_regex(  //
      R"(([A-Za-z0-9.\-]+):(\d{1,5}))"
    );
    std::smatch match;

    if (not std::regex_match(host_port_str, match, host_port_regex)) {
        throw std::invalid_argument(fmt::format(
          "Address must be in format \"<host>:<port>\". Found: {0}",
          host_port_str
        ));
    }

    auto host = match[1].str();
    auto port = to_integer<uint16_t>(match[2].str());

    if (not port or *port == 0) {
        throw std::invalid_argument(
          fmt::format("Bad port in address: {0}", host_port_str)
        );
    }

    return {host, *port};
}

}  // namespace slsk::utils
