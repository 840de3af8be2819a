#pragma once

#include <string>
#include <string_view>

namespace slsk::misc {

/**
 * @brief Lowercase hex MD5 digest, as the login message expects it
 */
auto md5_hex(std::string_view data) -> std::string;

}  // namespace slsk::misc
