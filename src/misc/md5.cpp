#include "misc/md5.hpp"

#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <openssl/evp.h>

namespace slsk::misc {

auto md5_hex(std::string_view data) -> std::string
{
    using ContextPtr =
      std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    ContextPtr context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (not context) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;

    if (EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr) != 1 or
        EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1 or
        EVP_DigestFinal_ex(context.get(), digest.data(), &digest_length) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }

    return fmt::format(
      "{:02x}", fmt::join(digest.begin(), digest.begin() + digest_length, "")
    );
}

}  // namespace slsk::misc
