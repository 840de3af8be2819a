#pragma once

#include <atomic>
#include <cstdint>
#include <random>

namespace slsk::client {

/**
 * @brief Source of request tokens (searches, transfers, indirect connects)
 *
 * Monotonic from a random start so tokens of a restarted process do not
 * collide with replies still addressed to the previous one. Zero is never
 * handed out.
 */
class TokenGenerator
{
 public:
    TokenGenerator() : _next(std::random_device{}() & 0x7FFFFFFF) {}
    explicit TokenGenerator(uint32_t first) : _next(first) {}

    auto next() -> uint32_t
    {
        auto token = _next.fetch_add(1);
        if (token == 0) {
            token = _next.fetch_add(1);
        }
        return token;
    }

    /**
     * @brief Next token for which in_use() is false
     */
    template<typename Pred>
    auto next_unused(Pred in_use) -> uint32_t
    {
        auto token = next();
        while (in_use(token)) {
            token = next();
        }
        return token;
    }

 private:
    std::atomic<uint32_t> _next;
};

}  // namespace slsk::client
