#pragma once
/**
 * @file hash.hpp
 * @brief 64-bit avalanche mixer used by hashing pickers.
 */

#include <cstdint>

namespace steer::routing {

    /// splitmix64-style finalizer salted with `seed`. Pure and deterministic.
    std::uint64_t mix(std::uint64_t x, std::uint64_t seed) noexcept;

} // namespace steer::routing
