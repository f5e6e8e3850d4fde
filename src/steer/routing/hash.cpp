/**
 * @file hash.cpp
 * @brief Seeded key mixer behind SeededHashPicker.
 */
#include "steer/routing/hash.hpp"

namespace steer::routing {

std::uint64_t mix(std::uint64_t x, std::uint64_t seed) noexcept {
    constexpr std::uint64_t kSalt  = 0x9e3779b97f4a7c15ULL;
    constexpr std::uint64_t kMulLo = 0xff51afd7ed558ccdULL;
    constexpr std::uint64_t kMulHi = 0xc4ceb9fe1a85ec53ULL;

    // Fold the seed in first so two routers with different seeds disagree
    // on most keys; the shift/multiply rounds then spread nearby request keys
    // (sequential ids, similar strings) across the whole index range.
    x ^= seed + kSalt + (x << 6) + (x >> 2);
    x = (x ^ (x >> 33)) * kMulLo;
    x = (x ^ (x >> 33)) * kMulHi;
    return x ^ (x >> 33);
}

} // namespace steer::routing
