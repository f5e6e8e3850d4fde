#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for steering, deadlines and the demo runtime.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (key = value file) in deployments.
 */

#include <cstddef>
#include <cstdint>

namespace steer::config::constants {

// =====================
// Deadline race defaults
// Units: milliseconds
// =====================
inline constexpr std::uint32_t DEADLINE_DEFAULT_MS = 100;  ///< Per-request deadline

// =====================
// Picker defaults
// =====================
inline constexpr std::uint64_t HASH_SEED_DEFAULT = 0x57EE5EEDULL; ///< Deterministic hash salt

// =====================
// Demo runtime defaults
// =====================
inline constexpr std::size_t   DEMO_SHARDS_DEFAULT      = 2;   ///< Number of echo shards
inline constexpr std::uint32_t DEMO_SHARD_DELAY_MS      = 20;  ///< Simulated shard service time
inline constexpr std::size_t   DEMO_SHARDS_MAX          = 64;  ///< Upper bound accepted by the loader

// =====================
// Driver defaults
// =====================
inline constexpr std::uint32_t DRIVER_IDLE_WAIT_MS = 50; ///< Max condvar wait when no timer is armed

} // namespace steer::config::constants
