#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a YAML file.
 * @details All defaults reference named constants to avoid magic numbers. The
 *          document is a flat mapping, e.g. `deadline_ms: 250`; keys left out
 *          keep their default. Parsed with yaml-cpp.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "steer/compat/expected.hpp"

namespace steer::config {

    /** @struct SteerConfig
     *  @brief Settings for the steering demo and the timeout layer.
     */
    struct SteerConfig {
        std::chrono::milliseconds deadline;      ///< Per-request deadline
        std::uint64_t             hash_seed;     ///< Salt for SeededHashPicker
        std::size_t               shards;        ///< Number of backends
        std::chrono::milliseconds shard_delay;   ///< Simulated backend service time
        bool                      log_events;    ///< Attach the printf observer
    };

    /** @enum ConfigError
     *  @brief Failures reported by Loader::load_from_file and Loader::parse.
     */
    enum class ConfigError : std::uint8_t {
        Unreadable = 1, ///< File could not be opened
        Malformed,      ///< YAML syntax error, or the document is not a flat mapping
        UnknownKey,     ///< Key not recognized
        InvalidValue    ///< Value failed to parse or is out of range
    };

    /// Stable lowercase name for a config error.
    std::string_view to_string(ConfigError e) noexcept;

    /** @class Loader
     *  @brief Source of configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Defaults built from constants.hpp.
        static SteerConfig defaults();

        /**
         * @brief Load configuration from a path; empty path returns defaults.
         * @details Keys: deadline_ms (>0), hash_seed, shards (1..64),
         *          shard_delay_ms, log_events (YAML bool).
         * @param path YAML file holding a mapping of those keys.
         * @return SteerConfig, or the first error encountered.
         */
        static steer_detail::expected<SteerConfig, ConfigError> load_from_file(const std::string& path);

        /// Same as load_from_file, but parsing an in-memory document.
        static steer_detail::expected<SteerConfig, ConfigError> parse(std::string_view text);
    };

} // namespace steer::config
