/**
 * @file config_loader.cpp
 * @brief Defaults from constants, overridden by a flat YAML mapping (yaml-cpp).
 */
#include "steer/config/config_loader.hpp"
#include "steer/config/constants.hpp"

#include <string>

#include <yaml-cpp/yaml.h>

namespace steer::config {
    using namespace steer::config::constants;

    namespace {
        /// Convert a scalar node; false on a failed conversion.
        template <class T>
        bool read(const YAML::Node& node, T& out) {
            try {
                out = node.as<T>();
                return true;
            } catch (const YAML::BadConversion&) {
                return false;
            }
        }

        // Apply one key/value pair; returns false with `err` set on rejection.
        bool apply(SteerConfig& cfg, const std::string& key, const YAML::Node& val, ConfigError& err) {
            err = ConfigError::InvalidValue;
            if (key == "deadline_ms") {
                std::uint32_t ms{};
                if (!read(val, ms) || ms == 0) return false;
                cfg.deadline = std::chrono::milliseconds{ms};
            } else if (key == "hash_seed") {
                if (!read(val, cfg.hash_seed)) return false;
            } else if (key == "shards") {
                std::size_t n{};
                if (!read(val, n) || n == 0 || n > DEMO_SHARDS_MAX) return false;
                cfg.shards = n;
            } else if (key == "shard_delay_ms") {
                std::uint32_t ms{};
                if (!read(val, ms)) return false;
                cfg.shard_delay = std::chrono::milliseconds{ms};
            } else if (key == "log_events") {
                if (!read(val, cfg.log_events)) return false;
            } else {
                err = ConfigError::UnknownKey;
                return false;
            }
            return true;
        }

        steer_detail::expected<SteerConfig, ConfigError> from_yaml(const YAML::Node& root) {
            SteerConfig cfg = Loader::defaults();
            if (!root || root.IsNull()) return cfg;   // empty document
            if (!root.IsMap()) return steer_detail::unexpected(ConfigError::Malformed);

            for (const auto& kv : root) {
                if (!kv.first.IsScalar()) return steer_detail::unexpected(ConfigError::Malformed);
                ConfigError err{};
                if (!apply(cfg, kv.first.Scalar(), kv.second, err)) return steer_detail::unexpected(err);
            }
            return cfg;
        }
    } // namespace

    std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::Unreadable:   return "unreadable";
            case ConfigError::Malformed:    return "malformed";
            case ConfigError::UnknownKey:   return "unknown_key";
            case ConfigError::InvalidValue: return "invalid_value";
        }
        return "unknown";
    }

    SteerConfig Loader::defaults() {
        SteerConfig cfg;
        cfg.deadline    = std::chrono::milliseconds{DEADLINE_DEFAULT_MS};
        cfg.hash_seed   = HASH_SEED_DEFAULT;
        cfg.shards      = DEMO_SHARDS_DEFAULT;
        cfg.shard_delay = std::chrono::milliseconds{DEMO_SHARD_DELAY_MS};
        cfg.log_events  = false;
        return cfg;
    }

    steer_detail::expected<SteerConfig, ConfigError> Loader::parse(std::string_view text) {
        YAML::Node root;
        try {
            root = YAML::Load(std::string(text));
        } catch (const YAML::ParserException&) {
            return steer_detail::unexpected(ConfigError::Malformed);
        }
        return from_yaml(root);
    }

    steer_detail::expected<SteerConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        if (path.empty()) return defaults();
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::BadFile&) {
            return steer_detail::unexpected(ConfigError::Unreadable);
        } catch (const YAML::ParserException&) {
            return steer_detail::unexpected(ConfigError::Malformed);
        }
        return from_yaml(root);
    }

} // namespace steer::config
