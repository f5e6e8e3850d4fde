#pragma once
/**
 * @file pickers.hpp
 * @brief Stock pickers: key modulo, seeded hash, round robin.
 * @details All of them take the service count from the span they are given;
 *          none inspects the services themselves.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

#include "steer/config/constants.hpp"
#include "steer/routing/hash.hpp"

namespace steer::routing {

/**
 * @class KeyModPicker
 * @brief index = key(req) % N. With an identity key this is plain sharding by id.
 * @tparam KeyFn Callable const Req& -> unsigned integral.
 */
template <class KeyFn>
class KeyModPicker final {
public:
    explicit KeyModPicker(KeyFn key) : key_(std::move(key)) {}

    template <class Req, class S>
    std::size_t pick(const Req& r, std::span<const S> services) const {
        if (services.empty()) return 0;
        return static_cast<std::size_t>(static_cast<std::uint64_t>(key_(r)) % services.size());
    }

private:
    KeyFn key_;
};

/**
 * @class SeededHashPicker
 * @brief index = mix(key(req), seed) % N. Spreads clustered keys evenly.
 */
template <class KeyFn>
class SeededHashPicker final {
public:
    explicit SeededHashPicker(KeyFn key,
                              std::uint64_t seed = steer::config::constants::HASH_SEED_DEFAULT)
        : key_(std::move(key)), seed_(seed) {}

    template <class Req, class S>
    std::size_t pick(const Req& r, std::span<const S> services) const {
        if (services.empty()) return 0;
        const auto h = mix(static_cast<std::uint64_t>(key_(r)), seed_);
        return static_cast<std::size_t>(h % services.size());
    }

    std::uint64_t seed() const noexcept { return seed_; }

private:
    KeyFn         key_;
    std::uint64_t seed_;
};

/**
 * @class RoundRobinPicker
 * @brief Stateful rotation over the services, ignoring the request.
 */
class RoundRobinPicker final {
public:
    template <class Req, class S>
    std::size_t pick(const Req&, std::span<const S> services) noexcept {
        if (services.empty()) return 0;
        return static_cast<std::size_t>(next_++ % services.size());
    }

private:
    std::uint64_t next_{0};
};

} // namespace steer::routing
