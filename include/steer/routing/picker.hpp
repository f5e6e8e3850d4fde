#pragma once
/**
 * @file picker.hpp
 * @brief Picker: maps a request to an index into the combinator's services.
 * @details A picker is either an object with pick(const Req&, std::span<const S>)
 *          or a callable with the same signature. Determinism is not assumed;
 *          the combinator asks once per call and never caches the answer.
 */

#include <concepts>
#include <cstddef>
#include <functional>
#include <span>
#include <type_traits>

namespace steer::routing {

template <class P, class S, class Req>
concept MemberPicker = requires(P& p, const Req& r, std::span<const S> services) {
    { p.pick(r, services) } -> std::convertible_to<std::size_t>;
};

template <class P, class S, class Req>
concept CallablePicker =
    std::invocable<P&, const Req&, std::span<const S>> &&
    std::convertible_to<std::invoke_result_t<P&, const Req&, std::span<const S>>, std::size_t>;

template <class P, class S, class Req>
concept Picker = MemberPicker<P, S, Req> || CallablePicker<P, S, Req>;

/// Dispatch to p.pick(...) or p(...), whichever the picker provides.
template <class S, class Req, class P>
    requires Picker<P, S, Req>
std::size_t pick(P& p, const Req& r, std::span<const S> services) {
    if constexpr (MemberPicker<P, S, Req>) {
        return static_cast<std::size_t>(p.pick(r, services));
    } else {
        return static_cast<std::size_t>(std::invoke(p, r, services));
    }
}

} // namespace steer::routing
