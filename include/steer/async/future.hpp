#pragma once
/**
 * @file future.hpp
 * @brief Future interface, the FutureLike concept and type-erased BoxFuture.
 *
 * A future is polled until it returns Ready; each Pending must be backed by a
 * registered waker. Polling a future again after it returned Ready is a
 * contract violation.
 *
 * Concrete futures do not have to derive from Future<T>: anything that models
 * FutureLike can be boxed with box() when a uniform type is needed.
 */

#include <concepts>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "steer/async/poll.hpp"
#include "steer/async/waker.hpp"
#include "steer/util/contract.hpp"

namespace steer::async {

/// Anything with an output_type and poll(Context&) -> Poll<output_type>.
template <class F>
concept FutureLike = requires(F& f, Context& cx) {
    typename F::output_type;
    { f.poll(cx) } -> std::same_as<Poll<typename F::output_type>>;
};

template <FutureLike F>
using output_of = typename F::output_type;

/**
 * @class Future
 * @brief Dynamic interface behind BoxFuture.
 */
template <class T>
class Future {
public:
    using output_type = T;
    virtual ~Future() = default;
    virtual Poll<T> poll(Context& cx) = 0;
};

/**
 * @class BoxFuture
 * @brief Owning, heap-allocated, type-erased future. Destroying it cancels the
 *        wrapped work.
 */
template <class T>
class BoxFuture final {
public:
    using output_type = T;

    BoxFuture() noexcept = default;
    explicit BoxFuture(std::unique_ptr<Future<T>> inner) noexcept : inner_(std::move(inner)) {}

    BoxFuture(BoxFuture&&) noexcept            = default;
    BoxFuture& operator=(BoxFuture&&) noexcept = default;
    BoxFuture(const BoxFuture&)                = delete;
    BoxFuture& operator=(const BoxFuture&)     = delete;

    Poll<T> poll(Context& cx) {
        util::require(inner_ != nullptr, "poll() on empty BoxFuture");
        return inner_->poll(cx);
    }

    explicit operator bool() const noexcept { return static_cast<bool>(inner_); }

private:
    std::unique_ptr<Future<T>> inner_;
};

namespace detail {
    template <class F>
    class Boxed final : public Future<output_of<F>> {
    public:
        explicit Boxed(F f) : f_(std::move(f)) {}
        Poll<output_of<F>> poll(Context& cx) override { return f_.poll(cx); }
    private:
        F f_;
    };

    template <class T> struct is_box_future : std::false_type {};
    template <class T> struct is_box_future<BoxFuture<T>> : std::true_type {};
}

/// Erase a future's concrete type. A BoxFuture passes through unchanged.
template <FutureLike F>
BoxFuture<output_of<F>> box(F f) {
    if constexpr (detail::is_box_future<F>::value) {
        return f;
    } else {
        return BoxFuture<output_of<F>>(std::make_unique<detail::Boxed<F>>(std::move(f)));
    }
}

/**
 * @class ReadyFuture
 * @brief Future that is ready on its first poll.
 */
template <class T>
class ReadyFuture final {
public:
    using output_type = T;

    explicit ReadyFuture(T value) : value_(std::move(value)) {}

    Poll<T> poll(Context&) {
        util::require(value_.has_value(), "ReadyFuture polled after completion");
        Poll<T> out{std::move(*value_)};
        value_.reset();
        return out;
    }

private:
    std::optional<T> value_;
};

template <class T>
ReadyFuture<std::decay_t<T>> make_ready(T&& value) {
    return ReadyFuture<std::decay_t<T>>(std::forward<T>(value));
}

/**
 * @class PollFn
 * @brief Future built from a callable Context& -> Poll<T>.
 */
template <class T, class Fn>
class PollFn final {
public:
    using output_type = T;

    explicit PollFn(Fn fn) : fn_(std::move(fn)) {}

    Poll<T> poll(Context& cx) { return fn_(cx); }

private:
    Fn fn_;
};

template <class T, class Fn>
PollFn<T, std::decay_t<Fn>> poll_fn(Fn&& fn) {
    return PollFn<T, std::decay_t<Fn>>(std::forward<Fn>(fn));
}

} // namespace steer::async
