/// @file scheduler.hpp
/// @brief Cooperative single-threaded scheduling primitives on Boost.Asio.
///
/// Every peer runs on one asio executor. Asynchronous operations are C++20
/// coroutines (`Task<T>`); a "turn" is one handler run by the executor.

#pragma once

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace leaf_cpp {

namespace net = boost::asio;

/// An asynchronous operation returning T.
template <typename T = void>
using Task = net::awaitable<T>;

/// The executor all peers, storages and syncers share.
using Executor = net::any_io_executor;

/// Suspend until the next turn of the current executor, letting handlers
/// that were already queued run first.
auto next_turn() -> Task<>;

/// Suspend for the given duration.
auto sleep_for(std::chrono::milliseconds duration) -> Task<>;

/// A one-shot event that coroutines can wait on.
///
/// Once notified a Signal stays notified: later waits complete
/// immediately. Always create through std::make_shared; waiting keeps the
/// signal alive.
class Signal : public std::enable_shared_from_this<Signal> {
public:
    explicit Signal(Executor executor);

    Signal(const Signal&) = delete;
    auto operator=(const Signal&) -> Signal& = delete;

    /// Wake every waiter and run every on_notify callback. Idempotent.
    void notify();

    auto notified() const -> bool { return notified_; }

    /// Number of coroutines currently suspended in wait() or wait_for().
    auto waiter_count() const -> std::size_t { return waiters_.size(); }

    /// Wait until notified.
    auto wait() -> Task<>;

    /// Wait until notified or until the timeout elapses.
    /// @return true if the signal was notified.
    auto wait_for(std::chrono::milliseconds timeout) -> Task<bool>;

    /// Run `callback` on notification, or right away if already notified.
    void on_notify(std::function<void()> callback);

    /// A signal notified as soon as any of `signals` is.
    static auto any(Executor executor, const std::vector<std::shared_ptr<Signal>>& signals)
        -> std::shared_ptr<Signal>;

private:
    auto wait_until(net::steady_timer::time_point deadline) -> Task<bool>;

    Executor executor_;
    bool notified_{false};
    std::vector<net::steady_timer*> waiters_;
    std::vector<std::function<void()>> callbacks_;
};

}  // namespace leaf_cpp
