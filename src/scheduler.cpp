#include <leaf-cpp/scheduler.hpp>

#include <boost/asio/redirect_error.hpp>

#include <algorithm>

namespace leaf_cpp {

auto next_turn() -> Task<> {
    auto executor = co_await net::this_coro::executor;
    co_await net::post(executor, net::use_awaitable);
}

auto sleep_for(std::chrono::milliseconds duration) -> Task<> {
    auto timer = net::steady_timer{co_await net::this_coro::executor, duration};
    co_await timer.async_wait(net::use_awaitable);
}

Signal::Signal(Executor executor) : executor_{std::move(executor)} {}

void Signal::notify() {
    if (notified_) return;
    notified_ = true;
    for (auto* timer : waiters_) {
        timer->cancel();
    }
    waiters_.clear();
    auto callbacks = std::move(callbacks_);
    callbacks_.clear();
    for (auto& callback : callbacks) {
        callback();
    }
}

auto Signal::wait() -> Task<> {
    co_await wait_until(net::steady_timer::time_point::max());
}

auto Signal::wait_for(std::chrono::milliseconds timeout) -> Task<bool> {
    co_return co_await wait_until(net::steady_timer::clock_type::now() + timeout);
}

auto Signal::wait_until(net::steady_timer::time_point deadline) -> Task<bool> {
    if (notified_) co_return true;

    auto self = shared_from_this();
    auto timer = net::steady_timer{executor_, deadline};

    // Deregisters the timer even when the frame is destroyed while suspended
    struct Registration {
        std::vector<net::steady_timer*>& waiters;
        net::steady_timer* timer;
        ~Registration() { std::erase(waiters, timer); }
    };
    waiters_.push_back(&timer);
    auto registration = Registration{waiters_, &timer};

    // Cancellation (operation_aborted) is how notify() wakes us
    auto ec = boost::system::error_code{};
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    co_return notified_;
}

void Signal::on_notify(std::function<void()> callback) {
    if (notified_) {
        callback();
        return;
    }
    callbacks_.push_back(std::move(callback));
}

auto Signal::any(Executor executor, const std::vector<std::shared_ptr<Signal>>& signals)
    -> std::shared_ptr<Signal> {
    auto combined = std::make_shared<Signal>(std::move(executor));
    for (const auto& signal : signals) {
        signal->on_notify([weak = std::weak_ptr<Signal>{combined}]() {
            if (auto target = weak.lock()) target->notify();
        });
    }
    return combined;
}

}  // namespace leaf_cpp
