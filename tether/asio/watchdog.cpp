#include "watchdog.hpp"

namespace tether::asio {

watchdog::watchdog(const boost::asio::any_io_executor& executor,
                   std::chrono::milliseconds timeout,
                   std::function<void()> on_expire)
    : state_(std::make_shared<state>(executor)) {
    if (timeout.count() <= 0) return;

    state_->on_expire = std::move(on_expire);
    state_->armed = true;
    state_->timer.expires_after(timeout);

    // the handler keeps the state alive, so it may run after the watchdog is gone
    state_->timer.async_wait([s = state_](const boost::system::error_code& ec) {
        if (ec) return;
        std::lock_guard<std::mutex> lock(s->mutex);
        if (!s->armed) return;
        s->expired = true;
        s->armed = false;
        if (s->on_expire) s->on_expire();
    });
}

watchdog::watchdog(boost::asio::io_context& io_context,
                   std::chrono::milliseconds timeout,
                   std::function<void()> on_expire)
    : watchdog(boost::asio::any_io_executor(io_context.get_executor()), timeout, std::move(on_expire)) {
}

watchdog::~watchdog() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->armed = false;
        state_->on_expire = nullptr;
    }
    state_->timer.cancel();
}

bool watchdog::expired() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->expired;
}

bool watchdog::armed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->armed;
}

}
