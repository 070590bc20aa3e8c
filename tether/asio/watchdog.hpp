#ifndef TETHER_ASIO_WATCHDOG_HPP
#define TETHER_ASIO_WATCHDOG_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/noncopyable.hpp>

namespace tether::asio {

/**
 * Scoped timer racing an asynchronous operation. When the timeout elapses while the
 * watchdog is still alive, the expiration callback runs (normally cancelling a socket)
 * and expired() reports true. Destroying the watchdog disarms it and waits for a
 * callback already running on another thread. A zero timeout disables the watchdog.
 *
 * The timer runs on the given executor; passing the strand that serializes the guarded
 * socket keeps the callback from interleaving with the operation it races.
 */
class watchdog : private boost::noncopyable {
public:
    watchdog(const boost::asio::any_io_executor& executor,
             std::chrono::milliseconds timeout,
             std::function<void()> on_expire);

    watchdog(boost::asio::io_context& io_context,
             std::chrono::milliseconds timeout,
             std::function<void()> on_expire);
    ~watchdog();

    bool expired() const;
    bool armed() const;

private:
    struct state {
        explicit state(const boost::asio::any_io_executor& executor) : timer(executor) {}
        boost::asio::steady_timer timer;
        std::mutex mutex;
        std::function<void()> on_expire;
        bool armed = false;
        bool expired = false;
    };

    std::shared_ptr<state> state_;
};

}

#endif
