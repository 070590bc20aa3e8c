#ifndef TETHER_TYPES
#define TETHER_TYPES

#include <functional>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace tether {

    // Awaitable type alias
    template<typename T = void>
    using awaitable = boost::asio::awaitable<T>;

    // Import commonly used awaitable utilities
    using boost::asio::use_awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;

    // For error handling without exceptions: the error is written to ec
    inline auto use_nothrow_awaitable(boost::system::error_code& ec) {
        return boost::asio::redirect_error(boost::asio::use_awaitable, ec);
    }

}

#endif
