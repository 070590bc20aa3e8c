#ifndef TETHER_ASIO_TRANSPORT_HPP
#define TETHER_ASIO_TRANSPORT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <utility>
#include <boost/asio.hpp>

#include "sockets/socket.hpp"
#include "../util/types.hpp"

namespace tether::asio {

// Unresolved network address: a host name (or literal) and a port
struct socket_address {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const;

    bool operator==(const socket_address& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const socket_address& other) const {
        return !(*this == other);
    }
};

// Transport-level options applied to every outbound connection
struct socket_options {
    bool tcp_no_delay = true;
    bool keep_alive = false;
    std::optional<int> receive_buffer_size;
    std::optional<int> send_buffer_size;
    std::chrono::milliseconds connect_timeout{std::chrono::seconds{10}};
};

/**
 * Opens raw transport connections. Implementations throw boost::system::system_error
 * when the connection cannot be opened.
 */
class transport {
public:
    virtual ~transport() = default;

    virtual awaitable<std::shared_ptr<socket>> connect(const socket_address& address,
                                                       const socket_options& options) = 0;
};

// TCP transport over the Boost.Asio resolver and tcp_socket
class tcp_transport : public transport {
public:
    explicit tcp_transport(boost::asio::io_context& io_context, std::string context = "http_client");

    awaitable<std::shared_ptr<socket>> connect(const socket_address& address,
                                               const socket_options& options) override;

    boost::asio::io_context& get_io_context() const;

private:
    boost::asio::io_context& io_context_;
    std::string context_;
};

}

#endif
