#include "transport.hpp"
#include "sockets/tcp_socket.hpp"
#include "../util/logger.hpp"

namespace tether::asio {

std::string socket_address::to_string() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

tcp_transport::tcp_transport(boost::asio::io_context& io_context, std::string context)
    : io_context_(io_context)
    , context_(std::move(context)) {
}

boost::asio::io_context& tcp_transport::get_io_context() const {
    return io_context_;
}

awaitable<std::shared_ptr<socket>> tcp_transport::connect(const socket_address& address,
                                                          const socket_options& options) {
    auto sock = std::make_shared<tcp_socket>(context_, io_context_);

    LOG_TRACE("connecting to: {}", address.to_string());
    co_await sock->connect(address.host, std::to_string(address.port), options.connect_timeout);

    try {
        if (options.tcp_no_delay) sock->enable_tcp_no_delay();
        if (options.keep_alive) sock->set_keep_alive(true);
        if (options.receive_buffer_size) sock->set_receive_buffer_size(*options.receive_buffer_size);
        if (options.send_buffer_size) sock->set_send_buffer_size(*options.send_buffer_size);
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("cannot apply socket options on {}: {}", address.to_string(), e.what());
        sock->close();
        throw;
    }

    co_return sock;
}

}
