#include "tcp_socket.hpp"
#include "../watchdog.hpp"

namespace tether::asio {

tcp_socket::tcp_socket(const std::string& context, boost::asio::io_context& io_context)
    : socket(context, io_context), socket_(io_context) {
}

tcp_socket::tcp_socket(const std::string& context, const std::shared_ptr<tcp_socket>& tcp_socket)
    : socket(context, tcp_socket->get_io_context()), socket_(std::move(tcp_socket->get_socket())) {
}

tcp_socket::~tcp_socket() {
    LOG_TRACE("releasing tcp connection");
    close();
}

void tcp_socket::close() {
    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
    socket_.close(ec);
    LOG_TRACE("closing tcp socket result: {}", ec.message());
}

void tcp_socket::cancel() {
    boost::system::error_code ec;
    socket_.cancel(ec);
}

awaitable<void> tcp_socket::connect(
    const std::string& host,
    const std::string& port,
    std::chrono::milliseconds timeout)
{
    close();

    // Resolve host
    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = co_await resolver.async_resolve(host, port, use_nothrow_awaitable(ec));
    if (ec) {
        throw boost::system::system_error(ec, "resolve " + host);
    }

    // Race between connect and timeout
    watchdog guard(strand_, timeout, [this]() { cancel(); });
    co_await boost::asio::async_connect(socket_, endpoints, use_nothrow_awaitable(ec));

    if (ec) {
        bool timed_out = guard.expired();
        close();
        throw boost::system::system_error(
            timed_out ? boost::asio::error::timed_out : ec, "connect " + host + ":" + port);
    }
    LOG_TRACE("connected to {}:{}", host, port);
}

boost::asio::ip::tcp::socket& tcp_socket::get_socket() {
    return socket_;
}

std::string tcp_socket::get_remote_ip() const {
    boost::system::error_code ec;
    auto remote_ep = socket_.remote_endpoint(ec);
    if (!ec) {
        return remote_ep.address().to_string();
    }
    return "0.0.0.0";
}

std::string tcp_socket::get_remote_port() const {
    boost::system::error_code ec;
    auto remote_ep = socket_.remote_endpoint(ec);
    if (!ec) {
        return std::to_string(remote_ep.port());
    }
    return "0";
}

awaitable<size_t> tcp_socket::read_some(uint8_t* buffer, size_t max_size) {
    boost::system::error_code ec;
    auto bytes = co_await socket_.async_read_some(
        boost::asio::buffer(buffer, max_size),
        use_nothrow_awaitable(ec));
    if (ec == boost::asio::error::eof) co_return 0;
    if (ec) throw boost::system::system_error(ec);
    co_return bytes;
}

awaitable<size_t> tcp_socket::write(std::string_view str) {
    boost::system::error_code ec;
    auto bytes = co_await boost::asio::async_write(
        socket_,
        boost::asio::buffer(str.data(), str.size()),
        use_nothrow_awaitable(ec));
    if (ec) throw boost::system::system_error(ec);
    co_return bytes;
}

void tcp_socket::enable_tcp_no_delay() {
    socket_.set_option(boost::asio::ip::tcp::no_delay(true));
}

void tcp_socket::disable_tcp_no_delay() {
    socket_.set_option(boost::asio::ip::tcp::no_delay(false));
}

void tcp_socket::set_keep_alive(bool keep_alive) {
    socket_.set_option(boost::asio::socket_base::keep_alive(keep_alive));
}

void tcp_socket::set_receive_buffer_size(int size) {
    socket_.set_option(boost::asio::socket_base::receive_buffer_size(size));
}

void tcp_socket::set_send_buffer_size(int size) {
    socket_.set_option(boost::asio::socket_base::send_buffer_size(size));
}

bool tcp_socket::is_open() const {
    return socket_.is_open();
}

bool tcp_socket::is_live() {
    if (!socket_.is_open()) return false;

    // peek one byte without blocking: would_block means the peer is still there, end
    // of stream or reset means it went away while idle. An idle connection has nothing
    // left to read, so any byte is a late message from a peer about to hang up
    boost::system::error_code ec;
    const bool user_non_blocking = socket_.non_blocking();
    socket_.non_blocking(true, ec);
    if (ec) return false;

    uint8_t probe = 0;
    auto bytes = socket_.receive(boost::asio::buffer(&probe, 1),
                                 boost::asio::socket_base::message_peek, ec);

    boost::system::error_code ignored;
    socket_.non_blocking(user_non_blocking, ignored);

    if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
        return true;
    }
    if (ec) {
        LOG_TRACE("tcp socket is not live: {}", ec.message());
        return false;
    }
    if (bytes > 0) {
        LOG_TRACE("tcp socket is not live: unsolicited data while idle");
    }
    return false;
}

bool tcp_socket::is_secure() const {
    return false;
}

size_t tcp_socket::available() const {
    boost::system::error_code ec;
    auto size = socket_.available(ec);
    if (ec) {
        LOG_ERROR("error while getting socket available bytes ({}): {}", size, ec.message());
    }
    return size;
}

}
