#include "ssl_socket.hpp"

namespace tether::asio {

ssl_socket::ssl_socket(const std::string& context, boost::asio::io_context& io_context,
                       const std::shared_ptr<boost::asio::ssl::context>& ssl_context)
    : tcp_socket(context, io_context)
    , ssl_stream_(socket_, *ssl_context)
    , ssl_context_(ssl_context) {
}

ssl_socket::ssl_socket(const std::string& context, const std::shared_ptr<tcp_socket>& socket,
                       const std::shared_ptr<boost::asio::ssl::context>& ssl_context)
    : tcp_socket(context, socket)
    , ssl_stream_(socket_, *ssl_context)
    , ssl_context_(ssl_context) {
}

ssl_socket::~ssl_socket() {
    LOG_TRACE("releasing ssl connection");
}

void ssl_socket::close() {
    // close underlying TCP socket
    tcp_socket::close();

    // clear ssl session to allow reusing socket (if necessary)
    // From SSL_clear: If a session is still open, it is considered bad and will be removed
    // from the session cache, as required by RFC2246
    SSL_clear(ssl_stream_.native_handle());
}

void ssl_socket::set_verify_host(bool verify) {
    verify_host_ = verify;
}

awaitable<void> ssl_socket::handshake(const std::string& host) {
    boost::system::error_code ec;
    if (!host.empty()) {
        // add support for SNI
        if (!SSL_set_tlsext_host_name(ssl_stream_.native_handle(), host.c_str())) {
            LOG_ERROR("SSL_set_tlsext_host_name failed. SNI will fail");
        }
        if (verify_host_) {
            ssl_stream_.set_verify_callback(boost::asio::ssl::host_name_verification(host));
        }
    }
    co_await ssl_stream_.async_handshake(
        boost::asio::ssl::stream_base::client,
        use_nothrow_awaitable(ec));
    if (ec) {
        throw boost::system::system_error(ec, "ssl handshake");
    }
}

awaitable<size_t> ssl_socket::read_some(uint8_t buffer[], size_t max_size) {
    boost::system::error_code ec;
    auto bytes = co_await ssl_stream_.async_read_some(
        boost::asio::buffer(buffer, max_size),
        use_nothrow_awaitable(ec));
    if (ec == boost::asio::error::eof || ec == boost::asio::ssl::error::stream_truncated) {
        co_return 0;
    }
    if (ec) throw boost::system::system_error(ec);
    co_return bytes;
}

awaitable<size_t> ssl_socket::write(std::string_view str) {
    boost::system::error_code ec;
    auto bytes = co_await boost::asio::async_write(
        ssl_stream_,
        boost::asio::buffer(str.data(), str.size()),
        use_nothrow_awaitable(ec));
    if (ec) throw boost::system::system_error(ec);
    co_return bytes;
}

bool ssl_socket::is_live() {
    if (!socket_.is_open()) return false;

    // run one non-blocking read through the tls engine: post-handshake records such
    // as session tickets are consumed and the read stops at would_block, while a
    // close_notify, a truncated stream or unsolicited data mean the peer is gone
    boost::system::error_code ec;
    const bool user_non_blocking = socket_.non_blocking();
    socket_.non_blocking(true, ec);
    if (ec) return false;

    uint8_t probe = 0;
    auto bytes = ssl_stream_.read_some(boost::asio::buffer(&probe, 1), ec);

    boost::system::error_code ignored;
    socket_.non_blocking(user_non_blocking, ignored);

    if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
        return true;
    }
    if (ec) {
        LOG_TRACE("ssl socket is not live: {}", ec.message());
    } else if (bytes > 0) {
        LOG_TRACE("ssl socket is not live: unsolicited data while idle");
    }
    return false;
}

bool ssl_socket::is_secure() const {
    return true;
}

}
