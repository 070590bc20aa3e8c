#ifndef TETHER_ASIO_SSL_SOCKET_HPP
#define TETHER_ASIO_SSL_SOCKET_HPP

#include "tcp_socket.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

namespace tether::asio {

class ssl_socket : public tcp_socket {
public:
    // constructors and destructors
    ssl_socket(const std::string& context, boost::asio::io_context& io_context,
               const std::shared_ptr<boost::asio::ssl::context>& ssl_context);
    ssl_socket(const std::string& context, const std::shared_ptr<tcp_socket>& socket,
               const std::shared_ptr<boost::asio::ssl::context>& ssl_context);
    ~ssl_socket() override;

    // socket control
    void close() override;

    // client handshake announcing and, when verifying, checking the peer host name
    awaitable<void> handshake(const std::string& host);
    void set_verify_host(bool verify);

    // read operations
    awaitable<size_t> read_some(uint8_t buffer[], size_t max_size) override;

    // write operations
    awaitable<size_t> write(std::string_view str) override;
    using tcp_socket::write;

    // some getters to check the state
    bool is_live() override;
    bool is_secure() const override;

private:
    boost::asio::ssl::stream<boost::asio::ip::tcp::socket&> ssl_stream_;
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;
    bool verify_host_ = false;
};

}

#endif
