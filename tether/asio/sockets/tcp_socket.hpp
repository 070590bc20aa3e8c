#ifndef TETHER_ASIO_TCP_SOCKET_HPP
#define TETHER_ASIO_TCP_SOCKET_HPP

#include <memory>
#include <string_view>

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>

#include "../../util/logger.hpp"
#include "socket.hpp"

namespace tether::asio {

class tcp_socket : public socket {

public:
    // constructors and destructors
    tcp_socket(const std::string &context, boost::asio::io_context &io_context);
    tcp_socket(const std::string &context, const std::shared_ptr<tcp_socket>& tcp_socket);
    ~tcp_socket() override;

    // socket control
    awaitable<void> connect(
        const std::string &host,
        const std::string &port,
        std::chrono::milliseconds timeout) override;
    void close() override;
    void cancel() override;

    // read operations
    awaitable<size_t> read_some(uint8_t buffer[], size_t max_size) override;

    // write operations
    awaitable<size_t> write(std::string_view str) override;
    using socket::write;

    // some getters to check the state
    bool is_open() const override;
    bool is_live() override;
    bool is_secure() const override;
    size_t available() const override;
    std::string get_remote_ip() const override;
    std::string get_remote_port() const override;

    // other methods
    void enable_tcp_no_delay();
    void disable_tcp_no_delay();
    void set_keep_alive(bool keep_alive);
    void set_receive_buffer_size(int size);
    void set_send_buffer_size(int size);
    virtual boost::asio::ip::tcp::socket &get_socket();

protected:
    boost::asio::ip::tcp::socket socket_;
};

}

#endif
