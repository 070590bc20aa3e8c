#ifndef TETHER_HTTP_CLIENT_CONNECTION_HPP
#define TETHER_HTTP_CLIENT_CONNECTION_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <boost/noncopyable.hpp>

#include "request_key.hpp"
#include "../../asio/sockets/socket.hpp"

namespace tether::http {

enum class reusable {
    reuse,
    dont_reuse
};

const char* to_string(reusable value);

/**
 * One live transport connection bound to a single request key. Besides the socket it
 * keeps the bytes already read past the end of the previous response (they belong to
 * the next exchange on this connection) and the reusability flag read by the pool when
 * the connection is released. Both are only written by the task holding the checkout.
 */
class client_connection : public boost::noncopyable {
public:
    static std::atomic<unsigned long> connections;

    client_connection(std::shared_ptr<asio::socket> socket, request_key key);
    virtual ~client_connection();

    const request_key& key() const { return key_; }
    std::shared_ptr<asio::socket> get_socket() const { return socket_; }

    // Connection management
    bool is_open() const;
    bool is_live();
    void close();

    // Leftover bytes from the previous exchange
    std::string take_next_bytes();
    void set_next_bytes(std::string bytes);
    std::string get_next_bytes() const;

    // Reusability flag, dont_reuse until an exchange proves otherwise
    reusable get_reusable() const;
    void set_reusable(reusable value);

private:
    std::shared_ptr<asio::socket> socket_;
    request_key key_;
    std::string next_bytes_;
    mutable std::mutex next_bytes_mutex_;
    std::atomic<reusable> reusable_{reusable::dont_reuse};
};

}

#endif
