#ifndef TETHER_TEST_FAKE_NETWORK_HPP
#define TETHER_TEST_FAKE_NETWORK_HPP

#include <algorithm>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include <tether/asio/sockets/socket.hpp>
#include <tether/asio/transport.hpp>
#include <tether/asio/ssl/security_context.hpp>
#include <tether/util/types.hpp>

namespace tether::test {

/**
 * Scripted in-memory socket. Reads return the queued inbound chunks in order; once
 * they are exhausted a read either reports end of stream or blocks until cancelled.
 * Everything written is appended to written.
 */
class fake_socket : public asio::socket {
public:
    explicit fake_socket(boost::asio::io_context& io_context)
        : asio::socket("fake", io_context)
        , stall_timer_(io_context) {
    }

    // script
    std::deque<std::string> inbound;
    bool eof_when_drained = false;
    bool stall_writes = false;
    bool live = true;
    bool secure = false;

    // observations
    std::string written;
    bool open = true;
    int closes = 0;
    int cancels = 0;
    std::string connected_host;
    std::string connected_port;

    awaitable<void> connect(const std::string& host, const std::string& port,
                            std::chrono::milliseconds) override {
        connected_host = host;
        connected_port = port;
        open = true;
        co_return;
    }

    void close() override {
        open = false;
        ++closes;
        stall_timer_.cancel();
    }

    void cancel() override {
        ++cancels;
        stall_timer_.cancel();
    }

    awaitable<size_t> read_some(uint8_t buffer[], size_t max_size) override {
        if (!open) {
            throw boost::system::system_error(boost::asio::error::bad_descriptor);
        }
        if (inbound.empty()) {
            if (eof_when_drained) co_return 0;
            co_await stall();
        }
        std::string& chunk = inbound.front();
        size_t bytes = std::min(max_size, chunk.size());
        std::memcpy(buffer, chunk.data(), bytes);
        if (bytes == chunk.size()) {
            inbound.pop_front();
        } else {
            chunk.erase(0, bytes);
        }
        co_return bytes;
    }

    awaitable<size_t> write(std::string_view str) override {
        if (!open) {
            throw boost::system::system_error(boost::asio::error::bad_descriptor);
        }
        if (stall_writes) {
            co_await stall();
        }
        written.append(str);
        co_return str.size();
    }

    using asio::socket::write;

    bool is_open() const override { return open; }
    bool is_live() override { return open && live; }
    bool is_secure() const override { return secure; }
    size_t available() const override { return inbound.empty() ? 0 : inbound.front().size(); }
    std::string get_remote_ip() const override { return connected_host; }
    std::string get_remote_port() const override { return connected_port; }

private:
    // waits until the socket is cancelled or closed, then fails as a real socket would
    awaitable<void> stall() {
        boost::system::error_code ec;
        stall_timer_.expires_at(boost::asio::steady_timer::time_point::max());
        co_await stall_timer_.async_wait(use_nothrow_awaitable(ec));
        throw boost::system::system_error(boost::asio::error::operation_aborted);
    }

    boost::asio::steady_timer stall_timer_;
};

/**
 * Transport handing out fake sockets. Every socket is prepared by setup (when set) and
 * recorded, along with the address it was opened for.
 */
class fake_transport : public asio::transport {
public:
    explicit fake_transport(boost::asio::io_context& io_context)
        : io_context_(io_context) {
    }

    std::function<void(fake_socket&)> setup;
    boost::system::error_code connect_error;

    std::vector<asio::socket_address> addresses;
    std::vector<std::shared_ptr<fake_socket>> sockets;
    std::vector<asio::socket_options> options;

    awaitable<std::shared_ptr<asio::socket>> connect(const asio::socket_address& address,
                                                     const asio::socket_options& socket_options) override {
        addresses.push_back(address);
        options.push_back(socket_options);
        if (connect_error) {
            throw boost::system::system_error(connect_error);
        }
        auto socket = std::make_shared<fake_socket>(io_context_);
        co_await socket->connect(address.host, std::to_string(address.port), socket_options.connect_timeout);
        if (setup) setup(*socket);
        sockets.push_back(socket);
        co_return socket;
    }

    std::shared_ptr<fake_socket> last_socket() const {
        return sockets.empty() ? nullptr : sockets.back();
    }

private:
    boost::asio::io_context& io_context_;
};

// Security context marking fake sockets as secure without any handshake
class fake_security_context : public asio::security_context {
public:
    std::vector<std::string> peer_hosts;
    boost::system::error_code handshake_error;

    awaitable<std::shared_ptr<asio::socket>> upgrade(std::shared_ptr<asio::socket> raw,
                                                     const std::string& peer_host) override {
        peer_hosts.push_back(peer_host);
        if (handshake_error) {
            throw boost::system::system_error(handshake_error);
        }
        if (auto fake = std::dynamic_pointer_cast<fake_socket>(raw)) {
            fake->secure = true;
        }
        co_return raw;
    }
};

}

#endif
