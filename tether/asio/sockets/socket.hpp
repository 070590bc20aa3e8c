#ifndef TETHER_ASIO_SOCKET_HPP
#define TETHER_ASIO_SOCKET_HPP

#include <atomic>
#include <chrono>
#include <mutex>
#include <map>
#include <string>
#include <string_view>

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>

#include "../../util/types.hpp"

namespace tether::asio {

class socket : private boost::asio::noncopyable {

public:
    // constructors and destructors
    socket(const std::string &context, boost::asio::io_context &io_context);
    virtual ~socket();

    // socket control
    virtual awaitable<void> connect(
        const std::string &host,
        const std::string &port,
        std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
    virtual void cancel() = 0;

    // read operations, returning 0 at end of stream
    virtual awaitable<size_t> read_some(uint8_t buffer[], size_t max_size) = 0;

    // write operations
    virtual awaitable<size_t> write(std::string_view str) = 0;

    // bounded operations, failing with boost::asio::error::timed_out; their timers run
    // on the socket strand
    awaitable<std::string> read(size_t max_size, std::chrono::milliseconds timeout);
    awaitable<size_t> write(std::string_view str, std::chrono::milliseconds timeout);

    // some getters to check the state
    virtual bool is_open() const = 0;
    virtual bool is_live();
    virtual bool is_secure() const = 0;
    virtual size_t available() const = 0;
    virtual std::string get_remote_ip() const = 0;
    virtual std::string get_remote_port() const = 0;

    // other methods
    boost::asio::io_context &get_io_context() const;

    // strand serializing the operations on this socket with their timeouts
    using strand_type = boost::asio::strand<boost::asio::io_context::executor_type>;
    const strand_type& get_strand() const;
    const std::string& get_context() const;
    static unsigned long get_connections();
    static unsigned long get_connections(const std::string& context);

protected:
    std::string context_;
    boost::asio::io_context &io_context_;
    strand_type strand_;
    static std::atomic<unsigned long> connections;
    static std::map<std::string, unsigned long> context_count;
    static std::mutex mutex_;
};

}

#endif
