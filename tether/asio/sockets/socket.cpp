#include "socket.hpp"
#include "../watchdog.hpp"

namespace tether::asio {

    std::atomic<unsigned long> socket::connections(0);
    std::map<std::string, unsigned long> socket::context_count;
    std::mutex socket::mutex_;

    socket::socket(const std::string& context, boost::asio::io_context& io_context)
        : context_(context), io_context_(io_context), strand_(boost::asio::make_strand(io_context)) {
        ++connections;
        std::lock_guard<std::mutex> lock(mutex_);
        context_count[context_]++;
    }

    socket::~socket() {
        --connections;
        std::lock_guard<std::mutex> lock(mutex_);
        if (--context_count[context_] == 0) {
            context_count.erase(context_);
        }
    }

    boost::asio::io_context& socket::get_io_context() const {
        return io_context_;
    }

    const socket::strand_type& socket::get_strand() const {
        return strand_;
    }

    const std::string& socket::get_context() const {
        return context_;
    }

    unsigned long socket::get_connections() {
        return connections.load();
    }

    unsigned long socket::get_connections(const std::string& context) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = context_count.find(context);
        return it != context_count.end() ? it->second : 0;
    }

    bool socket::is_live() {
        return is_open();
    }

    awaitable<std::string> socket::read(size_t max_size, std::chrono::milliseconds timeout) {
        std::string chunk(max_size, '\0');
        watchdog guard(strand_, timeout, [this]() { cancel(); });
        size_t bytes = 0;
        try {
            bytes = co_await read_some(reinterpret_cast<uint8_t*>(chunk.data()), max_size);
        } catch (const boost::system::system_error&) {
            if (guard.expired()) {
                throw boost::system::system_error(boost::asio::error::timed_out, "read");
            }
            throw;
        }
        chunk.resize(bytes);
        co_return chunk;
    }

    awaitable<size_t> socket::write(std::string_view str, std::chrono::milliseconds timeout) {
        watchdog guard(strand_, timeout, [this]() { cancel(); });
        size_t bytes = 0;
        try {
            bytes = co_await write(str);
        } catch (const boost::system::system_error&) {
            if (guard.expired()) {
                throw boost::system::system_error(boost::asio::error::timed_out, "write");
            }
            throw;
        }
        co_return bytes;
    }
}
