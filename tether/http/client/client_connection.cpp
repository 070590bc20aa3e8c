#include "client_connection.hpp"
#include "../../util/logger.hpp"

namespace tether::http {

std::atomic<unsigned long> client_connection::connections(0);

const char* to_string(reusable value) {
    return value == reusable::reuse ? "reuse" : "dont_reuse";
}

client_connection::client_connection(std::shared_ptr<asio::socket> socket, request_key key)
    : socket_(std::move(socket))
    , key_(std::move(key)) {
    ++connections;
    LOG_TRACE("created http client connection for {}. total: {}", key_.to_string(), connections.load());
}

client_connection::~client_connection() {
    close();
    --connections;
    LOG_TRACE("releasing http client connection for {}. total: {}", key_.to_string(), connections.load());
}

bool client_connection::is_open() const {
    return socket_ && socket_->is_open();
}

bool client_connection::is_live() {
    return socket_ && socket_->is_live();
}

void client_connection::close() {
    if (socket_ && socket_->is_open()) {
        socket_->close();
    }
}

std::string client_connection::take_next_bytes() {
    std::lock_guard<std::mutex> lock(next_bytes_mutex_);
    std::string bytes;
    bytes.swap(next_bytes_);
    return bytes;
}

void client_connection::set_next_bytes(std::string bytes) {
    std::lock_guard<std::mutex> lock(next_bytes_mutex_);
    next_bytes_ = std::move(bytes);
}

std::string client_connection::get_next_bytes() const {
    std::lock_guard<std::mutex> lock(next_bytes_mutex_);
    return next_bytes_;
}

reusable client_connection::get_reusable() const {
    return reusable_.load();
}

void client_connection::set_reusable(reusable value) {
    reusable_.store(value);
}

}
