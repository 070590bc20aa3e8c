#include "connection_pool.hpp"
#include "../../util/logger.hpp"

#include <vector>

namespace tether::http {

managed_connection::managed_connection(std::shared_ptr<client_connection> connection,
                                       bool reused,
                                       std::weak_ptr<connection_pool> pool)
    : connection_(std::move(connection))
    , reused_(reused)
    , pool_(std::move(pool)) {
}

managed_connection::~managed_connection() {
    release();
}

managed_connection::managed_connection(managed_connection&& other) noexcept
    : connection_(std::move(other.connection_))
    , reused_(other.reused_)
    , pool_(std::move(other.pool_)) {
}

managed_connection& managed_connection::operator=(managed_connection&& other) noexcept {
    if (this != &other) {
        release();
        connection_ = std::move(other.connection_);
        reused_ = other.reused_;
        pool_ = std::move(other.pool_);
    }
    return *this;
}

void managed_connection::release() {
    if (!connection_) return;
    auto connection = std::move(connection_);
    connection_.reset();
    if (auto pool = pool_.lock()) {
        pool->release(std::move(connection));
    } else {
        // pool already gone, nobody can take this connection again
        connection->close();
    }
}

connection_pool::connection_pool(connection_factory factory)
    : factory_(std::move(factory)) {
}

connection_pool::~connection_pool() {
    // Always close connections when destroying the pool
    shutdown();
}

std::shared_ptr<client_connection> connection_pool::take_idle(const request_key& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& key_index = idle_.get<by_key>();
    auto it = key_index.find(key);
    if (it == key_index.end()) {
        return nullptr;
    }
    auto connection = it->connection;
    key_index.erase(it);
    return connection;
}

awaitable<managed_connection> connection_pool::take(const request_key& key) {
    auto connection = take_idle(key);
    bool reused = connection != nullptr;

    if (reused) {
        LOG_DEBUG("reusing connection from pool for {}", key.to_string());
    } else {
        LOG_DEBUG("creating new connection for {}", key.to_string());
        connection = co_await factory_(key);
    }

    // every checkout must prove again that the connection can be reused
    connection->set_reusable(reusable::dont_reuse);
    ++leased_;
    co_return managed_connection(std::move(connection), reused, weak_from_this());
}

void connection_pool::release(std::shared_ptr<client_connection> connection) {
    if (!connection) return;
    --leased_;

    if (connection->get_reusable() == reusable::reuse && connection->is_open()) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!closed_) {
            idle_.get<by_sequence>().push_back(idle_entry{connection->key(), connection, std::chrono::steady_clock::now()});
            LOG_TRACE("connection for {} returned to pool. idle: {}", connection->key().to_string(), idle_.size());
            return;
        }
    }

    LOG_TRACE("closing released connection for {} ({})",
              connection->key().to_string(), to_string(connection->get_reusable()));
    connection->close();
}

size_t connection_pool::evict_idle(std::chrono::steady_clock::duration max_idle) {
    std::vector<std::shared_ptr<client_connection>> evicted;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        auto& seq_index = idle_.get<by_sequence>();
        auto it = seq_index.begin();
        while (it != seq_index.end()) {
            if (now - it->idle_since >= max_idle) {
                evicted.push_back(it->connection);
                it = seq_index.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& connection : evicted) {
        connection->close();
    }
    if (!evicted.empty()) {
        LOG_DEBUG("evicted {} idle connections", evicted.size());
    }
    return evicted.size();
}

size_t connection_pool::cleanup_closed() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    auto& seq_index = idle_.get<by_sequence>();
    auto it = seq_index.begin();
    while (it != seq_index.end()) {
        if (!it->connection->is_open()) {
            it = seq_index.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void connection_pool::clear() {
    idle_container idle;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        idle.swap(idle_);
    }
    for (const auto& entry : idle) {
        entry.connection->close();
    }
}

void connection_pool::shutdown() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        closed_ = true;
    }
    clear();
}

bool connection_pool::is_shutdown() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return closed_;
}

size_t connection_pool::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return idle_.size();
}

size_t connection_pool::size(const request_key& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return idle_.get<by_key>().count(key);
}

size_t connection_pool::leased() const {
    return leased_.load();
}

}
