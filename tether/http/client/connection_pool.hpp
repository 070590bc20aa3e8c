#ifndef TETHER_HTTP_CLIENT_CONNECTION_POOL_HPP
#define TETHER_HTTP_CLIENT_CONNECTION_POOL_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/functional/hash.hpp>

#include "client_connection.hpp"
#include "request_key.hpp"
#include "../../util/types.hpp"

namespace tether::http {

class connection_pool;

/**
 * Checkout of a pooled connection. Move only; releasing it (explicitly or on
 * destruction) hands the connection back to the pool, which keeps it idle only when
 * it was marked reusable and closes it otherwise.
 */
class managed_connection {
public:
    managed_connection() = default;
    managed_connection(std::shared_ptr<client_connection> connection,
                       bool reused,
                       std::weak_ptr<connection_pool> pool);
    ~managed_connection();

    managed_connection(managed_connection&& other) noexcept;
    managed_connection& operator=(managed_connection&& other) noexcept;
    managed_connection(const managed_connection&) = delete;
    managed_connection& operator=(const managed_connection&) = delete;

    // true when the connection was idle in the pool, false when freshly established
    bool is_reused() const { return reused_; }

    client_connection& value() const { return *connection_; }
    client_connection* operator->() const { return connection_.get(); }
    client_connection& operator*() const { return *connection_; }
    const std::shared_ptr<client_connection>& get() const { return connection_; }

    explicit operator bool() const { return connection_ != nullptr; }

    void release();

private:
    std::shared_ptr<client_connection> connection_;
    bool reused_ = false;
    std::weak_ptr<connection_pool> pool_;
};

/**
 * Keyed pool of idle client connections. The pool has no sizing policy: connections
 * are created on demand by the factory when no idle connection exists for a key, and
 * every connection released as reusable is kept idle until taken, evicted or cleared.
 */
class connection_pool : public std::enable_shared_from_this<connection_pool> {
public:
    using connection_factory =
        std::function<awaitable<std::shared_ptr<client_connection>>(const request_key&)>;

    explicit connection_pool(connection_factory factory);
    ~connection_pool();

    // Take an idle connection for the key, or create a fresh one
    awaitable<managed_connection> take(const request_key& key);

    // Return a connection, keeping it idle only if it is reusable and still open
    void release(std::shared_ptr<client_connection> connection);

    // Close idle connections older than max_idle; returns the number removed
    size_t evict_idle(std::chrono::steady_clock::duration max_idle);

    // Remove idle connections whose socket is no longer open
    size_t cleanup_closed();

    // Close every idle connection
    void clear();

    // Close every idle connection; connections released afterwards are closed too
    void shutdown();
    bool is_shutdown() const;

    size_t size() const;
    size_t size(const request_key& key) const;
    size_t leased() const;

private:
    struct idle_entry {
        request_key key;
        std::shared_ptr<client_connection> connection;
        std::chrono::steady_clock::time_point idle_since;
    };

    struct by_key {};
    struct by_sequence {};

    using idle_container = boost::multi_index_container<
        idle_entry,
        boost::multi_index::indexed_by<
            boost::multi_index::hashed_non_unique<
                boost::multi_index::tag<by_key>,
                boost::multi_index::member<idle_entry, request_key, &idle_entry::key>,
                boost::hash<request_key>
            >,
            // release order, oldest first
            boost::multi_index::sequenced<
                boost::multi_index::tag<by_sequence>
            >
        >
    >;

    std::shared_ptr<client_connection> take_idle(const request_key& key);

    connection_factory factory_;
    idle_container idle_;
    mutable std::shared_mutex mutex_;
    std::atomic<size_t> leased_{0};
    bool closed_ = false;
};

}

#endif
