#ifndef TETHER_HTTP_CLIENT_HTTP_CLIENT_HPP
#define TETHER_HTTP_CLIENT_HTTP_CLIENT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/noncopyable.hpp>

#include "client_exchange.hpp"
#include "codec.hpp"
#include "connection_binding.hpp"
#include "connection_establisher.hpp"
#include "connection_pool.hpp"
#include "exchange_pipeline.hpp"
#include "request_preprocessor.hpp"
#include "../common/http_request.hpp"
#include "../../asio/transport.hpp"
#include "../../asio/ssl/security_context.hpp"
#include "../../util/types.hpp"

namespace tether::http {

/**
 * HTTP/1.1 client over a keyed pool of persistent connections. Each request checks out
 * a live connection for its (scheme, host, port), is written with the configured
 * encoder and answered through the configured parser. The returned exchange must be
 * finished to return the connection to the pool.
 *
 * Requests may run concurrently on any number of coroutines; the client must outlive
 * every request it sends. The pool refers back to the client, so it is neither copied
 * nor moved.
 */
class http_client : public boost::noncopyable {
public:
    static constexpr auto DEFAULT_USER_AGENT = "tether/1.0";

    http_client(boost::asio::io_context& io_context,
                std::shared_ptr<request_encoder> encoder,
                std::shared_ptr<response_parser> parser);

    http_client(std::shared_ptr<asio::transport> transport,
                std::shared_ptr<request_encoder> encoder,
                std::shared_ptr<response_parser> parser);

    virtual ~http_client();

    // Configuration setters (fluent API), zero durations disable the timeout
    http_client& timeout(std::chrono::milliseconds t) { settings_.timeout = t; return *this; }
    http_client& idle_timeout(std::chrono::milliseconds t) { settings_.idle_timeout = t; return *this; }
    http_client& chunk_size(size_t size) { settings_.chunk_size = size; return *this; }
    http_client& max_response_header_size(size_t size) { settings_.max_response_header_size = size; return *this; }
    http_client& user_agent(std::optional<std::string> agent);
    http_client& security(std::shared_ptr<asio::security_context> security);
    http_client& verify_ssl(bool verify);
    http_client& socket_options(asio::socket_options options);
    http_client& max_stale_retries(unsigned retries) { max_stale_retries_ = retries; return *this; }

    // Configuration getters
    std::chrono::milliseconds get_timeout() const { return settings_.timeout; }
    std::chrono::milliseconds get_idle_timeout() const { return settings_.idle_timeout; }
    size_t get_chunk_size() const { return settings_.chunk_size; }
    size_t get_max_response_header_size() const { return settings_.max_response_header_size; }
    const std::optional<std::string>& get_user_agent() const { return preprocessor_.get_user_agent(); }
    const std::shared_ptr<asio::security_context>& get_security() const { return establisher_.get_security_context(); }
    const asio::socket_options& get_socket_options() const { return establisher_.get_socket_options(); }
    unsigned get_max_stale_retries() const { return max_stale_retries_; }

    // Request creation, throws std::invalid_argument on an unsupported URL
    std::shared_ptr<http_request> create_request(method m, const std::string& url) const;

    // Send a request over a pooled connection
    awaitable<client_exchange> send(std::shared_ptr<http_request> request);

    // Check out a live connection for the request destination
    awaitable<managed_connection> acquire(const http_request& request);

    // Send a request over a connection obtained from acquire()
    awaitable<client_exchange> send(std::shared_ptr<http_request> request, managed_connection connection);

    // Connection pool management
    void clear_connections() { pool_->clear(); }
    size_t pool_size() const { return pool_->size(); }
    connection_pool& get_pool() { return *pool_; }

private:
    awaitable<client_exchange> exchange(std::shared_ptr<http_request> request, managed_connection connection);

    std::shared_ptr<request_encoder> encoder_;
    std::shared_ptr<response_parser> parser_;
    connection_establisher establisher_;
    request_preprocessor preprocessor_;
    exchange_settings settings_;
    unsigned max_stale_retries_ = DEFAULT_MAX_STALE_RETRIES;
    std::shared_ptr<connection_pool> pool_;
};

}

#endif
