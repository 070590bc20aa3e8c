#include "http_client.hpp"
#include "errors.hpp"
#include "../../util/logger.hpp"

#include <stdexcept>

namespace tether::http {

http_client::http_client(boost::asio::io_context& io_context,
                         std::shared_ptr<request_encoder> encoder,
                         std::shared_ptr<response_parser> parser)
    : http_client(std::make_shared<asio::tcp_transport>(io_context), std::move(encoder), std::move(parser)) {
}

http_client::http_client(std::shared_ptr<asio::transport> transport,
                         std::shared_ptr<request_encoder> encoder,
                         std::shared_ptr<response_parser> parser)
    : encoder_(std::move(encoder))
    , parser_(std::move(parser))
    , establisher_(std::move(transport), std::make_shared<asio::ssl_security_context>(true))
    , preprocessor_(std::string{DEFAULT_USER_AGENT})
    , pool_(std::make_shared<connection_pool>([this](const request_key& key) {
          return establisher_.establish(key);
      })) {
    if (!encoder_ || !parser_) {
        throw std::invalid_argument("http client requires a request encoder and a response parser");
    }
}

http_client::~http_client() {
    LOG_DEBUG("destroying http client");
    pool_->shutdown();
}

http_client& http_client::user_agent(std::optional<std::string> agent) {
    preprocessor_.set_user_agent(std::move(agent));
    return *this;
}

http_client& http_client::security(std::shared_ptr<asio::security_context> security) {
    establisher_.set_security_context(std::move(security));
    return *this;
}

http_client& http_client::verify_ssl(bool verify) {
    establisher_.set_security_context(std::make_shared<asio::ssl_security_context>(verify));
    return *this;
}

http_client& http_client::socket_options(asio::socket_options options) {
    establisher_.set_socket_options(std::move(options));
    return *this;
}

std::shared_ptr<http_request> http_client::create_request(method m, const std::string& url) const {
    auto request = std::make_shared<http_request>();
    request->set_method(m);
    if (!request->set_url(url)) {
        throw std::invalid_argument("unsupported url: " + url);
    }
    return request;
}

awaitable<managed_connection> http_client::acquire(const http_request& request) {
    co_return co_await get_valid_managed(*pool_, request_key::from_request(request), max_stale_retries_);
}

awaitable<client_exchange> http_client::send(std::shared_ptr<http_request> request) {
    auto processed = preprocessor_.preprocess(*request);
    auto connection = co_await get_valid_managed(*pool_, request_key::from_request(*processed), max_stale_retries_);
    co_return co_await exchange(std::move(processed), std::move(connection));
}

awaitable<client_exchange> http_client::send(std::shared_ptr<http_request> request, managed_connection connection) {
    if (!connection) {
        throw std::invalid_argument("cannot send over an empty connection");
    }
    auto key = request_key::from_request(*request);
    if (key != connection->key()) {
        throw std::invalid_argument("connection for " + connection->key().to_string() +
                                    " cannot send a request to " + key.to_string());
    }
    co_return co_await exchange(preprocessor_.preprocess(*request), std::move(connection));
}

awaitable<client_exchange> http_client::exchange(std::shared_ptr<http_request> request, managed_connection connection) {
    LOG_DEBUG("sending {} {} over {} connection to {}", get_method(request->get_method()), request->get_uri(),
              connection.is_reused() ? "pooled" : "new", connection->key().to_string());

    // the exchange runs on the socket strand, serialized with its timeouts
    exchange_pipeline pipeline(encoder_, parser_, settings_);
    auto result = co_await co_spawn(connection->get_socket()->get_strand(),
                                    pipeline.run(request, connection.value()),
                                    use_awaitable);
    co_return client_exchange(std::move(request), std::move(result), std::move(connection));
}

}
