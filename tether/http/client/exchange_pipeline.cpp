#include "exchange_pipeline.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <boost/lexical_cast/bad_lexical_cast.hpp>

#include "../../asio/watchdog.hpp"
#include "../../util/logger.hpp"

namespace tether::http {

namespace {

    [[noreturn]] void throw_malformed(const std::exception& e, const request_key& key) {
        LOG_ERROR("invalid response from {}: {}", key.to_string(), e.what());
        throw exchange_error(client_error::malformed_response, key, exchange_phase::read);
    }

    [[noreturn]] void throw_read_error(const boost::system::system_error& e,
                                       bool deadline_expired,
                                       const request_key& key,
                                       exchange_phase phase) {
        if (deadline_expired) {
            throw exchange_error(client_error::exchange_timeout, key, phase);
        }
        if (e.code() == boost::asio::error::timed_out) {
            throw exchange_error(client_error::read_timeout, key, phase);
        }
        throw exchange_error(e.code(), key, phase);
    }

    awaitable<std::string> read_chunk(std::shared_ptr<asio::socket> socket,
                                      size_t chunk_size,
                                      std::chrono::milliseconds idle_timeout) {
        co_return co_await socket->read(chunk_size, idle_timeout);
    }

    awaitable<std::optional<std::string>> drain_body(drain_function drain, request_key key) {
        if (!drain) co_return std::nullopt;
        try {
            co_return co_await drain();
        } catch (const exchange_error&) {
            throw;
        } catch (const boost::system::system_error& e) {
            throw_read_error(e, false, key, exchange_phase::drain);
        }
    }

    awaitable<std::string> read_body(read_function body, request_key key) {
        try {
            co_return co_await body();
        } catch (const exchange_error&) {
            throw;
        } catch (const boost::system::system_error& e) {
            throw_read_error(e, false, key, exchange_phase::read);
        }
    }

}

exchange_pipeline::exchange_pipeline(std::shared_ptr<request_encoder> encoder,
                                     std::shared_ptr<response_parser> parser,
                                     exchange_settings settings)
    : encoder_(std::move(encoder))
    , parser_(std::move(parser))
    , settings_(settings) {
}

awaitable<void> exchange_pipeline::write_request(const http_request& request,
                                                 client_connection& connection) const {
    std::string bytes = encoder_->encode(request);
    request.log("CLIENT->", 0);

    try {
        co_await connection.get_socket()->write(bytes, settings_.idle_timeout);
    } catch (const boost::system::system_error& e) {
        if (e.code() == boost::asio::error::timed_out) {
            LOG_ERROR("timed out writing request to {}", connection.key().to_string());
            throw exchange_error(client_error::write_timeout, connection.key(), exchange_phase::write);
        }
        LOG_ERROR("error writing request to {}: {}", connection.key().to_string(), e.what());
        throw exchange_error(e.code(), connection.key(), exchange_phase::write);
    }
}

awaitable<pooled_exchange> exchange_pipeline::run(std::shared_ptr<http_request> request,
                                                  client_connection& connection) const {
    const request_key key = connection.key();
    auto socket = connection.get_socket();

    co_await write_request(*request, connection);

    // bytes already read past the previous response on this connection
    std::string head = connection.take_next_bytes();
    if (!head.empty()) {
        LOG_TRACE("starting response parse with {} buffered bytes", head.size());
    }

    const size_t chunk_size = settings_.chunk_size;
    const auto idle_timeout = settings_.idle_timeout;
    read_function read = [socket, chunk_size, idle_timeout]() {
        return read_chunk(socket, chunk_size, idle_timeout);
    };

    parsed_response parsed;
    {
        asio::watchdog deadline(socket->get_strand(), settings_.timeout, [socket]() { socket->cancel(); });
        try {
            parsed = co_await parser_->parse(settings_.max_response_header_size, std::move(head), read);
        } catch (const exchange_error&) {
            throw;
        } catch (const boost::system::system_error& e) {
            LOG_ERROR("error reading response from {}: {}", key.to_string(), e.what());
            throw_read_error(e, deadline.expired(), key, exchange_phase::read);
        } catch (const std::runtime_error& e) {
            throw_malformed(e, key);
        } catch (const std::invalid_argument& e) {
            throw_malformed(e, key);
        } catch (const std::out_of_range& e) {
            throw_malformed(e, key);
        } catch (const boost::bad_lexical_cast& e) {
            throw_malformed(e, key);
        }
    }

    if (!parsed.response) {
        throw exchange_error(client_error::malformed_response, key, exchange_phase::read);
    }
    parsed.response->log("<-CLIENT", 0);

    pooled_exchange exchange;
    exchange.response = std::move(parsed.response);
    if (parsed.body) {
        exchange.body = [body = std::move(parsed.body), key]() {
            return read_body(body, key);
        };
    }
    exchange.drain = deferred_drain([drain = std::move(parsed.drain), key]() {
        return drain_body(drain, key);
    });
    co_return exchange;
}

}
