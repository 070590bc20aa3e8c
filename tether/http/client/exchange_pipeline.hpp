#ifndef TETHER_HTTP_CLIENT_EXCHANGE_PIPELINE_HPP
#define TETHER_HTTP_CLIENT_EXCHANGE_PIPELINE_HPP

#include <chrono>
#include <memory>

#include "client_connection.hpp"
#include "codec.hpp"
#include "deferred_drain.hpp"
#include "../../util/types.hpp"

namespace tether::http {

struct exchange_settings {
    static constexpr size_t DEFAULT_CHUNK_SIZE = 32 * 1024;
    static constexpr size_t DEFAULT_MAX_RESPONSE_HEADER_SIZE = 4096;
    static constexpr auto DEFAULT_IDLE_TIMEOUT = std::chrono::seconds{60};
    static constexpr auto DEFAULT_TIMEOUT = std::chrono::seconds{45};

    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    size_t max_response_header_size = DEFAULT_MAX_RESPONSE_HEADER_SIZE;
    // bounds every single read or write, zero disables it
    std::chrono::milliseconds idle_timeout = DEFAULT_IDLE_TIMEOUT;
    // bounds the whole response header parse, zero disables it
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
};

// Outcome of one write/read cycle over a pooled connection
struct pooled_exchange {
    std::shared_ptr<http_response> response;
    read_function body;
    deferred_drain drain;
};

/**
 * Writes a request on a checked out connection and parses the response, starting with
 * the bytes left on the connection by its previous exchange. Failures are thrown as
 * exchange_error and never retried here.
 */
class exchange_pipeline {
public:
    exchange_pipeline(std::shared_ptr<request_encoder> encoder,
                      std::shared_ptr<response_parser> parser,
                      exchange_settings settings = {});

    awaitable<pooled_exchange> run(std::shared_ptr<http_request> request,
                                   client_connection& connection) const;

    const exchange_settings& get_settings() const { return settings_; }

private:
    awaitable<void> write_request(const http_request& request, client_connection& connection) const;

    std::shared_ptr<request_encoder> encoder_;
    std::shared_ptr<response_parser> parser_;
    exchange_settings settings_;
};

}

#endif
