#ifndef TETHER_HTTP_CLIENT_CLIENT_EXCHANGE_HPP
#define TETHER_HTTP_CLIENT_CLIENT_EXCHANGE_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "connection_pool.hpp"
#include "exchange_pipeline.hpp"
#include "../common/http_request.hpp"
#include "../common/http_response.hpp"
#include "../../util/types.hpp"

namespace tether::http {

/**
 * Response of a request sent by the client, still bound to the connection it was read
 * from. The response (and its streamed body, if any) can be consumed until finish()
 * drains what is left, decides whether the connection is reused and releases it.
 * Destroying an exchange that was never finished closes its connection.
 */
class client_exchange {
public:
    client_exchange() = default;
    client_exchange(std::shared_ptr<http_request> request,
                    pooled_exchange exchange,
                    managed_connection connection);
    ~client_exchange();

    client_exchange(client_exchange&&) noexcept = default;
    client_exchange& operator=(client_exchange&&) noexcept = default;
    client_exchange(const client_exchange&) = delete;
    client_exchange& operator=(const client_exchange&) = delete;

    const http_response& response() const { return *response_; }
    std::shared_ptr<http_response> get_response() const { return response_; }
    const std::shared_ptr<http_request>& get_request() const { return request_; }
    int status_code() const;

    // Next body chunk, empty at the end; nothing to stream when the body is in the response
    awaitable<std::string> read_body();

    // Drain, decide reuse and release the connection; later calls return the first decision
    awaitable<reusable> finish();

    bool finished() const { return decision_.has_value(); }
    std::optional<reusable> reuse_decision() const { return decision_; }

private:
    std::shared_ptr<http_request> request_;
    std::shared_ptr<http_response> response_;
    read_function body_;
    deferred_drain drain_;
    managed_connection connection_;
    std::optional<reusable> decision_;
};

}

#endif
