#include "reuse_decider.hpp"
#include "../../util/logger.hpp"

namespace tether::http {

awaitable<reusable> post_process_response(const http_request& request,
                                          const http_response& response,
                                          deferred_drain& drain,
                                          client_connection& connection) {
    auto leftover = co_await drain();
    if (!leftover) {
        LOG_DEBUG("response body from {} not bounded, connection will not be reused",
                  connection.key().to_string());
        co_return connection.get_reusable();
    }

    if (request.has_connection_close() || response.has_connection_close()) {
        LOG_DEBUG("connection close requested for {}", connection.key().to_string());
        co_return connection.get_reusable();
    }

    connection.set_next_bytes(std::move(*leftover));
    connection.set_reusable(reusable::reuse);
    co_return reusable::reuse;
}

}
