#ifndef TETHER_HTTP_CLIENT_REUSE_DECIDER_HPP
#define TETHER_HTTP_CLIENT_REUSE_DECIDER_HPP

#include "client_connection.hpp"
#include "deferred_drain.hpp"
#include "../common/http_request.hpp"
#include "../common/http_response.hpp"
#include "../../util/types.hpp"

namespace tether::http {

/**
 * Runs once the caller is done with a response. Drains the rest of the body; when the
 * body was cleanly bounded and neither side asked for Connection: close, the bytes read
 * past the response are kept for the next exchange and the connection is marked
 * reusable. In any other case the connection is left untouched (not reusable).
 * Drain failures propagate to the caller.
 */
awaitable<reusable> post_process_response(const http_request& request,
                                          const http_response& response,
                                          deferred_drain& drain,
                                          client_connection& connection);

}

#endif
