#ifndef TETHER_HTTP_CLIENT_CONNECTION_BINDING_HPP
#define TETHER_HTTP_CLIENT_CONNECTION_BINDING_HPP

#include "connection_pool.hpp"
#include "request_key.hpp"
#include "../../util/types.hpp"

namespace tether::http {

constexpr unsigned DEFAULT_MAX_STALE_RETRIES = 16;

/**
 * Check out a live connection for the key. Idle connections closed by the peer while
 * pooled are discarded and the checkout is retried, up to max_stale_retries times
 * (client_error::pool_exhausted afterwards). A freshly established connection that is
 * already closed fails with client_error::connection_dead.
 */
awaitable<managed_connection> get_valid_managed(connection_pool& pool,
                                                const request_key& key,
                                                unsigned max_stale_retries = DEFAULT_MAX_STALE_RETRIES);

}

#endif
