#include "connection_binding.hpp"
#include "errors.hpp"
#include "../../util/logger.hpp"

namespace tether::http {

awaitable<managed_connection> get_valid_managed(connection_pool& pool,
                                                const request_key& key,
                                                unsigned max_stale_retries) {
    for (unsigned stale = 0;; ++stale) {
        auto managed = co_await pool.take(key);

        if (managed->is_live()) {
            co_return managed;
        }

        if (!managed.is_reused()) {
            LOG_ERROR("fresh connection to {} is not open", key.to_string());
            throw exchange_error(client_error::connection_dead, key, exchange_phase::checkout);
        }

        // closed by the peer while idle, discard it and try again
        LOG_DEBUG("discarding stale pooled connection for {} (attempt #{})", key.to_string(), stale + 1);
        managed->set_reusable(reusable::dont_reuse);
        managed.release();

        if (stale >= max_stale_retries) {
            LOG_ERROR("giving up after {} stale pooled connections for {}", stale + 1, key.to_string());
            throw exchange_error(client_error::pool_exhausted, key, exchange_phase::checkout);
        }
    }
}

}
