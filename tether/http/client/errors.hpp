#ifndef TETHER_HTTP_CLIENT_ERRORS_HPP
#define TETHER_HTTP_CLIENT_ERRORS_HPP

#include <string>
#include <type_traits>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include "request_key.hpp"

namespace tether::http {

enum class client_error {
    address_resolution_failed = 1,      // host cannot be resolved to an address
    not_configured_for_secure_scheme,   // https requested without a security context
    connection_dead,                    // a freshly established connection is already closed
    write_timeout,                      // request not written within the idle timeout
    read_timeout,                       // no response bytes within the idle timeout
    exchange_timeout,                   // response not parsed within the overall timeout
    malformed_response,                 // response cannot be parsed
    response_header_too_large,          // response header exceeds the configured maximum
    pool_exhausted                      // too many stale pooled connections in a row
};

const boost::system::error_category& client_category() noexcept;

boost::system::error_code make_error_code(client_error e) noexcept;

// Step of the exchange where a failure happened
enum class exchange_phase {
    resolve,
    connect,
    handshake,
    checkout,
    write,
    read,
    drain
};

const char* to_string(exchange_phase phase);

/**
 * Failure surfaced to callers of the client. Carries the pool key and the phase of
 * the exchange so callers can tell conditions they may retry with a new connection
 * (timeouts, pool exhaustion) from fatal ones (configuration, dead fresh connection).
 */
class exchange_error : public boost::system::system_error {
public:
    exchange_error(boost::system::error_code ec, request_key key, exchange_phase phase);
    exchange_error(client_error e, request_key key, exchange_phase phase);

    const request_key& key() const noexcept { return key_; }
    exchange_phase phase() const noexcept { return phase_; }

    bool is_timeout() const noexcept;
    bool is_protocol_error() const noexcept;
    bool retryable() const noexcept;

private:
    request_key key_;
    exchange_phase phase_;
};

}

namespace boost::system {
    template<>
    struct is_error_code_enum<tether::http::client_error> {
        static const bool value = true;
    };
}

#endif
