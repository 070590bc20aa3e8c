#include "errors.hpp"

namespace tether::http {

namespace {
    class client_category_impl final : public boost::system::error_category {
    public:
        const char* name() const noexcept override {
            return "tether.client";
        }

        std::string message(int ev) const override {
            switch (static_cast<client_error>(ev)) {
                case client_error::address_resolution_failed:        return "host cannot be resolved";
                case client_error::not_configured_for_secure_scheme: return "client not configured for secure scheme";
                case client_error::connection_dead:                  return "fresh connection from pool was not open";
                case client_error::write_timeout:                    return "timed out writing request";
                case client_error::read_timeout:                     return "timed out reading response";
                case client_error::exchange_timeout:                 return "response not received within the exchange timeout";
                case client_error::malformed_response:               return "malformed response";
                case client_error::response_header_too_large:        return "response header too large";
                case client_error::pool_exhausted:                   return "no live connection available in pool";
            }
            return "unknown client error";
        }
    };
}

const boost::system::error_category& client_category() noexcept {
    static client_category_impl instance;
    return instance;
}

boost::system::error_code make_error_code(client_error e) noexcept {
    return {static_cast<int>(e), client_category()};
}

const char* to_string(exchange_phase phase) {
    switch (phase) {
        case exchange_phase::resolve:   return "resolve";
        case exchange_phase::connect:   return "connect";
        case exchange_phase::handshake: return "handshake";
        case exchange_phase::checkout:  return "checkout";
        case exchange_phase::write:     return "write";
        case exchange_phase::read:      return "read";
        case exchange_phase::drain:     return "drain";
    }
    return "unknown";
}

exchange_error::exchange_error(boost::system::error_code ec, request_key key, exchange_phase phase)
    : boost::system::system_error(ec, key.to_string() + " (" + to_string(phase) + ")")
    , key_(std::move(key))
    , phase_(phase) {
}

exchange_error::exchange_error(client_error e, request_key key, exchange_phase phase)
    : exchange_error(make_error_code(e), std::move(key), phase) {
}

bool exchange_error::is_timeout() const noexcept {
    return code() == client_error::write_timeout ||
           code() == client_error::read_timeout ||
           code() == client_error::exchange_timeout;
}

bool exchange_error::is_protocol_error() const noexcept {
    return code() == client_error::malformed_response ||
           code() == client_error::response_header_too_large;
}

bool exchange_error::retryable() const noexcept {
    return is_timeout() || code() == client_error::pool_exhausted;
}

}
