#include "address_resolver.hpp"
#include "errors.hpp"

namespace tether::http {

uint16_t address_resolver::default_port(const std::string& scheme) {
    return scheme == "https" ? DEFAULT_HTTPS_PORT : DEFAULT_HTTP_PORT;
}

asio::socket_address address_resolver::resolve(const request_key& key) {
    if (key.host().empty()) {
        throw exchange_error(client_error::address_resolution_failed, key, exchange_phase::resolve);
    }
    return asio::socket_address{
        key.host(),
        key.port().value_or(default_port(key.scheme()))
    };
}

}
