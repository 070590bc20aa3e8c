#ifndef TETHER_HTTP_CLIENT_ADDRESS_RESOLVER_HPP
#define TETHER_HTTP_CLIENT_ADDRESS_RESOLVER_HPP

#include "request_key.hpp"
#include "../../asio/transport.hpp"

namespace tether::http {

class address_resolver {
public:
    static constexpr uint16_t DEFAULT_HTTP_PORT  = 80;
    static constexpr uint16_t DEFAULT_HTTPS_PORT = 443;

    // Network address for a pool key, defaulting the port from the scheme
    static asio::socket_address resolve(const request_key& key);

    static uint16_t default_port(const std::string& scheme);
};

}

#endif
