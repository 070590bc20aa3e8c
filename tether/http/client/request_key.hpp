#ifndef TETHER_HTTP_CLIENT_REQUEST_KEY_HPP
#define TETHER_HTTP_CLIENT_REQUEST_KEY_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "../common/http_request.hpp"

namespace tether::http {

/**
 * Identifies a pool partition: requests with the same scheme, host and port may share
 * a connection. The port is only present when the request URL carries one explicitly.
 */
class request_key {
public:
    request_key() = default;
    request_key(std::string scheme, std::string host, std::optional<uint16_t> port = std::nullopt);

    static request_key from_request(const http_request& request);

    const std::string& scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    const std::optional<uint16_t>& port() const { return port_; }
    bool is_secure() const { return scheme_ == "https"; }

    std::string to_string() const;

    bool operator==(const request_key& other) const;
    bool operator!=(const request_key& other) const { return !(*this == other); }

private:
    std::string scheme_;
    std::string host_;
    std::optional<uint16_t> port_;
};

// boost::hash support, used by the pool index
std::size_t hash_value(const request_key& key);

}

template<>
struct std::hash<tether::http::request_key> {
    std::size_t operator()(const tether::http::request_key& key) const noexcept {
        return tether::http::hash_value(key);
    }
};

#endif
