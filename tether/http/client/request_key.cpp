#include "request_key.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/functional/hash.hpp>

namespace tether::http {

request_key::request_key(std::string scheme, std::string host, std::optional<uint16_t> port)
    : scheme_(boost::algorithm::to_lower_copy(scheme))
    , host_(boost::algorithm::to_lower_copy(host))
    , port_(port) {
}

request_key request_key::from_request(const http_request& request) {
    return request_key(request.get_protocol(), request.get_host(), request.get_explicit_port());
}

std::string request_key::to_string() const {
    std::string result = scheme_ + "://";
    if (host_.find(':') != std::string::npos) {
        result += "[" + host_ + "]";
    } else {
        result += host_;
    }
    if (port_) {
        result += ":" + std::to_string(*port_);
    }
    return result;
}

bool request_key::operator==(const request_key& other) const {
    return scheme_ == other.scheme_ && host_ == other.host_ && port_ == other.port_;
}

std::size_t hash_value(const request_key& key) {
    std::size_t seed = 0;
    boost::hash_combine(seed, key.scheme());
    boost::hash_combine(seed, key.host());
    boost::hash_combine(seed, key.port() ? static_cast<int>(*key.port()) : -1);
    return seed;
}

}
