#include "http_request.hpp"

#include <array>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "../../util/logger.hpp"

namespace tether::http {

namespace {
    const std::array<std::string, 10> method_names{
        "GET", "HEAD", "POST", "PUT", "DELETE", "OPTIONS", "PATCH", "CONNECT", "TRACE", "UNKNOWN"
    };
}

const std::string& get_method(method m) {
    return method_names[static_cast<size_t>(m)];
}

method get_method(std::string_view name) {
    for (size_t i = 0; i < method_names.size() - 1; ++i) {
        if (method_names[i] == name) return static_cast<method>(i);
    }
    return method::UNKNOWN;
}

http_request::http_request(method m, const std::string& url) : method_(m) {
    set_url(url);
}

bool http_request::set_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return false;

    std::string protocol = boost::algorithm::to_lower_copy(url.substr(0, scheme_end));
    if (protocol != "http" && protocol != "https") return false;

    auto authority_start = scheme_end + 3;
    auto authority_end = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);

    // drop user information, it never reaches the connection layer
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);
    if (authority.empty()) return false;

    std::string host;
    std::string port;
    if (authority.front() == '[') {
        // IPv6 literal
        auto bracket = authority.find(']');
        if (bracket == std::string::npos) return false;
        host = authority.substr(1, bracket - 1);
        if (bracket + 1 < authority.size()) {
            if (authority[bracket + 1] != ':') return false;
            port = authority.substr(bracket + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        } else {
            host = authority;
        }
    }
    if (host.empty()) return false;

    std::optional<uint16_t> explicit_port;
    if (!port.empty()) {
        try {
            auto value = boost::lexical_cast<unsigned int>(port);
            if (value == 0 || value > 65535) return false;
            explicit_port = static_cast<uint16_t>(value);
        } catch (const boost::bad_lexical_cast&) {
            return false;
        }
    }

    std::string uri = authority_end == std::string::npos ? "/" : url.substr(authority_end);
    auto fragment = uri.find('#');
    if (fragment != std::string::npos) uri.erase(fragment);
    if (uri.empty() || uri.front() == '?') uri.insert(0, "/");

    url_ = url;
    protocol_ = std::move(protocol);
    host_ = boost::algorithm::to_lower_copy(host);
    port_ = explicit_port;
    uri_ = std::move(uri);
    return true;
}

void http_request::set_method(method m) {
    method_ = m;
}

void http_request::set_content(std::string content) {
    body_ = std::move(content);
    set_header(header::content_length, std::to_string(body_.size()));
}

void http_request::set_content(std::string content, std::string content_type) {
    set_content(std::move(content));
    set_header(header::content_type, std::move(content_type));
}

method http_request::get_method() const {
    return method_;
}

const std::string& http_request::get_url() const {
    return url_;
}

const std::string& http_request::get_protocol() const {
    return protocol_;
}

const std::string& http_request::get_host() const {
    return host_;
}

std::string http_request::get_port() const {
    if (port_) return std::to_string(*port_);
    return is_ssl() ? "443" : "80";
}

std::optional<uint16_t> http_request::get_explicit_port() const {
    return port_;
}

const std::string& http_request::get_uri() const {
    return uri_;
}

std::string http_request::get_path() const {
    auto query = uri_.find('?');
    return query == std::string::npos ? uri_ : uri_.substr(0, query);
}

const std::string& http_request::get_body() const {
    return body_;
}

bool http_request::has_content() const {
    return !body_.empty();
}

bool http_request::is_ssl() const {
    return protocol_ == "https";
}

void http_request::log(const char* scope, int level) const {
    LOG_DEBUG("[{}] {} {}://{}:{}{}", scope, http::get_method(method_), protocol_, host_, get_port(), uri_);
    headers::log(scope, level);
}

}
