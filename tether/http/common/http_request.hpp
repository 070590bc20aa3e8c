#ifndef TETHER_HTTP_REQUEST_HPP
#define TETHER_HTTP_REQUEST_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "headers.hpp"

namespace tether::http {

enum class method {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

const std::string& get_method(method m);
method get_method(std::string_view name);

class http_request : public headers {

public:
    http_request() = default;
    http_request(method m, const std::string& url);
    ~http_request() override = default;

    /**
     * Parse an absolute http or https URL: scheme://[userinfo@]host[:port][/path][?query].
     * Returns false, leaving the request untouched, when the URL cannot be parsed or
     * the scheme is not supported.
     */
    bool set_url(const std::string& url);

    void set_method(method m);
    void set_content(std::string content);
    void set_content(std::string content, std::string content_type);

    // some getters
    method get_method() const;
    const std::string& get_url() const;
    const std::string& get_protocol() const;
    const std::string& get_host() const;
    std::string get_port() const;
    std::optional<uint16_t> get_explicit_port() const;
    const std::string& get_uri() const;
    std::string get_path() const;
    const std::string& get_body() const;
    bool has_content() const;
    bool is_ssl() const;

    // log
    void log(const char* scope, int level) const override;

private:
    method method_ = method::UNKNOWN;
    std::string url_;
    std::string protocol_ = "http";
    std::string host_;
    std::optional<uint16_t> port_;
    std::string uri_;
    std::string body_;
};

}

#endif
