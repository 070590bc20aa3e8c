#ifndef TETHER_HTTP_RESPONSE_HPP
#define TETHER_HTTP_RESPONSE_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "headers.hpp"

namespace tether::http {

class http_response : public headers {

public:

    // the status of the http_response.
    enum class status {
        switching_protocols = 101,
        ok = 200,
        created = 201,
        accepted = 202,
        no_content = 204,
        moved_permanently = 301,
        moved_temporarily = 302,
        not_modified = 304,
        temporary_redirect = 307,
        permanent_redirect = 308,
        bad_request = 400,
        unauthorized = 401,
        forbidden = 403,
        not_found = 404,
        timed_out = 408,
        payload_too_large = 413,
        too_many_requests = 429,
        internal_server_error = 500,
        bad_gateway = 502,
        service_unavailable = 503
    };

    http_response() = default;
    ~http_response() override = default;

    // some setters
    void set_content(std::string content);
    void append_content(std::string_view content);
    void set_status(uint16_t status_code);
    void set_status(status status_code);
    void set_reason_phrase(const std::string& reason);

    // some getters
    const std::string& get_content() const;
    size_t get_content_size() const;
    status get_status() const;
    int get_status_code() const;
    const std::string& get_reason_phrase() const;
    bool is_ok() const;
    bool is_redirect_response() const;

    // log
    void log(const char* scope, int level) const override;

private:
    std::string content_;
    uint16_t status_ = 200;
    std::string reason_phrase_;
};

}

#endif
