#include "http_response.hpp"
#include "../../util/logger.hpp"

namespace tether::http {

void http_response::set_content(std::string content) {
    content_ = std::move(content);
}

void http_response::append_content(std::string_view content) {
    content_.append(content.data(), content.size());
}

void http_response::set_status(uint16_t status_code) {
    status_ = status_code;
}

void http_response::set_status(status status_code) {
    status_ = static_cast<uint16_t>(status_code);
}

void http_response::set_reason_phrase(const std::string& reason) {
    reason_phrase_ = reason;
}

const std::string& http_response::get_content() const {
    return content_;
}

size_t http_response::get_content_size() const {
    return content_.size();
}

http_response::status http_response::get_status() const {
    return static_cast<status>(status_);
}

int http_response::get_status_code() const {
    return status_;
}

const std::string& http_response::get_reason_phrase() const {
    return reason_phrase_;
}

bool http_response::is_ok() const {
    return status_ >= 200 && status_ < 300;
}

bool http_response::is_redirect_response() const {
    switch (status_) {
        case 301:
        case 302:
        case 303:
        case 307:
        case 308:
            return true;
        default:
            return false;
    }
}

void http_response::log(const char* scope, int level) const {
    LOG_DEBUG("[{}] HTTP/{}.{} {} {}", scope, get_http_version_major(), get_http_version_minor(),
              status_, reason_phrase_);
    headers::log(scope, level);
}

}
