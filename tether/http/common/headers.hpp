#ifndef TETHER_HTTP_HEADERS_HPP
#define TETHER_HTTP_HEADERS_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tether::http {

namespace header {
    constexpr auto connection        = "Connection";
    constexpr auto date              = "Date";
    constexpr auto user_agent        = "User-Agent";
    constexpr auto host              = "Host";
    constexpr auto content_length    = "Content-Length";
    constexpr auto content_type      = "Content-Type";
    constexpr auto transfer_encoding = "Transfer-Encoding";
}

// Tokens carried by the Connection header
namespace connection_token {
    constexpr auto keep_alive = "keep-alive";
    constexpr auto close      = "close";
    constexpr auto upgrade    = "upgrade";
}

class headers {

public:
    using http_header = std::pair<std::string, std::string>;

    headers() = default;
    virtual ~headers() = default;

    // header manipulation, header names are case insensitive
    void add_header(std::string key, std::string value);
    void set_header(std::string key, std::string value);
    bool remove_header(std::string_view key);

    bool has_header(std::string_view key) const;
    const std::string& get_header(std::string_view key) const;
    std::vector<std::string> get_headers_with_key(std::string_view key) const;
    size_t count_header(std::string_view key) const;
    const std::vector<http_header>& get_headers() const;
    bool empty_headers() const;

    /**
     * Check for a token in the comma separated values of every Connection header,
     * i.e., "Connection: Upgrade, close" carries both "upgrade" and "close".
     */
    bool has_connection_token(std::string_view token) const;
    bool has_connection_close() const;

    /**
     * Connection persistence: an explicit close or keep-alive token decides,
     * otherwise HTTP/1.1 and later default to persistent connections.
     */
    bool keep_alive() const;
    void set_keep_alive(bool keep_alive);

    size_t get_content_length() const;

    void set_http_version_major(uint8_t http_version_major);
    void set_http_version_minor(uint8_t http_version_minor);
    int get_http_version_major() const;
    int get_http_version_minor() const;

    virtual void log(const char* scope, int level) const;

protected:
    static bool is_header(std::string_view key, std::string_view header);

    std::vector<http_header> headers_;
    uint8_t http_version_major_ = 1;
    uint8_t http_version_minor_ = 1;
};

}

#endif
