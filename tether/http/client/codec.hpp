#ifndef TETHER_HTTP_CLIENT_CODEC_HPP
#define TETHER_HTTP_CLIENT_CODEC_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../common/http_request.hpp"
#include "../common/http_response.hpp"
#include "../../util/types.hpp"

namespace tether::http {

// Reads the next chunk of bytes; an empty string signals the end of the stream
using read_function = std::function<awaitable<std::string>()>;

// Consumes what is left of a response body, yielding the bytes read past its end,
// or nothing when the body could not be cleanly bounded
using drain_function = std::function<awaitable<std::optional<std::string>>()>;

struct parsed_response {
    std::shared_ptr<http_response> response;

    // streams the body, empty when the parser already stored it in the response
    read_function body;

    drain_function drain;
};

// Serializes a request to its HTTP/1.1 wire form
class request_encoder {
public:
    virtual ~request_encoder() = default;

    virtual std::string encode(const http_request& request) const = 0;
};

/**
 * Parses a response from the head bytes left by a previous exchange followed by the
 * bytes returned by read. Throws boost::system::system_error with
 * client_error::response_header_too_large when the header exceeds max_header_size and
 * client_error::malformed_response on invalid input.
 */
class response_parser {
public:
    virtual ~response_parser() = default;

    virtual awaitable<parsed_response> parse(size_t max_header_size,
                                             std::string head,
                                             read_function read) = 0;
};

}

#endif
