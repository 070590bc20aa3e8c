#ifndef TETHER_HTTP_CLIENT_HPP
#define TETHER_HTTP_CLIENT_HPP

// HTTP client
#include <tether/http/client/http_client.hpp>        // http_client, send/acquire entry points
#include <tether/http/client/client_exchange.hpp>    // two-phase response handle returned by send()
#include <tether/http/client/codec.hpp>              // request_encoder / response_parser interfaces
#include <tether/http/client/errors.hpp>             // exchange_error and client_error codes

// Transport and security seams
#include <tether/asio/transport.hpp>
#include <tether/asio/ssl/security_context.hpp>

// Common HTTP types needed by client
#include <tether/http/common/http_request.hpp>
#include <tether/http/common/http_response.hpp>

// Library logging
#include <tether/util/logger.hpp>

#endif
