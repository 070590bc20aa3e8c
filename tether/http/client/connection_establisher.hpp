#ifndef TETHER_HTTP_CLIENT_CONNECTION_ESTABLISHER_HPP
#define TETHER_HTTP_CLIENT_CONNECTION_ESTABLISHER_HPP

#include <memory>

#include "client_connection.hpp"
#include "request_key.hpp"
#include "../../asio/transport.hpp"
#include "../../asio/ssl/security_context.hpp"
#include "../../util/types.hpp"

namespace tether::http {

/**
 * Opens the transport connection for a request key: resolves the address, connects a
 * raw socket and, for https, upgrades it with the configured security context.
 * Whatever was opened is closed again when a later step fails.
 */
class connection_establisher {
public:
    connection_establisher(std::shared_ptr<asio::transport> transport,
                           std::shared_ptr<asio::security_context> security = nullptr,
                           asio::socket_options options = {});

    awaitable<std::shared_ptr<client_connection>> establish(const request_key& key) const;

    void set_security_context(std::shared_ptr<asio::security_context> security);
    void set_socket_options(asio::socket_options options);

    const std::shared_ptr<asio::security_context>& get_security_context() const { return security_; }
    const asio::socket_options& get_socket_options() const { return options_; }

private:
    std::shared_ptr<asio::transport> transport_;
    std::shared_ptr<asio::security_context> security_;
    asio::socket_options options_;
};

}

#endif
