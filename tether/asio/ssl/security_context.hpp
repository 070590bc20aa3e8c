#ifndef TETHER_ASIO_SECURITY_CONTEXT_HPP
#define TETHER_ASIO_SECURITY_CONTEXT_HPP

#include <memory>
#include <string>

#include <utility>
#include <boost/asio/ssl.hpp>

#include "../sockets/socket.hpp"
#include "../../util/types.hpp"

namespace tether::asio {

/**
 * Upgrades a connected raw socket to an encrypted channel. The peer host is used as
 * the identity hint (SNI) of the handshake. Implementations throw
 * boost::system::system_error when the handshake fails.
 */
class security_context {
public:
    virtual ~security_context() = default;

    virtual awaitable<std::shared_ptr<socket>> upgrade(std::shared_ptr<socket> raw,
                                                       const std::string& peer_host) = 0;
};

// TLS client context backed by Boost.Asio SSL (OpenSSL)
class ssl_security_context : public security_context {
public:
    explicit ssl_security_context(bool verify_peer = true);
    explicit ssl_security_context(std::shared_ptr<boost::asio::ssl::context> context,
                                  bool verify_peer = true);

    awaitable<std::shared_ptr<socket>> upgrade(std::shared_ptr<socket> raw,
                                               const std::string& peer_host) override;

    std::shared_ptr<boost::asio::ssl::context> get_context() const { return context_; }
    bool verify_peer() const { return verify_peer_; }

private:
    std::shared_ptr<boost::asio::ssl::context> context_;
    bool verify_peer_;
};

}

#endif
