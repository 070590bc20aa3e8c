#include "security_context.hpp"
#include "../sockets/ssl_socket.hpp"
#include "../../util/logger.hpp"

namespace tether::asio {

ssl_security_context::ssl_security_context(bool verify_peer)
    : context_(std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client))
    , verify_peer_(verify_peer) {
    context_->set_default_verify_paths();
    context_->set_verify_mode(verify_peer ? boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none);
}

ssl_security_context::ssl_security_context(std::shared_ptr<boost::asio::ssl::context> context,
                                           bool verify_peer)
    : context_(std::move(context))
    , verify_peer_(verify_peer) {
}

awaitable<std::shared_ptr<socket>> ssl_security_context::upgrade(std::shared_ptr<socket> raw,
                                                                 const std::string& peer_host) {
    auto tcp = std::dynamic_pointer_cast<tcp_socket>(raw);
    if (!tcp) {
        throw boost::system::system_error(boost::asio::error::operation_not_supported,
                                          "secure upgrade requires a tcp socket");
    }

    // the ssl socket takes over the connected tcp descriptor
    auto secure = std::make_shared<ssl_socket>(raw->get_context(), tcp, context_);
    secure->set_verify_host(verify_peer_);
    tcp.reset();
    raw.reset();

    LOG_TRACE("starting tls handshake with {}", peer_host);
    co_await secure->handshake(peer_host);
    co_return secure;
}

}
