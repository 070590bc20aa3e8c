#include "connection_establisher.hpp"
#include "address_resolver.hpp"
#include "errors.hpp"
#include "../../util/logger.hpp"

namespace tether::http {

namespace {
    bool is_resolution_error(const boost::system::error_code& ec) {
        return ec == boost::asio::error::host_not_found ||
               ec == boost::asio::error::host_not_found_try_again ||
               ec == boost::asio::error::no_data;
    }
}

connection_establisher::connection_establisher(std::shared_ptr<asio::transport> transport,
                                               std::shared_ptr<asio::security_context> security,
                                               asio::socket_options options)
    : transport_(std::move(transport))
    , security_(std::move(security))
    , options_(std::move(options)) {
}

void connection_establisher::set_security_context(std::shared_ptr<asio::security_context> security) {
    security_ = std::move(security);
}

void connection_establisher::set_socket_options(asio::socket_options options) {
    options_ = std::move(options);
}

awaitable<std::shared_ptr<client_connection>> connection_establisher::establish(const request_key& key) const {
    auto address = address_resolver::resolve(key);

    std::shared_ptr<asio::socket> socket;
    try {
        socket = co_await transport_->connect(address, options_);
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("error while connecting to {}: {} ({})", address.to_string(), e.what(), e.code().value());
        if (is_resolution_error(e.code())) {
            throw exchange_error(client_error::address_resolution_failed, key, exchange_phase::resolve);
        }
        throw exchange_error(e.code(), key, exchange_phase::connect);
    }

    if (key.is_secure()) {
        if (!security_) {
            socket->close();
            throw exchange_error(client_error::not_configured_for_secure_scheme, key, exchange_phase::connect);
        }
        try {
            socket = co_await security_->upgrade(socket, address.host);
        } catch (const boost::system::system_error& e) {
            LOG_ERROR("tls handshake with {} failed: {}", address.to_string(), e.what());
            socket->close();
            throw exchange_error(e.code(), key, exchange_phase::handshake);
        }
    }

    LOG_DEBUG("established connection to {} ({})", key.to_string(), address.to_string());
    co_return std::make_shared<client_connection>(std::move(socket), key);
}

}
