#include "client_exchange.hpp"
#include "reuse_decider.hpp"
#include "../../util/logger.hpp"

namespace tether::http {

client_exchange::client_exchange(std::shared_ptr<http_request> request,
                                 pooled_exchange exchange,
                                 managed_connection connection)
    : request_(std::move(request))
    , response_(std::move(exchange.response))
    , body_(std::move(exchange.body))
    , drain_(std::move(exchange.drain))
    , connection_(std::move(connection)) {
}

client_exchange::~client_exchange() {
    if (connection_ && !decision_) {
        LOG_DEBUG("exchange with {} abandoned before finishing, closing connection",
                  connection_->key().to_string());
    }
    // not reusable unless finish() decided otherwise, so the pool closes it
    connection_.release();
}

int client_exchange::status_code() const {
    return response_ ? response_->get_status_code() : 0;
}

awaitable<std::string> client_exchange::read_body() {
    if (!body_ || decision_ || !connection_) co_return std::string{};
    co_return co_await co_spawn(connection_->get_socket()->get_strand(), body_(), use_awaitable);
}

awaitable<reusable> client_exchange::finish() {
    if (decision_) co_return *decision_;
    if (!connection_) {
        throw std::logic_error("client exchange has no connection");
    }

    reusable decision = reusable::dont_reuse;
    try {
        decision = co_await co_spawn(connection_->get_socket()->get_strand(),
                                     post_process_response(*request_, *response_, drain_, connection_.value()),
                                     use_awaitable);
    } catch (const std::exception& e) {
        LOG_ERROR("error finishing exchange with {}: {}", connection_->key().to_string(), e.what());
        decision_ = reusable::dont_reuse;
        connection_->set_reusable(reusable::dont_reuse);
        connection_.release();
        throw;
    }

    LOG_TRACE("exchange with {} finished: {}", connection_->key().to_string(), to_string(decision));
    decision_ = decision;
    connection_.release();
    co_return decision;
}

}
