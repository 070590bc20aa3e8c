#include "request_preprocessor.hpp"
#include "../util/http_date.hpp"

namespace tether::http {

request_preprocessor::request_preprocessor(std::optional<std::string> user_agent, clock_function clock)
    : user_agent_(std::move(user_agent))
    , clock_(clock ? std::move(clock) : clock_function([]() { return std::chrono::system_clock::now(); })) {
}

void request_preprocessor::set_user_agent(std::optional<std::string> user_agent) {
    user_agent_ = std::move(user_agent);
}

std::shared_ptr<http_request> request_preprocessor::preprocess(const http_request& request) const {
    auto processed = std::make_shared<http_request>(request);

    if (!processed->has_header(header::date)) {
        processed->add_header(header::date, util::format_http_date(clock_()));
    }

    if (!processed->has_header(header::connection)) {
        processed->add_header(header::connection, connection_token::keep_alive);
    }

    if (user_agent_ && !processed->has_header(header::user_agent)) {
        processed->add_header(header::user_agent, *user_agent_);
    }

    return processed;
}

}
