#ifndef TETHER_HTTP_CLIENT_REQUEST_PREPROCESSOR_HPP
#define TETHER_HTTP_CLIENT_REQUEST_PREPROCESSOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../common/http_request.hpp"

namespace tether::http {

/**
 * Fills in the headers every outgoing request carries: Connection (keep-alive unless
 * the caller set one), Date and User-Agent. Headers already present are never replaced
 * or duplicated, so preprocessing a request twice yields the same headers.
 */
class request_preprocessor {
public:
    using clock_function = std::function<std::chrono::system_clock::time_point()>;

    explicit request_preprocessor(std::optional<std::string> user_agent = std::nullopt,
                                  clock_function clock = nullptr);

    std::shared_ptr<http_request> preprocess(const http_request& request) const;

    void set_user_agent(std::optional<std::string> user_agent);
    const std::optional<std::string>& get_user_agent() const { return user_agent_; }

private:
    std::optional<std::string> user_agent_;
    clock_function clock_;
};

}

#endif
