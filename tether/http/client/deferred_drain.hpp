#ifndef TETHER_HTTP_CLIENT_DEFERRED_DRAIN_HPP
#define TETHER_HTTP_CLIENT_DEFERRED_DRAIN_HPP

#include <exception>
#include <optional>
#include <string>

#include "codec.hpp"

namespace tether::http {

// Drain action evaluated at most once; later invocations return the first outcome
class deferred_drain {
public:
    deferred_drain() = default;
    explicit deferred_drain(drain_function drain);

    awaitable<std::optional<std::string>> operator()();

    bool evaluated() const { return evaluated_; }

private:
    drain_function drain_;
    bool evaluated_ = false;
    std::optional<std::string> result_;
    std::exception_ptr error_;
};

}

#endif
