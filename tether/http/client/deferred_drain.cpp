#include "deferred_drain.hpp"

namespace tether::http {

deferred_drain::deferred_drain(drain_function drain)
    : drain_(std::move(drain)) {
}

awaitable<std::optional<std::string>> deferred_drain::operator()() {
    if (!evaluated_) {
        evaluated_ = true;
        if (drain_) {
            try {
                result_ = co_await drain_();
            } catch (const std::exception&) {
                error_ = std::current_exception();
            }
        }
        drain_ = nullptr;
    }
    if (error_) {
        std::rethrow_exception(error_);
    }
    co_return result_;
}

}
