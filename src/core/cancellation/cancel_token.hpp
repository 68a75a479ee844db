#pragma once
#include <atomic>
#include <memory>

namespace codeloop::core::cancellation {

    // Shared between the host that requests the stop and every suspension
    // point of one invocation. A null token never reports cancellation.
    using CancelToken = std::shared_ptr<std::atomic_bool>;

    inline CancelToken make_cancel_token() {
        return std::make_shared<std::atomic_bool>(false);
    }

    inline bool is_cancelled(const CancelToken& token) {
        return token && token->load();
    }

    inline void request_cancel(const CancelToken& token) {
        if (token) {
            token->store(true);
        }
    }

} // namespace codeloop::core::cancellation
