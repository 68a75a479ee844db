#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include "protocol/event_contract.hpp"

namespace codeloop::runtime {

// Hands loop events from the worker running the orchestrator to a consumer
// thread. pop() blocks until an event arrives or the channel is closed and drained.
class EventChannel {
public:
    bool push(protocol::LoopEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(event));
        }
        ready_.notify_one();
        return true;
    }

    std::optional<protocol::LoopEvent> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        protocol::LoopEvent event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<protocol::LoopEvent> queue_;
    bool closed_ = false;
};

}  // namespace codeloop::runtime
