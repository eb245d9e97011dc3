// Copyright (c) 2025 VAM Voice Relay
// Cooperative cancellation signal shared between a requester and a worker

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace core {

class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Signal cancellation. Registered callbacks run once, on the calling thread.
    /// Safe to call more than once; later calls do nothing.
    void cancel();

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /// Register a callback for cancellation. Runs immediately (before returning)
    /// if the token is already cancelled.
    /// @return id for remove_callback()
    size_t on_cancel(Callback callback);

    /// Unregister a callback that has not run yet.
    void remove_callback(size_t id);

    /// Block until cancelled or the timeout elapses.
    /// @return true if cancelled
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    std::map<size_t, Callback> callbacks_;
    size_t next_id_ = 1;
};

}
