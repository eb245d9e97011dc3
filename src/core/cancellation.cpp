// Copyright (c) 2025 VAM Voice Relay

#include "core/cancellation.hpp"
#include "core/logging.hpp"

#include <exception>
#include <vector>

namespace core {

void CancellationToken::cancel() {
    std::vector<Callback> to_run;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_relaxed)) {
            return;
        }
        cancelled_.store(true, std::memory_order_release);
        to_run.reserve(callbacks_.size());
        for (auto& entry : callbacks_) {
            to_run.push_back(std::move(entry.second));
        }
        callbacks_.clear();
    }
    cv_.notify_all();

    for (auto& callback : to_run) {
        try {
            callback();
        } catch (const std::exception& e) {
            log_error(std::string("Cancellation callback exception: ") + e.what());
        }
    }
}

size_t CancellationToken::on_cancel(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load(std::memory_order_relaxed)) {
            size_t id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::remove_callback(size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(std::memory_order_acquire); });
}

}
