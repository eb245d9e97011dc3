// Copyright (c) 2025 VAM Voice Relay

#include "app/playback_session_manager.hpp"
#include "core/logging.hpp"

namespace app {

PlaybackSessionManager::~PlaybackSessionManager() {
    stop_all();
}

size_t PlaybackSessionManager::stop_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t count = sessions_.size();
    for (auto& entry : sessions_) {
        entry.second->cancel();
    }
    sessions_.clear();
    return count;
}

PlaybackHandle PlaybackSessionManager::begin(const std::string& client_id) {
    auto handle = std::make_shared<core::CancellationToken>();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(client_id);
    if (it != sessions_.end()) {
        core::log_debug("[playback] barge-in for client " + client_id);
        it->second->cancel();
        sessions_.erase(it);
    }
    sessions_.emplace(client_id, handle);
    return handle;
}

bool PlaybackSessionManager::end(const std::string& client_id, const PlaybackHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(client_id);
    if (it == sessions_.end() || it->second != handle) {
        return false;
    }
    sessions_.erase(it);
    return true;
}

bool PlaybackSessionManager::stop(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(client_id);
    if (it == sessions_.end()) {
        return false;
    }
    it->second->cancel();
    sessions_.erase(it);
    core::log_debug("[playback] stopped for client " + client_id);
    return true;
}

bool PlaybackSessionManager::is_active(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(client_id) != 0;
}

PlaybackHandle PlaybackSessionManager::active_handle(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(client_id);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t PlaybackSessionManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace app
