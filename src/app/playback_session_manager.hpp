// Copyright (c) 2025 VAM Voice Relay
// Per-client registry of the active speech-synthesis stream (barge-in)

#pragma once

#include "core/cancellation.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace app {

/// Cancellation handle of one synthesis stream
using PlaybackHandle = std::shared_ptr<core::CancellationToken>;

/// Registry guaranteeing at most one live synthesis stream per client.
///
/// State per client key: Idle -> Active -> Idle. A new begin() supersedes and
/// cancels the previous stream before installing the new handle.
///
/// Thread Safety:
/// - All public methods are thread-safe; one mutex guards the whole map
/// - Cancellation callbacks run while the registry lock is held and must not
///   call back into the manager
class PlaybackSessionManager {
public:
    PlaybackSessionManager() = default;
    ~PlaybackSessionManager();

    PlaybackSessionManager(const PlaybackSessionManager&) = delete;
    PlaybackSessionManager& operator=(const PlaybackSessionManager&) = delete;

    /// Cancel any active stream for `client_id` and install a fresh handle.
    /// @return the new handle; the caller passes it to the synthesizer
    PlaybackHandle begin(const std::string& client_id);

    /// Remove the entry only if it is still `handle` (stale completions are ignored).
    /// @return true if the entry was removed
    bool end(const std::string& client_id, const PlaybackHandle& handle);

    /// Cancel the active stream, if any, leaving the client Idle.
    /// @return true if a stream was cancelled
    bool stop(const std::string& client_id);

    /// Cancel every active stream (shutdown)
    /// @return number of streams cancelled
    size_t stop_all();

    bool is_active(const std::string& client_id) const;

    /// Currently registered handle, or nullptr when Idle
    PlaybackHandle active_handle(const std::string& client_id) const;

    size_t active_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PlaybackHandle> sessions_;
};

} // namespace app
