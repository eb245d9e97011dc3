// Copyright (c) 2025 VAM Voice Relay
// Barge-in speech playback: begin -> synthesize -> end

#pragma once

#include "app/playback_session_manager.hpp"
#include "tts/speech_synthesizer.hpp"

#include <cstddef>
#include <string>

namespace app {

/// How a playback request ended
enum class PlaybackOutcome {
    COMPLETED,                                ///< Stream ran to its end
    CANCELLED,                                ///< Superseded or stopped (not an error)
    FAILED                                    ///< Synthesis failed
};

struct PlaybackResult {
    PlaybackOutcome outcome = PlaybackOutcome::COMPLETED;
    size_t bytes_delivered = 0;
    std::string error;                        ///< Set only for FAILED
};

const char* to_string(PlaybackOutcome outcome);

/// Runs synthesis requests under the playback registry so that a new request
/// for a client cancels the one still speaking.
class SpeechPlayback {
public:
    SpeechPlayback(PlaybackSessionManager& sessions, tts::ISpeechSynthesizer& synthesizer);

    /// Synthesize `text` for `client_id`, forwarding audio to `sink`.
    /// Blocks until the stream completes, fails, or is cancelled.
    /// Cancellation wins over a concurrent stream end or error.
    PlaybackResult speak(const std::string& client_id, const std::string& text, const tts::AudioSink& sink);

    /// Cancel the client's current stream without starting another.
    bool stop(const std::string& client_id);

    PlaybackSessionManager& sessions() { return sessions_; }

    /// MIME type of the audio handed to sinks
    std::string mime_type() const { return synthesizer_.mime_type(); }

private:
    PlaybackSessionManager& sessions_;
    tts::ISpeechSynthesizer& synthesizer_;
};

} // namespace app
