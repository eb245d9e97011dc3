// Copyright (c) 2025 VAM Voice Relay

#include "app/speech_playback.hpp"
#include "core/logging.hpp"

#include <exception>

namespace app {

const char* to_string(PlaybackOutcome outcome) {
    switch (outcome) {
    case PlaybackOutcome::COMPLETED: return "completed";
    case PlaybackOutcome::CANCELLED: return "cancelled";
    case PlaybackOutcome::FAILED:    return "failed";
    }
    return "unknown";
}

SpeechPlayback::SpeechPlayback(PlaybackSessionManager& sessions, tts::ISpeechSynthesizer& synthesizer)
    : sessions_(sessions), synthesizer_(synthesizer) {}

PlaybackResult SpeechPlayback::speak(const std::string& client_id, const std::string& text,
                                     const tts::AudioSink& sink) {
    PlaybackResult result;
    PlaybackHandle handle = sessions_.begin(client_id);

    // Gate every chunk on the handle so nothing reaches the client after cancel.
    tts::AudioSink gated = [&](const uint8_t* data, size_t size) {
        if (handle->is_cancelled()) return false;
        if (!sink(data, size)) return false;
        result.bytes_delivered += size;
        return true;
    };

    try {
        synthesizer_.synthesize(text, *handle, gated);
    } catch (const tts::SynthesisError& e) {
        if (!handle->is_cancelled()) {
            result.outcome = PlaybackOutcome::FAILED;
            result.error = e.what();
        }
    } catch (const std::exception& e) {
        if (!handle->is_cancelled()) {
            result.outcome = PlaybackOutcome::FAILED;
            result.error = std::string("unexpected synthesis failure: ") + e.what();
        }
    }

    if (handle->is_cancelled()) {
        result.outcome = PlaybackOutcome::CANCELLED;
        result.error.clear();
    }
    sessions_.end(client_id, handle);

    if (result.outcome == PlaybackOutcome::FAILED) {
        core::log_error("[playback] synthesis failed for client " + client_id + ": " + result.error);
    } else {
        core::log_debug("[playback] client " + client_id + " " + to_string(result.outcome) + ", " +
                        std::to_string(result.bytes_delivered) + " bytes");
    }
    return result;
}

bool SpeechPlayback::stop(const std::string& client_id) {
    return sessions_.stop(client_id);
}

} // namespace app
