// Copyright (c) 2025 VAM Voice Relay
// Speech synthesis over an OpenAI-compatible audio/speech endpoint

#pragma once

#include "tts/speech_synthesizer.hpp"

#include <QJsonObject>
#include <string>

namespace tts {

struct HttpSynthesizerSettings {
    std::string url;                          ///< e.g. https://api.openai.com/v1/audio/speech
    std::string api_key;
    std::string model = "tts-1";
    std::string voice = "alloy";
    std::string format = "mp3";               ///< mp3 | opus | aac | flac | wav | pcm
    int timeout_ms = 30000;
    int cancel_poll_ms = 20;                  ///< How often the request checks its token
};

/// MIME type for a response format name ("application/octet-stream" if unknown)
std::string mime_type_for_format(const std::string& format);

/// Request body for one synthesis call
QJsonObject build_speech_request(const HttpSynthesizerSettings& settings, const std::string& text);

/// Streams synthesized audio chunk by chunk as the HTTP body arrives.
///
/// Blocking; runs a local event loop on the calling thread (requires a
/// QCoreApplication). Cancellation aborts the request within cancel_poll_ms.
class HttpSpeechSynthesizer : public ISpeechSynthesizer {
public:
    explicit HttpSpeechSynthesizer(HttpSynthesizerSettings settings);

    void synthesize(const std::string& text,
                    core::CancellationToken& cancel,
                    const AudioSink& sink) override;

    std::string mime_type() const override { return mime_type_for_format(settings_.format); }

private:
    HttpSynthesizerSettings settings_;
};

} // namespace tts
