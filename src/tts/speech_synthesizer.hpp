// Copyright (c) 2025 VAM Voice Relay
// Speech synthesis boundary

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace core {
class CancellationToken;
}

namespace tts {

/// Receives synthesized audio as it streams in. Return false to stop the stream.
using AudioSink = std::function<bool(const uint8_t* data, size_t size)>;

/// Raised when synthesis fails for a reason other than cancellation
class SynthesisError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Text-to-speech engine producing a cancellable byte stream
class ISpeechSynthesizer {
public:
    virtual ~ISpeechSynthesizer() = default;

    /// Synthesize `text`, pushing audio bytes to `sink` until done.
    /// Returns promptly, without throwing, once `cancel` is signalled or the
    /// sink returns false.
    /// @throws SynthesisError on any other failure
    virtual void synthesize(const std::string& text,
                            core::CancellationToken& cancel,
                            const AudioSink& sink) = 0;

    /// MIME type of the produced audio ("audio/mpeg")
    virtual std::string mime_type() const = 0;
};

} // namespace tts
