// Copyright (c) 2025 VAM Voice Relay
// Speech-to-text transport boundary

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace audio {
class FrameBuffer;
}

namespace asr {

/// One recognition hypothesis
struct TranscriptAlternative {
    std::string text;
};

/// A recognition result; only the first alternative is used downstream
struct TranscriptResult {
    std::vector<TranscriptAlternative> alternatives;
    bool is_partial = true;                   ///< false once the utterance is settled
};

/// One event from the transport (zero or more results)
struct TranscriptEvent {
    std::vector<TranscriptResult> results;
};

/// Stream parameters handed to the transport at start
struct StreamParams {
    std::string language = "es-US";          ///< Locale, e.g. "es-US"
    int sample_rate = 16000;                  ///< Frame sample rate (Hz)
    std::string encoding = "pcm";             ///< Frame encoding (16-bit LE linear PCM)
};

/// Raised when the transport cannot start or fails mid-stream
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Lazy, potentially infinite sequence of transcript events for one session
class ITranscriptStream {
public:
    virtual ~ITranscriptStream() = default;

    /// Block until the next event is available.
    /// @return false at end of stream
    /// @throws TransportError on mid-stream failure
    virtual bool next(TranscriptEvent& event) = 0;
};

/// Duplex transcription transport: consumes frames, produces transcript events
class ITranscriptionTransport {
public:
    virtual ~ITranscriptionTransport() = default;

    /// Start a stream that pulls frames from `frames` until it reports end of stream.
    /// The buffer must outlive the returned stream.
    /// @throws TransportError if the transport fails to start
    virtual std::unique_ptr<ITranscriptStream> start(const StreamParams& params,
                                                     audio::FrameBuffer& frames) = 0;
};

} // namespace asr
