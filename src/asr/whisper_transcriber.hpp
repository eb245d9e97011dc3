// Copyright (c) 2025 VAM Voice Relay
// Local transcription transport backed by whisper.cpp

#pragma once

#include "asr/transcription_transport.hpp"
#include "asr/whisper_backend.hpp"

namespace asr {

/// Utterance segmentation settings for the whisper transport
struct WhisperTranscriberConfig {
    std::string model = "base";               ///< Model name or path
    int partial_interval_ms = 1000;           ///< New speech between partial results
    int silence_ms = 800;                     ///< Trailing silence that settles an utterance
    int max_utterance_ms = 10000;             ///< Force a final result at this length
    float speech_rms = 0.015f;                ///< Frame RMS (full scale = 1.0) counted as speech
};

/// Transcription transport running whisper.cpp in-process.
///
/// Each started stream owns a worker thread that pulls frames, gates them by
/// energy into utterances, and re-transcribes the growing utterance to emit
/// partial results, then a final result once the speaker pauses.
class WhisperTranscriber : public ITranscriptionTransport {
public:
    WhisperTranscriber(WhisperBackend& backend, const WhisperTranscriberConfig& config);

    std::unique_ptr<ITranscriptStream> start(const StreamParams& params,
                                             audio::FrameBuffer& frames) override;

private:
    WhisperBackend& backend_;
    WhisperTranscriberConfig config_;
};

/// RMS of PCM16 samples normalized to [0, 1]
float frame_rms(const int16_t* samples, size_t count);

} // namespace asr
