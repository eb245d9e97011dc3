// Copyright (c) 2025 VAM Voice Relay
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace asr {

// Process-wide whisper.cpp model shared by all transcription streams.
// Calls into the model are serialized; load once at startup.
class WhisperBackend {
public:
    // Accepts a path to a .gguf/.bin file or a bare model name resolved under models/.
    bool load_model(const std::string& model_name);
    bool is_loaded() const;

    // Transcribe 16 kHz mono PCM16. `language` is a whisper code ("es", "en")
    // or a locale ("es-US"); empty means auto-detect.
    // Returns trimmed text with non-speech tokens removed; empty on failure.
    std::string transcribe(const int16_t* data, size_t samples, const std::string& language);

    void set_threads(int n);   // 0 = hardware concurrency
};

// "es-US" -> "es"; "" stays empty
std::string whisper_language_from_locale(const std::string& locale);

}
