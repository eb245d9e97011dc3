// Copyright (c) 2025 VAM Voice Relay
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// WAV-backed source that simulates a client microphone: returns the file as
// little-endian PCM16 mono byte chunks at the file's own sample rate.
class FileCapture {
public:
    // Supports PCM16 and float32 WAV, any channel count (downmixed to mono).
    bool open(const std::string& path);
    void close();

    // Next chunk of chunk_ms milliseconds, as PCM16 LE bytes.
    // Empty when no more data.
    std::vector<uint8_t> read_chunk(int chunk_ms = 20);

    bool eof() const { return cursor_ >= mono_.size(); }
    int sample_rate() const { return sample_rate_; }
    int channels() const { return channels_; }
    int bits_per_sample() const { return bits_per_sample_; }
    double duration_seconds() const { return duration_seconds_; }
    const std::string& source_path() const { return source_path_; }

private:
    std::string source_path_;
    std::vector<int16_t> mono_;
    size_t cursor_ = 0;
    int sample_rate_ = 0;
    int channels_ = 0;
    int bits_per_sample_ = 0;
    double duration_seconds_ = 0.0;
};

} // namespace audio
