// Copyright (c) 2025 VAM Voice Relay
#include "audio/file_capture.hpp"
#include "audio/resampler.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>

namespace audio {

namespace {
struct FmtChunk {
    uint16_t audio_format;   // 1=PCM, 3=float
    uint16_t num_channels;
    uint32_t sample_rate;
    uint32_t byte_rate;
    uint16_t block_align;
    uint16_t bits_per_sample;
};

bool read_u32(std::ifstream& f, uint32_t& v) {
    return static_cast<bool>(f.read(reinterpret_cast<char*>(&v), 4));
}
} // namespace

bool FileCapture::open(const std::string& path) {
    close();

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        core::log_error("Cannot open WAV file: " + path);
        return false;
    }

    char riff[4];
    uint32_t riff_size = 0;
    char wave[4];
    if (!f.read(riff, 4) || !read_u32(f, riff_size) || !f.read(wave, 4) ||
        std::strncmp(riff, "RIFF", 4) != 0 || std::strncmp(wave, "WAVE", 4) != 0) {
        core::log_error("Not a RIFF/WAVE file: " + path);
        return false;
    }

    // Walk chunks: fmt must precede data
    FmtChunk fmt{};
    bool have_fmt = false;
    std::vector<char> data;
    char chunk_id[4];
    uint32_t chunk_size = 0;
    while (f.read(chunk_id, 4) && read_u32(f, chunk_size)) {
        if (std::strncmp(chunk_id, "fmt ", 4) == 0) {
            if (chunk_size < sizeof(FmtChunk) ||
                !f.read(reinterpret_cast<char*>(&fmt), sizeof(FmtChunk))) {
                return false;
            }
            f.seekg(chunk_size - sizeof(FmtChunk) + (chunk_size & 1), std::ios::cur);
            have_fmt = true;
        } else if (std::strncmp(chunk_id, "data", 4) == 0) {
            data.resize(chunk_size);
            if (!f.read(data.data(), chunk_size)) {
                // Truncated files are common from recorders; keep what we got
                data.resize(static_cast<size_t>(f.gcount()));
            }
            break;
        } else {
            f.seekg(chunk_size + (chunk_size & 1), std::ios::cur);
        }
    }
    if (!have_fmt || data.empty()) {
        core::log_error("WAV file has no fmt/data chunk: " + path);
        return false;
    }

    const size_t channels = std::max<uint16_t>(1, fmt.num_channels);
    if (fmt.audio_format == 1 && fmt.bits_per_sample == 16) {
        auto interleaved = pcm16_from_bytes(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        const size_t frames = interleaved.size() / channels;
        mono_.resize(frames);
        for (size_t i = 0; i < frames; ++i) {
            int sum = 0;
            for (size_t c = 0; c < channels; ++c) sum += interleaved[i * channels + c];
            mono_[i] = static_cast<int16_t>(sum / static_cast<int>(channels));
        }
    } else if (fmt.audio_format == 3 && fmt.bits_per_sample == 32) {
        const size_t frames = data.size() / (sizeof(float) * channels);
        mono_.resize(frames);
        for (size_t i = 0; i < frames; ++i) {
            float sum = 0.0f;
            for (size_t c = 0; c < channels; ++c) {
                float s = 0.0f;
                std::memcpy(&s, data.data() + (i * channels + c) * sizeof(float), sizeof(float));
                sum += s;
            }
            float v = std::clamp(sum / static_cast<float>(channels), -1.0f, 1.0f);
            mono_[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
        }
    } else {
        core::log_error("Unsupported WAV encoding (format=" + std::to_string(fmt.audio_format) +
                        ", bits=" + std::to_string(fmt.bits_per_sample) + "): " + path);
        return false;
    }

    sample_rate_ = static_cast<int>(fmt.sample_rate);
    channels_ = fmt.num_channels;
    bits_per_sample_ = fmt.bits_per_sample;
    duration_seconds_ = static_cast<double>(mono_.size()) / std::max<uint32_t>(1, fmt.sample_rate);
    source_path_ = path;
    return sample_rate_ > 0;
}

void FileCapture::close() {
    source_path_.clear();
    mono_.clear();
    cursor_ = 0;
    sample_rate_ = 0;
    channels_ = 0;
    bits_per_sample_ = 0;
    duration_seconds_ = 0.0;
}

std::vector<uint8_t> FileCapture::read_chunk(int chunk_ms) {
    if (sample_rate_ <= 0 || cursor_ >= mono_.size()) return {};
    size_t frames_per_chunk = static_cast<size_t>(sample_rate_) * std::max(1, chunk_ms) / 1000;
    frames_per_chunk = std::max<size_t>(1, frames_per_chunk);
    const size_t n = std::min(frames_per_chunk, mono_.size() - cursor_);
    std::vector<int16_t> chunk(mono_.begin() + cursor_, mono_.begin() + cursor_ + n);
    cursor_ += n;
    return pcm16_to_bytes(chunk);
}

} // namespace audio
