// Copyright (c) 2025 VAM Voice Relay
#include "audio/resampler.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace audio {

std::vector<int16_t> resample_linear(const std::vector<int16_t>& in, int src_hz, int dst_hz) {
    if (src_hz <= 0 || dst_hz <= 0) {
        throw std::invalid_argument("resample_linear: sample rates must be positive (src=" +
                                    std::to_string(src_hz) + ", dst=" + std::to_string(dst_hz) + ")");
    }
    if (src_hz == dst_hz) return in;
    if (in.empty()) return {};

    const double ratio = static_cast<double>(src_hz) / static_cast<double>(dst_hz);
    // floor(n / ratio) in integer arithmetic
    const size_t out_len = static_cast<size_t>(static_cast<uint64_t>(in.size()) * static_cast<uint64_t>(dst_hz) /
                                               static_cast<uint64_t>(src_hz));
    const size_t last = in.size() - 1;

    std::vector<int16_t> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        const double idx = static_cast<double>(i) * ratio;
        const size_t i0 = std::min(static_cast<size_t>(idx), last);
        const size_t i1 = std::min(i0 + 1, last);
        const double frac = idx - static_cast<double>(i0);
        const double v = static_cast<double>(in[i0]) + (static_cast<double>(in[i1]) - in[i0]) * frac;
        out[i] = static_cast<int16_t>(v); // truncate toward zero
    }
    return out;
}

std::vector<int16_t> pcm16_from_bytes(const uint8_t* data, size_t size) {
    const size_t n = size / 2;
    std::vector<int16_t> out(n);
    for (size_t i = 0; i < n; ++i) {
        const uint16_t lo = data[2 * i];
        const uint16_t hi = data[2 * i + 1];
        out[i] = static_cast<int16_t>(lo | (hi << 8));
    }
    return out;
}

std::vector<uint8_t> pcm16_to_bytes(const std::vector<int16_t>& samples) {
    std::vector<uint8_t> out;
    out.reserve(samples.size() * 2);
    for (int16_t s : samples) {
        const uint16_t u = static_cast<uint16_t>(s);
        out.push_back(static_cast<uint8_t>(u & 0xFF));
        out.push_back(static_cast<uint8_t>(u >> 8));
    }
    return out;
}

} // namespace audio
