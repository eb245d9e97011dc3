// Copyright (c) 2025 VAM Voice Relay
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

// Linear-interpolation resampler for mono PCM16.
// Each call is independent: no fractional phase is carried between chunks.
// Output length is floor(in.size() / (src_hz / dst_hz)); interpolated values
// are truncated toward zero. Returns the input unchanged when src_hz == dst_hz.
// Throws std::invalid_argument for a non-positive rate.
std::vector<int16_t> resample_linear(const std::vector<int16_t>& in, int src_hz, int dst_hz);

// Decode little-endian PCM16 bytes. A trailing odd byte is dropped.
std::vector<int16_t> pcm16_from_bytes(const uint8_t* data, size_t size);

// Encode samples as little-endian PCM16 bytes.
std::vector<uint8_t> pcm16_to_bytes(const std::vector<int16_t>& samples);

} // namespace audio
