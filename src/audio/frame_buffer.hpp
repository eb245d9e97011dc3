// Copyright (c) 2025 VAM Voice Relay
#pragma once
#include <vector>
#include <mutex>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <atomic>

namespace audio {

// Bridges push-based audio arrival with pull-based frame consumption.
// Design: the ingress side never blocks and never loses data while running.
//         The consumer pulls fixed-size frames and sleeps while starved.
//         After stop(), whole frames still buffered are drained, then the
//         remainder (< one frame) is discarded and next_frame() returns false.
// Exactly one consumer may wait in next_frame() at a time.
class FrameBuffer {
public:
    explicit FrameBuffer(size_t frame_bytes);

    // Bytes in one frame: sample_rate * bytes_per_sample * frame_ms / 1000
    // (640 for 16 kHz / 16-bit / 20 ms).
    static size_t frame_bytes_for(int sample_rate, int frame_ms, int bytes_per_sample = 2);

    // Append bytes (called by the ingress path).
    // Returns false if the buffer was already stopped; the bytes are dropped.
    bool push(const uint8_t* data, size_t size);
    bool push(const std::vector<uint8_t>& data) { return push(data.data(), data.size()); }

    // Signal stop (no more bytes will be added). Wakes a waiting consumer.
    void stop();

    // Pull the next frame (called by the transport's sender).
    // Blocks while fewer than frame_bytes() are buffered and not stopped.
    // Returns false at end of stream.
    bool next_frame(std::vector<uint8_t>& frame);

    size_t frame_bytes() const { return frame_bytes_; }
    size_t buffered() const;
    bool stopped() const;

    uint64_t frames_emitted() const { return frames_emitted_.load(); }
    uint64_t bytes_discarded() const { return bytes_discarded_.load(); }

private:
    size_t available_locked() const { return buffer_.size() - cursor_; }
    void compact_locked();

    const size_t frame_bytes_;
    mutable std::mutex mutex_;
    std::condition_variable cv_data_;   // Notifies next_frame() when a frame is ready or on stop
    std::vector<uint8_t> buffer_;
    size_t cursor_ = 0;                 // Read position into buffer_
    bool stopped_ = false;
    bool waiting_ = false;              // A consumer is parked in next_frame()
    std::atomic<uint64_t> frames_emitted_{0};
    std::atomic<uint64_t> bytes_discarded_{0};
};

} // namespace audio
