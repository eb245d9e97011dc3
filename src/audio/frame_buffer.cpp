// Copyright (c) 2025 VAM Voice Relay
#include "audio/frame_buffer.hpp"
#include <stdexcept>

namespace audio {

FrameBuffer::FrameBuffer(size_t frame_bytes) : frame_bytes_(frame_bytes) {
    if (frame_bytes_ == 0) {
        throw std::invalid_argument("FrameBuffer: frame size must be non-zero");
    }
}

size_t FrameBuffer::frame_bytes_for(int sample_rate, int frame_ms, int bytes_per_sample) {
    if (sample_rate <= 0 || frame_ms <= 0 || bytes_per_sample <= 0) {
        throw std::invalid_argument("FrameBuffer: rate, duration and sample width must be positive");
    }
    return static_cast<size_t>(sample_rate) * bytes_per_sample * frame_ms / 1000;
}

bool FrameBuffer::push(const uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return false;
    }
    if (size == 0) {
        return true;
    }

    buffer_.insert(buffer_.end(), data, data + size);

    // Notify while holding the lock: the waiter re-checks the predicate under
    // the same mutex, so a push can never slip between its check and its sleep.
    if (waiting_ && available_locked() >= frame_bytes_) {
        cv_data_.notify_one();
    }
    return true;
}

void FrameBuffer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    cv_data_.notify_all();
}

bool FrameBuffer::next_frame(std::vector<uint8_t>& frame) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (waiting_) {
        throw std::logic_error("FrameBuffer: only one consumer may wait in next_frame()");
    }

    waiting_ = true;
    cv_data_.wait(lock, [this] { return available_locked() >= frame_bytes_ || stopped_; });
    waiting_ = false;

    if (available_locked() < frame_bytes_) {
        // Stopped with a partial frame left: it is never emitted.
        bytes_discarded_ += available_locked();
        buffer_.clear();
        cursor_ = 0;
        return false;
    }

    frame.assign(buffer_.begin() + cursor_, buffer_.begin() + cursor_ + frame_bytes_);
    cursor_ += frame_bytes_;
    compact_locked();
    frames_emitted_++;
    return true;
}

size_t FrameBuffer::buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_locked();
}

bool FrameBuffer::stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

void FrameBuffer::compact_locked() {
    if (cursor_ == buffer_.size()) {
        buffer_.clear();
        cursor_ = 0;
    } else if (cursor_ >= frame_bytes_ * 16 && cursor_ * 2 >= buffer_.size()) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + cursor_);
        cursor_ = 0;
    }
}

} // namespace audio
