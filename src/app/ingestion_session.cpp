// Copyright (c) 2025 VAM Voice Relay

#include "app/ingestion_session.hpp"
#include "audio/resampler.hpp"
#include "core/logging.hpp"

#include <chrono>
#include <exception>
#include <random>
#include <utility>
#include <vector>

namespace app {

IngestionSession::IngestionSession(std::string session_id,
                                   const IngestionConfig& config,
                                   asr::ITranscriptionTransport& transport,
                                   agent::IAgentClient& agent,
                                   std::shared_ptr<IClientChannel> channel)
    : session_id_(std::move(session_id))
    , config_(config)
    , transport_(transport)
    , agent_(agent)
    , channel_(std::move(channel))
    , frames_(audio::FrameBuffer::frame_bytes_for(config.target_sample_rate, config.frame_ms)) {}

IngestionSession::~IngestionSession() {
    frames_.stop();
    if (worker_.joinable()) {
        // The worker may hold the last reference; never join ourselves.
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

bool IngestionSession::start() {
    if (!alive_ || started_.exchange(true)) {
        return false;
    }
    auto self = shared_from_this();
    worker_ = std::thread([self] { self->run(); });
    core::log_info("[session " + session_id_ + "] started");
    return true;
}

void IngestionSession::on_chunk(const uint8_t* data, size_t size, int source_rate) {
    if (!alive_) {
        return;
    }
    chunks_received_++;
    if (size % 2 != 0) {
        odd_bytes_dropped_++;
    }
    std::vector<int16_t> samples = audio::pcm16_from_bytes(data, size);   // drops the odd byte
    if (samples.empty()) {
        return;
    }
    if (source_rate <= 0) {
        source_rate = config_.source_sample_rate;
    }
    if (!is_supported_source_rate(source_rate)) {
        fail("Unsupported sample rate", "rejected chunk at " + std::to_string(source_rate) + " Hz");
        return;
    }
    try {
        std::vector<int16_t> resampled = audio::resample_linear(samples, source_rate, config_.target_sample_rate);
        frames_.push(audio::pcm16_to_bytes(resampled));
    } catch (const std::exception& e) {
        fail("Audio could not be processed", std::string("chunk rejected: ") + e.what());
    }
}

bool IngestionSession::on_close() {
    if (alive_.exchange(false)) {
        core::log_info("[session " + session_id_ + "] closing");
    }
    frames_.stop();

    if (!started_) {
        return true;
    }
    const bool finished = wait_finished(std::chrono::milliseconds(config_.close_timeout_ms));
    if (finished) {
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    } else {
        core::log_warn("[session " + session_id_ + "] transport still shutting down after " +
                       std::to_string(config_.close_timeout_ms) + " ms; not waiting further");
    }
    return finished;
}

bool IngestionSession::wait_finished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(finish_mutex_);
    return finish_cv_.wait_for(lock, timeout, [this] { return finished_; });
}

void IngestionSession::run() {
    asr::StreamParams params;
    params.language = config_.language;
    params.sample_rate = config_.target_sample_rate;
    params.encoding = "pcm";

    std::unique_ptr<asr::ITranscriptStream> stream;
    try {
        stream = transport_.start(params, frames_);
    } catch (const std::exception& e) {
        fail("Transcription could not be started", std::string("transport start failed: ") + e.what());
        mark_finished();
        return;
    }

    TranscriptDispatcher dispatcher(session_id_, agent_, channel_, config_.dispatcher);
    try {
        dispatcher.run(*stream);
        // Stream ended normally: the last utterances still get their replies
        dispatcher.wait_idle();
    } catch (const std::exception& e) {
        fail("Transcription error", std::string("transport stream failed: ") + e.what());
    }

    // After a failure this drops queued agent calls; the in-flight one completes first.
    dispatcher.shutdown();
    stream.reset();
    core::log_info("[session " + session_id_ + "] finished (" +
                   std::to_string(frames_.frames_emitted()) + " frames)");
    mark_finished();
}

void IngestionSession::fail(const std::string& client_message, const std::string& log_message) {
    core::log_error("[session " + session_id_ + "] " + log_message);
    alive_ = false;
    frames_.stop();
    try {
        channel_->send_error(client_message);
        channel_->close();
    } catch (const std::exception& e) {
        core::log_error("Channel exception while failing session: " + std::string(e.what()));
    }
}

void IngestionSession::mark_finished() {
    std::lock_guard<std::mutex> lock(finish_mutex_);
    finished_ = true;
    finish_cv_.notify_all();
}

std::string generate_session_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::string id;
    id.reserve(32);
    for (int part = 0; part < 2; ++part) {
        uint64_t v = rng();
        for (int i = 0; i < 16; ++i) {
            id.push_back(hex[v & 0xF]);
            v >>= 4;
        }
    }
    return id;
}

} // namespace app
