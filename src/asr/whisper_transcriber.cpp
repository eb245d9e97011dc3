// Copyright (c) 2025 VAM Voice Relay

#include "asr/whisper_transcriber.hpp"
#include "audio/frame_buffer.hpp"
#include "audio/resampler.hpp"
#include "core/logging.hpp"

#include <cmath>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

namespace asr {

namespace {

class WhisperStream : public ITranscriptStream {
public:
    WhisperStream(WhisperBackend& backend, const WhisperTranscriberConfig& config,
                  const StreamParams& params, audio::FrameBuffer& frames)
        : backend_(backend), config_(config), params_(params), frames_(frames) {
        worker_ = std::thread(&WhisperStream::worker_loop, this);
    }

    ~WhisperStream() override {
        // The worker ends once the frame buffer reports end of stream.
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    bool next(TranscriptEvent& event) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !events_.empty() || finished_; });
        if (!events_.empty()) {
            event = std::move(events_.front());
            events_.pop_front();
            return true;
        }
        if (!error_.empty()) {
            throw TransportError(error_);
        }
        return false;
    }

private:
    void worker_loop();
    void emit(const std::string& text, bool is_partial);
    void finish(const std::string& error);

    size_t ms_to_samples(int ms) const {
        return static_cast<size_t>(params_.sample_rate) * static_cast<size_t>(ms) / 1000;
    }

    WhisperBackend& backend_;
    WhisperTranscriberConfig config_;
    StreamParams params_;
    audio::FrameBuffer& frames_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TranscriptEvent> events_;
    bool finished_ = false;
    std::string error_;

    std::thread worker_;
};

void WhisperStream::emit(const std::string& text, bool is_partial) {
    if (text.empty()) return;
    TranscriptEvent event;
    TranscriptResult result;
    result.alternatives.push_back(TranscriptAlternative{text});
    result.is_partial = is_partial;
    event.results.push_back(std::move(result));

    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
    cv_.notify_one();
}

void WhisperStream::finish(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
    error_ = error;
    cv_.notify_all();
}

void WhisperStream::worker_loop() {
    std::vector<int16_t> utterance;
    size_t samples_since_partial = 0;
    size_t trailing_silence = 0;
    bool in_speech = false;

    const size_t partial_samples = ms_to_samples(config_.partial_interval_ms);
    const size_t silence_samples = ms_to_samples(config_.silence_ms);
    const size_t max_samples = ms_to_samples(config_.max_utterance_ms);

    auto settle = [&]() {
        if (in_speech && !utterance.empty()) {
            emit(backend_.transcribe(utterance.data(), utterance.size(), params_.language), false);
        }
        utterance.clear();
        samples_since_partial = 0;
        trailing_silence = 0;
        in_speech = false;
    };

    try {
        std::vector<uint8_t> frame;
        while (frames_.next_frame(frame)) {
            const std::vector<int16_t> samples = audio::pcm16_from_bytes(frame.data(), frame.size());
            const bool speech = frame_rms(samples.data(), samples.size()) >= config_.speech_rms;

            if (!in_speech) {
                if (!speech) continue;
                in_speech = true;
            }

            utterance.insert(utterance.end(), samples.begin(), samples.end());
            samples_since_partial += samples.size();
            trailing_silence = speech ? 0 : trailing_silence + samples.size();

            if (trailing_silence >= silence_samples || utterance.size() >= max_samples) {
                settle();
            } else if (speech && samples_since_partial >= partial_samples) {
                samples_since_partial = 0;
                emit(backend_.transcribe(utterance.data(), utterance.size(), params_.language), true);
            }
        }
        // End of audio: settle whatever the speaker left us with
        settle();
        finish(std::string());
    } catch (const std::exception& e) {
        core::log_error(std::string("[whisper] stream failed: ") + e.what());
        finish(e.what());
    }
}

} // namespace

float frame_rms(const int16_t* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;
    double acc = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const double s = samples[i] / 32768.0;
        acc += s * s;
    }
    return static_cast<float>(std::sqrt(acc / static_cast<double>(count)));
}

WhisperTranscriber::WhisperTranscriber(WhisperBackend& backend, const WhisperTranscriberConfig& config)
    : backend_(backend), config_(config) {}

std::unique_ptr<ITranscriptStream> WhisperTranscriber::start(const StreamParams& params,
                                                             audio::FrameBuffer& frames) {
    if (params.encoding != "pcm") {
        throw TransportError("whisper transport supports pcm only, got: " + params.encoding);
    }
    if (params.sample_rate != 16000) {
        throw TransportError("whisper transport requires 16000 Hz, got: " + std::to_string(params.sample_rate));
    }
    if (!backend_.is_loaded() && !backend_.load_model(config_.model)) {
        throw TransportError("whisper model could not be loaded: " + config_.model);
    }
    core::log_debug("[whisper] stream started (" + params.language + ")");
    return std::make_unique<WhisperStream>(backend_, config_, params, frames);
}

} // namespace asr
