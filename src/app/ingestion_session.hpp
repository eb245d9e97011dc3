// Copyright (c) 2025 VAM Voice Relay
// Ingestion Session - one client's audio lifecycle

#pragma once

#include "agent/agent_client.hpp"
#include "app/client_channel.hpp"
#include "app/transcript_dispatcher.hpp"
#include "asr/transcription_transport.hpp"
#include "audio/frame_buffer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace app {

/// Client-declared source rates outside this range are refused
constexpr int kMinSourceSampleRate = 8000;
constexpr int kMaxSourceSampleRate = 192000;

inline bool is_supported_source_rate(int hz) {
    return hz >= kMinSourceSampleRate && hz <= kMaxSourceSampleRate;
}

/// Configuration for one ingestion session
struct IngestionConfig {
    int source_sample_rate = 44100;           ///< Rate assumed for chunks without a declared rate
    int target_sample_rate = 16000;           ///< Rate of frames handed to the transport
    int frame_ms = 20;                        ///< Frame duration (640 bytes at 16 kHz)
    std::string language = "es-US";           ///< Transcription locale
    int close_timeout_ms = 2000;              ///< Max wait for the transport on close
    DispatcherConfig dispatcher;
};

/// Owns one connection's audio path:
///   chunk -> even-length trim -> resample -> FrameBuffer -> transport
/// and the worker that runs the transport and the TranscriptDispatcher.
///
/// Lifecycle:
/// - start() once after construction (launches the worker)
/// - on_chunk() from the ingress path, never blocks
/// - on_close() when the connection closes; waits at most close_timeout_ms
///   for the transport to wind down, then lets the worker finish on its own
///
/// Transport failures (start or mid-stream) send one {error} to the client and
/// close the connection; they are not retried.
///
/// Always held by std::shared_ptr (the worker keeps the session alive).
class IngestionSession : public std::enable_shared_from_this<IngestionSession> {
public:
    IngestionSession(std::string session_id,
                     const IngestionConfig& config,
                     asr::ITranscriptionTransport& transport,
                     agent::IAgentClient& agent,
                     std::shared_ptr<IClientChannel> channel);
    ~IngestionSession();

    IngestionSession(const IngestionSession&) = delete;
    IngestionSession& operator=(const IngestionSession&) = delete;

    /// Launch the transport worker.
    /// @return false if already started or closed
    bool start();

    /// Ingest one raw client chunk (LE PCM16 at `source_rate`).
    /// A trailing odd byte is dropped. Ignored once the session is closed.
    /// A rate outside [kMinSourceSampleRate, kMaxSourceSampleRate] fails the
    /// session with one {error} instead of buffering the chunk.
    void on_chunk(const uint8_t* data, size_t size, int source_rate);
    void on_chunk(const uint8_t* data, size_t size) { on_chunk(data, size, config_.source_sample_rate); }

    /// Connection closed: stop ingestion and wait (bounded) for the transport.
    /// @return true if the worker finished within close_timeout_ms
    bool on_close();

    /// Block until the worker has finished (tests, shutdown)
    /// @return true if finished within the timeout
    bool wait_finished(std::chrono::milliseconds timeout);

    bool is_alive() const { return alive_; }
    const std::string& session_id() const { return session_id_; }
    size_t frame_bytes() const { return frames_.frame_bytes(); }
    const audio::FrameBuffer& frame_buffer() const { return frames_; }

    uint64_t chunks_received() const { return chunks_received_; }
    uint64_t odd_bytes_dropped() const { return odd_bytes_dropped_; }

private:
    void run();
    void fail(const std::string& client_message, const std::string& log_message);
    void mark_finished();

    const std::string session_id_;
    const IngestionConfig config_;
    asr::ITranscriptionTransport& transport_;
    agent::IAgentClient& agent_;
    std::shared_ptr<IClientChannel> channel_;

    audio::FrameBuffer frames_;               // Exclusively owned; stop() is the consumer's end signal
    std::atomic<bool> alive_{true};
    std::atomic<bool> started_{false};

    std::mutex finish_mutex_;
    std::condition_variable finish_cv_;
    bool finished_ = false;
    std::thread worker_;

    std::atomic<uint64_t> chunks_received_{0};
    std::atomic<uint64_t> odd_bytes_dropped_{0};
};

/// Random 128-bit id rendered as 32 lowercase hex digits
std::string generate_session_id();

} // namespace app
