// Copyright (c) 2025 VAM Voice Relay
// Transcript Dispatcher - forwards transcripts, turns final utterances into agent calls

#pragma once

#include "agent/agent_client.hpp"
#include "asr/transcription_transport.hpp"
#include "app/client_channel.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace app {

struct DispatcherConfig {
    /// Run agent calls on a per-session worker so transcript forwarding never
    /// waits for the agent. Replies keep utterance order either way.
    bool async_agent_calls = true;
};

/// Sequential consumer of one session's transcript stream.
///
/// - Every result is forwarded to the client (first alternative only)
/// - A final result with non-blank text triggers exactly one agent call
///   scoped to the session id; the reply follows that final transcript
/// - Agent failures are logged and skipped; the stream keeps flowing
class TranscriptDispatcher {
public:
    TranscriptDispatcher(std::string session_id,
                         agent::IAgentClient& agent,
                         std::shared_ptr<IClientChannel> channel,
                         DispatcherConfig config = DispatcherConfig());

    /// Stops the agent worker (pending calls are dropped)
    ~TranscriptDispatcher();

    TranscriptDispatcher(const TranscriptDispatcher&) = delete;
    TranscriptDispatcher& operator=(const TranscriptDispatcher&) = delete;

    /// Consume `stream` until it ends.
    /// @throws asr::TransportError if the stream fails
    void run(asr::ITranscriptStream& stream);

    /// Forward one event (used by run())
    void handle_event(const asr::TranscriptEvent& event);

    /// Wait for the in-flight agent call, drop queued ones, stop the worker.
    void shutdown();

    /// Block until every queued agent call has completed (tests, graceful drain)
    void wait_idle();

    const std::string& session_id() const { return session_id_; }
    int transcripts_forwarded() const { return transcripts_forwarded_; }
    int agent_calls() const { return agent_calls_; }
    int agent_failures() const { return agent_failures_; }

private:
    void handle_result(const asr::TranscriptResult& result);
    void invoke_agent(const std::string& text);
    void agent_loop();

    std::string session_id_;
    agent::IAgentClient& agent_;
    std::shared_ptr<IClientChannel> channel_;
    DispatcherConfig config_;

    // Agent worker (async mode)
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::string> pending_;
    bool stopping_ = false;
    bool busy_ = false;
    std::thread agent_thread_;

    // Statistics
    std::atomic<int> transcripts_forwarded_{0};
    std::atomic<int> agent_calls_{0};
    std::atomic<int> agent_failures_{0};
};

} // namespace app
