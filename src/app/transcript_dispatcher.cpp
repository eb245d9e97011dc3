// Copyright (c) 2025 VAM Voice Relay

#include "app/transcript_dispatcher.hpp"
#include "core/logging.hpp"
#include "core/string_utils.hpp"

#include <exception>
#include <utility>

namespace app {

TranscriptDispatcher::TranscriptDispatcher(std::string session_id,
                                           agent::IAgentClient& agent,
                                           std::shared_ptr<IClientChannel> channel,
                                           DispatcherConfig config)
    : session_id_(std::move(session_id))
    , agent_(agent)
    , channel_(std::move(channel))
    , config_(config) {
    if (config_.async_agent_calls) {
        agent_thread_ = std::thread(&TranscriptDispatcher::agent_loop, this);
    }
}

TranscriptDispatcher::~TranscriptDispatcher() {
    shutdown();
}

void TranscriptDispatcher::run(asr::ITranscriptStream& stream) {
    asr::TranscriptEvent event;
    while (stream.next(event)) {
        handle_event(event);
    }
    core::log_debug("[dispatch] " + session_id_ + ": transcript stream ended");
}

void TranscriptDispatcher::handle_event(const asr::TranscriptEvent& event) {
    for (const auto& result : event.results) {
        handle_result(result);
    }
}

void TranscriptDispatcher::handle_result(const asr::TranscriptResult& result) {
    if (result.alternatives.empty()) {
        return;
    }
    const std::string& text = result.alternatives.front().text;

    try {
        channel_->send_transcript(text, result.is_partial);
    } catch (const std::exception& e) {
        core::log_error("Transcript send exception: " + std::string(e.what()));
    }
    transcripts_forwarded_++;

    if (result.is_partial) {
        return;
    }
    if (core::is_blank(text)) {
        return;
    }

    if (!config_.async_agent_calls) {
        invoke_agent(text);
        return;
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stopping_) {
        return;
    }
    pending_.push_back(text);
    queue_cv_.notify_one();
}

void TranscriptDispatcher::invoke_agent(const std::string& text) {
    agent_calls_++;
    core::log_debug("[dispatch] " + session_id_ + " -> agent: " + text);

    std::string reply;
    try {
        reply = agent_.invoke(text, session_id_);
    } catch (const std::exception& e) {
        agent_failures_++;
        core::log_error("[dispatch] agent call failed for session " + session_id_ + ": " + e.what());
        return;
    }

    try {
        channel_->send_reply(reply);
    } catch (const std::exception& e) {
        core::log_error("Reply send exception: " + std::string(e.what()));
    }
}

void TranscriptDispatcher::agent_loop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    for (;;) {
        queue_cv_.wait(lock, [this] { return !pending_.empty() || stopping_; });
        if (stopping_) {
            break;
        }
        std::string text = std::move(pending_.front());
        pending_.pop_front();
        busy_ = true;

        lock.unlock();
        invoke_agent(text);
        lock.lock();

        busy_ = false;
        idle_cv_.notify_all();
    }
    busy_ = false;
    idle_cv_.notify_all();
}

void TranscriptDispatcher::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!pending_.empty()) {
            core::log_debug("[dispatch] " + session_id_ + ": dropping " +
                            std::to_string(pending_.size()) + " pending agent call(s)");
        }
        pending_.clear();
        stopping_ = true;
        queue_cv_.notify_all();
        idle_cv_.notify_all();
    }
    if (agent_thread_.joinable()) {
        agent_thread_.join();
    }
}

void TranscriptDispatcher::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return (pending_.empty() && !busy_) || stopping_; });
}

} // namespace app
