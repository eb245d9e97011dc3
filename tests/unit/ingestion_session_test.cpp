// Copyright (c) 2025 VAM Voice Relay
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include "app/ingestion_session.hpp"
#include "fakes.hpp"

using fakes::Sent;
using std::chrono::milliseconds;

namespace {
app::IngestionConfig config(int source_rate) {
    app::IngestionConfig c;
    c.source_sample_rate = source_rate;
    c.target_sample_rate = 16000;
    c.frame_ms = 20;
    c.close_timeout_ms = 2000;
    c.dispatcher.async_agent_calls = false;
    return c;
}

std::vector<uint8_t> pcm_bytes(size_t samples) {
    std::vector<uint8_t> v(samples * 2);
    for (size_t i = 0; i < samples; ++i) {
        const uint16_t s = static_cast<uint16_t>(i * 7);
        v[2 * i] = static_cast<uint8_t>(s & 0xFF);
        v[2 * i + 1] = static_cast<uint8_t>(s >> 8);
    }
    return v;
}
}

static void test_matching_rate_yields_two_frames() {
    fakes::ScriptedTransport transport;
    fakes::ScriptedAgent agent;
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto session = std::make_shared<app::IngestionSession>("s1", config(16000), transport, agent, channel);
    assert(session->frame_bytes() == 640);
    assert(session->start());
    assert(!session->start());

    auto data = pcm_bytes(640);   // 1280 bytes
    session->on_chunk(data.data(), data.size());
    assert(session->on_close());

    auto frames = transport.frames();
    assert(frames.size() == 2);
    assert(frames[0].size() == 640 && frames[1].size() == 640);
    std::vector<uint8_t> joined(frames[0]);
    joined.insert(joined.end(), frames[1].begin(), frames[1].end());
    assert(joined == data);
    assert(session->frame_buffer().bytes_discarded() == 0);

    auto params = transport.last_params();
    assert(params.sample_rate == 16000);
    assert(params.encoding == "pcm");
    assert(params.language == "es-US");
    assert(transport.started() == 1);
}

static void test_odd_chunk_is_truncated() {
    fakes::ScriptedTransport transport;
    fakes::ScriptedAgent agent;
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto session = std::make_shared<app::IngestionSession>("s1", config(16000), transport, agent, channel);

    const uint8_t chunk[7] = {1, 0, 2, 0, 3, 0, 9};
    session->on_chunk(chunk, sizeof(chunk));
    assert(session->odd_bytes_dropped() == 1);
    assert(session->chunks_received() == 1);
    assert(session->frame_buffer().buffered() == 6);
    session->on_close();
}

static void test_chunks_are_resampled_to_target_rate() {
    fakes::ScriptedTransport transport;
    fakes::ScriptedAgent agent;
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto session = std::make_shared<app::IngestionSession>("s1", config(44100), transport, agent, channel);
    assert(session->start());

    // Ten 10 ms chunks at 44.1 kHz -> 10 * 160 samples at 16 kHz -> 5 frames
    auto chunk = pcm_bytes(441);
    for (int i = 0; i < 10; ++i) session->on_chunk(chunk.data(), chunk.size());
    assert(session->on_close());
    assert(transport.frames().size() == 5);

    // A per-connection declared rate overrides the default
    fakes::ScriptedTransport t2;
    auto s2 = std::make_shared<app::IngestionSession>("s2", config(44100), t2, agent, channel);
    assert(s2->start());
    auto same = pcm_bytes(320);
    s2->on_chunk(same.data(), same.size(), 16000);
    assert(s2->on_close());
    assert(t2.frames().size() == 1);
}

static void test_transcripts_and_replies_reach_client() {
    fakes::ScriptedTransport transport;
    transport.events = {fakes::event("ho", true), fakes::event("hola", false)};
    fakes::ScriptedAgent agent;
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto session = std::make_shared<app::IngestionSession>("s1", config(16000), transport, agent, channel);
    assert(session->start());
    session->on_close();
    assert(session->wait_finished(milliseconds(2000)));

    assert(channel->count(Sent::TRANSCRIPT) == 2);
    assert(channel->count(Sent::REPLY) == 1);
    auto calls = agent.calls();
    assert(calls.size() == 1 && calls[0].first == "hola" && calls[0].second == "s1");
    assert(channel->close_calls() == 0);
}

static void test_transport_start_failure_reports_and_closes() {
    fakes::ScriptedTransport transport;
    transport.fail_start = true;
    fakes::ScriptedAgent agent;
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto session = std::make_shared<app::IngestionSession>("s1", config(16000), transport, agent, channel);
    assert(session->start());
    assert(session->wait_finished(milliseconds(2000)));

    auto msgs = channel->messages();
    assert(msgs.size() == 1);
    assert(msgs[0].kind == Sent::ERROR);
    assert(msgs[0].text == "Transcription could not be started");
    assert(channel->close_calls() == 1);
    assert(!session->is_alive());

    // Audio after the failure is ignored
    auto data = pcm_bytes(320);
    session->on_chunk(data.data(), data.size());
    assert(session->chunks_received() == 0);
    session->on_close();
}

static void test_mid_stream_failure_reports_generic_error() {
    fakes::ScriptedTransport transport;
    transport.events = {fakes::event("hola", true)};
    transport.fail_mid_stream = true;
    fakes::ScriptedAgent agent;
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto session = std::make_shared<app::IngestionSession>("s1", config(16000), transport, agent, channel);
    assert(session->start());
    session->on_close();
    assert(session->wait_finished(milliseconds(2000)));

    auto msgs = channel->messages();
    assert(msgs.size() == 2);
    assert(msgs[0].kind == Sent::TRANSCRIPT);
    assert(msgs[1].kind == Sent::ERROR && msgs[1].text == "Transcription error");
    assert(channel->close_calls() == 1);
    assert(transport.started() == 1);   // not retried
}

static void test_close_wait_is_bounded() {
    fakes::ScriptedTransport transport;
    transport.linger = milliseconds(800);
    fakes::ScriptedAgent agent;
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto cfg = config(16000);
    cfg.close_timeout_ms = 50;
    auto session = std::make_shared<app::IngestionSession>("s1", cfg, transport, agent, channel);
    assert(session->start());

    auto t0 = std::chrono::steady_clock::now();
    assert(!session->on_close());
    assert(std::chrono::steady_clock::now() - t0 < milliseconds(600));
    assert(session->wait_finished(milliseconds(3000)));
}

static void test_worker_outlives_released_session() {
    fakes::ScriptedTransport transport;
    transport.linger = milliseconds(100);
    fakes::ScriptedAgent agent;
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto cfg = config(16000);
    cfg.close_timeout_ms = 1;
    {
        auto session = std::make_shared<app::IngestionSession>("s1", cfg, transport, agent, channel);
        assert(session->start());
        session->on_close();
    }
    // The worker still owns the session; let it finish on its own
    std::this_thread::sleep_for(milliseconds(300));
    assert(transport.started() == 1);
}

static void test_out_of_range_rate_is_refused() {
    assert(app::is_supported_source_rate(8000));
    assert(app::is_supported_source_rate(192000));
    assert(!app::is_supported_source_rate(7999));
    assert(!app::is_supported_source_rate(192001));
    assert(!app::is_supported_source_rate(1));

    fakes::ScriptedTransport transport;
    fakes::ScriptedAgent agent;
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto session = std::make_shared<app::IngestionSession>("s1", config(16000), transport, agent, channel);
    assert(session->start());

    fakes::ScriptedTransport other_transport;
    auto other_channel = std::make_shared<fakes::RecordingChannel>();
    auto other = std::make_shared<app::IngestionSession>("s2", config(16000), other_transport, agent, other_channel);
    assert(other->start());

    // 1 Hz would expand each chunk 16000-fold
    std::vector<uint8_t> zeros(200, 0);
    session->on_chunk(zeros.data(), zeros.size(), 1);
    assert(session->frame_buffer().buffered() == 0);
    assert(session->frame_buffer().frames_emitted() == 0);
    assert(!session->is_alive());
    auto msgs = channel->messages();
    assert(msgs.size() == 1);
    assert(msgs[0].kind == Sent::ERROR && msgs[0].text == "Unsupported sample rate");
    assert(channel->close_calls() == 1);

    // Later chunks are ignored
    session->on_chunk(zeros.data(), zeros.size(), 16000);
    assert(session->chunks_received() == 1);
    assert(session->wait_finished(milliseconds(2000)));

    // Other sessions keep streaming
    auto data = pcm_bytes(320);
    other->on_chunk(data.data(), data.size(), 16000);
    assert(other->is_alive());
    assert(other->on_close());
    assert(other_transport.frames().size() == 1);
    assert(other_channel->count(Sent::ERROR) == 0);
}

static void test_worker_drains_before_collaborators_go_away() {
    fakes::ScriptedTransport transport;
    transport.events = {fakes::event("hola", false)};
    fakes::ScriptedAgent agent;
    agent.delay = milliseconds(300);
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto cfg = config(16000);
    cfg.close_timeout_ms = 20;
    auto session = std::make_shared<app::IngestionSession>("s1", cfg, transport, agent, channel);
    assert(session->start());

    // Close gives up early; shutdown then waits the worker out
    assert(!session->on_close());
    assert(session->wait_finished(milliseconds(3000)));
    assert(agent.calls().size() == 1);
    assert(channel->count(Sent::REPLY) == 1);

    // Nothing touches the agent once the worker reported finished
    std::this_thread::sleep_for(milliseconds(50));
    assert(agent.calls().size() == 1);
}

static void test_generated_session_ids() {
    const std::string a = app::generate_session_id();
    const std::string b = app::generate_session_id();
    assert(a.size() == 32);
    assert(a != b);
    for (char c : a) assert((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
}

int main() {
    test_matching_rate_yields_two_frames();
    test_odd_chunk_is_truncated();
    test_chunks_are_resampled_to_target_rate();
    test_transcripts_and_replies_reach_client();
    test_transport_start_failure_reports_and_closes();
    test_mid_stream_failure_reports_generic_error();
    test_close_wait_is_bounded();
    test_worker_outlives_released_session();
    test_out_of_range_rate_is_refused();
    test_worker_drains_before_collaborators_go_away();
    test_generated_session_ids();
    std::cout << "ingestion_session_test: PASS\n";
    return 0;
}
