// Copyright (c) 2025 VAM Voice Relay
// End-to-end relay flow with in-process fakes: client audio in, transcripts and
// replies out, and barge-in speech delivered over the same client channel.
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include "app/ingestion_session.hpp"
#include "app/speech_playback.hpp"
#include "fakes.hpp"

using fakes::Sent;
using std::chrono::milliseconds;

namespace {
app::IngestionConfig relay_config() {
    app::IngestionConfig c;
    c.source_sample_rate = 44100;
    c.target_sample_rate = 16000;
    c.frame_ms = 20;
    c.close_timeout_ms = 2000;
    return c;
}

std::vector<uint8_t> tone_chunk_44k_10ms() {
    std::vector<uint8_t> v(441 * 2);
    for (size_t i = 0; i < 441; ++i) {
        const int16_t s = static_cast<int16_t>((i % 50) * 400 - 10000);
        v[2 * i] = static_cast<uint8_t>(static_cast<uint16_t>(s) & 0xFF);
        v[2 * i + 1] = static_cast<uint8_t>(static_cast<uint16_t>(s) >> 8);
    }
    return v;
}
}

static void test_two_clients_are_independent() {
    fakes::ScriptedTransport transport;
    transport.events = {fakes::event("hol", true), fakes::event("hola", false)};
    fakes::ScriptedAgent agent;
    agent.fail_on = {"hola"};   // agent trouble must not leak into the other client

    auto ch_a = std::make_shared<fakes::RecordingChannel>();
    auto ch_b = std::make_shared<fakes::RecordingChannel>();
    auto a = std::make_shared<app::IngestionSession>("a", relay_config(), transport, agent, ch_a);
    auto b = std::make_shared<app::IngestionSession>("b", relay_config(), transport, agent, ch_b);
    assert(a->start());
    assert(b->start());

    auto chunk = tone_chunk_44k_10ms();
    std::thread feed_a([&] { for (int i = 0; i < 100; ++i) a->on_chunk(chunk.data(), chunk.size()); });
    std::thread feed_b([&] { for (int i = 0; i < 50; ++i) b->on_chunk(chunk.data(), chunk.size()); });
    feed_a.join();
    feed_b.join();

    assert(a->on_close());
    assert(b->on_close());

    // 100 x 160 samples = 16000 samples = 32000 bytes = 50 frames; 25 for b
    size_t frames = transport.frames().size();
    assert(frames == 75);
    assert(a->frame_buffer().frames_emitted() == 50);
    assert(b->frame_buffer().frames_emitted() == 25);

    for (auto& ch : {ch_a, ch_b}) {
        assert(ch->count(Sent::TRANSCRIPT) == 2);
        assert(ch->count(Sent::REPLY) == 0);
        assert(ch->count(Sent::ERROR) == 0);
        assert(ch->close_calls() == 0);
    }
    assert(agent.calls().size() == 2);
}

static void test_reply_then_barge_in_over_client_channel() {
    fakes::ScriptedTransport transport;
    transport.events = {fakes::event("cuéntame un cuento", false)};
    fakes::ScriptedAgent agent;
    auto channel = std::make_shared<fakes::RecordingChannel>();
    auto session = std::make_shared<app::IngestionSession>("c1", relay_config(), transport, agent, channel);
    assert(session->start());

    auto chunk = tone_chunk_44k_10ms();
    for (int i = 0; i < 20; ++i) session->on_chunk(chunk.data(), chunk.size());
    session->on_close();
    assert(channel->wait_for(Sent::REPLY, 1, milliseconds(2000)));
    const std::string reply = channel->messages().back().text;
    assert(reply == "reply:cuéntame un cuento");

    // The reply is spoken; a second request barges in on the first
    app::PlaybackSessionManager sessions;
    fakes::ChunkedSynthesizer synth;
    synth.chunks = 500;
    synth.interval = milliseconds(2);
    app::SpeechPlayback playback(sessions, synth);
    auto to_client = [channel](const uint8_t* data, size_t size) {
        channel->send_audio(data, size);
        return channel->is_open();
    };

    app::PlaybackResult first;
    std::thread speaker([&] { first = playback.speak("c1", reply, to_client); });
    assert(channel->wait_for(Sent::AUDIO, 3, milliseconds(2000)));

    fakes::ChunkedSynthesizer short_synth;
    short_synth.chunks = 3;
    app::SpeechPlayback playback2(sessions, short_synth);
    app::PlaybackResult second = playback2.speak("c1", "¡Alto!", to_client);
    speaker.join();

    assert(first.outcome == app::PlaybackOutcome::CANCELLED);
    assert(second.outcome == app::PlaybackOutcome::COMPLETED);
    assert(second.bytes_delivered == 300);
    assert(!sessions.is_active("c1"));

    size_t audio_bytes = 0;
    for (const auto& m : channel->messages()) {
        if (m.kind == Sent::AUDIO) audio_bytes += m.audio_bytes;
    }
    assert(audio_bytes == first.bytes_delivered + second.bytes_delivered);
}

int main() {
    test_two_clients_are_independent();
    test_reply_then_barge_in_over_client_channel();
    std::cout << "relay_pipeline_test: PASS\n";
    return 0;
}
