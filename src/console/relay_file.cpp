// Copyright (c) 2025 VAM Voice Relay
// Console tool: stream a WAV file through one ingestion session as if it were
// a connected client, printing what the client would receive.
#include <QCoreApplication>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "agent/http_agent_client.hpp"
#include "app/client_channel.hpp"
#include "app/ingestion_session.hpp"
#include "asr/whisper_backend.hpp"
#include "asr/whisper_transcriber.hpp"
#include "audio/file_capture.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

namespace {

// Prints client-bound messages instead of sending them
class ConsoleChannel : public app::IClientChannel {
public:
    void send_transcript(const std::string& text, bool is_partial) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << (is_partial ? "[partial] " : "[final]   ") << text << std::endl;
    }
    void send_reply(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[reply]   " << text << std::endl;
    }
    void send_error(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[error]   " << message << std::endl;
    }
    void send_audio(const uint8_t*, size_t size) override {
        core::log_debug("Dropping " + std::to_string(size) + " audio bytes");
    }
    void close() override { open_ = false; }
    bool is_open() const override { return open_; }

private:
    std::mutex mutex_;
    std::atomic<bool> open_{true};
};

void usage() {
    std::cerr << "Usage: relay_file <wav> [--model name|path] [--rate-override hz] [--no-pace] [-v]\n";
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);   // Qt Network needs an application instance

    std::string path;
    std::string model_arg;
    int rate_override = 0;
    bool pace = true;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") { core::set_verbose(true); continue; }
        if (a == "--model" && i + 1 < argc) { model_arg = argv[++i]; continue; }
        if (a == "--rate-override" && i + 1 < argc) { rate_override = std::atoi(argv[++i]); continue; }
        if (a == "--no-pace") { pace = false; continue; }
        if (a == "-h" || a == "--help") { usage(); return 0; }
        if (path.empty()) path = a;
    }
    if (path.empty()) {
        usage();
        return 2;
    }

    core::load_env_file(".env");
    const core::Config& cfg = core::get_config();
    if (cfg.verbose) core::set_verbose(true);

    audio::FileCapture file;
    if (!file.open(path)) {
        core::log_error("Failed to open WAV: " + path);
        return 1;
    }
    const int source_rate = rate_override > 0 ? rate_override : file.sample_rate();
    std::cerr << "[input] " << path << " (" << file.sample_rate() << " Hz, " << file.channels()
              << " ch, " << file.duration_seconds() << " s)";
    if (rate_override > 0) std::cerr << " declared as " << rate_override << " Hz";
    std::cerr << "\n";

    asr::WhisperBackend whisper;
    whisper.set_threads(cfg.whisper_threads);
    asr::WhisperTranscriberConfig wcfg;
    wcfg.model = model_arg.empty() ? cfg.whisper_model : model_arg;
    asr::WhisperTranscriber transcriber(whisper, wcfg);

    agent::HttpAgentSettings agent_settings;
    agent_settings.url = cfg.agent_url;
    agent_settings.api_key = cfg.agent_api_key;
    agent_settings.model = cfg.agent_model;
    agent_settings.max_tokens = cfg.agent_max_tokens;
    agent_settings.temperature = cfg.agent_temperature;
    agent_settings.top_p = cfg.agent_top_p;
    agent::Persona persona;
    if (!cfg.agent_prompt_file.empty()) {
        agent::load_persona(cfg.agent_prompt_file, persona);
    }
    agent::HttpAgentClient agent_client(agent_settings, persona);

    app::IngestionConfig icfg;
    icfg.source_sample_rate = source_rate;
    icfg.target_sample_rate = cfg.target_sample_rate;
    icfg.frame_ms = cfg.frame_ms;
    icfg.language = cfg.language;
    icfg.close_timeout_ms = cfg.close_timeout_ms;
    // Replies for every utterance, in order, before the session ends
    icfg.dispatcher.async_agent_calls = false;

    auto channel = std::make_shared<ConsoleChannel>();
    auto session = std::make_shared<app::IngestionSession>(app::generate_session_id(), icfg,
                                                           transcriber, agent_client, channel);
    if (!session->start()) {
        core::log_error("Session failed to start");
        return 1;
    }

    const int chunk_ms = 20;
    auto next_due = std::chrono::steady_clock::now();
    while (!file.eof() && channel->is_open()) {
        std::vector<uint8_t> chunk = file.read_chunk(chunk_ms);
        if (chunk.empty()) break;
        session->on_chunk(chunk.data(), chunk.size(), source_rate);
        if (pace) {
            next_due += std::chrono::milliseconds(chunk_ms);
            std::this_thread::sleep_until(next_due);
        }
    }

    if (!session->on_close()) {
        core::log_info("Waiting for transcription to finish...");
    }
    if (!session->wait_finished(std::chrono::minutes(5))) {
        core::log_error("Transcription did not finish");
        return 1;
    }
    core::log_info("Done: " + std::to_string(session->chunks_received()) + " chunks, " +
                   std::to_string(session->frame_buffer().frames_emitted()) + " frames");
    return 0;
}
