// Copyright (c) 2025 VAM Voice Relay
// Main entry point for the voice relay server

#include <QCoreApplication>
#include <QThreadPool>
#include <QTimer>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>

#include "agent/http_agent_client.hpp"
#include "app/ingestion_session.hpp"
#include "app/playback_session_manager.hpp"
#include "app/speech_playback.hpp"
#include "asr/whisper_backend.hpp"
#include "asr/whisper_transcriber.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "net/control_server.hpp"
#include "net/relay_server.hpp"
#include "tts/http_speech_synthesizer.hpp"

namespace {
std::atomic<bool> g_quit{false};

constexpr int kShutdownTimeoutMs = 30000;

void on_signal(int) {
    g_quit = true;
}
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("voice-relay"));

    if (core::load_env_file(".env")) {
        core::log_info("Loaded .env");
    }
    const core::Config& cfg = core::get_config();
    core::set_verbose(cfg.verbose);

    // Transcription
    asr::WhisperBackend whisper;
    whisper.set_threads(cfg.whisper_threads);
    asr::WhisperTranscriberConfig wcfg;
    wcfg.model = cfg.whisper_model;
    asr::WhisperTranscriber transcriber(whisper, wcfg);
    // Load up front so the first connection does not pay for it
    if (!whisper.load_model(cfg.whisper_model)) {
        core::log_warn("Whisper model '" + cfg.whisper_model + "' not loaded; sessions will report an error");
    }

    // Agent
    agent::HttpAgentSettings agent_settings;
    agent_settings.url = cfg.agent_url;
    agent_settings.api_key = cfg.agent_api_key;
    agent_settings.model = cfg.agent_model;
    agent_settings.max_tokens = cfg.agent_max_tokens;
    agent_settings.temperature = cfg.agent_temperature;
    agent_settings.top_p = cfg.agent_top_p;
    agent::Persona persona;
    if (!cfg.agent_prompt_file.empty() && !agent::load_persona(cfg.agent_prompt_file, persona)) {
        core::log_warn("Continuing without persona prompt");
    }
    if (cfg.agent_url.empty()) {
        core::log_warn("RELAY_AGENT_URL not set; agent calls will fail");
    }
    agent::HttpAgentClient agent_client(agent_settings, persona);

    // Speech synthesis
    tts::HttpSynthesizerSettings tts_settings;
    tts_settings.url = cfg.tts_url;
    tts_settings.api_key = cfg.tts_api_key;
    tts_settings.model = cfg.tts_model;
    tts_settings.voice = cfg.tts_voice;
    tts_settings.format = cfg.tts_format;
    tts::HttpSpeechSynthesizer synthesizer(tts_settings);

    app::PlaybackSessionManager playback_sessions;
    app::SpeechPlayback playback(playback_sessions, synthesizer);

    app::IngestionConfig icfg;
    icfg.source_sample_rate = cfg.source_sample_rate;
    icfg.target_sample_rate = cfg.target_sample_rate;
    icfg.frame_ms = cfg.frame_ms;
    icfg.language = cfg.language;
    icfg.close_timeout_ms = cfg.close_timeout_ms;

    net::RelayServer relay(icfg, transcriber, agent_client);
    if (!relay.listen(static_cast<quint16>(cfg.ws_port))) {
        return 1;
    }
    net::ControlServer control(playback, agent_client, &relay);
    if (!control.listen(static_cast<quint16>(cfg.http_port))) {
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    QTimer quit_poll;
    QObject::connect(&quit_poll, &QTimer::timeout, &app, [&app]() {
        if (g_quit) {
            core::log_info("Shutting down");
            app.quit();
        }
    });
    quit_poll.start(100);

    const int rc = app.exec();

    // Session workers and control requests borrow the transcriber, agent and
    // synthesizer below; none may outlive them.
    playback_sessions.stop_all();
    const bool drained = relay.shutdown(std::chrono::milliseconds(kShutdownTimeoutMs));
    QThreadPool::globalInstance()->waitForDone();
    if (!drained) {
        core::log_error("Exiting with session workers still running");
        std::_Exit(rc == 0 ? 1 : rc);
    }
    return rc;
}
