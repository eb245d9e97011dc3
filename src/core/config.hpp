// Copyright (c) 2025 VAM Voice Relay
// Relay configuration (environment + optional .env file)

#pragma once
#include <string>

namespace core {

struct Config {
    // Network
    int http_port = 4000;                ///< Control surface (speak/stop/chat)
    int ws_port = 4001;                  ///< Audio ingress WebSocket

    // Audio pipeline
    std::string language = "es-US";     ///< Transcription locale
    int source_sample_rate = 44100;      ///< Client audio rate when not declared
    int target_sample_rate = 16000;      ///< Transcription transport rate
    int frame_ms = 20;                   ///< Frame duration handed to the transport
    int close_timeout_ms = 2000;         ///< Max wait for transport shutdown on close

    // Whisper
    std::string whisper_model = "base";
    int whisper_threads = 0;             ///< 0 = hardware concurrency

    // Agent (OpenAI-compatible chat completions)
    std::string agent_url;
    std::string agent_api_key;
    std::string agent_model = "gpt-4o-mini";
    std::string agent_prompt_file;       ///< JSON persona prompt + few-shot examples
    int agent_max_tokens = 512;
    float agent_temperature = 0.7f;
    float agent_top_p = 0.9f;

    // Speech synthesis (OpenAI-compatible audio/speech)
    std::string tts_url;
    std::string tts_api_key;
    std::string tts_model = "tts-1";
    std::string tts_voice = "alloy";
    std::string tts_format = "mp3";

    bool verbose = false;
};

/// Load KEY=VALUE lines from a .env style file into the process environment.
/// Variables that are already set are left untouched.
/// @return true if the file was read
bool load_env_file(const std::string& path);

/// Build a Config from the process environment, defaults for unset keys.
Config config_from_env();

/// Process-wide configuration, built from the environment on first use.
const Config& get_config();

}
