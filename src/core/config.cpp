// Copyright (c) 2025 VAM Voice Relay

#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/string_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace core {

namespace {

bool get_env(const char* key, std::string& out) {
    const char* v = std::getenv(key);
    if (!v) return false;
    out = v;
    return true;
}

void read_string(const char* key, std::string& field) {
    std::string v;
    if (get_env(key, v) && !v.empty()) field = v;
}

void read_int(const char* key, int& field) {
    std::string v;
    if (!get_env(key, v) || v.empty()) return;
    try {
        size_t used = 0;
        int parsed = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        field = parsed;
    } catch (const std::exception&) {
        log_warn(std::string("Ignoring malformed ") + key + "=" + v);
    }
}

void read_float(const char* key, float& field) {
    std::string v;
    if (!get_env(key, v) || v.empty()) return;
    try {
        size_t used = 0;
        float parsed = std::stof(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        field = parsed;
    } catch (const std::exception&) {
        log_warn(std::string("Ignoring malformed ") + key + "=" + v);
    }
}

} // namespace

bool load_env_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return false;

    std::string line;
    while (std::getline(f, line)) {
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        if (s.compare(0, 7, "export ") == 0) s = trim(s.substr(7));

        size_t eq = s.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = trim(s.substr(0, eq));
        std::string value = trim(s.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        // overwrite=0: the real environment wins over the file
        ::setenv(key.c_str(), value.c_str(), 0);
    }
    return true;
}

Config config_from_env() {
    Config c;

    read_int("PORT", c.http_port);
    c.ws_port = c.http_port + 1;
    read_int("WS_PORT", c.ws_port);

    read_string("RELAY_LANGUAGE", c.language);
    read_int("RELAY_SOURCE_RATE", c.source_sample_rate);
    read_int("RELAY_TARGET_RATE", c.target_sample_rate);
    read_int("RELAY_FRAME_MS", c.frame_ms);
    read_int("RELAY_CLOSE_TIMEOUT_MS", c.close_timeout_ms);

    read_string("RELAY_WHISPER_MODEL", c.whisper_model);
    read_int("RELAY_WHISPER_THREADS", c.whisper_threads);

    read_string("RELAY_AGENT_URL", c.agent_url);
    read_string("RELAY_AGENT_API_KEY", c.agent_api_key);
    read_string("RELAY_AGENT_MODEL", c.agent_model);
    read_string("RELAY_AGENT_PROMPT_FILE", c.agent_prompt_file);
    read_int("RELAY_AGENT_MAX_TOKENS", c.agent_max_tokens);
    read_float("RELAY_AGENT_TEMPERATURE", c.agent_temperature);
    read_float("RELAY_AGENT_TOP_P", c.agent_top_p);

    read_string("RELAY_TTS_URL", c.tts_url);
    read_string("RELAY_TTS_API_KEY", c.tts_api_key);
    read_string("RELAY_TTS_MODEL", c.tts_model);
    read_string("RELAY_TTS_VOICE", c.tts_voice);
    read_string("RELAY_TTS_FORMAT", c.tts_format);

    c.verbose = std::getenv("RELAY_DEBUG") != nullptr;
    return c;
}

const Config& get_config() {
    static const Config config = config_from_env();
    return config;
}

}
