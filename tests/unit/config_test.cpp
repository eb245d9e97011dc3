// Copyright (c) 2025 VAM Voice Relay
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include "core/config.hpp"
#include "core/string_utils.hpp"

static void clear_env() {
    for (const char* key : {"PORT", "WS_PORT", "RELAY_LANGUAGE", "RELAY_SOURCE_RATE", "RELAY_FRAME_MS",
                            "RELAY_AGENT_TEMPERATURE", "RELAY_AGENT_URL", "RELAY_TTS_VOICE",
                            "RELAY_CLOSE_TIMEOUT_MS", "RELAY_DEBUG"}) {
        ::unsetenv(key);
    }
}

static void test_defaults() {
    clear_env();
    core::Config c = core::config_from_env();
    assert(c.http_port == 4000);
    assert(c.ws_port == 4001);
    assert(c.language == "es-US");
    assert(c.source_sample_rate == 44100);
    assert(c.target_sample_rate == 16000);
    assert(c.frame_ms == 20);
    assert(c.close_timeout_ms == 2000);
    assert(c.agent_max_tokens == 512);
    assert(c.agent_temperature > 0.69f && c.agent_temperature < 0.71f);
    assert(c.agent_top_p > 0.89f && c.agent_top_p < 0.91f);
    assert(c.tts_format == "mp3");
    assert(!c.verbose);
}

static void test_environment_overrides() {
    clear_env();
    ::setenv("PORT", "5000", 1);
    ::setenv("RELAY_LANGUAGE", "en-US", 1);
    ::setenv("RELAY_SOURCE_RATE", "48000", 1);
    ::setenv("RELAY_AGENT_TEMPERATURE", "0.2", 1);
    ::setenv("RELAY_DEBUG", "1", 1);
    core::Config c = core::config_from_env();
    assert(c.http_port == 5000);
    assert(c.ws_port == 5001);
    assert(c.language == "en-US");
    assert(c.source_sample_rate == 48000);
    assert(c.agent_temperature > 0.19f && c.agent_temperature < 0.21f);
    assert(c.verbose);

    ::setenv("WS_PORT", "7000", 1);
    assert(core::config_from_env().ws_port == 7000);
    clear_env();
}

static void test_malformed_numbers_keep_defaults() {
    clear_env();
    ::setenv("RELAY_FRAME_MS", "20ms", 1);
    ::setenv("RELAY_CLOSE_TIMEOUT_MS", "soon", 1);
    core::Config c = core::config_from_env();
    assert(c.frame_ms == 20);
    assert(c.close_timeout_ms == 2000);
    clear_env();
}

static void test_env_file() {
    clear_env();
    const std::string path = "config_test.env";
    {
        std::ofstream f(path);
        f << "# relay settings\n"
          << "\n"
          << "RELAY_AGENT_URL=\"http://localhost:8080/v1/chat/completions\"\n"
          << "export RELAY_TTS_VOICE='nova'\n"
          << "PORT = 4100\n"
          << "RELAY_LANGUAGE=fr-FR\n"
          << "not a setting\n";
    }
    ::setenv("RELAY_LANGUAGE", "es-MX", 1);   // already set: the file must not override it

    assert(core::load_env_file(path));
    core::Config c = core::config_from_env();
    assert(c.agent_url == "http://localhost:8080/v1/chat/completions");
    assert(c.tts_voice == "nova");
    assert(c.http_port == 4100);
    assert(c.language == "es-MX");

    std::remove(path.c_str());
    assert(!core::load_env_file(path));
    clear_env();
}

static void test_string_helpers() {
    assert(core::trim("  hola \t\n") == "hola");
    assert(core::trim("") == "");
    assert(core::is_blank(" \t "));
    assert(!core::is_blank(" a "));
}

int main() {
    test_defaults();
    test_environment_overrides();
    test_malformed_numbers_keep_defaults();
    test_env_file();
    test_string_helpers();
    std::cout << "config_test: PASS\n";
    return 0;
}
