// Copyright (c) 2025 VAM Voice Relay
#include "asr/whisper_backend.hpp"
#include "core/logging.hpp"
#include "core/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>

#include "whisper.h"

// internal state for whisper backend
namespace {
struct whisper_state_holder {
    std::mutex mutex;
    whisper_context* ctx = nullptr;
    whisper_state* state = nullptr;
    bool initialized = false;
    unsigned n_threads = 0; // 0 = auto
};
whisper_state_holder g_ws;

// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    default:
        if (core::is_verbose()) std::fputs(text, stderr);
        break;
    }
}

std::string resolve_model_path(const std::string& model_name) {
    auto exists = [](const std::string& p) { return std::filesystem::exists(std::filesystem::u8path(p)); };
    const bool has_ext = (model_name.find(".gguf") != std::string::npos) ||
                         (model_name.find(".bin") != std::string::npos);
    if (has_ext) return model_name;

    const std::vector<std::string> candidates = {
        "models/" + model_name + ".gguf",
        "models/ggml-" + model_name + "-q5_1.gguf",
        "models/ggml-" + model_name + ".gguf",
        "models/" + model_name + ".bin",
        "models/ggml-" + model_name + ".bin",
        "models/ggml-" + model_name + "-q5_1.bin",
    };
    for (const auto& c : candidates) {
        if (exists(c)) return c;
    }
    return candidates.front(); // fallback, may fail
}

bool is_non_speech(const std::string& s) {
    if (s == "[BLANK_AUDIO]" || s == "[ Silence ]" || s == "[silence]" || s == "[ Silence]") return true;
    // Single bracketed/parenthesized token: [MUSIC], (applause)
    if (s.size() > 2 && ((s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')'))) {
        return true;
    }
    return false;
}
} // anonymous namespace

namespace asr {

std::string whisper_language_from_locale(const std::string& locale) {
    std::string lang = locale.substr(0, locale.find_first_of("-_"));
    std::transform(lang.begin(), lang.end(), lang.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lang;
}

bool WhisperBackend::load_model(const std::string& model_name) {
    std::lock_guard<std::mutex> lock(g_ws.mutex);
    if (g_ws.initialized) return true;

    const std::string path = resolve_model_path(model_name);
    // Set logging verbosity before creating context to suppress init spam when not verbose
    whisper_log_set(log_cb, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false; // CPU path
    core::log_info("[whisper] init from: " + path);
    g_ws.ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!g_ws.ctx) {
        core::log_error("[whisper] init FAILED for path: " + path);
        return false;
    }
    // persistent state for faster repeated calls
    g_ws.state = whisper_init_state(g_ws.ctx);
    if (!g_ws.state) {
        core::log_error("[whisper] state allocation failed");
        whisper_free(g_ws.ctx);
        g_ws.ctx = nullptr;
        return false;
    }
    g_ws.initialized = true;
    core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
    return true;
}

bool WhisperBackend::is_loaded() const {
    std::lock_guard<std::mutex> lock(g_ws.mutex);
    return g_ws.initialized;
}

std::string WhisperBackend::transcribe(const int16_t* data, size_t samples, const std::string& language) {
    if (!data || samples == 0) return {};
    std::lock_guard<std::mutex> lock(g_ws.mutex);
    if (!g_ws.initialized) return {};

    const std::string lang = whisper_language_from_locale(language);

    // Configure decoding for streaming/chunk mode
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = false;
    wparams.print_timestamps = false;
    wparams.print_special    = false;
    wparams.translate        = false;
    wparams.language         = lang.empty() ? "auto" : lang.c_str();
    wparams.detect_language  = lang.empty();
    wparams.n_threads        = (g_ws.n_threads == 0) ? static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))
                                                     : static_cast<int>(g_ws.n_threads);
    wparams.no_context       = true;  // every utterance stands alone
    wparams.single_segment   = false;
    wparams.greedy.best_of   = 1;

    // Convert int16 PCM to float [-1,1]
    std::vector<float> pcm_f32;
    pcm_f32.reserve(samples);
    constexpr float scale = 1.0f / 32768.0f;
    for (size_t i = 0; i < samples; ++i) {
        pcm_f32.push_back(static_cast<float>(data[i]) * scale);
    }
    core::log_debug("[whisper] running on samples=" + std::to_string(pcm_f32.size()) +
                    ", threads=" + std::to_string(wparams.n_threads));

    int ret = whisper_full_with_state(g_ws.ctx, g_ws.state, wparams, pcm_f32.data(), static_cast<int>(pcm_f32.size()));
    if (ret != 0) {
        core::log_error("[whisper] whisper_full FAILED, ret=" + std::to_string(ret));
        return {};
    }

    std::string out;
    const int n = whisper_full_n_segments_from_state(g_ws.state);
    for (int i = 0; i < n; ++i) {
        const char* txt = whisper_full_get_segment_text_from_state(g_ws.state, i);
        if (!txt) continue;
        std::string s = core::trim(txt);
        if (s.empty() || is_non_speech(s)) continue;
        if (!out.empty()) out += ' ';
        out += s;
    }
    return out;
}

void WhisperBackend::set_threads(int n) {
    std::lock_guard<std::mutex> lock(g_ws.mutex);
    g_ws.n_threads = n <= 0 ? 0u : static_cast<unsigned>(n);
}

} // namespace asr
