// Copyright (c) 2025 VAM Voice Relay

#include "core/logging.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace core {

namespace {
std::mutex g_log_mutex;
std::atomic<bool> g_verbose{std::getenv("RELAY_DEBUG") != nullptr};
}

void set_verbose(bool on) { g_verbose = on; }
bool is_verbose() { return g_verbose; }

void log_debug(const std::string& msg) {
    if (!g_verbose) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[DEBUG] " << msg << std::endl;
}

void log_info(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[INFO] " << msg << std::endl;
}

void log_warn(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[WARN] " << msg << std::endl;
}

void log_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[ERROR] " << msg << std::endl;
}

}
