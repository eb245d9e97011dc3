// Copyright (c) 2025 VAM Voice Relay
#pragma once
#include <string>

namespace core {

inline std::string trim(const std::string& x) {
    size_t a = x.find_first_not_of(" \t\r\n");
    size_t b = x.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    return x.substr(a, b - a + 1);
}

inline bool is_blank(const std::string& x) {
    return x.find_first_not_of(" \t\r\n") == std::string::npos;
}

}
