// Copyright (c) 2025 VAM Voice Relay
// Process-wide line logging

#pragma once
#include <string>

namespace core {

void set_verbose(bool on);
bool is_verbose();

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

}
