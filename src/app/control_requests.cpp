// Copyright (c) 2025 VAM Voice Relay

#include "app/control_requests.hpp"
#include "core/string_utils.hpp"

namespace app {

std::string resolve_client_id(const std::string& query_value, const std::string& header_value) {
    std::string id = core::trim(query_value);
    if (id.empty()) {
        id = core::trim(header_value);
    }
    return id;
}

ControlCheck check_speak_request(const std::string& client_id, const std::string& text) {
    if (client_id.empty()) {
        return ControlCheck::bad_request("Missing clientId (query ?clientId= or header x-client-id)");
    }
    if (core::is_blank(text)) {
        return ControlCheck::bad_request("Missing text");
    }
    return ControlCheck();
}

ControlCheck check_stop_request(const std::string& client_id) {
    if (client_id.empty()) {
        return ControlCheck::bad_request("Missing clientId");
    }
    return ControlCheck();
}

ControlCheck check_chat_request(const std::string& prompt) {
    if (core::is_blank(prompt)) {
        return ControlCheck::bad_request("Missing prompt");
    }
    return ControlCheck();
}

} // namespace app
