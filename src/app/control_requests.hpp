// Copyright (c) 2025 VAM Voice Relay
// Validation of control-surface requests (speak / stop / chat)

#pragma once

#include <string>

namespace app {

/// Outcome of validating one control request
struct ControlCheck {
    bool ok = true;
    int http_status = 200;                    ///< 400 when the request is malformed
    std::string error;                        ///< Human-readable reason when !ok

    static ControlCheck bad_request(const std::string& reason) {
        ControlCheck c;
        c.ok = false;
        c.http_status = 400;
        c.error = reason;
        return c;
    }
};

/// Client id from the `clientId` query parameter, else the `x-client-id` header
std::string resolve_client_id(const std::string& query_value, const std::string& header_value);

/// Requires a client id and non-blank text
ControlCheck check_speak_request(const std::string& client_id, const std::string& text);

/// Requires a client id
ControlCheck check_stop_request(const std::string& client_id);

/// Requires a non-blank prompt
ControlCheck check_chat_request(const std::string& prompt);

} // namespace app
