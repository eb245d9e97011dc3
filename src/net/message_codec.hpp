// Copyright (c) 2025 VAM Voice Relay
// JSON wire format of client messages and control bodies

#pragma once

#include <QByteArray>
#include <string>

namespace net {

/// {"transcript": text, "isPartial": bool}
QByteArray encode_transcript(const std::string& text, bool is_partial);

/// {"reply": text}
QByteArray encode_reply(const std::string& text);

/// {"error": message}
QByteArray encode_error(const std::string& message);

/// String member `field` of a JSON object body; empty when the body is not a
/// JSON object or the member is missing or not a string.
std::string json_string_field(const QByteArray& body, const char* field);

} // namespace net
