// Copyright (c) 2025 VAM Voice Relay
// Agent over an OpenAI-compatible chat-completions endpoint

#pragma once

#include "agent/agent_client.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <string>
#include <utility>
#include <vector>

namespace agent {

/// Endpoint and inference settings
struct HttpAgentSettings {
    std::string url;                          ///< e.g. https://api.openai.com/v1/chat/completions
    std::string api_key;                      ///< Sent as a Bearer token when set
    std::string model = "gpt-4o-mini";
    int max_tokens = 512;
    float temperature = 0.7f;
    float top_p = 0.9f;
    int timeout_ms = 30000;
};

/// Persona prompt plus few-shot example turns prepended to every request
struct Persona {
    std::string system;
    std::vector<std::pair<std::string, std::string>> examples;   ///< (user, assistant)
};

/// Reply used when the model returns no text
extern const char* const kEmptyReplyFallback;

/// Load a persona from JSON: {"system": str, "examples": [{"user": str, "assistant": str}]}
/// @return false if the file is missing or malformed
bool load_persona(const std::string& path, Persona& persona);

/// Request body for one user turn
QJsonObject build_chat_request(const HttpAgentSettings& settings, const Persona& persona,
                               const std::string& text, const std::string& session_id);

/// Extract choices[0].message.content; the fallback reply when it is empty.
/// @throws AgentError if the body is not a chat-completions response
std::string parse_chat_reply(const QByteArray& body);

/// Blocking agent call using Qt Network (requires a QCoreApplication).
/// Safe to call from any thread; each call uses its own network manager.
class HttpAgentClient : public IAgentClient {
public:
    HttpAgentClient(HttpAgentSettings settings, Persona persona);

    std::string invoke(const std::string& text, const std::string& session_id) override;

private:
    HttpAgentSettings settings_;
    Persona persona_;
};

} // namespace agent
