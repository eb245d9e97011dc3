// Copyright (c) 2025 VAM Voice Relay
// Conversational agent boundary

#pragma once

#include <stdexcept>
#include <string>

namespace agent {

/// Raised when the agent call fails (network, HTTP status, malformed reply)
class AgentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Single-shot conversational agent
class IAgentClient {
public:
    virtual ~IAgentClient() = default;

    /// Send one finalized user utterance and wait for the reply text.
    /// @param text User text (non-empty)
    /// @param session_id Correlates turns of one conversation
    /// @throws AgentError on failure
    virtual std::string invoke(const std::string& text, const std::string& session_id) = 0;
};

} // namespace agent
