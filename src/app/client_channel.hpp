// Copyright (c) 2025 VAM Voice Relay
// Outbound side of one client connection

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace app {

/// Messages the relay sends to a connected client.
///
/// Thread Safety:
/// - Implementations must accept calls from any thread (session worker,
///   agent worker, synthesis worker)
/// - Calls after close() are dropped silently
class IClientChannel {
public:
    virtual ~IClientChannel() = default;

    /// {transcript, isPartial}
    virtual void send_transcript(const std::string& text, bool is_partial) = 0;

    /// {reply}
    virtual void send_reply(const std::string& text) = 0;

    /// {error}, sent before a fatal close
    virtual void send_error(const std::string& message) = 0;

    /// Synthesized speech bytes
    virtual void send_audio(const uint8_t* data, size_t size) = 0;

    /// Close the connection (idempotent)
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace app
