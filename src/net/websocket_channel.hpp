// Copyright (c) 2025 VAM Voice Relay
// IClientChannel over a QWebSocket

#pragma once

#include "app/client_channel.hpp"

#include <QByteArray>
#include <QPointer>
#include <QWebSocket>
#include <atomic>

namespace net {

/// Marshals client messages from worker threads onto the socket's thread.
///
/// All sends are queued to `context` (the long-lived server object that owns
/// the socket); the socket pointer is only dereferenced on that thread.
/// Sends after `context` is destroyed are dropped.
class WebSocketChannel : public app::IClientChannel {
public:
    WebSocketChannel(QObject* context, QWebSocket* socket);

    void send_transcript(const std::string& text, bool is_partial) override;
    void send_reply(const std::string& text) override;
    void send_error(const std::string& message) override;
    void send_audio(const uint8_t* data, size_t size) override;
    void close() override;
    bool is_open() const override { return open_; }

    /// Called by the server when the socket disconnects
    void mark_closed() { open_ = false; }

private:
    void post_text(const QByteArray& json);

    QPointer<QObject> context_;
    QPointer<QWebSocket> socket_;
    std::atomic<bool> open_{true};
};

} // namespace net
