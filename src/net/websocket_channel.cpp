// Copyright (c) 2025 VAM Voice Relay

#include "net/websocket_channel.hpp"
#include "net/message_codec.hpp"

#include <QMetaObject>
#include <QString>

namespace net {

WebSocketChannel::WebSocketChannel(QObject* context, QWebSocket* socket)
    : context_(context)
    , socket_(socket) {}

void WebSocketChannel::send_transcript(const std::string& text, bool is_partial) {
    post_text(encode_transcript(text, is_partial));
}

void WebSocketChannel::send_reply(const std::string& text) {
    post_text(encode_reply(text));
}

void WebSocketChannel::send_error(const std::string& message) {
    post_text(encode_error(message));
}

void WebSocketChannel::send_audio(const uint8_t* data, size_t size) {
    if (!open_ || size == 0 || !context_) {
        return;
    }
    QByteArray bytes(reinterpret_cast<const char*>(data), static_cast<int>(size));
    QPointer<QWebSocket> socket = socket_;
    QMetaObject::invokeMethod(context_.data(), [socket, bytes]() {
        if (socket) {
            socket->sendBinaryMessage(bytes);
        }
    }, Qt::QueuedConnection);
}

void WebSocketChannel::close() {
    if (!open_.exchange(false) || !context_) {
        return;
    }
    QPointer<QWebSocket> socket = socket_;
    QMetaObject::invokeMethod(context_.data(), [socket]() {
        if (socket) {
            socket->close();
        }
    }, Qt::QueuedConnection);
}

void WebSocketChannel::post_text(const QByteArray& json) {
    if (!open_ || !context_) {
        return;
    }
    QPointer<QWebSocket> socket = socket_;
    QMetaObject::invokeMethod(context_.data(), [socket, json]() {
        if (socket) {
            socket->sendTextMessage(QString::fromUtf8(json));
        }
    }, Qt::QueuedConnection);
}

} // namespace net
