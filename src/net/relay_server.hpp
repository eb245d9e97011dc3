// Copyright (c) 2025 VAM Voice Relay
// RelayServer - Qt WebSocket ingress for client audio

#pragma once

#include "app/ingestion_session.hpp"
#include "net/websocket_channel.hpp"

#include <QObject>
#include <QWebSocketServer>
#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace net {

/// Accepts client WebSocket connections and runs one IngestionSession per
/// connection.
///
/// Connection URL query parameters:
/// - clientId:   key for barge-in playback and audio delivery
/// - sessionId:  conversation id (falls back to clientId, then a random id)
/// - sampleRate: rate of the binary PCM16 chunks (default from config);
///   values outside 8000..192000 Hz are refused with one {error}
///
/// Binary messages are audio chunks; text messages are ignored.
class RelayServer : public QObject {
    Q_OBJECT

public:
    RelayServer(const app::IngestionConfig& config,
                asr::ITranscriptionTransport& transport,
                agent::IAgentClient& agent,
                QObject* parent = nullptr);
    ~RelayServer() override;

    bool listen(quint16 port);
    quint16 port() const { return server_.serverPort(); }

    /// Channel of the client's live connection, or nullptr.
    /// Must be called on the server thread.
    std::shared_ptr<WebSocketChannel> channel_for(const std::string& client_id) const;

    int connection_count() const { return static_cast<int>(connections_.size()); }

    /// Stop accepting, close every connection and wait for all session
    /// workers, including those of already-disconnected clients.
    /// Call before the transport and agent are destroyed.
    /// @return true if every worker finished within `timeout`
    bool shutdown(std::chrono::milliseconds timeout);

private slots:
    void onNewConnection();

private:
    struct Connection {
        std::string client_id;
        int source_rate = 0;
        std::shared_ptr<WebSocketChannel> channel;
        std::shared_ptr<app::IngestionSession> session;
    };

    void onBinaryMessage(QWebSocket* socket, const QByteArray& message);
    void onTextMessage(QWebSocket* socket, const QString& message);
    void onDisconnected(QWebSocket* socket);
    void dropConnection(QWebSocket* socket, const std::string& client_message);

    app::IngestionConfig config_;
    asr::ITranscriptionTransport& transport_;
    agent::IAgentClient& agent_;

    QWebSocketServer server_;
    std::unordered_map<QWebSocket*, Connection> connections_;
    std::unordered_map<std::string, QWebSocket*> by_client_;
    std::vector<std::weak_ptr<app::IngestionSession>> closing_;   // Disconnected, worker may still run
};

} // namespace net
