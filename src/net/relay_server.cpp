// Copyright (c) 2025 VAM Voice Relay

#include "net/relay_server.hpp"
#include "app/control_requests.hpp"
#include "core/logging.hpp"
#include "net/message_codec.hpp"

#include <QDebug>
#include <QHostAddress>
#include <QNetworkRequest>
#include <QThreadPool>
#include <QUrlQuery>
#include <algorithm>
#include <stdexcept>

namespace net {

RelayServer::RelayServer(const app::IngestionConfig& config,
                         asr::ITranscriptionTransport& transport,
                         agent::IAgentClient& agent,
                         QObject* parent)
    : QObject(parent)
    , config_(config)
    , transport_(transport)
    , agent_(agent)
    , server_(QStringLiteral("voice-relay"), QWebSocketServer::NonSecureMode) {
    connect(&server_, &QWebSocketServer::newConnection, this, &RelayServer::onNewConnection);
}

RelayServer::~RelayServer() {
    shutdown(std::chrono::milliseconds(0));
}

bool RelayServer::shutdown(std::chrono::milliseconds timeout) {
    server_.close();
    std::vector<std::shared_ptr<app::IngestionSession>> sessions;
    for (auto& entry : connections_) {
        // Detach our slots first so abort() cannot re-enter onDisconnected()
        QObject::disconnect(entry.first, nullptr, this, nullptr);
        entry.second.channel->mark_closed();
        entry.second.session->on_close();
        sessions.push_back(entry.second.session);
        entry.first->abort();
        entry.first->deleteLater();
    }
    connections_.clear();
    by_client_.clear();

    for (auto& weak : closing_) {
        if (auto session = weak.lock()) {
            sessions.push_back(session);
        }
    }
    closing_.clear();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool all_finished = true;
    for (auto& session : sessions) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() < 0) left = std::chrono::milliseconds(0);
        if (!session->wait_finished(left)) {
            all_finished = false;
        }
    }
    if (!all_finished && timeout.count() > 0) {
        core::log_error("Session workers still running after " + std::to_string(timeout.count()) + " ms");
    }
    return all_finished;
}

bool RelayServer::listen(quint16 port) {
    if (!server_.listen(QHostAddress::Any, port)) {
        core::log_error("WebSocket listen failed on port " + std::to_string(port) + ": " +
                        server_.errorString().toStdString());
        return false;
    }
    core::log_info("Audio ingress listening on ws://0.0.0.0:" + std::to_string(server_.serverPort()));
    return true;
}

std::shared_ptr<WebSocketChannel> RelayServer::channel_for(const std::string& client_id) const {
    auto it = by_client_.find(client_id);
    if (it == by_client_.end()) {
        return nullptr;
    }
    auto conn = connections_.find(it->second);
    return conn == connections_.end() ? nullptr : conn->second.channel;
}

void RelayServer::onNewConnection() {
    while (QWebSocket* socket = server_.nextPendingConnection()) {
        const QUrlQuery query(socket->requestUrl());
        const std::string header_id = socket->request().rawHeader("x-client-id").toStdString();

        Connection conn;
        conn.client_id = app::resolve_client_id(
            query.queryItemValue(QStringLiteral("clientId")).toStdString(), header_id);

        std::string session_id = query.queryItemValue(QStringLiteral("sessionId")).toStdString();
        if (session_id.empty()) session_id = conn.client_id;
        if (session_id.empty()) session_id = app::generate_session_id();

        bool rate_ok = false;
        const int rate = query.queryItemValue(QStringLiteral("sampleRate")).toInt(&rate_ok);
        conn.source_rate = rate_ok ? rate : config_.source_sample_rate;
        if (!app::is_supported_source_rate(conn.source_rate)) {
            core::log_warn("Refusing connection with sampleRate " + std::to_string(conn.source_rate));
            socket->sendTextMessage(QString::fromUtf8(encode_error("Unsupported sample rate")));
            socket->close();
            socket->deleteLater();
            continue;
        }

        core::log_info("Client connected (client=" + (conn.client_id.empty() ? std::string("-") : conn.client_id) +
                       ", session=" + session_id + ", rate=" + std::to_string(conn.source_rate) + ")");

        conn.channel = std::make_shared<WebSocketChannel>(this, socket);
        conn.session = std::make_shared<app::IngestionSession>(session_id, config_, transport_, agent_, conn.channel);

        connect(socket, &QWebSocket::binaryMessageReceived, this,
                [this, socket](const QByteArray& message) { onBinaryMessage(socket, message); });
        connect(socket, &QWebSocket::textMessageReceived, this,
                [this, socket](const QString& message) { onTextMessage(socket, message); });
        connect(socket, &QWebSocket::disconnected, this,
                [this, socket]() { onDisconnected(socket); });

        if (!conn.client_id.empty()) {
            // A reconnect with the same id takes over audio delivery
            by_client_[conn.client_id] = socket;
        }
        auto session = conn.session;
        connections_.emplace(socket, std::move(conn));

        if (!session->start()) {
            qWarning() << "Session failed to start for" << QString::fromStdString(session_id);
            socket->close();
        }
    }
}

void RelayServer::onBinaryMessage(QWebSocket* socket, const QByteArray& message) {
    auto it = connections_.find(socket);
    if (it == connections_.end()) {
        return;
    }
    try {
        it->second.session->on_chunk(reinterpret_cast<const uint8_t*>(message.constData()),
                                     static_cast<size_t>(message.size()), it->second.source_rate);
    } catch (const std::exception& e) {
        core::log_error("Chunk failed for session " + it->second.session->session_id() + ": " + e.what());
        dropConnection(socket, "Audio could not be processed");
    }
}

void RelayServer::dropConnection(QWebSocket* socket, const std::string& client_message) {
    auto it = connections_.find(socket);
    if (it == connections_.end()) {
        return;
    }
    it->second.channel->send_error(client_message);
    it->second.channel->close();
}

void RelayServer::onTextMessage(QWebSocket* socket, const QString& message) {
    auto it = connections_.find(socket);
    const std::string who = it == connections_.end() ? std::string("?") : it->second.session->session_id();
    core::log_warn("Ignoring text message from session " + who + " (" +
                   std::to_string(message.size()) + " chars)");
}

void RelayServer::onDisconnected(QWebSocket* socket) {
    auto it = connections_.find(socket);
    if (it == connections_.end()) {
        return;
    }
    Connection conn = std::move(it->second);
    connections_.erase(it);

    auto by = by_client_.find(conn.client_id);
    if (by != by_client_.end() && by->second == socket) {
        by_client_.erase(by);
    }

    conn.channel->mark_closed();
    core::log_info("Client disconnected (session=" + conn.session->session_id() + ")");

    // on_close waits for the transport; keep that off the event loop.
    std::shared_ptr<app::IngestionSession> session = conn.session;
    closing_.erase(std::remove_if(closing_.begin(), closing_.end(),
                                  [](const std::weak_ptr<app::IngestionSession>& w) { return w.expired(); }),
                   closing_.end());
    closing_.push_back(session);
    QThreadPool::globalInstance()->start([session]() { session->on_close(); });

    socket->deleteLater();
}

} // namespace net
