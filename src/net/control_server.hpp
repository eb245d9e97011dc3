// Copyright (c) 2025 VAM Voice Relay
// ControlServer - HTTP control surface (speak / stop / chat)

#pragma once

#include "agent/agent_client.hpp"
#include "app/speech_playback.hpp"

#include <QHttpServer>
#include <QObject>
#include <QTcpServer>

namespace net {

class RelayServer;

/// HTTP routes:
///   POST /speak?clientId=       {"text"}   barge-in synthesis
///   POST /speak/stop?clientId=             stop without replacing
///   POST /chat                  {"prompt"} direct agent turn
///
/// The client id may also be given in the x-client-id header.
/// Blocking work (synthesis, agent calls) runs on the global thread pool.
class ControlServer : public QObject {
    Q_OBJECT

public:
    ControlServer(app::SpeechPlayback& playback,
                  agent::IAgentClient& agent,
                  RelayServer* relay,
                  QObject* parent = nullptr);

    bool listen(quint16 port);
    quint16 port() const { return tcp_ ? tcp_->serverPort() : 0; }

private:
    void setupRoutes();

    app::SpeechPlayback& playback_;
    agent::IAgentClient& agent_;
    RelayServer* relay_;                      // Not owned; may be null (no audio delivery over WS)

    QHttpServer http_;
    QTcpServer* tcp_ = nullptr;               // Owned by http_ once bound
};

} // namespace net
