// Copyright (c) 2025 VAM Voice Relay

#include "net/control_server.hpp"
#include "app/control_requests.hpp"
#include "core/logging.hpp"
#include "net/message_codec.hpp"
#include "net/relay_server.hpp"

#include <QHostAddress>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QJsonObject>
#include <QUrlQuery>
#include <QtConcurrent/QtConcurrent>

namespace net {

namespace {

std::string client_id_of(const QHttpServerRequest& request) {
    const std::string query = request.query().queryItemValue(QStringLiteral("clientId")).toStdString();
    const std::string header = request.headers().value("x-client-id").toByteArray().toStdString();
    return app::resolve_client_id(query, header);
}

QHttpServerResponse error_response(const std::string& message, QHttpServerResponse::StatusCode status) {
    return QHttpServerResponse(QByteArrayLiteral("application/json"), encode_error(message), status);
}

QHttpServerResponse ok_response(bool cancelled) {
    QJsonObject body;
    body.insert(QStringLiteral("ok"), true);
    if (cancelled) {
        body.insert(QStringLiteral("cancelled"), true);
    }
    return QHttpServerResponse(body);
}

} // namespace

ControlServer::ControlServer(app::SpeechPlayback& playback,
                             agent::IAgentClient& agent,
                             RelayServer* relay,
                             QObject* parent)
    : QObject(parent)
    , playback_(playback)
    , agent_(agent)
    , relay_(relay) {
    setupRoutes();
}

bool ControlServer::listen(quint16 port) {
    auto* tcp = new QTcpServer(this);
    if (!tcp->listen(QHostAddress::Any, port)) {
        core::log_error("HTTP listen failed on port " + std::to_string(port) + ": " +
                        tcp->errorString().toStdString());
        delete tcp;
        return false;
    }
    http_.bind(tcp);
    tcp_ = tcp;
    core::log_info("Control surface listening on http://0.0.0.0:" + std::to_string(tcp_->serverPort()));
    return true;
}

void ControlServer::setupRoutes() {
    http_.route("/speak", QHttpServerRequest::Method::Post,
                [this](const QHttpServerRequest& request) {
        const std::string client_id = client_id_of(request);
        const std::string text = json_string_field(request.body(), "text");

        const app::ControlCheck check = app::check_speak_request(client_id, text);

        // Resolved here, on the server thread; the channel marshals its own sends
        std::shared_ptr<WebSocketChannel> channel =
            (check.ok && relay_) ? relay_->channel_for(client_id) : nullptr;
        const QByteArray mime = QByteArray::fromStdString(playback_.mime_type());

        return QtConcurrent::run([this, check, client_id, text, channel, mime]() {
            if (!check.ok) {
                return error_response(check.error, QHttpServerResponse::StatusCode::BadRequest);
            }
            QByteArray collected;
            tts::AudioSink sink;
            if (channel) {
                sink = [channel](const uint8_t* data, size_t size) {
                    channel->send_audio(data, size);
                    return channel->is_open();
                };
            } else {
                sink = [&collected](const uint8_t* data, size_t size) {
                    collected.append(reinterpret_cast<const char*>(data), static_cast<qsizetype>(size));
                    return true;
                };
            }

            const app::PlaybackResult result = playback_.speak(client_id, text, sink);
            core::log_info("Speak for " + client_id + ": " + app::to_string(result.outcome) + " (" +
                           std::to_string(result.bytes_delivered) + " bytes)");

            switch (result.outcome) {
            case app::PlaybackOutcome::FAILED:
                return error_response(result.error, QHttpServerResponse::StatusCode::InternalServerError);
            case app::PlaybackOutcome::CANCELLED:
                return ok_response(true);
            case app::PlaybackOutcome::COMPLETED:
                break;
            }
            if (channel) {
                return ok_response(false);
            }
            return QHttpServerResponse(mime, collected);
        });
    });

    http_.route("/speak/stop", QHttpServerRequest::Method::Post,
                [this](const QHttpServerRequest& request) {
        const std::string client_id = client_id_of(request);
        const app::ControlCheck check = app::check_stop_request(client_id);
        if (!check.ok) {
            return error_response(check.error, QHttpServerResponse::StatusCode::BadRequest);
        }
        if (playback_.stop(client_id)) {
            core::log_info("Speech stopped for " + client_id);
        }
        return ok_response(false);
    });

    http_.route("/chat", QHttpServerRequest::Method::Post,
                [this](const QHttpServerRequest& request) {
        const std::string prompt = json_string_field(request.body(), "prompt");
        const app::ControlCheck check = app::check_chat_request(prompt);
        std::string session_id = client_id_of(request);
        if (session_id.empty()) {
            session_id = "http";
        }

        return QtConcurrent::run([this, check, prompt, session_id]() {
            if (!check.ok) {
                return error_response(check.error, QHttpServerResponse::StatusCode::BadRequest);
            }
            std::string reply;
            try {
                reply = agent_.invoke(prompt, session_id);
            } catch (const std::exception& e) {
                core::log_error("Chat failed for " + session_id + ": " + e.what());
                reply = std::string("Error: ") + e.what();
            }
            return QHttpServerResponse(QByteArrayLiteral("application/json"), encode_reply(reply));
        });
    });
}

} // namespace net
