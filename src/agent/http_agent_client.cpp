// Copyright (c) 2025 VAM Voice Relay

#include "agent/http_agent_client.hpp"
#include "core/logging.hpp"

#include <QEventLoop>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

namespace agent {

const char* const kEmptyReplyFallback = "No response from the model";

namespace {
QJsonObject message(const char* role, const std::string& content) {
    QJsonObject m;
    m.insert(QStringLiteral("role"), QLatin1String(role));
    m.insert(QStringLiteral("content"), QString::fromStdString(content));
    return m;
}
}

bool load_persona(const std::string& path, Persona& persona) {
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        core::log_error("Cannot open persona file: " + path);
        return false;
    }
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        core::log_error("Persona file is not a JSON object: " + path);
        return false;
    }

    Persona loaded;
    const QJsonObject root = doc.object();
    loaded.system = root.value(QStringLiteral("system")).toString().toStdString();
    for (const QJsonValue& v : root.value(QStringLiteral("examples")).toArray()) {
        const QJsonObject ex = v.toObject();
        const std::string user = ex.value(QStringLiteral("user")).toString().toStdString();
        const std::string assistant = ex.value(QStringLiteral("assistant")).toString().toStdString();
        if (user.empty() || assistant.empty()) {
            core::log_warn("Skipping incomplete persona example in " + path);
            continue;
        }
        loaded.examples.emplace_back(user, assistant);
    }
    persona = std::move(loaded);
    return true;
}

QJsonObject build_chat_request(const HttpAgentSettings& settings, const Persona& persona,
                               const std::string& text, const std::string& session_id) {
    QJsonArray messages;
    if (!persona.system.empty()) {
        messages.append(message("system", persona.system));
    }
    for (const auto& ex : persona.examples) {
        messages.append(message("user", ex.first));
        messages.append(message("assistant", ex.second));
    }
    messages.append(message("user", text));

    QJsonObject body;
    body.insert(QStringLiteral("model"), QString::fromStdString(settings.model));
    body.insert(QStringLiteral("messages"), messages);
    body.insert(QStringLiteral("max_tokens"), settings.max_tokens);
    body.insert(QStringLiteral("temperature"), static_cast<double>(settings.temperature));
    body.insert(QStringLiteral("top_p"), static_cast<double>(settings.top_p));
    if (!session_id.empty()) {
        body.insert(QStringLiteral("user"), QString::fromStdString(session_id));
    }
    return body;
}

std::string parse_chat_reply(const QByteArray& body) {
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        throw AgentError("agent reply is not JSON: " + err.errorString().toStdString());
    }
    const QJsonValue choices = doc.object().value(QStringLiteral("choices"));
    if (!choices.isArray()) {
        throw AgentError("agent reply has no choices");
    }
    const QJsonArray arr = choices.toArray();
    const std::string content = arr.isEmpty()
        ? std::string()
        : arr.first().toObject().value(QStringLiteral("message")).toObject()
              .value(QStringLiteral("content")).toString().toStdString();
    return content.empty() ? std::string(kEmptyReplyFallback) : content;
}

HttpAgentClient::HttpAgentClient(HttpAgentSettings settings, Persona persona)
    : settings_(std::move(settings))
    , persona_(std::move(persona)) {}

std::string HttpAgentClient::invoke(const std::string& text, const std::string& session_id) {
    if (settings_.url.empty()) {
        throw AgentError("agent endpoint not configured (RELAY_AGENT_URL)");
    }

    QNetworkAccessManager manager;
    QNetworkRequest request(QUrl(QString::fromStdString(settings_.url)));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!settings_.api_key.empty()) {
        request.setRawHeader("Authorization", QByteArray("Bearer ") + QByteArray::fromStdString(settings_.api_key));
    }
    request.setTransferTimeout(settings_.timeout_ms);

    const QByteArray payload = QJsonDocument(build_chat_request(settings_, persona_, text, session_id))
                                   .toJson(QJsonDocument::Compact);
    QNetworkReply* reply = manager.post(request, payload);   // owned by manager

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray body = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        throw AgentError("agent request failed (HTTP " + std::to_string(status) + "): " +
                         reply->errorString().toStdString());
    }
    if (status >= 400) {
        throw AgentError("agent returned HTTP " + std::to_string(status));
    }
    return parse_chat_reply(body);
}

} // namespace agent
