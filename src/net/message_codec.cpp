// Copyright (c) 2025 VAM Voice Relay

#include "net/message_codec.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>

namespace net {

namespace {
QByteArray compact(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}
}

QByteArray encode_transcript(const std::string& text, bool is_partial) {
    QJsonObject obj;
    obj.insert(QStringLiteral("transcript"), QString::fromStdString(text));
    obj.insert(QStringLiteral("isPartial"), is_partial);
    return compact(obj);
}

QByteArray encode_reply(const std::string& text) {
    QJsonObject obj;
    obj.insert(QStringLiteral("reply"), QString::fromStdString(text));
    return compact(obj);
}

QByteArray encode_error(const std::string& message) {
    QJsonObject obj;
    obj.insert(QStringLiteral("error"), QString::fromStdString(message));
    return compact(obj);
}

std::string json_string_field(const QByteArray& body, const char* field) {
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return {};
    }
    const QJsonValue v = doc.object().value(QLatin1String(field));
    if (!v.isString()) {
        return {};
    }
    return v.toString().toStdString();
}

} // namespace net
