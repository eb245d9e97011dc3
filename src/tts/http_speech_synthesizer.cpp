// Copyright (c) 2025 VAM Voice Relay

#include "tts/http_speech_synthesizer.hpp"
#include "core/cancellation.hpp"
#include "core/logging.hpp"

#include <QEventLoop>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace tts {

std::string mime_type_for_format(const std::string& format) {
    if (format == "mp3") return "audio/mpeg";
    if (format == "opus") return "audio/ogg";
    if (format == "aac") return "audio/aac";
    if (format == "flac") return "audio/flac";
    if (format == "wav") return "audio/wav";
    if (format == "pcm") return "audio/L16";
    return "application/octet-stream";
}

QJsonObject build_speech_request(const HttpSynthesizerSettings& settings, const std::string& text) {
    QJsonObject body;
    body.insert(QStringLiteral("model"), QString::fromStdString(settings.model));
    body.insert(QStringLiteral("voice"), QString::fromStdString(settings.voice));
    body.insert(QStringLiteral("input"), QString::fromStdString(text));
    body.insert(QStringLiteral("response_format"), QString::fromStdString(settings.format));
    return body;
}

HttpSpeechSynthesizer::HttpSpeechSynthesizer(HttpSynthesizerSettings settings)
    : settings_(std::move(settings)) {}

void HttpSpeechSynthesizer::synthesize(const std::string& text,
                                       core::CancellationToken& cancel,
                                       const AudioSink& sink) {
    if (settings_.url.empty()) {
        throw SynthesisError("speech endpoint not configured (RELAY_TTS_URL)");
    }
    if (cancel.is_cancelled()) {
        return;
    }

    QNetworkAccessManager manager;
    QNetworkRequest request(QUrl(QString::fromStdString(settings_.url)));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!settings_.api_key.empty()) {
        request.setRawHeader("Authorization", QByteArray("Bearer ") + QByteArray::fromStdString(settings_.api_key));
    }
    request.setTransferTimeout(settings_.timeout_ms);

    const QByteArray payload = QJsonDocument(build_speech_request(settings_, text)).toJson(QJsonDocument::Compact);
    QNetworkReply* reply = manager.post(request, payload);

    bool sink_stopped = false;
    bool http_failed = false;
    QEventLoop loop;

    QObject::connect(reply, &QNetworkReply::readyRead, &loop, [&]() {
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status >= 400) {
            // Error body; keep it for the message
            http_failed = true;
            return;
        }
        const QByteArray chunk = reply->readAll();
        if (chunk.isEmpty() || sink_stopped) {
            return;
        }
        if (!sink(reinterpret_cast<const uint8_t*>(chunk.constData()), static_cast<size_t>(chunk.size()))) {
            sink_stopped = true;
            reply->abort();
        }
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    // The token is polled rather than hooked so nothing outlives this frame
    QTimer poll;
    poll.setInterval(settings_.cancel_poll_ms);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (cancel.is_cancelled() && reply->isRunning()) {
            core::log_debug("Speech request cancelled");
            reply->abort();
        }
    });
    poll.start();

    if (!reply->isFinished()) {
        loop.exec();
    }
    poll.stop();

    if (sink_stopped || cancel.is_cancelled()) {
        return;
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (http_failed || status >= 400) {
        const QByteArray detail = reply->readAll().left(256);
        throw SynthesisError("speech endpoint returned HTTP " + std::to_string(status) +
                             (detail.isEmpty() ? std::string() : ": " + detail.toStdString()));
    }
    if (reply->error() != QNetworkReply::NoError) {
        throw SynthesisError("speech request failed: " + reply->errorString().toStdString());
    }
    // Any tail not delivered by readyRead
    const QByteArray tail = reply->readAll();
    if (!tail.isEmpty()) {
        sink(reinterpret_cast<const uint8_t*>(tail.constData()), static_cast<size_t>(tail.size()));
    }
}

} // namespace tts
