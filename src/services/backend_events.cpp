module;
#include <optional>
#include <variant>
#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>
#include <QtGlobal>

module dlsync.services.backend_events;

namespace dlsync::events {

namespace {

std::optional<qint64> byteCount(const QJsonObject& obj, const QString& key)
{
    const QJsonValue v = obj.value(key);
    if (!v.isDouble()) return std::nullopt;
    return static_cast<qint64>(v.toDouble());
}

std::optional<Download> entityFrom(const QJsonObject& obj)
{
    const QJsonValue v = obj.value("download");
    if (!v.isObject()) return std::nullopt;
    return Download::fromJson(v.toObject());
}

} // namespace

bool isKeepaliveFrame(const QByteArray& frame)
{
    const QByteArray trimmed = frame.trimmed();
    return trimmed == "\"pong\"" || trimmed == "pong";
}

std::optional<BackendEvent> decodeEvent(const QJsonObject& envelope)
{
    const QString type = envelope.value("type").toString();
    if (type.isEmpty()) return std::nullopt;

    if (type == "progress") {
        ProgressEvent e;
        e.id = envelope.value("id").toString();
        e.downloaded = byteCount(envelope, "downloaded");
        e.total = byteCount(envelope, "total");
        e.speed = byteCount(envelope, "speed").value_or(0);
        e.eta = byteCount(envelope, "eta");
        return e;
    }
    if (type == "segment_progress") {
        SegmentProgressEvent e;
        e.downloadId = envelope.value("downloadId").toString();
        const QJsonValue index = envelope.value("segmentIndex");
        if (index.isDouble()) e.segmentIndex = index.toInt();
        e.downloaded = byteCount(envelope, "downloaded");
        return e;
    }
    if (type == "status_changed") {
        StatusChangedEvent e;
        e.id = envelope.value("id").toString();
        e.status = envelope.value("status").toString();
        // The event channel carries the error text in `message`.
        e.error = envelope.value("error").toString();
        if (e.error.isEmpty()) e.error = envelope.value("message").toString();
        return e;
    }
    if (type == "download_added") {
        return DownloadAddedEvent{entityFrom(envelope)};
    }
    if (type == "download_updated") {
        return DownloadUpdatedEvent{entityFrom(envelope)};
    }
    if (type == "download_removed") {
        return DownloadRemovedEvent{envelope.value("id").toString()};
    }
    if (type == "queue_started") {
        return QueueStartedEvent{envelope.value("id").toString()};
    }
    if (type == "queue_completed") {
        return QueueCompletedEvent{envelope.value("id").toString()};
    }
    if (type == "error") {
        return ErrorEvent{envelope.value("message").toString(), envelope.value("context").toString()};
    }
    return UnknownEvent{type, envelope};
}

std::optional<BackendEvent> decodeFrame(const QByteArray& frame, QString* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(frame, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) *error = parseError.errorString();
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (error) *error = QStringLiteral("frame is not a JSON object");
        return std::nullopt;
    }
    auto event = decodeEvent(doc.object());
    if (!event && error) *error = QStringLiteral("frame has no type");
    return event;
}

QString eventType(const BackendEvent& event)
{
    struct Visitor {
        QString operator()(const ProgressEvent&) const { return QStringLiteral("progress"); }
        QString operator()(const SegmentProgressEvent&) const { return QStringLiteral("segment_progress"); }
        QString operator()(const StatusChangedEvent&) const { return QStringLiteral("status_changed"); }
        QString operator()(const DownloadAddedEvent&) const { return QStringLiteral("download_added"); }
        QString operator()(const DownloadUpdatedEvent&) const { return QStringLiteral("download_updated"); }
        QString operator()(const DownloadRemovedEvent&) const { return QStringLiteral("download_removed"); }
        QString operator()(const QueueStartedEvent&) const { return QStringLiteral("queue_started"); }
        QString operator()(const QueueCompletedEvent&) const { return QStringLiteral("queue_completed"); }
        QString operator()(const ErrorEvent&) const { return QStringLiteral("error"); }
        QString operator()(const UnknownEvent& e) const { return e.type; }
    };
    return std::visit(Visitor{}, event);
}

} // namespace dlsync::events
