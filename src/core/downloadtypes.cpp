module;
#include <optional>
#include <QDateTime>
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QVector>
#include <QtGlobal>

module dlsync.core.downloadtypes;

namespace {

std::optional<qint64> optionalInt64(const QJsonObject& obj, const QString& key)
{
    const QJsonValue v = obj.value(key);
    if (!v.isDouble()) return std::nullopt;
    return static_cast<qint64>(v.toDouble());
}

QDateTime dateFromJson(const QJsonValue& value)
{
    const QString text = value.toString();
    if (text.isEmpty()) return QDateTime();
    QDateTime dt = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!dt.isValid()) dt = QDateTime::fromString(text, Qt::ISODate);
    return dt.toUTC();
}

QJsonValue dateToJson(const QDateTime& dt)
{
    if (!dt.isValid()) return QJsonValue::Null;
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

QJsonValue optionalToJson(const std::optional<qint64>& value)
{
    if (!value) return QJsonValue::Null;
    return static_cast<double>(*value);
}

QJsonValue stringOrNull(const QString& value)
{
    if (value.isEmpty()) return QJsonValue::Null;
    return value;
}

} // namespace

QString downloadStatusName(DownloadStatus status)
{
    switch (status) {
    case DownloadStatus::Pending: return QStringLiteral("pending");
    case DownloadStatus::Queued: return QStringLiteral("queued");
    case DownloadStatus::Downloading: return QStringLiteral("downloading");
    case DownloadStatus::Paused: return QStringLiteral("paused");
    case DownloadStatus::Completed: return QStringLiteral("completed");
    case DownloadStatus::Failed: return QStringLiteral("failed");
    case DownloadStatus::Cancelled: return QStringLiteral("cancelled");
    case DownloadStatus::Deleted: return QStringLiteral("deleted");
    }
    return QStringLiteral("pending");
}

std::optional<DownloadStatus> parseDownloadStatus(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == "pending") return DownloadStatus::Pending;
    if (n == "queued") return DownloadStatus::Queued;
    if (n == "downloading") return DownloadStatus::Downloading;
    if (n == "paused") return DownloadStatus::Paused;
    if (n == "completed") return DownloadStatus::Completed;
    if (n == "failed") return DownloadStatus::Failed;
    if (n == "cancelled" || n == "canceled") return DownloadStatus::Cancelled;
    if (n == "deleted") return DownloadStatus::Deleted;
    return std::nullopt;
}

QString downloadFilterName(DownloadFilter filter)
{
    switch (filter) {
    case DownloadFilter::All: return QStringLiteral("all");
    case DownloadFilter::Active: return QStringLiteral("active");
    case DownloadFilter::Completed: return QStringLiteral("completed");
    case DownloadFilter::Failed: return QStringLiteral("failed");
    case DownloadFilter::Queued: return QStringLiteral("queued");
    case DownloadFilter::Paused: return QStringLiteral("paused");
    }
    return QStringLiteral("all");
}

std::optional<DownloadFilter> parseDownloadFilter(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == "all") return DownloadFilter::All;
    if (n == "active") return DownloadFilter::Active;
    if (n == "completed") return DownloadFilter::Completed;
    if (n == "failed") return DownloadFilter::Failed;
    if (n == "queued") return DownloadFilter::Queued;
    if (n == "paused") return DownloadFilter::Paused;
    return std::nullopt;
}

QString sortFieldName(SortField field)
{
    switch (field) {
    case SortField::Name: return QStringLiteral("name");
    case SortField::Size: return QStringLiteral("size");
    case SortField::Progress: return QStringLiteral("progress");
    case SortField::Date: return QStringLiteral("date");
    case SortField::Status: return QStringLiteral("status");
    }
    return QStringLiteral("date");
}

std::optional<SortField> parseSortField(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == "name") return SortField::Name;
    if (n == "size") return SortField::Size;
    if (n == "progress") return SortField::Progress;
    if (n == "date") return SortField::Date;
    if (n == "status") return SortField::Status;
    return std::nullopt;
}

Segment Segment::fromJson(const QJsonObject& obj)
{
    Segment s;
    s.index = obj.value("index").toInt(0);
    s.start = static_cast<qint64>(obj.value("start").toDouble(0));
    s.end = static_cast<qint64>(obj.value("end").toDouble(0));
    s.downloaded = static_cast<qint64>(obj.value("downloaded").toDouble(0));
    s.complete = obj.value("complete").toBool(false);
    return s;
}

QJsonObject Segment::toJson() const
{
    QJsonObject obj;
    obj.insert("index", index);
    obj.insert("start", static_cast<double>(start));
    obj.insert("end", static_cast<double>(end));
    obj.insert("downloaded", static_cast<double>(downloaded));
    obj.insert("complete", complete);
    return obj;
}

double Download::progress() const
{
    if (!size || *size <= 0) return 0.0;
    return static_cast<double>(downloaded) / static_cast<double>(*size);
}

std::optional<Download> Download::fromJson(const QJsonObject& obj)
{
    const QString id = obj.value("id").toString();
    if (id.isEmpty()) return std::nullopt;

    Download d;
    d.id = id;
    d.url = obj.value("url").toString();
    d.finalUrl = obj.value("finalUrl").toString();
    d.filename = obj.value("filename").toString();
    d.destination = obj.value("destination").toString();
    d.size = optionalInt64(obj, "size");
    d.downloaded = static_cast<qint64>(obj.value("downloaded").toDouble(0));
    d.status = parseDownloadStatus(obj.value("status").toString()).value_or(DownloadStatus::Pending);
    const QJsonArray segments = obj.value("segments").toArray();
    for (const QJsonValue& v : segments) {
        if (!v.isObject()) continue;
        d.segments.append(Segment::fromJson(v.toObject()));
    }
    d.queueId = obj.value("queueId").toString();
    d.categoryId = obj.value("categoryId").toString();
    d.color = obj.value("color").toString();
    d.speedLimit = optionalInt64(obj, "speedLimit");
    d.error = obj.value("error").toString();
    d.createdAt = dateFromJson(obj.value("createdAt"));
    d.completedAt = dateFromJson(obj.value("completedAt"));
    d.retryCount = obj.value("retryCount").toInt(0);
    return d;
}

QJsonObject Download::toJson() const
{
    QJsonObject obj;
    obj.insert("id", id);
    obj.insert("url", url);
    obj.insert("finalUrl", stringOrNull(finalUrl));
    obj.insert("filename", filename);
    obj.insert("destination", destination);
    obj.insert("size", optionalToJson(size));
    obj.insert("downloaded", static_cast<double>(downloaded));
    obj.insert("status", downloadStatusName(status));
    QJsonArray segmentArray;
    for (const Segment& s : segments) segmentArray.append(s.toJson());
    obj.insert("segments", segmentArray);
    obj.insert("queueId", queueId);
    obj.insert("categoryId", stringOrNull(categoryId));
    obj.insert("color", stringOrNull(color));
    obj.insert("error", stringOrNull(error));
    obj.insert("speedLimit", optionalToJson(speedLimit));
    obj.insert("createdAt", dateToJson(createdAt));
    obj.insert("completedAt", dateToJson(completedAt));
    obj.insert("retryCount", retryCount);
    return obj;
}

std::optional<QueueInfo> QueueInfo::fromJson(const QJsonObject& obj)
{
    const QString id = obj.value("id").toString();
    if (id.isEmpty()) return std::nullopt;

    QueueInfo q;
    q.id = id;
    q.name = obj.value("name").toString();
    q.color = obj.value("color").toString();
    q.icon = obj.value("icon").toString();
    q.maxConcurrent = obj.value("maxConcurrent").toInt(0);
    q.speedLimit = optionalInt64(obj, "speedLimit");
    const QJsonValue segmentCount = obj.value("segmentCount");
    if (segmentCount.isDouble()) q.segmentCount = segmentCount.toInt();
    return q;
}

QJsonObject QueueInfo::toJson() const
{
    QJsonObject obj;
    obj.insert("id", id);
    obj.insert("name", name);
    obj.insert("color", color);
    obj.insert("icon", stringOrNull(icon));
    obj.insert("maxConcurrent", maxConcurrent);
    obj.insert("speedLimit", optionalToJson(speedLimit));
    obj.insert("segmentCount", segmentCount ? QJsonValue(*segmentCount) : QJsonValue(QJsonValue::Null));
    return obj;
}

BackendStatus BackendStatus::fromJson(const QJsonObject& obj)
{
    BackendStatus s;
    s.connected = obj.value("connected").toBool(false);
    s.version = obj.value("version").toString();
    s.activeDownloads = obj.value("active_downloads").toInt(0);
    s.queues = obj.value("queues").toInt(0);
    return s;
}

QJsonObject AddDownloadRequest::toJson() const
{
    QJsonObject obj;
    obj.insert("url", url);
    if (!filename.isEmpty()) obj.insert("filename", filename);
    if (!destination.isEmpty()) obj.insert("destination", destination);
    if (!queueId.isEmpty()) obj.insert("queue_id", queueId);
    if (!referrer.isEmpty()) obj.insert("referrer", referrer);
    if (!cookies.isEmpty()) obj.insert("cookies", cookies);
    if (!headers.isEmpty()) {
        QJsonObject headerObj;
        for (auto it = headers.cbegin(); it != headers.cend(); ++it) {
            headerObj.insert(it.key(), it.value());
        }
        obj.insert("headers", headerObj);
    }
    return obj;
}
