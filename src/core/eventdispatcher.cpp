module;
#include <optional>
#include <variant>
#include <QDebug>
#include <QObject>
#include <QString>
#include <QtGlobal>

module dlsync.core.eventdispatcher;

namespace {

bool validCount(const std::optional<qint64>& value)
{
    return value && *value >= 0;
}

} // namespace

EventDispatcher::EventDispatcher(DownloadStore& store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
}

bool EventDispatcher::dispatch(const BackendEvent& event)
{
    return std::visit([this](const auto& e) { return apply(e); }, event);
}

bool EventDispatcher::apply(const ProgressEvent& event)
{
    if (event.id.isEmpty() || !validCount(event.downloaded)) {
        qDebug() << "EventDispatcher: ignoring progress event without id or byte count";
        return false;
    }
    std::optional<qint64> total = event.total;
    if (total && *total < 0) total.reset();
    std::optional<qint64> eta = event.eta;
    if (eta && *eta < 0) eta.reset();
    m_store.applyProgress(event.id, *event.downloaded, total, qMax<qint64>(0, event.speed), eta);
    return true;
}

bool EventDispatcher::apply(const SegmentProgressEvent& event)
{
    if (event.downloadId.isEmpty() || !event.segmentIndex || *event.segmentIndex < 0
        || !validCount(event.downloaded)) {
        qDebug() << "EventDispatcher: ignoring incomplete segment_progress event";
        return false;
    }
    m_store.applySegmentProgress(event.downloadId, *event.segmentIndex, *event.downloaded);
    return true;
}

bool EventDispatcher::apply(const StatusChangedEvent& event)
{
    const auto status = parseDownloadStatus(event.status);
    if (event.id.isEmpty() || !status) {
        qDebug() << "EventDispatcher: ignoring status_changed event" << event.id << event.status;
        return false;
    }
    m_store.applyStatus(event.id, *status, event.error);
    return true;
}

bool EventDispatcher::apply(const DownloadAddedEvent& event)
{
    if (!event.download) {
        qDebug() << "EventDispatcher: ignoring download_added event without entity";
        return false;
    }
    m_store.addOrReplace(*event.download);
    return true;
}

bool EventDispatcher::apply(const DownloadUpdatedEvent& event)
{
    if (!event.download) {
        qDebug() << "EventDispatcher: ignoring download_updated event without entity";
        return false;
    }
    m_store.addOrReplace(*event.download);
    return true;
}

bool EventDispatcher::apply(const DownloadRemovedEvent& event)
{
    if (event.id.isEmpty()) {
        qDebug() << "EventDispatcher: ignoring download_removed event without id";
        return false;
    }
    m_store.remove(event.id);
    return true;
}

bool EventDispatcher::apply(const QueueStartedEvent& event)
{
    if (!event.id.isEmpty()) emit queueStarted(event.id);
    return false;
}

bool EventDispatcher::apply(const QueueCompletedEvent& event)
{
    if (!event.id.isEmpty()) emit queueCompleted(event.id);
    return false;
}

bool EventDispatcher::apply(const ErrorEvent& event)
{
    // Routed to backendError() by the client; only reachable when fed directly.
    qWarning() << "EventDispatcher: backend error:" << event.message;
    return false;
}

bool EventDispatcher::apply(const UnknownEvent& event)
{
    qDebug() << "EventDispatcher: unhandled event type" << event.type;
    emit unhandledEvent(event.type);
    return false;
}
