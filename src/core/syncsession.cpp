module;
#include <functional>
#include <optional>
#include <QDateTime>
#include <QDebug>
#include <QObject>
#include <QPointer>
#include <QSet>
#include <QString>
#include <QTimer>
#include <QUrl>
#include <QUuid>
#include <QVector>

module dlsync.core.syncsession;

import dlsync.utils.download_utils;

namespace utils = dlsync::utils;

namespace {

const QString kTemporaryPrefix = QStringLiteral("tmp-");

} // namespace

SyncSession::SyncSession(BackendClient& client, DownloadStore& store, QObject* parent)
    : QObject(parent)
    , m_client(client)
    , m_store(store)
    , m_dispatcher(store)
{
    connect(&m_client, &BackendClient::eventReceived, &m_dispatcher, &EventDispatcher::dispatch);
    connect(&m_client, &BackendClient::connected, this, [this]() { setStatus(ConnectionStatus::Connected); });
    connect(&m_client, &BackendClient::disconnected, this, &SyncSession::handleDisconnected);
    connect(&m_client, &BackendClient::backendError, this, [this](const QString& message) {
        qWarning() << "SyncSession: backend error:" << message;
        emit backendError(message);
    });

    m_reconnectTimer.setSingleShot(true);
    connect(&m_reconnectTimer, &QTimer::timeout, this, &SyncSession::start);
}

void SyncSession::start()
{
    m_running = true;
    m_reconnectTimer.stop();
    if (!m_client.isConnected()) setStatus(ConnectionStatus::Connecting);

    QPointer<SyncSession> self(this);
    m_client.connectEvents([self](bool ok) {
        if (self) self->handleConnectResult(ok);
    });
}

void SyncSession::stop()
{
    m_running = false;
    m_reconnectTimer.stop();
    m_client.disconnectEvents();
    setStatus(ConnectionStatus::Disconnected);
}

void SyncSession::refresh()
{
    QPointer<SyncSession> self(this);
    m_client.fetchDownloads([self](std::optional<QVector<Download>> downloads) {
        if (!self) return;
        if (!downloads) {
            // Backend did not answer: keep what we have.
            emit self->refreshed();
            return;
        }
        QVector<Download> next = *downloads;
        QSet<QString> known;
        for (const Download& d : *downloads) known.insert(d.id);
        // Optimistic entries the backend does not know yet survive a snapshot.
        for (const Download& d : self->m_store.downloads()) {
            if (d.id.startsWith(kTemporaryPrefix) && !known.contains(d.id)) next.append(d);
        }
        self->m_store.setDownloads(next);
        emit self->refreshed();
    });
    m_client.listQueues([self](const QVector<QueueInfo>& queues) {
        if (!self) return;
        self->m_queues = queues;
        emit self->queuesChanged();
    });
}

QString SyncSession::addDownload(const AddDownloadRequest& request)
{
    Download pending;
    pending.id = kTemporaryPrefix + QUuid::createUuid().toString(QUuid::WithoutBraces);
    pending.url = request.url.trimmed();
    pending.filename = request.filename.trimmed();
    if (pending.filename.isEmpty()) pending.filename = utils::fileNameFromUrl(QUrl(pending.url));
    pending.destination = utils::normalizeFilePath(request.destination);
    pending.queueId = request.queueId;
    pending.status = DownloadStatus::Pending;
    pending.createdAt = QDateTime::currentDateTimeUtc();
    m_store.addOrReplace(pending);

    AddDownloadRequest outgoing = request;
    outgoing.url = pending.url;
    outgoing.destination = pending.destination;

    const QString temporaryId = pending.id;
    QPointer<SyncSession> self(this);
    m_client.addDownload(outgoing, [self, temporaryId](const AddDownloadResult& result) {
        if (!self) return;
        if (result.success) {
            if (result.download) {
                self->m_store.reconcile(temporaryId, *result.download);
                return;
            }
            // Accepted without a usable entity: the snapshot brings the real row.
            self->m_store.remove(temporaryId);
            self->refresh();
            return;
        }
        const QString error = result.error.isEmpty() ? QStringLiteral("Download was rejected") : result.error;
        qWarning() << "SyncSession: add failed for" << temporaryId << error;
        self->m_store.attachError(temporaryId, error);
        emit self->commandFailed(temporaryId, QStringLiteral("add"), error);
    });
    return temporaryId;
}

void SyncSession::pause(const QString& id)
{
    control(id, QStringLiteral("pause"), &BackendClient::pauseDownload);
}

void SyncSession::resume(const QString& id)
{
    control(id, QStringLiteral("resume"), &BackendClient::resumeDownload);
}

void SyncSession::cancel(const QString& id)
{
    control(id, QStringLiteral("cancel"), &BackendClient::cancelDownload);
}

QString SyncSession::connectionStatusName(ConnectionStatus status)
{
    switch (status) {
    case ConnectionStatus::Disconnected: return QStringLiteral("disconnected");
    case ConnectionStatus::Connecting: return QStringLiteral("connecting");
    case ConnectionStatus::Connected: return QStringLiteral("connected");
    case ConnectionStatus::HttpOnly: return QStringLiteral("http-only");
    }
    return QStringLiteral("disconnected");
}

void SyncSession::handleConnectResult(bool ok)
{
    if (!m_running) return;
    if (ok) {
        setStatus(ConnectionStatus::Connected);
        refresh();
        return;
    }

    QPointer<SyncSession> self(this);
    m_client.ping([self](bool alive) {
        if (!self || !self->m_running) return;
        self->setStatus(alive ? ConnectionStatus::HttpOnly : ConnectionStatus::Disconnected);
        self->refresh();
        self->scheduleReconnect();
    });
}

void SyncSession::handleDisconnected()
{
    setStatus(ConnectionStatus::Disconnected);
    scheduleReconnect();
}

void SyncSession::scheduleReconnect()
{
    if (!m_running || !m_client.config().autoReconnect) return;
    qDebug() << "SyncSession: reconnecting in" << m_client.config().reconnectIntervalMs << "ms";
    m_reconnectTimer.start(m_client.config().reconnectIntervalMs);
}

void SyncSession::control(const QString& id, const QString& action, ControlCall call)
{
    QPointer<SyncSession> self(this);
    (m_client.*call)(id, [self, id, action](const ControlResult& result) {
        if (!self || result.success) return;
        const QString error = result.error.isEmpty() ? QStringLiteral("Request failed") : result.error;
        qWarning() << "SyncSession:" << action << "failed for" << id << error;
        self->m_store.attachError(id, error);
        emit self->commandFailed(id, action, error);
    });
}

void SyncSession::setStatus(ConnectionStatus status)
{
    if (m_status == status) return;
    m_status = status;
    emit statusChanged(status);
}
