/*!
 * @file        syncsession.cppm
 * @brief       Composition of the backend client, store and dispatcher.
 * @details     SyncSession keeps a DownloadStore in step with the backend:
 *              it opens the event channel and feeds every event through an
 *              EventDispatcher, refreshes snapshots over the command channel,
 *              and turns user intents into optimistic store mutations followed
 *              by backend commands.
 *
 *              A failed intent is never rolled back. The entry stays visible
 *              with the error attached and commandFailed() is emitted.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <functional>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QVector>

#ifndef Q_MOC_RUN
export module dlsync.core.syncsession;
export import dlsync.core.downloadstore;
export import dlsync.core.eventdispatcher;
export import dlsync.services.backend_client;
#endif

#ifdef Q_MOC_RUN
#define DLSYNC_MODULE_EXPORT
#else
#define DLSYNC_MODULE_EXPORT export
#endif

DLSYNC_MODULE_EXPORT class SyncSession : public QObject {

    Q_OBJECT

public:
    enum class ConnectionStatus {
        Disconnected,   //!< Backend unreachable.
        Connecting,     //!< Event channel attempt in flight.
        Connected,      //!< Event channel open.
        HttpOnly        //!< Commands work, events do not.
    };

    /**
     * @brief Construct a session over externally owned client and store.
     */
    SyncSession(BackendClient& client, DownloadStore& store, QObject* parent = nullptr);

    /**
     * @brief Opens the event channel and refreshes snapshots.
     *
     * Snapshots are refreshed whatever the outcome of the channel attempt.
     * Enables automatic reconnection when the configuration allows it.
     */
    void start();

    //!< @brief Disables reconnection and closes the event channel on purpose.
    void stop();

    /**
     * @brief Re-fetches downloads and queues over the command channel.
     *
     * Any answered snapshot, including an empty one, replaces the store.
     * Temporary entries the backend does not know yet are kept.
     */
    void refresh();

    /**
     * @brief Submits a new download optimistically.
     *
     * A `pending` entry with a temporary id appears in the store at once; it
     * is reconciled with the backend entity on success or keeps the error on
     * failure. An acceptance without an entity drops the entry and refreshes.
     *
     * @return The temporary id.
     */
    QString addDownload(const AddDownloadRequest& request);

    void pause(const QString& id);
    void resume(const QString& id);
    void cancel(const QString& id);

    ConnectionStatus connectionStatus() const { return m_status; }
    bool isRunning() const { return m_running; }

    //!< @brief Last queue snapshot.
    QVector<QueueInfo> queues() const { return m_queues; }

    EventDispatcher& dispatcher() { return m_dispatcher; }

    //!< @brief Human readable status label.
    static QString connectionStatusName(ConnectionStatus status);

signals:
    void statusChanged(SyncSession::ConnectionStatus status);
    void queuesChanged();

    //!< @brief A download snapshot request finished (successfully or not).
    void refreshed();

    //!< @brief A state-changing intent was refused or could not be delivered.
    void commandFailed(const QString& id, const QString& action, const QString& error);

    void backendError(const QString& message);

private:
    using ControlCall = void (BackendClient::*)(const QString&, std::function<void(const ControlResult&)>);

    void handleConnectResult(bool ok);
    void handleDisconnected();
    void scheduleReconnect();
    void control(const QString& id, const QString& action, ControlCall call);
    void setStatus(ConnectionStatus status);

    BackendClient& m_client;                                //!< Transport, owned by the caller.
    DownloadStore& m_store;                                 //!< Canonical state, owned by the caller.
    EventDispatcher m_dispatcher;                           //!< Event router bound to m_store.
    ConnectionStatus m_status = ConnectionStatus::Disconnected;
    bool m_running = false;                                 //!< Between start() and stop().
    QVector<QueueInfo> m_queues;                            //!< Queue snapshot.
    QTimer m_reconnectTimer;                                //!< Reconnect delay.
};

#include "syncsession.moc"
