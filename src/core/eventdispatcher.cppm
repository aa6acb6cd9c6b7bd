/*!
 * @file        eventdispatcher.cppm
 * @brief       Applies backend events to the download store.
 * @details     Routes each typed event onto exactly one store mutation, or none
 *              when the event is unusable. An event is unusable when a field
 *              its mutation needs is absent or invalid (empty id, unknown
 *              status label, negative byte count); such events are logged and
 *              ignored.
 *
 *              Queue lifecycle and unknown kinds never touch the store and are
 *              surfaced as signals instead.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module dlsync.core.eventdispatcher;
export import dlsync.core.downloadstore;
export import dlsync.services.backend_events;
#endif

#ifdef Q_MOC_RUN
#define DLSYNC_MODULE_EXPORT
#else
#define DLSYNC_MODULE_EXPORT export
#endif

DLSYNC_MODULE_EXPORT class EventDispatcher : public QObject {

    Q_OBJECT

public:
    explicit EventDispatcher(DownloadStore& store, QObject* parent = nullptr);

    /**
     * @brief Applies one event synchronously.
     * @return true when a store mutation was issued.
     */
    bool dispatch(const BackendEvent& event);

signals:
    void queueStarted(const QString& queueId);
    void queueCompleted(const QString& queueId);

    //!< @brief An event of a kind this client does not model.
    void unhandledEvent(const QString& type);

private:
    bool apply(const ProgressEvent& event);
    bool apply(const SegmentProgressEvent& event);
    bool apply(const StatusChangedEvent& event);
    bool apply(const DownloadAddedEvent& event);
    bool apply(const DownloadUpdatedEvent& event);
    bool apply(const DownloadRemovedEvent& event);
    bool apply(const QueueStartedEvent& event);
    bool apply(const QueueCompletedEvent& event);
    bool apply(const ErrorEvent& event);
    bool apply(const UnknownEvent& event);

    DownloadStore& m_store;     //!< Target store.
};

#include "eventdispatcher.moc"
