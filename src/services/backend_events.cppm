/*!
 * @file        backend_events.cppm
 * @brief       Typed event envelopes received on the backend event channel.
 * @details     Declares one struct per event kind the backend pushes and a
 *              tagged union over them. Frames are small flat JSON objects with
 *              a `type` discriminant; the decoder maps each recognised
 *              discriminant onto its struct and keeps everything else as an
 *              UnknownEvent carrying the raw discriminant and payload, so a
 *              newer backend's events are still visible to diagnostics.
 *
 *              Decoding is deliberately permissive about fields: a frame that
 *              is valid JSON with a discriminant always decodes, and fields
 *              that are absent or of the wrong type are left unset. Deciding
 *              whether an event is usable is the dispatcher's job.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <optional>
#include <variant>
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module dlsync.services.backend_events;
export import dlsync.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define DLSYNC_MODULE_EXPORT
#else
#define DLSYNC_MODULE_EXPORT export
#endif

//!< @brief `progress`: transfer tick for one download.
DLSYNC_MODULE_EXPORT struct ProgressEvent {
    QString id;
    std::optional<qint64> downloaded;
    std::optional<qint64> total;
    qint64 speed = 0;
    std::optional<qint64> eta;
};

//!< @brief `segment_progress`: transfer tick for one segment.
DLSYNC_MODULE_EXPORT struct SegmentProgressEvent {
    QString downloadId;
    std::optional<int> segmentIndex;
    std::optional<qint64> downloaded;
};

//!< @brief `status_changed`: new lifecycle status, with an optional error.
DLSYNC_MODULE_EXPORT struct StatusChangedEvent {
    QString id;
    QString status;     //!< Raw status label as sent.
    QString error;
};

//!< @brief `download_added`: full entity of a new download.
DLSYNC_MODULE_EXPORT struct DownloadAddedEvent {
    std::optional<Download> download;
};

//!< @brief `download_updated`: full entity of a changed download.
DLSYNC_MODULE_EXPORT struct DownloadUpdatedEvent {
    std::optional<Download> download;
};

//!< @brief `download_removed`: a download was deleted on the backend.
DLSYNC_MODULE_EXPORT struct DownloadRemovedEvent {
    QString id;
};

//!< @brief `queue_started`: a queue began processing (scheduled start).
DLSYNC_MODULE_EXPORT struct QueueStartedEvent {
    QString id;
};

//!< @brief `queue_completed`: a queue ran out of work or was stopped.
DLSYNC_MODULE_EXPORT struct QueueCompletedEvent {
    QString id;
};

//!< @brief `error`: backend-reported failure.
DLSYNC_MODULE_EXPORT struct ErrorEvent {
    QString message;
    QString context;
};

//!< @brief Any discriminant this client does not model.
DLSYNC_MODULE_EXPORT struct UnknownEvent {
    QString type;
    QJsonObject payload;
};

/**
 * @brief Tagged union over every event kind.
 */
DLSYNC_MODULE_EXPORT using BackendEvent = std::variant<ProgressEvent,
                                                       SegmentProgressEvent,
                                                       StatusChangedEvent,
                                                       DownloadAddedEvent,
                                                       DownloadUpdatedEvent,
                                                       DownloadRemovedEvent,
                                                       QueueStartedEvent,
                                                       QueueCompletedEvent,
                                                       ErrorEvent,
                                                       UnknownEvent>;

DLSYNC_MODULE_EXPORT namespace dlsync::events {

/**
 * @brief Returns whether a frame is the keepalive response sentinel.
 *
 * Both the JSON string `"pong"` and the bare word are accepted.
 */
bool isKeepaliveFrame(const QByteArray& frame);

/**
 * @brief Decodes an already-parsed envelope.
 * @return The event, or an empty optional when `type` is missing.
 */
std::optional<BackendEvent> decodeEvent(const QJsonObject& envelope);

/**
 * @brief Decodes a raw text frame.
 *
 * @param frame UTF-8 JSON text.
 * @param error Receives a description when decoding fails (optional).
 * @return The event, or an empty optional for invalid JSON, a non-object
 *         payload, or a missing discriminant.
 */
std::optional<BackendEvent> decodeFrame(const QByteArray& frame, QString* error = nullptr);

//!< @brief Returns the wire discriminant of an event.
QString eventType(const BackendEvent& event);

} // namespace dlsync::events
