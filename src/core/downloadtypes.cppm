/*!
 * @file        downloadtypes.cppm
 * @brief       Entity model shared by the sync store, dispatcher and transport.
 * @details     Declares the plain data types that mirror the backend's JSON
 *              entities (downloads, segments, queues, status) together with
 *              the filter and sort vocabularies used by derived views.
 *
 *              The types carry no behavior beyond JSON conversion and a few
 *              read-only conveniences. The backend serializes entities in
 *              camelCase; decoding is lenient about optional fields and
 *              strict only about identity.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <optional>
#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module dlsync.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define DLSYNC_MODULE_EXPORT
#else
#define DLSYNC_MODULE_EXPORT export
#endif

/**
 * @brief Lifecycle status of a download as reported by the backend.
 *
 * `Completed`, `Cancelled` and `Deleted` are terminal. `Failed` is terminal
 * unless the backend retries the download. The store does not enforce any
 * transition table.
 */
DLSYNC_MODULE_EXPORT enum class DownloadStatus {
    Pending,        //!< Accepted intent, not yet scheduled.
    Queued,         //!< Explicitly deferred by its queue.
    Downloading,    //!< Actively transferring.
    Paused,         //!< Paused by the user or a policy.
    Completed,      //!< Finished successfully.
    Failed,         //!< Finished with an error.
    Cancelled,      //!< Cancelled by the user.
    Deleted         //!< Removed on the backend.
};

/**
 * @brief Semantic filter categories for the download list.
 */
DLSYNC_MODULE_EXPORT enum class DownloadFilter {
    All,
    Active,         //!< Downloading.
    Completed,
    Failed,
    Queued,         //!< Queued or pending.
    Paused
};

/**
 * @brief Sortable fields of the download list.
 */
DLSYNC_MODULE_EXPORT enum class SortField {
    Name,
    Size,
    Progress,
    Date,
    Status
};

/**
 * @brief Returns the lowercase wire label of a status ("downloading").
 */
DLSYNC_MODULE_EXPORT QString downloadStatusName(DownloadStatus status);

/**
 * @brief Parses a wire status label. Case-insensitive.
 * @return The status, or an empty optional for unknown labels.
 */
DLSYNC_MODULE_EXPORT std::optional<DownloadStatus> parseDownloadStatus(const QString& name);

//!< @brief Returns the label of a filter ("all", "active", ...).
DLSYNC_MODULE_EXPORT QString downloadFilterName(DownloadFilter filter);

//!< @brief Parses a filter label; unknown labels yield an empty optional.
DLSYNC_MODULE_EXPORT std::optional<DownloadFilter> parseDownloadFilter(const QString& name);

//!< @brief Returns the label of a sort field ("name", "size", ...).
DLSYNC_MODULE_EXPORT QString sortFieldName(SortField field);

//!< @brief Parses a sort field label; unknown labels yield an empty optional.
DLSYNC_MODULE_EXPORT std::optional<SortField> parseSortField(const QString& name);

/**
 * @brief A contiguous byte-range slice of a download.
 *
 * The range is half-open: [start, end).
 */
DLSYNC_MODULE_EXPORT struct Segment {
    int index = 0;              //!< Position within the parent download.
    qint64 start = 0;           //!< Range start offset.
    qint64 end = 0;             //!< Range end offset (exclusive).
    qint64 downloaded = 0;      //!< Bytes received within the range.
    bool complete = false;      //!< Whether the range is fully received.

    //!< @brief Length of the byte range.
    qint64 length() const { return end - start; }

    static Segment fromJson(const QJsonObject& obj);
    QJsonObject toJson() const;
};

/**
 * @brief Client-side representation of one backend download.
 *
 * Mirrors the backend entity and adds the transient transfer metrics carried
 * by progress events (speed and ETA).
 */
DLSYNC_MODULE_EXPORT struct Download {
    QString id;                             //!< Backend id, or a temporary id for optimistic entries.
    QString url;                            //!< Source URL.
    QString finalUrl;                       //!< Resolved URL after redirects (empty if unknown).
    QString filename;                       //!< Target file name.
    QString destination;                    //!< Target directory.
    std::optional<qint64> size;             //!< Total size, unknown until the backend reports it.
    qint64 downloaded = 0;                  //!< Bytes received.
    DownloadStatus status = DownloadStatus::Pending;
    QVector<Segment> segments;              //!< Segment plan, ordered by index.
    QString queueId;                        //!< Owning queue reference.
    QString categoryId;                     //!< Optional category reference.
    QString color;                          //!< Optional label color.
    std::optional<qint64> speedLimit;       //!< Per-download limit in bytes/sec.
    QString error;                          //!< Last error message.
    QDateTime createdAt;                    //!< Creation time (UTC).
    QDateTime completedAt;                  //!< Completion time (invalid if not completed).
    int retryCount = 0;                     //!< Number of retries performed.

    qint64 speed = 0;                       //!< Current speed in bytes/sec.
    std::optional<qint64> eta;              //!< Estimated seconds remaining.

    /**
     * @brief Fractional progress in [0, 1].
     *
     * Returns 0 when the size is unknown or zero.
     */
    double progress() const;

    /**
     * @brief Decodes a backend entity.
     * @return The download, or an empty optional when the id is missing.
     */
    static std::optional<Download> fromJson(const QJsonObject& obj);

    //!< @brief Encodes the entity in the backend wire format.
    QJsonObject toJson() const;
};

/**
 * @brief Read-only snapshot of a backend queue.
 */
DLSYNC_MODULE_EXPORT struct QueueInfo {
    QString id;
    QString name;
    QString color;
    QString icon;
    int maxConcurrent = 0;
    std::optional<qint64> speedLimit;
    std::optional<int> segmentCount;

    static std::optional<QueueInfo> fromJson(const QJsonObject& obj);
    QJsonObject toJson() const;
};

/**
 * @brief Backend liveness summary returned by `GET /api/status`.
 */
DLSYNC_MODULE_EXPORT struct BackendStatus {
    bool connected = false;
    QString version;
    int activeDownloads = 0;
    int queues = 0;

    static BackendStatus fromJson(const QJsonObject& obj);
};

/**
 * @brief Body of `POST /api/downloads`.
 *
 * Only `url` is required; empty strings and an empty header map are omitted
 * from the encoded body.
 */
DLSYNC_MODULE_EXPORT struct AddDownloadRequest {
    QString url;
    QString filename;
    QString destination;
    QString queueId;
    QString referrer;
    QString cookies;
    QHash<QString, QString> headers;

    QJsonObject toJson() const;
};
