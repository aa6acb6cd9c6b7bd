/*!
 * @file        downloadstore.cppm
 * @brief       Canonical client-side state of all backend downloads.
 * @details     Owns the map of downloads, the user selection and the view
 *              options (filter, search query, sort), and exposes the mutation
 *              operations used by optimistic UI intents and by backend events.
 *
 *              Every operation is synchronous: a mutation is complete before
 *              the corresponding change signal is emitted, and no other store
 *              call can interleave with it on the owning thread.
 *
 *              Mutations addressed to an id that is not present are silent
 *              no-ops. Backend events routinely race with local deletion and
 *              are not treated as errors.
 *
 *              Derived views (filtered and sorted projections) are pure
 *              functions over the canonical map, available both for the
 *              current view options and for explicit arguments.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <optional>
#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module dlsync.core.downloadstore;
export import dlsync.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define DLSYNC_MODULE_EXPORT
#else
#define DLSYNC_MODULE_EXPORT export
#endif

/**
 * @brief Single owner of canonical download state.
 *
 * Insertion order of downloads is preserved and serves as the tie-break for
 * every sort. Replacing an entry keeps its position.
 */
DLSYNC_MODULE_EXPORT class DownloadStore : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Constructs an empty store.
     * @param parent Optional QObject parent.
     */
    explicit DownloadStore(QObject* parent = nullptr);

    /**
     * @brief Inserts a download or fully overwrites the entry with the same id.
     *
     * Used for optimistic inserts and for authoritative added/updated events.
     */
    void addOrReplace(const Download& download);

    /**
     * @brief Replaces an optimistic entry with its authoritative counterpart.
     *
     * The authoritative entity takes over the temporary entry's position,
     * selection membership and anchor role. If the authoritative id is already
     * present, the temporary entry is dropped and the existing entry is
     * overwritten in place. If the temporary id is absent this behaves like
     * addOrReplace().
     *
     * @param temporaryId Id of the optimistic entry.
     * @param authoritative Entity returned by the backend.
     */
    void reconcile(const QString& temporaryId, const Download& authoritative);

    /**
     * @brief Replaces the whole map with a backend snapshot.
     *
     * The snapshot order becomes the insertion order. Selection is pruned.
     */
    void setDownloads(const QVector<Download>& downloads);

    //!< @brief Removes an entry and prunes it from the selection.
    void remove(const QString& id);

    /**
     * @brief Applies a progress tick.
     *
     * @param id Download id.
     * @param downloaded Bytes received, applied as-is (last write wins).
     * @param total Total size; adopted only while the size is still unknown.
     * @param speed Current speed in bytes/sec.
     * @param eta Estimated seconds remaining.
     */
    void applyProgress(const QString& id,
                       qint64 downloaded,
                       std::optional<qint64> total,
                       qint64 speed,
                       std::optional<qint64> eta);

    /**
     * @brief Updates the received byte count of one segment.
     *
     * No-op if the download or a segment with that index is absent.
     */
    void applySegmentProgress(const QString& id, int segmentIndex, qint64 downloaded);

    /**
     * @brief Sets the status and error of a download.
     *
     * Entering `Completed` snaps `downloaded` to the known size and stamps the
     * completion time. An empty error clears the previous one.
     */
    void applyStatus(const QString& id, DownloadStatus status, const QString& error = QString());

    //!< @brief Records an error on an entry without touching its status.
    void attachError(const QString& id, const QString& message);

    //!< @brief Reassigns the queue of every present id; absent ids are skipped.
    void moveToQueue(const QStringList& ids, const QString& queueId);

    //!< @brief Returns whether an entry with this id exists.
    bool contains(const QString& id) const { return m_downloads.contains(id); }

    //!< @brief Returns the entry for an id, or an empty optional.
    std::optional<Download> download(const QString& id) const;

    //!< @brief Returns all entries in insertion order.
    QVector<Download> downloads() const;

    //!< @brief Returns the number of entries.
    int count() const { return m_order.size(); }

    /**
     * @brief Replaces the selection with the present ids among @p ids.
     *
     * The last present id becomes the range anchor.
     */
    void setSelected(const QStringList& ids);

    /**
     * @brief Toggles or range-extends the selection.
     *
     * With @p extend and an anchor visible in the current view, the selection
     * becomes exactly the contiguous view rows between the anchor and @p id.
     * Otherwise membership of @p id is flipped and it becomes the anchor.
     */
    void toggle(const QString& id, bool extend = false);

    /**
     * @brief Selects every download, or only the present ids among @p ids.
     */
    void selectAll(const std::optional<QStringList>& ids = std::nullopt);

    //!< @brief Clears the selection and the anchor.
    void clearSelection();

    //!< @brief Returns the selected ids in insertion order.
    QStringList selectedIds() const;

    //!< @brief Returns whether an id is selected.
    bool isSelected(const QString& id) const { return m_selected.contains(id); }

    //!< @brief Returns the range-selection anchor (empty if none).
    QString anchorId() const { return m_anchor; }

    DownloadFilter filter() const { return m_filter; }
    QString searchQuery() const { return m_searchQuery; }
    SortField sortField() const { return m_sortField; }
    Qt::SortOrder sortOrder() const { return m_sortOrder; }

    //!< @brief Sets the filter; a change clears the selection.
    void setFilter(DownloadFilter filter);

    //!< @brief Sets the search query; a change clears the selection.
    void setSearchQuery(const QString& query);

    void setSortField(SortField field);
    void setSortOrder(Qt::SortOrder order);

    /**
     * @brief Projects the store through explicit view options.
     */
    QVector<Download> filteredSorted(DownloadFilter filter,
                                     const QString& query,
                                     SortField field,
                                     Qt::SortOrder order) const;

    //!< @brief Projects the store through the current view options.
    QVector<Download> view() const;

    /**
     * @brief Pure projection over an insertion-ordered list of downloads.
     *
     * Filters by semantic category and case-insensitive substring match on
     * filename or URL, then stable-sorts by @p field. Ties keep input order
     * in both directions.
     */
    static QVector<Download> filteredSorted(const QVector<Download>& downloads,
                                            DownloadFilter filter,
                                            const QString& query,
                                            SortField field,
                                            Qt::SortOrder order);

    //!< @brief Returns whether a download belongs to a filter category.
    static bool matchesFilter(const Download& download, DownloadFilter filter);

signals:
    //!< @brief Emitted after a new id was inserted.
    void downloadAdded(const QString& id);

    //!< @brief Emitted after an existing entry changed.
    void downloadChanged(const QString& id);

    //!< @brief Emitted after an entry was removed.
    void downloadRemoved(const QString& id);

    //!< @brief Emitted after the whole map was replaced or reshaped.
    void downloadsReset();

    //!< @brief Emitted when the selection or the anchor changed.
    void selectionChanged();

    //!< @brief Emitted when filter, query or sort options changed.
    void viewOptionsChanged();

private:
    //!< @brief Drops selected ids that are no longer present. Returns true if anything changed.
    bool pruneSelection();

    QHash<QString, Download> m_downloads;                   //!< Entries by id.
    QStringList m_order;                                    //!< Ids in insertion order.
    QSet<QString> m_selected;                               //!< Selected ids.
    QString m_anchor;                                       //!< Range-selection anchor.

    DownloadFilter m_filter = DownloadFilter::All;          //!< Current filter.
    QString m_searchQuery;                                  //!< Current search text.
    SortField m_sortField = SortField::Date;                //!< Current sort field.
    Qt::SortOrder m_sortOrder = Qt::DescendingOrder;        //!< Current sort order.
};

#include "downloadstore.moc"
