/*!
 * @file        downloadlistmodel.cppm
 * @brief       QAbstractListModel projection of the download store.
 * @details     Exposes the store's current filtered and sorted view as a Qt
 *              item model with custom roles, so list views (QML or widgets)
 *              can bind to it directly.
 *
 *              The model owns no download state. It keeps a row snapshot of
 *              DownloadStore::view() and recomputes it on every store signal:
 *              rows that merely changed content produce dataChanged(), any
 *              change of row identity or order resets the model.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QString>
#include <QVariant>
#include <QVector>

#ifndef Q_MOC_RUN
export module dlsync.core.downloadlistmodel;
export import dlsync.core.downloadstore;
#endif

#ifdef Q_MOC_RUN
#define DLSYNC_MODULE_EXPORT
#else
#define DLSYNC_MODULE_EXPORT export
#endif

/**
 * @brief Qt list model over DownloadStore::view().
 */
DLSYNC_MODULE_EXPORT class DownloadListModel : public QAbstractListModel {
    Q_OBJECT

public:
    /**
     * @brief Custom model roles.
     */
    enum Roles {
        IdRole = Qt::UserRole + 1,   //!< Download id
        FileNameRole,                //!< Display file name
        UrlRole,                     //!< Source URL
        ProgressRole,                //!< Progress ratio (0.0 – 1.0)
        StatusRole,                  //!< Status label
        BytesReceivedRole,           //!< Raw bytes received
        BytesTotalRole,              //!< Raw bytes total (0 if unknown)
        SpeedRole,                   //!< Bytes per second
        EtaRole,                     //!< Seconds remaining (-1 if unknown)
        QueueRole,                   //!< Queue id
        ErrorRole,                   //!< Last error message
        SelectedRole                 //!< Selection membership
    };

    /**
     * @brief Constructs a model bound to @p store.
     */
    explicit DownloadListModel(DownloadStore& store, QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    /**
     * @brief Sorts the view by a role name.
     *
     * @param roleName One of fileName, bytesTotal, progress, createdAt or
     *        status. Anything else sorts by name.
     * @param ascending Sort order.
     */
    Q_INVOKABLE void sortBy(const QString& roleName, bool ascending);

    /**
     * @brief Applies a filter by its label (all, active, completed, ...).
     * @return false for an unknown label; the filter is left unchanged.
     */
    Q_INVOKABLE bool setFilterName(const QString& name);

    Q_INVOKABLE void setSearchQuery(const QString& query);

    //!< @brief Toggles selection of a row; @p extend selects a range from the anchor.
    Q_INVOKABLE void toggleSelectionAt(int row, bool extend = false);

    //!< @brief Download id at @p row, or an empty string.
    Q_INVOKABLE QString idAt(int row) const;

private:
    //!< @brief Recomputes the row snapshot from the store.
    void refresh();

    DownloadStore& m_store;             //!< Source of truth.
    QVector<Download> m_rows;           //!< Current projection.
};

#include "downloadlistmodel.moc"
