module;
#include <utility>
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QModelIndex>
#include <QString>
#include <QVariant>
#include <QVector>
#include <QtGlobal>

module dlsync.core.downloadlistmodel;

DownloadListModel::DownloadListModel(DownloadStore& store, QObject* parent)
    : QAbstractListModel(parent)
    , m_store(store)
{
    connect(&m_store, &DownloadStore::downloadAdded, this, &DownloadListModel::refresh);
    connect(&m_store, &DownloadStore::downloadChanged, this, &DownloadListModel::refresh);
    connect(&m_store, &DownloadStore::downloadRemoved, this, &DownloadListModel::refresh);
    connect(&m_store, &DownloadStore::downloadsReset, this, &DownloadListModel::refresh);
    connect(&m_store, &DownloadStore::selectionChanged, this, &DownloadListModel::refresh);
    connect(&m_store, &DownloadStore::viewOptionsChanged, this, &DownloadListModel::refresh);
    m_rows = m_store.view();
}

int DownloadListModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    return m_rows.size();
}

QVariant DownloadListModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || index.row() >= m_rows.size()) return {};
    const Download& item = m_rows[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole: return item.filename;
    case IdRole: return item.id;
    case UrlRole: return item.url;
    case ProgressRole: return item.progress();
    case StatusRole: return downloadStatusName(item.status);
    case BytesReceivedRole: return item.downloaded;
    case BytesTotalRole: return item.size.value_or(0);
    case SpeedRole: return item.speed;
    case EtaRole: return item.eta.value_or(-1);
    case QueueRole: return item.queueId;
    case ErrorRole: return item.error;
    case SelectedRole: return m_store.isSelected(item.id);
    }
    return {};
}

QHash<int, QByteArray> DownloadListModel::roleNames() const {
    return {
        {IdRole, "id"},
        {FileNameRole, "fileName"},
        {UrlRole, "url"},
        {ProgressRole, "progress"},
        {StatusRole, "status"},
        {BytesReceivedRole, "bytesReceived"},
        {BytesTotalRole, "bytesTotal"},
        {SpeedRole, "speed"},
        {EtaRole, "eta"},
        {QueueRole, "queueId"},
        {ErrorRole, "error"},
        {SelectedRole, "selected"}
    };
}

void DownloadListModel::sortBy(const QString& roleName, bool ascending)
{
    SortField field = SortField::Name;
    if (roleName == "bytesTotal") field = SortField::Size;
    else if (roleName == "progress") field = SortField::Progress;
    else if (roleName == "createdAt") field = SortField::Date;
    else if (roleName == "status") field = SortField::Status;

    m_store.setSortField(field);
    m_store.setSortOrder(ascending ? Qt::AscendingOrder : Qt::DescendingOrder);
}

bool DownloadListModel::setFilterName(const QString& name)
{
    const auto filter = parseDownloadFilter(name);
    if (!filter) return false;
    m_store.setFilter(*filter);
    return true;
}

void DownloadListModel::setSearchQuery(const QString& query)
{
    m_store.setSearchQuery(query);
}

void DownloadListModel::toggleSelectionAt(int row, bool extend)
{
    const QString id = idAt(row);
    if (id.isEmpty()) return;
    m_store.toggle(id, extend);
}

QString DownloadListModel::idAt(int row) const {
    if (row < 0 || row >= m_rows.size()) return QString();
    return m_rows[row].id;
}

void DownloadListModel::refresh()
{
    QVector<Download> next = m_store.view();

    bool sameOrder = (next.size() == m_rows.size());
    for (int i = 0; sameOrder && i < next.size(); ++i) {
        sameOrder = (next[i].id == m_rows[i].id);
    }

    if (!sameOrder) {
        beginResetModel();
        m_rows = std::move(next);
        endResetModel();
        return;
    }

    m_rows = std::move(next);
    if (m_rows.isEmpty()) return;
    emit dataChanged(index(0), index(m_rows.size() - 1));
}
