module;
#include <algorithm>
#include <optional>
#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

module dlsync.core.downloadstore;

namespace {

qint64 createdMs(const Download& d)
{
    return d.createdAt.isValid() ? d.createdAt.toMSecsSinceEpoch() : 0;
}

int compareBy(SortField field, const Download& a, const Download& b)
{
    auto cmp = [](const auto& lhs, const auto& rhs) {
        return (lhs < rhs) ? -1 : (rhs < lhs ? 1 : 0);
    };
    switch (field) {
    case SortField::Name:
        return QString::compare(a.filename, b.filename, Qt::CaseInsensitive);
    case SortField::Size:
        return cmp(a.size.value_or(0), b.size.value_or(0));
    case SortField::Progress:
        return cmp(a.progress(), b.progress());
    case SortField::Date:
        return cmp(createdMs(a), createdMs(b));
    case SortField::Status:
        return QString::compare(downloadStatusName(a.status), downloadStatusName(b.status));
    }
    return 0;
}

} // namespace

DownloadStore::DownloadStore(QObject* parent) : QObject(parent) {}

void DownloadStore::addOrReplace(const Download& download)
{
    if (download.id.isEmpty()) return;
    const bool existed = m_downloads.contains(download.id);
    m_downloads.insert(download.id, download);
    if (existed) {
        emit downloadChanged(download.id);
        return;
    }
    m_order.append(download.id);
    emit downloadAdded(download.id);
}

void DownloadStore::reconcile(const QString& temporaryId, const Download& authoritative)
{
    if (authoritative.id.isEmpty()) return;
    if (temporaryId == authoritative.id || !m_downloads.contains(temporaryId)) {
        addOrReplace(authoritative);
        return;
    }

    const bool wasSelected = m_selected.remove(temporaryId);
    const bool wasAnchor = (m_anchor == temporaryId);

    m_downloads.remove(temporaryId);
    if (m_downloads.contains(authoritative.id)) {
        // The backend's added event won the race; keep its position.
        m_order.removeOne(temporaryId);
    } else {
        const int pos = m_order.indexOf(temporaryId);
        m_order[pos] = authoritative.id;
    }
    m_downloads.insert(authoritative.id, authoritative);

    if (wasSelected) m_selected.insert(authoritative.id);
    if (wasAnchor) m_anchor = authoritative.id;

    emit downloadsReset();
    if (wasSelected || wasAnchor) emit selectionChanged();
}

void DownloadStore::setDownloads(const QVector<Download>& downloads)
{
    m_downloads.clear();
    m_order.clear();
    for (const Download& d : downloads) {
        if (d.id.isEmpty()) continue;
        if (!m_downloads.contains(d.id)) m_order.append(d.id);
        m_downloads.insert(d.id, d);
    }
    const bool pruned = pruneSelection();
    emit downloadsReset();
    if (pruned) emit selectionChanged();
}

void DownloadStore::remove(const QString& id)
{
    if (!m_downloads.remove(id)) return;
    m_order.removeOne(id);
    bool selectionTouched = m_selected.remove(id);
    if (m_anchor == id) {
        m_anchor.clear();
        selectionTouched = true;
    }
    emit downloadRemoved(id);
    if (selectionTouched) emit selectionChanged();
}

void DownloadStore::applyProgress(const QString& id,
                                  qint64 downloaded,
                                  std::optional<qint64> total,
                                  qint64 speed,
                                  std::optional<qint64> eta)
{
    auto it = m_downloads.find(id);
    if (it == m_downloads.end()) return;
    Download& d = it.value();
    d.downloaded = downloaded;
    d.speed = speed;
    d.eta = eta;
    if (total && !d.size) d.size = total;
    emit downloadChanged(id);
}

void DownloadStore::applySegmentProgress(const QString& id, int segmentIndex, qint64 downloaded)
{
    auto it = m_downloads.find(id);
    if (it == m_downloads.end()) return;
    for (Segment& s : it.value().segments) {
        if (s.index != segmentIndex) continue;
        s.downloaded = downloaded;
        emit downloadChanged(id);
        return;
    }
}

void DownloadStore::applyStatus(const QString& id, DownloadStatus status, const QString& error)
{
    auto it = m_downloads.find(id);
    if (it == m_downloads.end()) return;
    Download& d = it.value();
    const bool entering = (d.status != status);
    d.status = status;
    d.error = error;
    if (status == DownloadStatus::Completed) {
        if (d.size) d.downloaded = *d.size;
        if (entering || !d.completedAt.isValid()) d.completedAt = QDateTime::currentDateTimeUtc();
    }
    emit downloadChanged(id);
}

void DownloadStore::attachError(const QString& id, const QString& message)
{
    auto it = m_downloads.find(id);
    if (it == m_downloads.end()) return;
    it.value().error = message;
    emit downloadChanged(id);
}

void DownloadStore::moveToQueue(const QStringList& ids, const QString& queueId)
{
    for (const QString& id : ids) {
        auto it = m_downloads.find(id);
        if (it == m_downloads.end()) continue;
        if (it.value().queueId == queueId) continue;
        it.value().queueId = queueId;
        emit downloadChanged(id);
    }
}

std::optional<Download> DownloadStore::download(const QString& id) const
{
    auto it = m_downloads.constFind(id);
    if (it == m_downloads.constEnd()) return std::nullopt;
    return it.value();
}

QVector<Download> DownloadStore::downloads() const
{
    QVector<Download> out;
    out.reserve(m_order.size());
    for (const QString& id : m_order) out.append(m_downloads.value(id));
    return out;
}

void DownloadStore::setSelected(const QStringList& ids)
{
    QSet<QString> next;
    QString anchor;
    for (const QString& id : ids) {
        if (!m_downloads.contains(id)) continue;
        next.insert(id);
        anchor = id;
    }
    if (next == m_selected && anchor == m_anchor) return;
    m_selected = next;
    m_anchor = anchor;
    emit selectionChanged();
}

void DownloadStore::toggle(const QString& id, bool extend)
{
    if (!m_downloads.contains(id)) return;

    if (extend && !m_anchor.isEmpty()) {
        const QVector<Download> rows = view();
        int anchorRow = -1;
        int targetRow = -1;
        for (int i = 0; i < rows.size(); ++i) {
            if (rows[i].id == m_anchor) anchorRow = i;
            if (rows[i].id == id) targetRow = i;
        }
        if (anchorRow >= 0 && targetRow >= 0) {
            QSet<QString> next;
            const int from = qMin(anchorRow, targetRow);
            const int to = qMax(anchorRow, targetRow);
            for (int i = from; i <= to; ++i) next.insert(rows[i].id);
            if (next == m_selected) return;
            m_selected = next;
            emit selectionChanged();
            return;
        }
    }

    if (!m_selected.remove(id)) m_selected.insert(id);
    m_anchor = id;
    emit selectionChanged();
}

void DownloadStore::selectAll(const std::optional<QStringList>& ids)
{
    QSet<QString> next;
    if (ids) {
        for (const QString& id : *ids) {
            if (m_downloads.contains(id)) next.insert(id);
        }
    } else {
        for (const QString& id : m_order) next.insert(id);
    }
    if (next == m_selected) return;
    m_selected = next;
    emit selectionChanged();
}

void DownloadStore::clearSelection()
{
    if (m_selected.isEmpty() && m_anchor.isEmpty()) return;
    m_selected.clear();
    m_anchor.clear();
    emit selectionChanged();
}

QStringList DownloadStore::selectedIds() const
{
    QStringList out;
    for (const QString& id : m_order) {
        if (m_selected.contains(id)) out.append(id);
    }
    return out;
}

void DownloadStore::setFilter(DownloadFilter filter)
{
    if (m_filter == filter) return;
    m_filter = filter;
    clearSelection();
    emit viewOptionsChanged();
}

void DownloadStore::setSearchQuery(const QString& query)
{
    if (m_searchQuery == query) return;
    m_searchQuery = query;
    clearSelection();
    emit viewOptionsChanged();
}

void DownloadStore::setSortField(SortField field)
{
    if (m_sortField == field) return;
    m_sortField = field;
    emit viewOptionsChanged();
}

void DownloadStore::setSortOrder(Qt::SortOrder order)
{
    if (m_sortOrder == order) return;
    m_sortOrder = order;
    emit viewOptionsChanged();
}

QVector<Download> DownloadStore::filteredSorted(DownloadFilter filter,
                                                const QString& query,
                                                SortField field,
                                                Qt::SortOrder order) const
{
    return filteredSorted(downloads(), filter, query, field, order);
}

QVector<Download> DownloadStore::view() const
{
    return filteredSorted(m_filter, m_searchQuery, m_sortField, m_sortOrder);
}

QVector<Download> DownloadStore::filteredSorted(const QVector<Download>& downloads,
                                                DownloadFilter filter,
                                                const QString& query,
                                                SortField field,
                                                Qt::SortOrder order)
{
    QVector<Download> out;
    out.reserve(downloads.size());
    for (const Download& d : downloads) {
        if (!matchesFilter(d, filter)) continue;
        if (!query.isEmpty()
            && !d.filename.contains(query, Qt::CaseInsensitive)
            && !d.url.contains(query, Qt::CaseInsensitive)) {
            continue;
        }
        out.append(d);
    }

    const bool ascending = (order == Qt::AscendingOrder);
    std::stable_sort(out.begin(), out.end(), [field, ascending](const Download& a, const Download& b) {
        const int c = compareBy(field, a, b);
        return ascending ? (c < 0) : (c > 0);
    });
    return out;
}

bool DownloadStore::matchesFilter(const Download& download, DownloadFilter filter)
{
    switch (filter) {
    case DownloadFilter::All: return true;
    case DownloadFilter::Active: return download.status == DownloadStatus::Downloading;
    case DownloadFilter::Completed: return download.status == DownloadStatus::Completed;
    case DownloadFilter::Failed: return download.status == DownloadStatus::Failed;
    case DownloadFilter::Queued:
        return download.status == DownloadStatus::Queued || download.status == DownloadStatus::Pending;
    case DownloadFilter::Paused: return download.status == DownloadStatus::Paused;
    }
    return true;
}

bool DownloadStore::pruneSelection()
{
    bool changed = false;
    for (auto it = m_selected.begin(); it != m_selected.end();) {
        if (m_downloads.contains(*it)) {
            ++it;
        } else {
            it = m_selected.erase(it);
            changed = true;
        }
    }
    if (!m_anchor.isEmpty() && !m_downloads.contains(m_anchor)) {
        m_anchor.clear();
        changed = true;
    }
    return changed;
}
