#include "test_support.hpp"

#include <optional>
#include <QAbstractItemModel>
#include <QByteArray>
#include <QHash>
#include <QModelIndex>
#include <QObject>
#include <QStringList>
#include <QVariant>

import dlsync.core.downloadlistmodel;

namespace {

Download makeDownload(const QString& id, const QString& filename, DownloadStatus status, qint64 size) {
    Download d;
    d.id = id;
    d.url = "https://example.com/" + filename;
    d.filename = filename;
    d.status = status;
    d.size = size;
    return d;
}

QStringList rowIds(const DownloadListModel& model) {
    QStringList ids;
    for (int row = 0; row < model.rowCount(); ++row) ids << model.idAt(row);
    return ids;
}

struct ModelCounters {
    int resets = 0;
    int changes = 0;
};

void watch(DownloadListModel& model, ModelCounters& counters) {
    QObject::connect(&model, &QAbstractItemModel::modelReset, [&counters]() { ++counters.resets; });
    QObject::connect(&model, &QAbstractItemModel::dataChanged, [&counters]() { ++counters.changes; });
}

void seed(DownloadStore& store) {
    store.addOrReplace(makeDownload("a", "charlie.iso", DownloadStatus::Downloading, 300));
    store.addOrReplace(makeDownload("b", "alpha.zip", DownloadStatus::Paused, 100));
    store.addOrReplace(makeDownload("c", "bravo.tar", DownloadStatus::Completed, 200));
}

} // namespace

TEST_CASE("rows follow the store's sorted view") {
    DownloadStore store;
    seed(store);
    DownloadListModel model(store);

    model.sortBy("fileName", true);
    REQUIRE(rowIds(model) == QStringList({"b", "c", "a"}));

    model.sortBy("bytesTotal", false);
    REQUIRE(rowIds(model) == QStringList({"a", "c", "b"}));
    REQUIRE(store.sortField() == SortField::Size);
    REQUIRE(store.sortOrder() == Qt::DescendingOrder);

    model.sortBy("somethingElse", true);
    REQUIRE(store.sortField() == SortField::Name);
}

TEST_CASE("roles expose download fields") {
    DownloadStore store;
    Download d = makeDownload("d1", "movie.mkv", DownloadStatus::Downloading, 1000);
    d.downloaded = 250;
    d.speed = 64;
    d.queueId = "q1";
    d.error = "slow mirror";
    store.addOrReplace(d);
    store.addOrReplace(makeDownload("d2", "unknown.bin", DownloadStatus::Queued, 0));
    store.setSortField(SortField::Name);
    store.setSortOrder(Qt::AscendingOrder);

    DownloadListModel model(store);
    REQUIRE(model.rowCount() == 2);

    const QModelIndex first = model.index(0);
    REQUIRE(model.data(first, DownloadListModel::IdRole).toString() == QString("d1"));
    REQUIRE(model.data(first, Qt::DisplayRole).toString() == QString("movie.mkv"));
    REQUIRE(model.data(first, DownloadListModel::ProgressRole).toDouble() == Approx(0.25));
    REQUIRE(model.data(first, DownloadListModel::StatusRole).toString() == QString("downloading"));
    REQUIRE(model.data(first, DownloadListModel::BytesReceivedRole).toLongLong() == 250);
    REQUIRE(model.data(first, DownloadListModel::BytesTotalRole).toLongLong() == 1000);
    REQUIRE(model.data(first, DownloadListModel::SpeedRole).toLongLong() == 64);
    REQUIRE(model.data(first, DownloadListModel::EtaRole).toLongLong() == -1);
    REQUIRE(model.data(first, DownloadListModel::QueueRole).toString() == QString("q1"));
    REQUIRE(model.data(first, DownloadListModel::ErrorRole).toString() == QString("slow mirror"));
    REQUIRE_FALSE(model.data(first, DownloadListModel::SelectedRole).toBool());

    REQUIRE(model.data(model.index(1), DownloadListModel::ProgressRole).toDouble() == Approx(0.0));
    REQUIRE_FALSE(model.data(model.index(5), DownloadListModel::IdRole).isValid());

    const QHash<int, QByteArray> roles = model.roleNames();
    REQUIRE(roles.value(DownloadListModel::FileNameRole) == QByteArray("fileName"));
    REQUIRE(roles.value(DownloadListModel::SelectedRole) == QByteArray("selected"));
}

TEST_CASE("filter names map onto store filters") {
    DownloadStore store;
    seed(store);
    DownloadListModel model(store);

    REQUIRE(model.setFilterName("paused"));
    REQUIRE(rowIds(model) == QStringList({"b"}));

    REQUIRE_FALSE(model.setFilterName("archived"));
    REQUIRE(store.filter() == DownloadFilter::Paused);

    REQUIRE(model.setFilterName("All"));
    model.setSearchQuery("BRAVO");
    REQUIRE(rowIds(model) == QStringList({"c"}));
}

TEST_CASE("row selection goes through the store") {
    DownloadStore store;
    seed(store);
    DownloadListModel model(store);
    model.sortBy("fileName", true);
    // Rows: b c a

    model.toggleSelectionAt(0);
    model.toggleSelectionAt(2, true);
    REQUIRE(store.selectedIds() == QStringList({"a", "b", "c"}));
    REQUIRE(model.data(model.index(1), DownloadListModel::SelectedRole).toBool());

    model.toggleSelectionAt(7);
    REQUIRE(store.selectedIds().size() == 3);
    REQUIRE(model.idAt(-1).isEmpty());
}

TEST_CASE("field updates change data, membership changes reset") {
    DownloadStore store;
    seed(store);
    DownloadListModel model(store);
    ModelCounters counters;
    watch(model, counters);

    store.applyProgress("a", 150, std::nullopt, 10, std::nullopt);
    REQUIRE(counters.changes == 1);
    REQUIRE(counters.resets == 0);

    store.addOrReplace(makeDownload("d", "delta.bin", DownloadStatus::Queued, 50));
    REQUIRE(counters.resets == 1);
    REQUIRE(model.rowCount() == 4);

    store.remove("b");
    REQUIRE(counters.resets == 2);
    REQUIRE(model.rowCount() == 3);
}
