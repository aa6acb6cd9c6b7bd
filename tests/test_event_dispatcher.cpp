#include "test_support.hpp"

#include <optional>
#include <QObject>
#include <QStringList>

import dlsync.core.eventdispatcher;

using dlsync::events::decodeFrame;

namespace {

Download makeDownload(const QString& id, std::optional<qint64> size) {
    Download d;
    d.id = id;
    d.url = "https://example.com/" + id;
    d.filename = id;
    d.size = size;
    d.status = DownloadStatus::Downloading;
    return d;
}

bool dispatchFrame(EventDispatcher& dispatcher, const char* frame) {
    const auto event = decodeFrame(frame);
    REQUIRE(event);
    return dispatcher.dispatch(*event);
}

} // namespace

TEST_CASE("progress for an unknown id leaves the store unchanged") {
    DownloadStore store;
    store.addOrReplace(makeDownload("d1", 100));
    EventDispatcher dispatcher(store);
    int changes = 0;
    QObject::connect(&store, &DownloadStore::downloadChanged, [&changes](const QString&) { ++changes; });

    REQUIRE_NOTHROW(dispatchFrame(dispatcher, R"({"type":"progress","id":"missing"})"));
    dispatchFrame(dispatcher, R"({"type":"progress","id":"missing","downloaded":10})");

    REQUIRE(store.count() == 1);
    REQUIRE(store.download("d1")->downloaded == 0);
    REQUIRE_FALSE(store.contains("missing"));
    REQUIRE(changes == 0);
}

TEST_CASE("progress requires id and a non-negative byte count") {
    DownloadStore store;
    store.addOrReplace(makeDownload("d1", std::nullopt));
    EventDispatcher dispatcher(store);

    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"progress","downloaded":10})"));
    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"progress","id":"d1"})"));
    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"progress","id":"d1","downloaded":-1})"));
    REQUIRE(dispatchFrame(dispatcher, R"({"type":"progress","id":"d1","downloaded":10,"total":400,"speed":3,"eta":9})"));

    const auto d = store.download("d1");
    REQUIRE(d->downloaded == 10);
    REQUIRE(d->size == 400);
    REQUIRE(d->speed == 3);
    REQUIRE(d->eta == 9);
}

TEST_CASE("progress events apply in receipt order, last write wins") {
    DownloadStore store;
    store.addOrReplace(makeDownload("d1", 1000));
    EventDispatcher dispatcher(store);

    dispatchFrame(dispatcher, R"({"type":"progress","id":"d1","downloaded":700})");
    dispatchFrame(dispatcher, R"({"type":"progress","id":"d1","downloaded":300})");

    REQUIRE(store.download("d1")->downloaded == 300);
}

TEST_CASE("segment progress requires all three fields") {
    DownloadStore store;
    Download d = makeDownload("d1", 100);
    d.segments.append(Segment{0, 0, 50, 0, false});
    d.segments.append(Segment{1, 50, 100, 0, false});
    store.addOrReplace(d);
    EventDispatcher dispatcher(store);

    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"segment_progress","downloadId":"d1","downloaded":5})"));
    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"segment_progress","segmentIndex":1,"downloaded":5})"));
    REQUIRE(dispatchFrame(dispatcher, R"({"type":"segment_progress","downloadId":"d1","segmentIndex":1,"downloaded":25})"));

    REQUIRE(store.download("d1")->segments[1].downloaded == 25);
}

TEST_CASE("status change with a known label snaps completion") {
    DownloadStore store;
    store.addOrReplace(makeDownload("d1", 1000));
    EventDispatcher dispatcher(store);

    dispatchFrame(dispatcher, R"({"type":"progress","id":"d1","downloaded":500})");
    REQUIRE(dispatchFrame(dispatcher, R"({"type":"status_changed","id":"d1","status":"completed"})"));

    const auto d = store.download("d1");
    REQUIRE(d->status == DownloadStatus::Completed);
    REQUIRE(d->downloaded == 1000);
    REQUIRE(d->completedAt.isValid());
}

TEST_CASE("status change with an unknown label is ignored") {
    DownloadStore store;
    store.addOrReplace(makeDownload("d1", 10));
    EventDispatcher dispatcher(store);

    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"status_changed","id":"d1","status":"vanished"})"));
    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"status_changed","status":"paused"})"));
    REQUIRE(store.download("d1")->status == DownloadStatus::Downloading);
}

TEST_CASE("status change error falls back to message") {
    DownloadStore store;
    store.addOrReplace(makeDownload("d1", 10));
    EventDispatcher dispatcher(store);

    dispatchFrame(dispatcher, R"({"type":"status_changed","id":"d1","status":"failed","message":"Connection reset"})");

    REQUIRE(store.download("d1")->status == DownloadStatus::Failed);
    REQUIRE(store.download("d1")->error == QString("Connection reset"));
}

TEST_CASE("added and updated events insert or overwrite the entity") {
    DownloadStore store;
    EventDispatcher dispatcher(store);

    REQUIRE(dispatchFrame(dispatcher, R"({"type":"download_added","download":{"id":"d1","url":"u","size":5}})"));
    REQUIRE(store.contains("d1"));
    REQUIRE(dispatchFrame(dispatcher, R"({"type":"download_updated","download":{"id":"d1","url":"u","size":9}})"));
    REQUIRE(store.download("d1")->size == 9);
    REQUIRE(store.count() == 1);

    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"download_added"})"));
    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"download_added","download":{"url":"u"}})"));
    REQUIRE(store.count() == 1);
}

TEST_CASE("removed event deletes the entry") {
    DownloadStore store;
    store.addOrReplace(makeDownload("d1", 10));
    EventDispatcher dispatcher(store);

    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"download_removed"})"));
    REQUIRE(dispatchFrame(dispatcher, R"({"type":"download_removed","id":"d1"})"));
    REQUIRE_FALSE(store.contains("d1"));
}

TEST_CASE("queue lifecycle and unknown kinds surface as signals only") {
    DownloadStore store;
    store.addOrReplace(makeDownload("d1", 10));
    EventDispatcher dispatcher(store);
    QStringList log;
    QObject::connect(&dispatcher, &EventDispatcher::queueStarted, [&log](const QString& id) { log << "started:" + id; });
    QObject::connect(&dispatcher, &EventDispatcher::queueCompleted, [&log](const QString& id) { log << "completed:" + id; });
    QObject::connect(&dispatcher, &EventDispatcher::unhandledEvent, [&log](const QString& type) { log << "unknown:" + type; });

    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"queue_started","id":"q1"})"));
    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"queue_completed","id":"q1"})"));
    REQUIRE_FALSE(dispatchFrame(dispatcher, R"({"type":"speed_sample","value":1})"));

    REQUIRE(log == QStringList({"started:q1", "completed:q1", "unknown:speed_sample"}));
    REQUIRE(store.count() == 1);
}
