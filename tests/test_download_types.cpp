#include "test_support.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

import dlsync.core.downloadtypes;

namespace {

QJsonObject parseObject(const char* json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace

TEST_CASE("download decodes the camelCase backend entity") {
    const QJsonObject obj = parseObject(R"({
        "id": "d1",
        "url": "https://example.com/a.iso",
        "finalUrl": "https://mirror.example.com/a.iso",
        "filename": "a.iso",
        "destination": "/tmp",
        "size": 1000,
        "downloaded": 250,
        "status": "downloading",
        "segments": [
            {"index": 0, "start": 0, "end": 500, "downloaded": 250, "complete": false},
            {"index": 1, "start": 500, "end": 1000, "downloaded": 0, "complete": false}
        ],
        "queueId": "q1",
        "categoryId": null,
        "speedLimit": 2048,
        "createdAt": "2026-01-02T03:04:05Z",
        "completedAt": null,
        "retryCount": 2
    })");

    const auto d = Download::fromJson(obj);
    REQUIRE(d.has_value());
    REQUIRE(d->id == QString("d1"));
    REQUIRE(d->finalUrl == QString("https://mirror.example.com/a.iso"));
    REQUIRE(d->size == 1000);
    REQUIRE(d->downloaded == 250);
    REQUIRE(d->status == DownloadStatus::Downloading);
    REQUIRE(d->segments.size() == 2);
    REQUIRE(d->segments[1].start == 500);
    REQUIRE(d->segments[1].length() == 500);
    REQUIRE(d->queueId == QString("q1"));
    REQUIRE(d->categoryId.isEmpty());
    REQUIRE(d->speedLimit == 2048);
    REQUIRE(d->createdAt.isValid());
    REQUIRE(d->createdAt.date().year() == 2026);
    REQUIRE_FALSE(d->completedAt.isValid());
    REQUIRE(d->retryCount == 2);
    REQUIRE(d->progress() == Approx(0.25));
}

TEST_CASE("download without id is rejected") {
    REQUIRE_FALSE(Download::fromJson(parseObject(R"({"url": "https://example.com/x"})")).has_value());
    REQUIRE_FALSE(Download::fromJson(parseObject(R"({"id": ""})")).has_value());
}

TEST_CASE("unknown status decodes as pending and null size stays unknown") {
    const auto d = Download::fromJson(parseObject(R"({"id": "d2", "status": "exploded", "size": null})"));
    REQUIRE(d.has_value());
    REQUIRE(d->status == DownloadStatus::Pending);
    REQUIRE_FALSE(d->size.has_value());
    REQUIRE(d->progress() == 0.0);
}

TEST_CASE("status labels parse case-insensitively") {
    REQUIRE(parseDownloadStatus("Completed") == DownloadStatus::Completed);
    REQUIRE(parseDownloadStatus("canceled") == DownloadStatus::Cancelled);
    REQUIRE_FALSE(parseDownloadStatus("done").has_value());
    REQUIRE(downloadStatusName(DownloadStatus::Paused) == QString("paused"));
    REQUIRE(parseDownloadFilter("queued") == DownloadFilter::Queued);
    REQUIRE_FALSE(parseDownloadFilter("everything").has_value());
    REQUIRE(parseSortField("progress") == SortField::Progress);
    REQUIRE(sortFieldName(SortField::Date) == QString("date"));
}

TEST_CASE("add request encodes snake_case keys and omits empty fields") {
    AddDownloadRequest request;
    request.url = "https://example.com/file.bin";
    request.queueId = "q9";
    request.headers.insert("Authorization", "Bearer x");

    const QJsonObject body = request.toJson();
    REQUIRE(body.value("url").toString() == QString("https://example.com/file.bin"));
    REQUIRE(body.value("queue_id").toString() == QString("q9"));
    REQUIRE_FALSE(body.contains("queueId"));
    REQUIRE_FALSE(body.contains("filename"));
    REQUIRE_FALSE(body.contains("destination"));
    REQUIRE_FALSE(body.contains("cookies"));
    REQUIRE(body.value("headers").toObject().value("Authorization").toString() == QString("Bearer x"));
}

TEST_CASE("backend status reads snake_case counters") {
    const BackendStatus status = BackendStatus::fromJson(
        parseObject(R"({"connected": true, "version": "1.4.0", "active_downloads": 3, "queues": 2})"));
    REQUIRE(status.connected);
    REQUIRE(status.version == QString("1.4.0"));
    REQUIRE(status.activeDownloads == 3);
    REQUIRE(status.queues == 2);
}

TEST_CASE("queue info decodes optional limits") {
    const auto queue = QueueInfo::fromJson(
        parseObject(R"({"id": "q1", "name": "Main", "color": "#ff0000", "maxConcurrent": 4, "speedLimit": null, "segmentCount": 8})"));
    REQUIRE(queue.has_value());
    REQUIRE(queue->name == QString("Main"));
    REQUIRE(queue->maxConcurrent == 4);
    REQUIRE_FALSE(queue->speedLimit.has_value());
    REQUIRE(queue->segmentCount == 8);
    REQUIRE_FALSE(QueueInfo::fromJson(parseObject(R"({"name": "no id"})")).has_value());
}
