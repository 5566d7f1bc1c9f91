#include "TestSupport.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include "TransferHistory.hpp"

using remotebridge::ErrorKind;
using Status = TransferRecord::Status;

namespace {

TransferRecord finished(quint64 id, Status st, const QDateTime& when = QDateTime::currentDateTimeUtc()) {
    TransferRecord r;
    r.id = id;
    r.direction = TransferRecord::Direction::Download;
    r.sessionId = "demo@mock";
    r.src = QStringLiteral("/remote/%1.txt").arg(id);
    r.dst = QStringLiteral("/tmp/%1.txt").arg(id);
    r.status = st;
    r.totalBytes = 10;
    r.bytesTransferred = st == Status::Succeeded ? 10 : 4;
    r.attempts = 1;
    r.created = r.updated = when;
    if (st == Status::Failed) {
        r.errorKind = ErrorKind::PermissionDenied;
        r.error = "Permission denied";
    }
    return r;
}

} // namespace

TEST_CASE("history survives a reload") {
    QTemporaryDir tmp;
    const QString path = tmp.filePath("history.json");
    {
        TransferHistory h(path);
        REQUIRE(h.load());
        CHECK(h.records().isEmpty());
        TransferRecord ok = finished(1, Status::Succeeded);
        ok.remoteFingerprint.size = 10;
        ok.remoteFingerprint.mtime = 1700000100;
        ok.remoteFingerprint.valid = true;
        REQUIRE(h.upsert(ok));
        REQUIRE(h.upsert(finished(2, Status::Failed)));
    }
    TransferHistory h(path);
    QString err;
    REQUIRE(h.load(&err));
    const auto recs = h.records();
    REQUIRE(recs.size() == 2);
    CHECK(h.maxId() == 2);

    auto failed = h.find(2);
    REQUIRE(failed.has_value());
    CHECK(failed->status == Status::Failed);
    CHECK(failed->errorKind == ErrorKind::PermissionDenied);
    CHECK(failed->error == "Permission denied");
    CHECK(failed->bytesTransferred == 4);

    auto ok = h.find(1);
    REQUIRE(ok.has_value());
    CHECK(ok->remoteFingerprint.valid);
    CHECK(ok->remoteFingerprint.mtime == 1700000100);
    CHECK(ok->dst == "/tmp/1.txt");
}

TEST_CASE("upsert replaces a record and keeps newest first") {
    QTemporaryDir tmp;
    TransferHistory h(tmp.filePath("h.json"));
    h.upsert(finished(1, Status::Failed));
    h.upsert(finished(2, Status::Succeeded));
    TransferRecord again = finished(1, Status::Succeeded);
    again.retryCount = 1;
    h.upsert(again);
    const auto recs = h.records();
    REQUIRE(recs.size() == 2);
    CHECK(recs[0].id == 1);
    CHECK(recs[0].status == Status::Succeeded);
    CHECK(recs[0].retryCount == 1);
    CHECK(recs[1].id == 2);
}

TEST_CASE("retention bounds the history") {
    QTemporaryDir tmp;
    TransferHistory h(tmp.filePath("h.json"));

    SUBCASE("by count") {
        h.setRetention(3, 0);
        for (quint64 id = 1; id <= 5; ++id) h.upsert(finished(id, Status::Succeeded));
        const auto recs = h.records();
        REQUIRE(recs.size() == 3);
        CHECK(recs[0].id == 5);
        CHECK_FALSE(h.find(1).has_value());
        CHECK_FALSE(h.find(2).has_value());
    }
    SUBCASE("by age") {
        h.setRetention(100, 30);
        h.upsert(finished(1, Status::Succeeded, QDateTime::currentDateTimeUtc().addDays(-40)));
        h.upsert(finished(2, Status::Succeeded, QDateTime::currentDateTimeUtc().addDays(-2)));
        CHECK_FALSE(h.find(1).has_value());
        CHECK(h.find(2).has_value());
    }
}

TEST_CASE("a corrupt history file is reported and left alone") {
    QTemporaryDir tmp;
    const QString path = tmp.filePath("h.json");
    REQUIRE(testsupport::writeLocal(path, "{ not json"));
    TransferHistory h(path);
    QString err;
    CHECK_FALSE(h.load(&err));
    CHECK(err.contains("Corrupt"));
    CHECK(h.records().isEmpty());
    CHECK(testsupport::readLocal(path) == "{ not json");
}

TEST_CASE("records with unknown fields are skipped individually") {
    QTemporaryDir tmp;
    const QString path = tmp.filePath("h.json");
    QJsonObject good = TransferHistory::toJson(finished(7, Status::Cancelled));
    QJsonObject future = TransferHistory::toJson(finished(8, Status::Succeeded));
    future["status"] = "archived";
    QJsonObject noId = TransferHistory::toJson(finished(9, Status::Succeeded));
    noId.remove("id");
    QJsonObject root;
    root["version"] = 1;
    root["records"] = QJsonArray{ good, future, noId };
    REQUIRE(testsupport::writeLocal(path, QJsonDocument(root).toJson()));

    TransferHistory h(path);
    REQUIRE(h.load());
    REQUIRE(h.records().size() == 1);
    CHECK(h.records()[0].id == 7);
    CHECK(h.records()[0].status == Status::Cancelled);
}

TEST_CASE("clear removes old or all records") {
    QTemporaryDir tmp;
    TransferHistory h(tmp.filePath("h.json"));
    const QDateTime now = QDateTime::currentDateTimeUtc();
    h.upsert(finished(1, Status::Succeeded, now.addDays(-5)));
    h.upsert(finished(2, Status::Succeeded, now.addDays(-1)));
    h.upsert(finished(3, Status::Failed, now));

    CHECK(h.clear(now.addDays(-3)) == 1);
    CHECK(h.records().size() == 2);
    CHECK(h.maxId() == 3);

    CHECK(h.clear() == 2);
    CHECK(h.records().isEmpty());
    CHECK(h.maxId() == 0);

    TransferHistory reloaded(h.path());
    REQUIRE(reloaded.load());
    CHECK(reloaded.records().isEmpty());
}

TEST_CASE("start and finish times survive a reload") {
    QTemporaryDir tmp;
    const QString path = tmp.filePath("history.json");
    const QDateTime start = QDateTime::currentDateTimeUtc().addSecs(-60);
    {
        TransferHistory h(path);
        REQUIRE(h.load());
        TransferRecord r = finished(7, Status::Succeeded, start.addSecs(4));
        r.totalBytes = r.bytesTransferred = 4 * 1024 * 1024;
        r.started = start;
        r.finished = start.addSecs(4);
        REQUIRE(h.upsert(r));
        REQUIRE(h.upsert(finished(8, Status::Cancelled)));
    }
    TransferHistory h(path);
    REQUIRE(h.load());
    auto r = h.find(7);
    REQUIRE(r.has_value());
    CHECK(r->started == start);
    CHECK(r->finished == start.addSecs(4));
    CHECK(r->durationMs() == 4000);
    CHECK(r->bytesPerSecond() == doctest::Approx(1024.0 * 1024.0));
    CHECK(formatTransferSpeed(r->bytesPerSecond()) == "1.0 MB/s");
    CHECK(formatTransferDuration(r->durationMs()) == "4s");

    // Never started: no timings to show.
    auto never = h.find(8);
    REQUIRE(never.has_value());
    CHECK_FALSE(never->started.isValid());
    CHECK(never->durationMs() == -1);
    CHECK(formatTransferDuration(never->durationMs()).isEmpty());
    CHECK(formatTransferSpeed(never->bytesPerSecond()).isEmpty());
}

TEST_CASE("speed and duration formatting") {
    CHECK(formatTransferSpeed(512) == "512 B/s");
    CHECK(formatTransferSpeed(1536) == "1.5 KB/s");
    CHECK(formatTransferDuration(999) == "0s");
    CHECK(formatTransferDuration(185000) == "3m 05s");
    CHECK(formatTransferDuration(3720000) == "1h 02m");
}
