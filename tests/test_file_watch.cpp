#include "TestSupport.hpp"

#include <QFile>
#include "FileWatchDispatcher.hpp"

using testsupport::pump;
using testsupport::waitUntil;

namespace {

struct WatchFixture {
    QTemporaryDir tmp;
    FileWatchDispatcher watcher;
    QStringList events;

    WatchFixture() {
        watcher.setDebounceInterval(100);
        QObject::connect(&watcher, &FileWatchDispatcher::changed, &watcher,
                         [this](const QString& p) { events << p; });
    }
    QString file(const QString& name, const QByteArray& data = "x") {
        const QString p = tmp.filePath(name);
        REQUIRE(testsupport::writeLocal(p, data));
        return p;
    }
};

} // namespace

TEST_CASE_FIXTURE(WatchFixture, "a burst of events collapses into one") {
    const QString p = file("a.txt");
    REQUIRE(watcher.watch(p));
    CHECK(watcher.isWatching(p));
    for (int i = 0; i < 5; ++i) {
        watcher.notifyRawEvent(p);
        pump(20);
    }
    REQUIRE(waitUntil([&] { return !events.isEmpty(); }, 2000));
    pump(250);
    REQUIRE(events.size() == 1);
    CHECK(events[0] == QFileInfo(p).absoluteFilePath());
}

TEST_CASE_FIXTURE(WatchFixture, "separate quiet periods give separate events") {
    const QString p = file("a.txt");
    REQUIRE(watcher.watch(p));
    watcher.notifyRawEvent(p);
    REQUIRE(waitUntil([&] { return events.size() == 1; }, 2000));
    watcher.notifyRawEvent(p);
    REQUIRE(waitUntil([&] { return events.size() == 2; }, 2000));
}

TEST_CASE_FIXTURE(WatchFixture, "writes to a watched file are reported") {
    const QString p = file("a.txt", "one");
    REQUIRE(watcher.watch(p));
    for (int i = 0; i < 3; ++i) {
        QFile f(p);
        REQUIRE(f.open(QIODevice::Append));
        f.write("more");
        f.close();
        pump(10);
    }
    REQUIRE(waitUntil([&] { return !events.isEmpty(); }, 3000));
    pump(250);
    CHECK(events.size() == 1);
}

TEST_CASE_FIXTURE(WatchFixture, "paths that cannot be watched") {
    CHECK_FALSE(watcher.watch(tmp.filePath("missing.txt")));
    CHECK_FALSE(watcher.isWatching(tmp.filePath("missing.txt")));
    // Events for unknown paths are ignored.
    watcher.notifyRawEvent(tmp.filePath("other.txt"));
    pump(200);
    CHECK(events.isEmpty());
}

TEST_CASE_FIXTURE(WatchFixture, "unwatch drops pending events") {
    const QString p = file("a.txt");
    REQUIRE(watcher.watch(p));
    watcher.notifyRawEvent(p);
    watcher.unwatch(p);
    CHECK_FALSE(watcher.isWatching(p));
    pump(250);
    CHECK(events.isEmpty());
}

TEST_CASE_FIXTURE(WatchFixture, "a file deleted before the quiet period ends produces nothing") {
    const QString p = file("a.txt");
    REQUIRE(watcher.watch(p));
    watcher.notifyRawEvent(p);
    REQUIRE(QFile::remove(p));
    pump(250);
    CHECK(events.isEmpty());
}
