#include "TestSupport.hpp"

#include "FileWatchDispatcher.hpp"
#include "ShadowStore.hpp"
#include "TransferQueue.hpp"

using namespace remotebridge;
using testsupport::readLocal;
using testsupport::remoteData;
using testsupport::waitUntil;
using testsupport::writeLocal;
using ShadowStatus = ShadowEntry::Status;

namespace {

struct ShadowFixture {
    QTemporaryDir tmp;
    std::shared_ptr<MockRemoteFs> fs = std::make_shared<MockRemoteFs>();
    std::shared_ptr<TransportSession> session;
    FileWatchDispatcher watcher;
    TransferQueue queue;
    std::unique_ptr<ShadowStore> store;

    ShadowFixture() {
        fs->writeFile("/srv/doc.txt", "server v1");
        session = testsupport::connectedSession(fs);
        TransferQueue::Options o;
        o.retryBackoffMs = 10;
        o.progressIntervalMs = 0;
        queue.setOptions(o);
        queue.attachSession(session);
        watcher.setDebounceInterval(100);
        store = makeStore();
    }
    ~ShadowFixture() {
        store.reset();
        queue.shutdown();
    }

    std::unique_ptr<ShadowStore> makeStore() {
        auto s = std::make_unique<ShadowStore>(&queue, &watcher, tmp.filePath("shadows"));
        s->setDownloadTimeout(5000);
        return s;
    }
    QString open(const QString& remote = "/srv/doc.txt") {
        QString local;
        Error err;
        REQUIRE_MESSAGE(store->openForEdit("s1", remote, local, err), err.describe());
        return local;
    }
    ShadowStatus status(const QString& local) {
        auto e = store->entry(local);
        REQUIRE(e.has_value());
        return e->status;
    }
    bool reaches(const QString& local, ShadowStatus s, int timeoutMs = 5000) {
        return waitUntil([&] {
            auto e = store->entry(local);
            return e && e->status == s;
        }, timeoutMs);
    }
    int uploadsTo(const QString& remote) const {
        int n = 0;
        for (const auto& r : queue.records()) {
            if (r.direction == TransferRecord::Direction::Upload && r.dst == remote) ++n;
        }
        return n;
    }
};

} // namespace

TEST_CASE_FIXTURE(ShadowFixture, "open, edit and sync back") {
    const QString local = open();
    CHECK(local == store->shadowPathFor("s1", "/srv/doc.txt"));
    CHECK(local.startsWith(store->root()));
    CHECK(readLocal(local) == "server v1");
    CHECK(status(local) == ShadowStatus::Editing);
    CHECK(watcher.isWatching(local));

    // Unchanged content does not upload.
    CHECK_FALSE(store->notifyLocalChange(local));

    REQUIRE(writeLocal(local, "edited locally"));
    CHECK(store->notifyLocalChange(local));
    REQUIRE(reaches(local, ShadowStatus::Clean));
    CHECK(remoteData(fs, "/srv/doc.txt") == "edited locally");

    FileInfo fi{};
    REQUIRE(fs->statPath("/srv/doc.txt", fi));
    const auto e = store->entry(local);
    REQUIRE(e.has_value());
    CHECK(e->remoteFingerprint.matches(Fingerprint::of(fi)));
    CHECK(e->localHash == ShadowStore::hashFile(local));
    CHECK(e->pendingTransfer == 0);
}

TEST_CASE_FIXTURE(ShadowFixture, "reopening returns the same shadow") {
    const QString a = open();
    const QString b = open("/srv/./doc.txt");
    CHECK(a == b);
    CHECK(store->entries().size() == 1);
    CHECK(store->entryFor("s1", "/srv/doc.txt").has_value());
}

TEST_CASE_FIXTURE(ShadowFixture, "opening a missing file fails cleanly") {
    QString local;
    Error err;
    CHECK_FALSE(store->openForEdit("s1", "/srv/none.txt", local, err));
    CHECK(err.kind == ErrorKind::NotFound);
    CHECK(store->entries().isEmpty());
    CHECK_FALSE(QFileInfo::exists(store->shadowPathFor("s1", "/srv/none.txt")));
}

TEST_CASE_FIXTURE(ShadowFixture, "a burst of saves becomes one upload") {
    const QString local = open();
    REQUIRE(writeLocal(local, "burst"));
    for (int i = 0; i < 5; ++i) {
        watcher.notifyRawEvent(local);
        testsupport::pump(20);
    }
    REQUIRE(reaches(local, ShadowStatus::Clean));
    testsupport::pump(300);
    CHECK(uploadsTo("/srv/doc.txt") == 1);
    CHECK(remoteData(fs, "/srv/doc.txt") == "burst");
}

TEST_CASE_FIXTURE(ShadowFixture, "remote change while editing is a conflict") {
    const QString local = open();
    QStringList conflicts;
    QObject::connect(store.get(), &ShadowStore::conflictDetected, store.get(),
                     [&](const QString& l, const QString&) { conflicts << l; });

    fs->writeFile("/srv/doc.txt", "changed by a colleague");
    REQUIRE(writeLocal(local, "my edit"));
    CHECK(store->notifyLocalChange(local));
    REQUIRE(reaches(local, ShadowStatus::Conflict));
    CHECK(conflicts == QStringList{ local });
    CHECK(remoteData(fs, "/srv/doc.txt") == "changed by a colleague");
    CHECK_FALSE(store->entry(local)->lastError.isEmpty());

    // Further edits wait for the user.
    REQUIRE(writeLocal(local, "my edit, more"));
    CHECK_FALSE(store->notifyLocalChange(local));

    Error err;
    SUBCASE("overwrite remote") {
        REQUIRE(store->resolveConflict(local, ShadowStore::Resolution::OverwriteRemote, err));
        REQUIRE(reaches(local, ShadowStatus::Clean));
        CHECK(remoteData(fs, "/srv/doc.txt") == "my edit, more");
    }
    SUBCASE("redownload") {
        REQUIRE(store->resolveConflict(local, ShadowStore::Resolution::Redownload, err));
        CHECK(status(local) == ShadowStatus::Editing);
        CHECK(readLocal(local) == "changed by a colleague");
        // Editing resumes against the new server version.
        REQUIRE(writeLocal(local, "merged"));
        CHECK(store->notifyLocalChange(local));
        REQUIRE(reaches(local, ShadowStatus::Clean));
        CHECK(remoteData(fs, "/srv/doc.txt") == "merged");
    }
    SUBCASE("upload as copy") {
        REQUIRE(store->resolveConflict(local, ShadowStore::Resolution::UploadAsCopy, err));
        CHECK(remoteData(fs, "/srv/doc-copy.txt") == "my edit, more");
        CHECK(remoteData(fs, "/srv/doc.txt") == "changed by a colleague");
        CHECK(readLocal(local) == "changed by a colleague");
        CHECK(status(local) == ShadowStatus::Editing);
    }
}

TEST_CASE_FIXTURE(ShadowFixture, "resolveConflict needs a conflict") {
    const QString local = open();
    Error err;
    CHECK_FALSE(store->resolveConflict(local, ShadowStore::Resolution::Redownload, err));
    CHECK(err.kind == ErrorKind::Io);
    CHECK_FALSE(store->resolveConflict(tmp.filePath("unknown"), ShadowStore::Resolution::Redownload, err));
    CHECK(err.kind == ErrorKind::NotFound);
}

TEST_CASE_FIXTURE(ShadowFixture, "conflict checking can be turned off") {
    store->setConflictCheck(false);
    const QString local = open();
    fs->writeFile("/srv/doc.txt", "changed by a colleague");
    REQUIRE(writeLocal(local, "last writer wins"));
    CHECK(store->notifyLocalChange(local));
    REQUIRE(reaches(local, ShadowStatus::Clean));
    CHECK(remoteData(fs, "/srv/doc.txt") == "last writer wins");
}

TEST_CASE_FIXTURE(ShadowFixture, "closing a shadow") {
    const QString local = open();

    SUBCASE("clean") {
        CHECK(store->close(local, 1000) == ShadowStore::CloseResult::Closed);
        CHECK_FALSE(QFileInfo::exists(local));
        CHECK(store->entries().isEmpty());
        CHECK_FALSE(watcher.isWatching(local));
        CHECK(store->close(local, 1000) == ShadowStore::CloseResult::NotFound);
    }
    SUBCASE("unsynced edits are flushed first") {
        REQUIRE(writeLocal(local, "flushed on close"));
        CHECK(store->close(local, 5000) == ShadowStore::CloseResult::Closed);
        CHECK(remoteData(fs, "/srv/doc.txt") == "flushed on close");
    }
    SUBCASE("unsaved changes need force") {
        session->disconnect();
        REQUIRE(writeLocal(local, "cannot upload"));
        CHECK(store->close(local, 300) == ShadowStore::CloseResult::UnsavedChanges);
        CHECK(store->entry(local).has_value());
        CHECK(QFileInfo::exists(local));
        CHECK(store->close(local, 100, true) == ShadowStore::CloseResult::Closed);
        CHECK_FALSE(QFileInfo::exists(local));
        CHECK(remoteData(fs, "/srv/doc.txt") == "server v1");
    }
}

TEST_CASE_FIXTURE(ShadowFixture, "orphaned shadows ignore edits until reattached") {
    const QString local = open();
    store->orphanSession("s1");
    CHECK(status(local) == ShadowStatus::Orphaned);
    REQUIRE(writeLocal(local, "offline edit"));
    CHECK_FALSE(store->notifyLocalChange(local));
    CHECK(status(local) == ShadowStatus::Orphaned);

    CHECK(store->reattachSession("other") == 0);
    CHECK(store->reattachSession("s1") == 1);
    REQUIRE(reaches(local, ShadowStatus::Clean));
    CHECK(remoteData(fs, "/srv/doc.txt") == "offline edit");
}

TEST_CASE_FIXTURE(ShadowFixture, "shadows survive a crash") {
    const QString local = open();
    const QString root = store->root();
    store.reset(); // no shutdown: the index stays behind
    REQUIRE(writeLocal(local, "edited before the crash"));

    store = makeStore();
    CHECK(store->root() == root);
    QString err;
    REQUIRE(store->loadIndex(&err));
    REQUIRE(store->entries().size() == 1);
    CHECK(status(local) == ShadowStatus::Orphaned);
    CHECK(store->entry(local)->remotePath == "/srv/doc.txt");

    CHECK(store->reattachSession("s1") == 1);
    REQUIRE(reaches(local, ShadowStatus::Clean));
    CHECK(remoteData(fs, "/srv/doc.txt") == "edited before the crash");
}

TEST_CASE_FIXTURE(ShadowFixture, "shutdown flushes pending edits") {
    const QString local = open();
    REQUIRE(writeLocal(local, "saved at exit"));
    store->shutdown(5000);
    CHECK(remoteData(fs, "/srv/doc.txt") == "saved at exit");
    CHECK(store->entries().isEmpty());
    CHECK_FALSE(QFileInfo::exists(local));
}

TEST_CASE_FIXTURE(ShadowFixture, "shutdown keeps what it could not flush") {
    const QString local = open();
    session->disconnect();
    REQUIRE(writeLocal(local, "stuck"));
    store->shutdown(300);
    REQUIRE(store->entries().size() == 1);
    CHECK(status(local) == ShadowStatus::Orphaned);
    CHECK(readLocal(local) == "stuck");

    auto next = makeStore();
    REQUIRE(next->loadIndex());
    CHECK(next->entries().size() == 1);
}
