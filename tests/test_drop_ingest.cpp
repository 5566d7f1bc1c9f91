#include "TestSupport.hpp"

#include "DropIngest.hpp"
#include "TransferQueue.hpp"

using namespace remotebridge;
using testsupport::remoteData;
using testsupport::writeLocal;
using Status = TransferRecord::Status;

namespace {

struct DropFixture {
    QTemporaryDir tmp;
    std::shared_ptr<MockRemoteFs> fs = std::make_shared<MockRemoteFs>();
    std::shared_ptr<TransportSession> session;
    TransferQueue queue;
    DropIngest drops{ &queue };

    DropFixture() {
        fs->addDir("/dst");
        session = testsupport::connectedSession(fs);
        TransferQueue::Options o;
        o.retryBackoffMs = 10;
        o.progressIntervalMs = 0;
        queue.setOptions(o);
        queue.attachSession(session);
    }
    ~DropFixture() { queue.shutdown(); }

    QString local(const QString& rel, const QByteArray& data) {
        const QString p = tmp.filePath(rel);
        REQUIRE(writeLocal(p, data));
        return p;
    }
    void policy(CollisionPolicy p) {
        DropIngest::Options o = drops.options();
        o.policy = p;
        drops.setOptions(o);
    }
    DropPlan planUpload(const QStringList& paths, const QString& dir = "/dst") {
        DropPlan plan;
        Error err;
        REQUIRE_MESSAGE(drops.planUpload("s1", paths, dir, plan, err), err.describe());
        return plan;
    }
    DropResult submit(DropPlan& plan) {
        DropResult res;
        Error err;
        REQUIRE_MESSAGE(drops.submit(plan, res, err), err.describe());
        return res;
    }
    void waitAll(const DropResult& res) {
        if (res.jobId) REQUIRE(queue.waitForFinished(res.jobId, 10000));
        for (quint64 id : res.transferIds) REQUIRE(queue.waitForFinished(id, 10000));
    }
};

} // namespace

TEST_CASE_FIXTURE(DropFixture, "dropping a directory creates one job") {
    local("proj/a.txt", "a");
    local("proj/b.txt", "bb");
    local("proj/c.txt", "ccc");
    REQUIRE(QDir().mkpath(tmp.filePath("proj/empty")));

    DropPlan plan = planUpload({ tmp.filePath("proj") });
    CHECK(plan.containsDirectory());
    REQUIRE(plan.files.size() == 3);
    CHECK(plan.files[0].dst == "/dst/proj/a.txt");
    CHECK(plan.files[1].dst == "/dst/proj/b.txt");
    CHECK(plan.files[2].dst == "/dst/proj/c.txt");
    CHECK(plan.directories == QStringList{ "/dst/proj", "/dst/proj/empty" });
    CHECK(plan.totalBytes() == 6);
    CHECK(plan.collisions() == 0);

    fs->failTransfers("/dst/proj/b.txt", ErrorKind::PermissionDenied);
    DropResult res = submit(plan);
    REQUIRE(res.jobId != 0);
    CHECK(res.transferIds.size() == 3);
    waitAll(res);

    const auto job = queue.record(res.jobId);
    REQUIRE(job.has_value());
    CHECK(job->status == Status::Failed);
    CHECK(job->childSucceeded == 2);
    CHECK(job->childFailed == 1);
    CHECK(remoteData(fs, "/dst/proj/a.txt") == "a");
    CHECK(remoteData(fs, "/dst/proj/c.txt") == "ccc");
    CHECK_FALSE(fs->exists("/dst/proj/b.txt"));
    CHECK(fs->exists("/dst/proj/empty"));
}

TEST_CASE_FIXTURE(DropFixture, "dropping plain files gives independent transfers") {
    DropPlan plan = planUpload({ local("one.txt", "1"), local("two.txt", "2") });
    CHECK_FALSE(plan.containsDirectory());
    DropResult res = submit(plan);
    CHECK(res.jobId == 0);
    CHECK(res.transferIds.size() == 2);
    waitAll(res);
    CHECK(remoteData(fs, "/dst/one.txt") == "1");
    CHECK(remoteData(fs, "/dst/two.txt") == "2");
}

TEST_CASE_FIXTURE(DropFixture, "collision policies") {
    fs->writeFile("/dst/a.txt", "server copy");
    const QStringList paths{ local("a.txt", "dropped"), local("b.txt", "b") };

    SUBCASE("skip") {
        policy(CollisionPolicy::Skip);
        DropPlan plan = planUpload(paths);
        CHECK(plan.collisions() == 1);
        CHECK(plan.files[0].collides);
        DropResult res = submit(plan);
        CHECK(res.skipped == 1);
        CHECK(res.transferIds.size() == 1);
        waitAll(res);
        CHECK(remoteData(fs, "/dst/a.txt") == "server copy");
        CHECK(remoteData(fs, "/dst/b.txt") == "b");
    }
    SUBCASE("overwrite") {
        policy(CollisionPolicy::Overwrite);
        DropPlan plan = planUpload(paths);
        DropResult res = submit(plan);
        CHECK(res.skipped == 0);
        waitAll(res);
        CHECK(remoteData(fs, "/dst/a.txt") == "dropped");
    }
    SUBCASE("rename") {
        policy(CollisionPolicy::AutoRename);
        DropPlan plan = planUpload(paths);
        drops.resolveCollisions(plan);
        CHECK(plan.files[0].dst == "/dst/a (1).txt");
        CHECK(plan.files[1].dst == "/dst/b.txt");
        DropResult res = submit(plan);
        waitAll(res);
        CHECK(remoteData(fs, "/dst/a.txt") == "server copy");
        CHECK(remoteData(fs, "/dst/a (1).txt") == "dropped");
    }
    SUBCASE("rename past taken names") {
        fs->writeFile("/dst/a (1).txt", "older copy");
        policy(CollisionPolicy::AutoRename);
        DropPlan plan = planUpload(paths);
        drops.resolveCollisions(plan);
        CHECK(plan.files[0].dst == "/dst/a (2).txt");
    }
    SUBCASE("ask without any prompt skips") {
        policy(CollisionPolicy::Ask);
        DropPlan plan = planUpload(paths);
        DropResult res = submit(plan);
        CHECK(res.skipped == 1);
    }
}

TEST_CASE_FIXTURE(DropFixture, "asking about collisions") {
    policy(CollisionPolicy::Ask);
    int fileAsks = 0, batchAsks = 0, batchCount = 0;
    drops.setFilePrompt([&](const PlannedTransfer&) {
        ++fileAsks;
        return CollisionPolicy::AutoRename;
    });
    drops.setBatchPrompt([&](const DropPlan&, int n) {
        ++batchAsks;
        batchCount = n;
        return CollisionPolicy::Overwrite;
    });

    SUBCASE("a few collisions are asked one by one") {
        fs->writeFile("/dst/x.txt", "old");
        fs->writeFile("/dst/y.txt", "old");
        DropPlan plan = planUpload({ local("x.txt", "x"), local("y.txt", "y") });
        drops.resolveCollisions(plan);
        drops.resolveCollisions(plan);
        CHECK(fileAsks == 2);
        CHECK(batchAsks == 0);
        CHECK(plan.files[0].dst == "/dst/x (1).txt");
        CHECK(plan.files[1].dst == "/dst/y (1).txt");
    }
    SUBCASE("many collisions are asked once") {
        QStringList paths;
        for (int i = 0; i < 4; ++i) {
            const QString name = QStringLiteral("f%1.txt").arg(i);
            fs->writeFile("/dst/" + name.toStdString(), "old");
            paths << local(name, "new");
        }
        DropPlan plan = planUpload(paths);
        DropResult res = submit(plan);
        CHECK(fileAsks == 0);
        CHECK(batchAsks == 1);
        CHECK(batchCount == 4);
        CHECK(res.transferIds.size() == 4);
        waitAll(res);
        CHECK(remoteData(fs, "/dst/f3.txt") == "new");
    }
}

TEST_CASE("auto-renamed names") {
    CHECK(DropIngest::autoRenamed("report.pdf", {}) == "report (1).pdf");
    CHECK(DropIngest::autoRenamed("report.pdf", { "report (1).pdf" }) == "report (2).pdf");
    CHECK(DropIngest::autoRenamed("Makefile", {}) == "Makefile (1)");
    CHECK(DropIngest::autoRenamed(".bashrc", {}) == ".bashrc (1)");
    CHECK(DropIngest::autoRenamed("archive.tar.gz", {}) == "archive.tar (1).gz");
}

TEST_CASE_FIXTURE(DropFixture, "dropping remote items onto a local directory") {
    fs->writeFile("/srv/r.txt", "remote");
    fs->writeFile("/srv/tree/one.txt", "1");
    fs->writeFile("/srv/tree/sub/two.txt", "22");
    const QString into = tmp.filePath("downloads");
    local("downloads/r.txt", "local already");
    policy(CollisionPolicy::AutoRename);

    DropPlan plan;
    Error err;
    REQUIRE(drops.planDownload("s1", { "/srv/r.txt", "/srv/tree", "/srv/missing" }, into, plan, err));
    CHECK(plan.unreadable == QStringList{ "/srv/missing" });
    REQUIRE(plan.files.size() == 3);
    CHECK(plan.files[0].collides);
    CHECK(plan.collisions() == 1);

    DropResult res = submit(plan);
    CHECK(res.jobId != 0);
    waitAll(res);
    CHECK(testsupport::readLocal(into + "/r.txt") == "local already");
    CHECK(testsupport::readLocal(into + "/r (1).txt") == "remote");
    CHECK(testsupport::readLocal(into + "/tree/one.txt") == "1");
    CHECK(testsupport::readLocal(into + "/tree/sub/two.txt") == "22");
}

TEST_CASE_FIXTURE(DropFixture, "planning problems") {
    SUBCASE("missing local items are reported") {
        DropPlan plan = planUpload({ tmp.filePath("nope.txt"), local("ok.txt", "ok") });
        CHECK(plan.unreadable == QStringList{ tmp.filePath("nope.txt") });
        CHECK(plan.files.size() == 1);
    }
    SUBCASE("a disconnected session cannot plan") {
        session->disconnect();
        DropPlan plan;
        Error err;
        CHECK_FALSE(drops.planUpload("s1", { local("ok.txt", "ok") }, "/dst", plan, err));
        CHECK(err.kind == ErrorKind::Disconnected);
        CHECK_FALSE(drops.planDownload("s1", { "/dst" }, tmp.path(), plan, err));
        CHECK(err.kind == ErrorKind::Disconnected);
    }
    SUBCASE("unknown session") {
        DropPlan plan;
        Error err;
        CHECK_FALSE(drops.planUpload("nobody", { local("ok.txt", "ok") }, "/dst", plan, err));
        CHECK(err.kind == ErrorKind::Disconnected);
    }
}
