#include "TestSupport.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace remotebridge;
using testsupport::mockOptions;

namespace {

struct StateLog {
    std::mutex mtx;
    std::vector<SessionState> states;

    void attach(TransportSession& s) {
        s.setStateListener([this](SessionState st, const std::string&) {
            std::lock_guard<std::mutex> lk(mtx);
            states.push_back(st);
        });
    }
    bool saw(SessionState st) {
        std::lock_guard<std::mutex> lk(mtx);
        for (auto s : states) {
            if (s == st) return true;
        }
        return false;
    }
};

} // namespace

TEST_CASE("connect and list the demo tree") {
    auto fs = MockRemoteFs::demo();
    auto s = testsupport::connectedSession(fs);
    CHECK(s->isConnected());
    CHECK(s->state() == SessionState::Connected);

    std::vector<FileInfo> out;
    Error err;
    REQUIRE(s->list("/", out, err));
    REQUIRE(out.size() == 4);
    // Directories first, then by name
    CHECK(out[0].name == "etc");
    CHECK(out[1].name == "home");
    CHECK(out[2].name == "var");
    CHECK(out[3].name == "readme.txt");
    CHECK_FALSE(out[3].is_dir);

    FileInfo fi{};
    CHECK_FALSE(s->stat("/nope", fi, err));
    CHECK(err.kind == ErrorKind::NotFound);

    bool isDir = false;
    err.clear();
    CHECK(s->exists("/home/demo", isDir, err));
    CHECK(isDir);
    CHECK_FALSE(s->exists("/home/other", isDir, err));
    CHECK(err.empty());
}

TEST_CASE("connect failures are classified") {
    auto fs = std::make_shared<MockRemoteFs>();
    TransportSession s("s1", std::make_unique<MockSftpClient>(fs));
    StateLog log;
    log.attach(s);
    Error err;

    SUBCASE("authentication") {
        fs->setRequiredPassword(std::string("secret"));
        CHECK_FALSE(s.connect(mockOptions(), err));
        CHECK(err.kind == ErrorKind::AuthFailure);
        CHECK(s.state() == SessionState::Failed);
        CHECK(log.saw(SessionState::Failed));

        SessionOptions o = mockOptions();
        o.password = std::string("secret");
        err.clear();
        CHECK(s.connect(o, err));
        CHECK(s.isConnected());
        // Secrets never leave the session
        CHECK_FALSE(s.endpoint().password.has_value());
        CHECK(s.endpoint().host == "mock");
    }
    SUBCASE("host key mismatch needs an explicit trust") {
        fs->setHostKeyMismatch("SHA256:AB:CD");
        CHECK_FALSE(s.connect(mockOptions(), err));
        CHECK(err.kind == ErrorKind::HostKeyMismatch);

        SessionOptions o = mockOptions();
        o.trusted_fingerprint = std::string("SHA256:AB:CD");
        err.clear();
        CHECK(s.connect(o, err));
    }
    SUBCASE("unreachable") {
        fs->setConnectError(ErrorKind::NetworkUnreachable, "No route to host");
        CHECK_FALSE(s.connect(mockOptions(), err));
        CHECK(err.kind == ErrorKind::NetworkUnreachable);
        CHECK(s.failureReason() == "No route to host");
    }
}

TEST_CASE("the pool bounds concurrent operations") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->writeFile("/big.bin", std::string(200, 'x'));
    fs->setChunkSize(20);
    fs->setChunkDelay(std::chrono::milliseconds(5));
    auto s = testsupport::connectedSession(fs, "s1", 2);
    CHECK(s->maxConnections() == 2);

    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&, i]() {
            Error err;
            const std::string local = tmp.filePath(QStringLiteral("copy%1").arg(i)).toStdString();
            if (s->get("/big.bin", local, err)) ++ok;
        });
    }
    for (auto& t : threads) t.join();
    CHECK(ok.load() == 6);
    CHECK(fs->maxConcurrentOps() <= 2);
    CHECK(fs->connectCount() <= 2);
}

TEST_CASE("explicit disconnect aborts an in-flight transfer") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->writeFile("/big.bin", std::string(400, 'x'));
    fs->setChunkSize(4);
    fs->setChunkDelay(std::chrono::milliseconds(5));
    auto s = testsupport::connectedSession(fs);
    StateLog log;
    log.attach(*s);

    QTemporaryDir tmp;
    std::atomic<std::uint64_t> seen{0};
    Error err;
    bool ok = true;
    std::thread worker([&]() {
        ok = s->get("/big.bin", tmp.filePath("big.bin").toStdString(), err,
                    [&](std::uint64_t done, std::uint64_t) { seen = done; });
    });
    REQUIRE(testsupport::waitUntil([&] { return seen.load() > 0; }));
    s->disconnect();
    worker.join();

    CHECK_FALSE(ok);
    CHECK(err.kind == ErrorKind::Disconnected);
    CHECK(s->state() == SessionState::Disconnected);
    CHECK(log.saw(SessionState::Disconnected));

    std::vector<FileInfo> out;
    Error lerr;
    CHECK_FALSE(s->list("/", out, lerr));
    CHECK(lerr.kind == ErrorKind::Disconnected);
}

TEST_CASE("a dropped connection fails the session until reconnect") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->writeFile("/big.bin", std::string(400, 'x'));
    fs->setChunkSize(4);
    auto s = testsupport::connectedSession(fs);
    StateLog log;
    log.attach(*s);

    fs->dropConnectionsAfter(40);
    QTemporaryDir tmp;
    Error err;
    CHECK_FALSE(s->get("/big.bin", tmp.filePath("big.bin").toStdString(), err));
    CHECK(err.kind == ErrorKind::Disconnected);
    CHECK(s->state() == SessionState::Failed);
    CHECK(log.saw(SessionState::Failed));

    err.clear();
    REQUIRE(s->connect(mockOptions(), err));
    std::vector<FileInfo> out;
    CHECK(s->list("/", out, err));
    CHECK(s->get("/big.bin", tmp.filePath("big.bin").toStdString(), err));
}

TEST_CASE("a timed out connection is replaced, the session stays up") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->writeFile("/slow.txt", "late");
    auto s = testsupport::connectedSession(fs);
    StateLog log;
    log.attach(*s);
    const int before = fs->connectCount();

    fs->failTransfers("/slow.txt", ErrorKind::Timeout, 1);
    QTemporaryDir tmp;
    const std::string local = tmp.filePath("slow.txt").toStdString();
    Error err;
    CHECK_FALSE(s->get("/slow.txt", local, err));
    CHECK(err.kind == ErrorKind::Timeout);
    CHECK(s->state() == SessionState::Connected);
    CHECK_FALSE(log.saw(SessionState::Failed));

    err.clear();
    CHECK(s->get("/slow.txt", local, err));
    CHECK(fs->connectCount() == before + 1);
}

TEST_CASE("mkdirs creates every missing component") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->writeFile("/file", "x");
    auto s = testsupport::connectedSession(fs);
    Error err;
    CHECK(s->mkdirs("/a/b/c", err));
    CHECK(fs->exists("/a/b/c"));
    CHECK(s->mkdirs("/a/b/c", err));

    CHECK_FALSE(s->mkdirs("/file/sub", err));
    CHECK(err.kind == ErrorKind::Io);
}
