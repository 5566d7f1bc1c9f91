#include "TestSupport.hpp"

#include "BridgeEngine.hpp"
#include "ShadowStore.hpp"
#include "TransferHistory.hpp"
#include "TransferManager.hpp"
#include "TransferQueue.hpp"

using namespace remotebridge;
using testsupport::waitUntil;
using Status = TransferRecord::Status;

namespace {

class FixedCredentials : public CredentialProvider {
public:
    std::optional<std::string> getCredential(const SessionParams& params) override {
        ++asked;
        if (params.auth == AuthMethod::Agent) return std::nullopt;
        return secret;
    }
    std::string secret = "s3cret";
    int asked = 0;
};

struct EngineFixture {
    QTemporaryDir tmp;
    std::shared_ptr<MockRemoteFs> fs = MockRemoteFs::demo();
    std::unique_ptr<BridgeEngine> engine;
    QStringList states;

    EngineFixture() { engine = makeEngine(); }

    std::unique_ptr<BridgeEngine> makeEngine() {
        BridgeSettings s;
        s.shadowRoot = tmp.filePath("shadows");
        s.retryBackoffMs = 10;
        s.progressIntervalMs = 0;
        s.debounceMs = 50;
        s.flushTimeoutMs = 2000;
        auto e = std::make_unique<BridgeEngine>(s, tmp.filePath("history.json"));
        auto shared = fs;
        e->setClientFactory([shared]() { return std::make_unique<MockSftpClient>(shared); });
        QObject::connect(e.get(), &BridgeEngine::sessionStateChanged, e.get(),
                         [this](const QString&, const QString& st, const QString&) { states << st; });
        return e;
    }
    static SessionParams demoParams() {
        SessionParams p;
        p.id = "demo@mock";
        p.host = "mock";
        p.username = "demo";
        return p;
    }
    void connect() {
        Error err;
        REQUIRE_MESSAGE(engine->connectSession(demoParams(), err), err.describe());
    }
};

} // namespace

TEST_CASE_FIXTURE(EngineFixture, "connecting starts in the user's home") {
    connect();
    CHECK(engine->sessionIds() == QStringList{ "demo@mock" });
    auto* res = engine->resolver("demo@mock");
    REQUIRE(res != nullptr);
    CHECK(res->cwd() == "/home/demo");
    CHECK(engine->session("demo@mock")->isConnected());
    CHECK(engine->queue()->session("demo@mock") != nullptr);

    // Connecting again is a no-op.
    Error err;
    CHECK(engine->connectSession(demoParams(), err));
    CHECK(engine->sessionIds().size() == 1);
}

TEST_CASE_FIXTURE(EngineFixture, "browsing") {
    connect();
    std::vector<FileInfo> entries;
    Error err;
    REQUIRE(engine->listRemote("demo@mock", "", entries, err));
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].name == "projects");
    CHECK(entries[1].name == "notes.md");

    REQUIRE(engine->changeDirectory("demo@mock", "projects", err));
    CHECK(engine->resolver("demo@mock")->cwd() == "/home/demo/projects");
    REQUIRE(engine->changeDirectory("demo@mock", "../..", err));
    CHECK(engine->resolver("demo@mock")->cwd() == "/home");

    REQUIRE(engine->listRemote("demo@mock", "/", entries, err));
    CHECK(entries.size() == 4);

    CHECK_FALSE(engine->changeDirectory("demo@mock", "/readme.txt", err));
    CHECK(err.kind == ErrorKind::Io);
    CHECK_FALSE(engine->changeDirectory("demo@mock", "/nowhere", err));
    CHECK(err.kind == ErrorKind::NotFound);
    CHECK(engine->resolver("demo@mock")->cwd() == "/home");

    CHECK_FALSE(engine->listRemote("ghost", "/", entries, err));
    CHECK(err.kind == ErrorKind::NotFound);
    CHECK_FALSE(engine->changeDirectory("ghost", "/", err));
    CHECK(err.kind == ErrorKind::NotFound);
}

TEST_CASE_FIXTURE(EngineFixture, "session state is reported") {
    connect();
    REQUIRE(waitUntil([&] { return states.contains("connected"); }));
    engine->disconnectSession("demo@mock");
    REQUIRE(waitUntil([&] { return states.contains("disconnected"); }));
    CHECK_FALSE(engine->session("demo@mock")->isConnected());

    Error err;
    REQUIRE(engine->reconnectSession("demo@mock", err));
    CHECK(engine->session("demo@mock")->isConnected());
    CHECK_FALSE(engine->reconnectSession("ghost", err));
    CHECK(err.kind == ErrorKind::NotFound);
}

TEST_CASE_FIXTURE(EngineFixture, "password sessions take their secret from the provider") {
    fs->setRequiredPassword(std::string("s3cret"));
    SessionParams p = demoParams();
    p.auth = AuthMethod::Password;
    Error err;

    SUBCASE("no provider") {
        CHECK_FALSE(engine->connectSession(p, err));
        CHECK(err.kind == ErrorKind::AuthFailure);
    }
    SUBCASE("with provider") {
        FixedCredentials creds;
        engine->setCredentialProvider(&creds);
        REQUIRE(engine->connectSession(p, err));
        CHECK(creds.asked == 1);
        engine->shutdown();
    }
    SUBCASE("wrong secret") {
        FixedCredentials creds;
        creds.secret = "guess";
        engine->setCredentialProvider(&creds);
        CHECK_FALSE(engine->connectSession(p, err));
        CHECK(err.kind == ErrorKind::AuthFailure);
        engine->setCredentialProvider(nullptr);
    }
}

TEST_CASE_FIXTURE(EngineFixture, "a changed host key needs explicit trust") {
    fs->setHostKeyMismatch("SHA256:newkey");
    Error err;
    CHECK_FALSE(engine->connectSession(demoParams(), err));
    CHECK(err.kind == ErrorKind::HostKeyMismatch);
    CHECK_FALSE(engine->connectSession(demoParams(), err, std::string("SHA256:other")));
    CHECK(err.kind == ErrorKind::HostKeyMismatch);
    REQUIRE(engine->connectSession(demoParams(), err, std::string("SHA256:newkey")));
    CHECK(engine->session("demo@mock")->isConnected());
}

TEST_CASE_FIXTURE(EngineFixture, "transfers survive a dropped connection") {
    connect();
    const QString src = tmp.filePath("big.bin");
    const QByteArray data(400, 'z');
    REQUIRE(testsupport::writeLocal(src, data));
    fs->setChunkSize(4);
    fs->setChunkDelay(std::chrono::milliseconds(2));
    fs->dropConnectionsAfter(100);

    TransferRequest req;
    req.direction = TransferRecord::Direction::Upload;
    req.sessionId = "demo@mock";
    req.src = src;
    req.dst = "/home/demo/big.bin";
    const quint64 id = engine->queue()->enqueue(req);
    REQUIRE(engine->queue()->waitForFinished(id, 5000));
    CHECK(engine->queue()->record(id)->errorKind == ErrorKind::Disconnected);
    REQUIRE(waitUntil([&] { return states.contains("failed"); }));

    Error err;
    REQUIRE(engine->reconnectSession("demo@mock", err));
    CHECK(engine->manager()->retry(id) == id);
    REQUIRE(engine->queue()->waitForFinished(id, 10000));
    CHECK(engine->queue()->record(id)->status == Status::Succeeded);
    CHECK(testsupport::remoteData(fs, "/home/demo/big.bin") == data.toStdString());
}

TEST_CASE_FIXTURE(EngineFixture, "edits made while disconnected sync after reconnecting") {
    connect();
    QString local;
    Error err;
    REQUIRE(engine->shadows()->openForEdit("demo@mock", "/home/demo/notes.md", local, err));
    engine->disconnectSession("demo@mock");
    CHECK(engine->shadows()->entry(local)->status == ShadowEntry::Status::Orphaned);

    REQUIRE(testsupport::writeLocal(local, "# notes\nwritten offline\n"));
    REQUIRE(engine->reconnectSession("demo@mock", err));
    REQUIRE(waitUntil([&] { return engine->shadows()->entry(local)->status == ShadowEntry::Status::Clean; }));
    CHECK(testsupport::remoteData(fs, "/home/demo/notes.md") == "# notes\nwritten offline\n");
}

TEST_CASE_FIXTURE(EngineFixture, "history is written by the time the engine shuts down") {
    connect();
    const QString src = tmp.filePath("a.txt");
    REQUIRE(testsupport::writeLocal(src, "a"));
    TransferRequest req;
    req.direction = TransferRecord::Direction::Upload;
    req.sessionId = "demo@mock";
    req.src = src;
    req.dst = "/tmp/a.txt";
    const quint64 id = engine->queue()->enqueue(req);
    REQUIRE(engine->queue()->waitForFinished(id, 5000));
    const QString path = engine->history()->path();
    engine->shutdown();

    TransferHistory h(path);
    REQUIRE(h.load());
    auto r = h.find(id);
    REQUIRE(r.has_value());
    CHECK(r->status == Status::Succeeded);

    // A new engine continues the numbering.
    engine.reset();
    engine = makeEngine();
    connect();
    req.dst = "/tmp/b.txt";
    CHECK(engine->queue()->enqueue(req) > id);
}

TEST_CASE_FIXTURE(EngineFixture, "removing a session cancels its work") {
    connect();
    engine->queue()->pauseAll();
    const QString src = tmp.filePath("a.txt");
    REQUIRE(testsupport::writeLocal(src, "a"));
    TransferRequest req;
    req.direction = TransferRecord::Direction::Upload;
    req.sessionId = "demo@mock";
    req.src = src;
    req.dst = "/tmp/a.txt";
    const quint64 id = engine->queue()->enqueue(req);
    engine->removeSession("demo@mock");
    CHECK(engine->sessionIds().isEmpty());
    CHECK(engine->queue()->record(id)->status == Status::Cancelled);
    CHECK(engine->resolver("demo@mock") == nullptr);
}
