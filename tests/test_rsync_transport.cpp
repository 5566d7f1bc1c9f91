#include "TestSupport.hpp"

#include "RsyncTransport.hpp"
#include "TransferQueue.hpp"

using namespace remotebridge;

namespace {

SessionOptions endpoint() {
    SessionOptions ep;
    ep.host = "files.example.org";
    ep.port = 2222;
    ep.username = "alice";
    return ep;
}

TransferRecord bulkRecord(const QString& src, const QString& dst) {
    TransferRecord r;
    r.id = 1;
    r.direction = TransferRecord::Direction::Upload;
    r.src = src;
    r.dst = dst;
    r.bulkSync = true;
    return r;
}

} // namespace

TEST_CASE("rsync command line") {
    SUBCASE("upload of a directory") {
        const QStringList args = RsyncTransport::buildArguments(
            endpoint(), TransferRecord::Direction::Upload, "/home/me/site", "/var/www", true);
        REQUIRE(args.size() == 7);
        CHECK(args[0] == "-a");
        CHECK(args[1] == "--partial");
        CHECK(args[2] == "--info=progress2");
        CHECK(args[3] == "-e");
        CHECK(args[4] == "ssh -p 2222 -o StrictHostKeyChecking=yes -o BatchMode=yes");
        CHECK(args[5] == "/home/me/site/");
        CHECK(args[6] == "alice@files.example.org:/var/www");
    }
    SUBCASE("download with key and known hosts") {
        SessionOptions ep = endpoint();
        ep.private_key_path = std::string("/keys/id_ed25519");
        ep.known_hosts_path = std::string("/tmp/known_hosts");
        ep.known_hosts_policy = KnownHostsPolicy::AcceptNew;
        const QStringList args =
            RsyncTransport::buildArguments(ep, TransferRecord::Direction::Download, "/data/logs/", "/tmp/logs", true);
        CHECK(args[4] ==
              "ssh -p 2222 -i /keys/id_ed25519 -o UserKnownHostsFile=/tmp/known_hosts "
              "-o StrictHostKeyChecking=accept-new -o BatchMode=yes");
        CHECK(args[5] == "alice@files.example.org:/data/logs/");
        CHECK(args[6] == "/tmp/logs");
    }
    SUBCASE("paths with spaces and quotes stay one word") {
        SessionOptions ep = endpoint();
        ep.private_key_path = std::string("/home/me/My Keys/id_rsa");
        ep.known_hosts_path = std::string("/home/me/bob's hosts");
        const QStringList args =
            RsyncTransport::buildArguments(ep, TransferRecord::Direction::Upload, "/home/me/site", "/var/www", true);
        CHECK(args[4] ==
              "ssh -p 2222 -i '/home/me/My Keys/id_rsa' -o 'UserKnownHostsFile=/home/me/bob'\"'\"'s hosts' "
              "-o StrictHostKeyChecking=yes -o BatchMode=yes");
    }
    SUBCASE("single file keeps its name") {
        const QStringList args = RsyncTransport::buildArguments(
            endpoint(), TransferRecord::Direction::Upload, "/home/me/a.iso", "/isos/a.iso", false);
        CHECK(args[5] == "/home/me/a.iso");
    }
}

TEST_CASE("rsync progress lines") {
    quint64 bytes = 0;
    int percent = 0;
    REQUIRE(RsyncTransport::parseProgress("      1,234,567  45%    1.20MB/s    0:00:03 (xfr#2, to-chk=1/4)", bytes,
                                          percent));
    CHECK(bytes == 1234567);
    CHECK(percent == 45);
    REQUIRE(RsyncTransport::parseProgress("0 0%", bytes, percent));
    CHECK(bytes == 0);
    CHECK_FALSE(RsyncTransport::parseProgress("sending incremental file list", bytes, percent));
    CHECK_FALSE(RsyncTransport::parseProgress("", bytes, percent));
}

TEST_CASE("rsync failures map onto error kinds") {
    CHECK(RsyncTransport::classifyFailure(255, "Host key verification failed.") == ErrorKind::HostKeyMismatch);
    CHECK(RsyncTransport::classifyFailure(255, "alice@h: Permission denied (publickey,password).") ==
          ErrorKind::AuthFailure);
    CHECK(RsyncTransport::classifyFailure(23, "rsync: mkstemp \"/x\" failed: Permission denied (13)") ==
          ErrorKind::PermissionDenied);
    CHECK(RsyncTransport::classifyFailure(23, "rsync: change_dir \"/nope\" failed: No such file or directory (2)") ==
          ErrorKind::NotFound);
    CHECK(RsyncTransport::classifyFailure(255, "ssh: connect to host h port 22: Connection refused") ==
          ErrorKind::NetworkUnreachable);
    CHECK(RsyncTransport::classifyFailure(30, "") == ErrorKind::Timeout);
    CHECK(RsyncTransport::classifyFailure(255, "") == ErrorKind::Disconnected);
    CHECK(RsyncTransport::classifyFailure(1, "syntax or usage error") == ErrorKind::Io);
}

TEST_CASE("running the rsync child") {
    QTemporaryDir tmp;
    const TransferRecord rec = bulkRecord(tmp.path(), "/remote/dir");
    Error err;

    SUBCASE("success") {
        RsyncTransport t("true");
        CHECK(t.run(endpoint(), rec, {}, {}, err));
    }
    SUBCASE("non-zero exit") {
        RsyncTransport t("false");
        CHECK_FALSE(t.run(endpoint(), rec, {}, {}, err));
        CHECK(err.kind == ErrorKind::Io);
        CHECK(err.message.find("code 1") != std::string::npos);
    }
    SUBCASE("program that does not exist") {
        RsyncTransport t("remotebridge-no-such-rsync");
        CHECK_FALSE(t.run(endpoint(), rec, {}, {}, err));
        CHECK(err.kind == ErrorKind::Io);
    }
}

TEST_CASE("bulk sync records run through the queue") {
    QTemporaryDir tmp;
    REQUIRE(testsupport::writeLocal(tmp.filePath("site/index.html"), "<html/>"));
    auto fs = std::make_shared<MockRemoteFs>();
    auto session = testsupport::connectedSession(fs);
    TransferQueue queue;
    TransferQueue::Options o;
    o.maxAutoRetries = 0;
    queue.setOptions(o);
    queue.attachSession(session);

    TransferRequest req;
    req.direction = TransferRecord::Direction::Upload;
    req.sessionId = "s1";
    req.src = tmp.filePath("site");
    req.dst = "/var/www/site";
    req.bulkSync = true;

    SUBCASE("without an rsync transport") {
        const quint64 id = queue.enqueue(req);
        REQUIRE(queue.waitForFinished(id, 5000));
        CHECK(queue.record(id)->status == TransferRecord::Status::Failed);
    }
    SUBCASE("with one") {
        queue.setBulkSyncTransport(std::make_shared<RsyncTransport>("true"));
        const quint64 id = queue.enqueue(req);
        REQUIRE(queue.waitForFinished(id, 5000));
        CHECK(queue.record(id)->status == TransferRecord::Status::Succeeded);
        CHECK(queue.record(id)->bulkSync);
        // The destination directory is prepared before rsync runs.
        CHECK(fs->exists("/var/www/site"));
    }
    queue.shutdown();
}
