// Mock implementation: an in-memory tree of nodes keyed by normalized path.
#include "remotebridge/MockSftpClient.hpp"
#include "remotebridge/RemotePath.hpp"
#include <algorithm>
#include <cstdio>
#include <thread>

namespace remotebridge {

namespace {

// Counts one in-flight operation against the shared filesystem.
class OpScope {
public:
    explicit OpScope(std::function<void()> end) : end_(std::move(end)) {}
    ~OpScope() { end_(); }
private:
    std::function<void()> end_;
};

} // namespace

MockRemoteFs::MockRemoteFs() {
    nodes_["/"].dir = true;
    nodes_["/"].mode = 0755;
}

std::shared_ptr<MockRemoteFs> MockRemoteFs::demo() {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/home/demo/projects");
    fs->addDir("/var/log");
    fs->writeFile("/readme.txt", "RemoteBridge mock server\n");
    fs->writeFile("/home/demo/notes.md", "# notes\n");
    fs->writeFile("/etc/app.conf", "port=8080\n");
    return fs;
}

std::uint64_t MockRemoteFs::tickLocked() {
    return ++clock_;
}

void MockRemoteFs::addDirLocked(const std::string& path) {
    std::string cur;
    for (const auto& seg : splitRemotePath(normalizeRemotePath(path))) {
        cur += "/" + seg;
        auto& n = nodes_[cur];
        if (!n.dir && n.data.empty() && n.mtime == 0) {
            n.dir = true;
            n.mode = 0755;
            n.mtime = tickLocked();
        }
    }
}

void MockRemoteFs::addDir(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    addDirLocked(path);
}

void MockRemoteFs::writeFile(const std::string& path, const std::string& data) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = normalizeRemotePath(path);
    addDirLocked(remoteParent(p));
    auto& n = nodes_[p];
    n.dir = false;
    n.data = data;
    n.mode = 0644;
    n.mtime = tickLocked();
}

bool MockRemoteFs::readFile(const std::string& path, std::string& out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalizeRemotePath(path));
    if (it == nodes_.end() || it->second.dir) return false;
    out = it->second.data;
    return true;
}

bool MockRemoteFs::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return nodes_.count(normalizeRemotePath(path)) > 0;
}

bool MockRemoteFs::statPath(const std::string& path, FileInfo& out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = normalizeRemotePath(path);
    auto it = nodes_.find(p);
    if (it == nodes_.end()) return false;
    out = FileInfo{};
    out.name = remoteBaseName(p);
    out.is_dir = it->second.dir;
    out.kind = it->second.dir ? EntryKind::Directory : EntryKind::File;
    out.size = it->second.dir ? 0 : it->second.data.size();
    out.mtime = it->second.mtime;
    out.mode = it->second.mode;
    return true;
}

void MockRemoteFs::remove(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = normalizeRemotePath(path);
    for (auto it = nodes_.begin(); it != nodes_.end();) {
        if (it->first == p || it->first.rfind(p + "/", 0) == 0) it = nodes_.erase(it);
        else ++it;
    }
}

void MockRemoteFs::failTransfers(const std::string& path, ErrorKind kind, int times) {
    std::lock_guard<std::mutex> lk(mtx_);
    failures_[normalizeRemotePath(path)] = Failure{kind, times};
}

void MockRemoteFs::clearFailures() {
    std::lock_guard<std::mutex> lk(mtx_);
    failures_.clear();
}

void MockRemoteFs::setConnectError(ErrorKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lk(mtx_);
    connectError_ = kind;
    connectMessage_ = message;
}

void MockRemoteFs::setRequiredPassword(const std::optional<std::string>& pw) {
    std::lock_guard<std::mutex> lk(mtx_);
    requiredPassword_ = pw;
}

void MockRemoteFs::setHostKeyMismatch(const std::string& presentedFingerprint) {
    std::lock_guard<std::mutex> lk(mtx_);
    mismatchFingerprint_ = presentedFingerprint;
}

void MockRemoteFs::setChunkSize(std::size_t bytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    chunkSize_ = bytes > 0 ? bytes : 1;
}

void MockRemoteFs::setChunkDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lk(mtx_);
    chunkDelay_ = delay;
}

void MockRemoteFs::dropConnectionsAfter(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    dropAfter_ = bytes;
    bytesSinceArm_ = 0;
}

void MockRemoteFs::dropConnections() {
    std::lock_guard<std::mutex> lk(mtx_);
    ++generation_;
}

int MockRemoteFs::maxConcurrentWrites(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = maxWrites_.find(normalizeRemotePath(path));
    return it == maxWrites_.end() ? 0 : it->second;
}

int MockRemoteFs::completedPuts(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = completedPuts_.find(normalizeRemotePath(path));
    return it == completedPuts_.end() ? 0 : it->second;
}

int MockRemoteFs::maxConcurrentOps() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return maxOps_;
}

int MockRemoteFs::connectCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connects_;
}

bool MockRemoteFs::takeFailure(const std::string& path, Error& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = failures_.find(normalizeRemotePath(path));
    if (it == failures_.end()) return false;
    ErrorKind kind = it->second.kind;
    if (it->second.remaining > 0 && --it->second.remaining == 0) failures_.erase(it);
    switch (kind) {
        case ErrorKind::PermissionDenied: err.set(kind, "Permission denied: " + path); break;
        case ErrorKind::NotFound: err.set(kind, "No such file: " + path); break;
        case ErrorKind::Timeout: err.set(kind, "Operation timed out"); break;
        case ErrorKind::Disconnected: err.set(kind, "Connection lost"); break;
        default: err.set(kind, std::string("Injected failure (") + errorKindName(kind) + ")"); break;
    }
    if (kind == ErrorKind::Disconnected) ++generation_;
    return true;
}

void MockRemoteFs::countBytes(std::uint64_t n) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (dropAfter_ == 0) return;
    bytesSinceArm_ += n;
    if (bytesSinceArm_ >= dropAfter_) {
        dropAfter_ = 0;
        ++generation_;
    }
}

std::uint64_t MockRemoteFs::generation() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return generation_;
}

void MockRemoteFs::beginOp() {
    std::lock_guard<std::mutex> lk(mtx_);
    ++activeOps_;
    maxOps_ = std::max(maxOps_, activeOps_);
}

void MockRemoteFs::endOp() {
    std::lock_guard<std::mutex> lk(mtx_);
    --activeOps_;
}

void MockRemoteFs::beginWrite(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    int& a = activeWrites_[path];
    ++a;
    int& m = maxWrites_[path];
    m = std::max(m, a);
}

void MockRemoteFs::endWrite(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    --activeWrites_[path];
}

MockSftpClient::MockSftpClient() : fs_(std::make_shared<MockRemoteFs>()) {}

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemoteFs> fs) : fs_(std::move(fs)) {}

bool MockSftpClient::connect(const SessionOptions& opt, Error& err) {
    if (opt.host.empty() || opt.username.empty()) {
        err.set(ErrorKind::Io, "Host and user are required");
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        if (fs_->connectError_ != ErrorKind::None) {
            err.set(fs_->connectError_, fs_->connectMessage_.empty()
                                            ? std::string("Connection refused by mock")
                                            : fs_->connectMessage_);
            return false;
        }
        if (!fs_->mismatchFingerprint_.empty() && opt.known_hosts_policy != KnownHostsPolicy::Off &&
            (!opt.trusted_fingerprint || *opt.trusted_fingerprint != fs_->mismatchFingerprint_)) {
            err.set(ErrorKind::HostKeyMismatch,
                    "Host key does not match known_hosts (presented " + fs_->mismatchFingerprint_ + ")");
            return false;
        }
        if (fs_->requiredPassword_ && (!opt.password || *opt.password != *fs_->requiredPassword_)) {
            err.set(ErrorKind::AuthFailure, "Authentication failed for " + opt.username);
            return false;
        }
        ++fs_->connects_;
        generation_ = fs_->generation_;
    }
    connected_ = true;
    return true;
}

std::unique_ptr<SftpClient> MockSftpClient::newConnectionLike(const SessionOptions& opt,
                                                              Error& err) {
    auto p = std::make_unique<MockSftpClient>(fs_);
    if (!p->connect(opt, err)) return nullptr;
    return p;
}

void MockSftpClient::disconnect() {
    connected_ = false;
}

bool MockSftpClient::isConnected() const {
    return connected_ && fs_->generation() == generation_;
}

bool MockSftpClient::checkAlive(Error& err) const {
    if (!connected_) {
        err.set(ErrorKind::Disconnected, "Not connected");
        return false;
    }
    if (fs_->generation() != generation_) {
        err.set(ErrorKind::Disconnected, "Connection lost");
        return false;
    }
    return true;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          Error& err) {
    if (!checkAlive(err)) return false;
    fs_->beginOp();
    OpScope scope([this] { fs_->endOp(); });

    const std::string path = normalizeRemotePath(remote_path.empty() ? "/" : remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, "Remote path not found: " + path);
        return false;
    }
    if (!it->second.dir) {
        err.set(ErrorKind::Io, "Not a directory: " + path);
        return false;
    }
    out.clear();
    const std::string prefix = path == "/" ? "/" : path + "/";
    for (auto c = fs_->nodes_.lower_bound(prefix); c != fs_->nodes_.end(); ++c) {
        if (c->first.rfind(prefix, 0) != 0) break;
        const std::string rest = c->first.substr(prefix.size());
        if (rest.empty() || rest.find('/') != std::string::npos) continue;
        FileInfo fi{};
        fi.name = rest;
        fi.is_dir = c->second.dir;
        fi.kind = c->second.dir ? EntryKind::Directory : EntryKind::File;
        fi.size = c->second.dir ? 0 : c->second.data.size();
        fi.mtime = c->second.mtime;
        fi.mode = c->second.mode;
        out.push_back(std::move(fi));
    }
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
        if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // directories first
        return a.name < b.name;
    });
    return true;
}

bool MockSftpClient::get(const std::string& remote,
                         const std::string& local,
                         Error& err,
                         ProgressCB progress,
                         CancelCB shouldCancel,
                         bool resume) {
    if (!checkAlive(err)) return false;
    fs_->beginOp();
    OpScope scope([this] { fs_->endOp(); });
    if (fs_->takeFailure(remote, err)) {
        if (err.kind == ErrorKind::Timeout) connected_ = false;
        return false;
    }

    std::string data;
    std::size_t chunk = 0;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        auto it = fs_->nodes_.find(normalizeRemotePath(remote));
        if (it == fs_->nodes_.end()) {
            err.set(ErrorKind::NotFound, "No such file: " + remote);
            return false;
        }
        if (it->second.dir) {
            err.set(ErrorKind::Io, "Is a directory: " + remote);
            return false;
        }
        data = it->second.data;
        chunk = fs_->chunkSize_;
        delay = fs_->chunkDelay_;
    }

    FILE* lf = nullptr;
    std::size_t offset = 0;
    if (resume) {
        lf = std::fopen(local.c_str(), "ab");
        if (lf) {
            long cur = std::ftell(lf);
            if (cur > 0 && (std::size_t)cur <= data.size()) offset = (std::size_t)cur;
        }
    }
    if (!lf) lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err.set(ErrorKind::LocalIo, "Could not open local file for writing: " + local);
        return false;
    }

    const std::uint64_t total = data.size();
    std::size_t done = offset;
    while (done < data.size()) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled");
            std::fclose(lf);
            return false;
        }
        if (!checkAlive(err)) {
            std::fclose(lf);
            return false;
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        const std::size_t n = std::min(chunk, data.size() - done);
        if (std::fwrite(data.data() + done, 1, n, lf) != n) {
            err.set(ErrorKind::LocalIo, "Local write failed: " + local);
            std::fclose(lf);
            return false;
        }
        done += n;
        fs_->countBytes(n);
        if (progress) progress(done, total);
    }
    std::fclose(lf);
    if (total == 0 && progress) progress(0, 0);
    return true;
}

bool MockSftpClient::put(const std::string& local,
                         const std::string& remote,
                         Error& err,
                         ProgressCB progress,
                         CancelCB shouldCancel,
                         bool resume) {
    if (!checkAlive(err)) return false;
    fs_->beginOp();
    OpScope scope([this] { fs_->endOp(); });
    const std::string path = normalizeRemotePath(remote);
    if (fs_->takeFailure(path, err)) {
        if (err.kind == ErrorKind::Timeout) connected_ = false;
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err.set(ErrorKind::LocalIo, "Could not open local file for reading: " + local);
        return false;
    }
    std::string data;
    char buf[64 * 1024];
    std::size_t r = 0;
    while ((r = std::fread(buf, 1, sizeof(buf), lf)) > 0) data.append(buf, r);
    const bool readFailed = std::ferror(lf) != 0;
    std::fclose(lf);
    if (readFailed) {
        err.set(ErrorKind::LocalIo, "Local read failed: " + local);
        return false;
    }

    std::size_t chunk = 0;
    std::chrono::milliseconds delay{0};
    std::size_t offset = 0;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        auto parent = fs_->nodes_.find(remoteParent(path));
        if (parent == fs_->nodes_.end() || !parent->second.dir) {
            err.set(ErrorKind::NotFound, "No such directory: " + remoteParent(path));
            return false;
        }
        auto existing = fs_->nodes_.find(path);
        if (existing != fs_->nodes_.end() && existing->second.dir) {
            err.set(ErrorKind::Io, "Is a directory: " + path);
            return false;
        }
        auto& n = fs_->nodes_[path];
        if (resume && n.data.size() < data.size()) offset = n.data.size();
        n.data.resize(offset);
        n.mtime = fs_->tickLocked();
        chunk = fs_->chunkSize_;
        delay = fs_->chunkDelay_;
    }

    fs_->beginWrite(path);
    OpScope writeScope([this, path] { fs_->endWrite(path); });

    const std::uint64_t total = data.size();
    std::size_t done = offset;
    while (done < data.size()) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled");
            return false;
        }
        if (!checkAlive(err)) return false;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        const std::size_t n = std::min(chunk, data.size() - done);
        {
            std::lock_guard<std::mutex> lk(fs_->mtx_);
            auto& node = fs_->nodes_[path];
            node.data.append(data, done, n);
            node.mtime = fs_->tickLocked();
        }
        done += n;
        fs_->countBytes(n);
        if (progress) progress(done, total);
    }
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        fs_->nodes_[path].mtime = fs_->tickLocked();
        ++fs_->completedPuts_[path];
    }
    if (total == 0 && progress) progress(0, 0);
    return true;
}

bool MockSftpClient::exists(const std::string& remote_path,
                            bool& isDir,
                            Error& err) {
    isDir = false;
    if (!checkAlive(err)) return false;
    FileInfo fi{};
    if (!fs_->statPath(remote_path, fi)) {
        err.clear();
        return false;
    }
    isDir = fi.is_dir;
    return true;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          Error& err) {
    if (!checkAlive(err)) return false;
    fs_->beginOp();
    OpScope scope([this] { fs_->endOp(); });
    if (!fs_->statPath(remote_path, info)) {
        err.set(ErrorKind::NotFound, "No such file: " + remote_path);
        return false;
    }
    return true;
}

bool MockSftpClient::mkdir(const std::string& remote_dir,
                           Error& err,
                           unsigned int mode) {
    if (!checkAlive(err)) return false;
    const std::string path = normalizeRemotePath(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto parent = fs_->nodes_.find(remoteParent(path));
    if (parent == fs_->nodes_.end() || !parent->second.dir) {
        err.set(ErrorKind::NotFound, "No such directory: " + remoteParent(path));
        return false;
    }
    if (fs_->nodes_.count(path)) {
        err.set(ErrorKind::Io, "File exists: " + path);
        return false;
    }
    auto& n = fs_->nodes_[path];
    n.dir = true;
    n.mode = mode;
    n.mtime = fs_->tickLocked();
    return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path,
                                Error& err) {
    if (!checkAlive(err)) return false;
    const std::string path = normalizeRemotePath(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, "No such file: " + path);
        return false;
    }
    if (it->second.dir) {
        err.set(ErrorKind::Io, "Is a directory: " + path);
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSftpClient::removeDir(const std::string& remote_dir,
                               Error& err) {
    if (!checkAlive(err)) return false;
    const std::string path = normalizeRemotePath(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, "No such directory: " + path);
        return false;
    }
    if (!it->second.dir) {
        err.set(ErrorKind::Io, "Not a directory: " + path);
        return false;
    }
    auto next = std::next(it);
    if (next != fs_->nodes_.end() && next->first.rfind(path + "/", 0) == 0) {
        err.set(ErrorKind::Io, "Directory not empty: " + path);
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSftpClient::rename(const std::string& from,
                            const std::string& to,
                            Error& err,
                            bool overwrite) {
    if (!checkAlive(err)) return false;
    const std::string src = normalizeRemotePath(from);
    const std::string dst = normalizeRemotePath(to);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (!fs_->nodes_.count(src)) {
        err.set(ErrorKind::NotFound, "No such file: " + src);
        return false;
    }
    if (fs_->nodes_.count(dst) && !overwrite) {
        err.set(ErrorKind::Io, "Destination exists: " + dst);
        return false;
    }
    std::map<std::string, MockRemoteFs::Node> moved;
    for (auto it = fs_->nodes_.begin(); it != fs_->nodes_.end();) {
        if (it->first == src || it->first.rfind(src + "/", 0) == 0) {
            moved[dst + it->first.substr(src.size())] = it->second;
            it = fs_->nodes_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& kv : moved) fs_->nodes_[kv.first] = kv.second;
    return true;
}

} // namespace remotebridge
