// Connection pool and failure propagation for one SSH endpoint.
#include "remotebridge/TransportSession.hpp"
#include "remotebridge/RemotePath.hpp"
#include "remotebridge/Log.hpp"
#include <algorithm>

namespace remotebridge {

const char* sessionStateName(SessionState s) {
    switch (s) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting: return "connecting";
        case SessionState::Connected: return "connected";
        case SessionState::Failed: return "failed";
    }
    return "disconnected";
}

// Borrowed connection; returned to the pool on scope exit.
class TransportSession::Lease {
public:
    explicit Lease(TransportSession& s) : s_(s) {}
    ~Lease() {
        if (client_) s_.release(client_, generation_);
    }
    bool acquire(Error& err) {
        client_ = s_.acquire(generation_, err);
        return client_ != nullptr;
    }
    SftpClient& client() { return *client_; }
    std::uint64_t generation() const { return generation_; }

private:
    TransportSession& s_;
    std::shared_ptr<SftpClient> client_;
    std::uint64_t generation_ = 0;
};

TransportSession::TransportSession(std::string id, std::unique_ptr<SftpClient> factory,
                                   std::size_t maxConnections)
    : id_(std::move(id)), factory_(std::move(factory)), limit_(maxConnections ? maxConnections : 1) {}

TransportSession::~TransportSession() {
    setStateListener(nullptr);
    disconnect();
}

std::size_t TransportSession::maxConnections() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return limit_;
}

SessionState TransportSession::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

std::string TransportSession::failureReason() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reason_;
}

SessionOptions TransportSession::endpoint() const {
    std::lock_guard<std::mutex> lk(mtx_);
    SessionOptions o = opt_ ? *opt_ : SessionOptions{};
    o.password.reset();
    o.private_key_passphrase.reset();
    o.hostkey_confirm_cb = nullptr;
    o.keyboard_interactive_cb = nullptr;
    return o;
}

void TransportSession::setStateListener(StateListener cb) {
    std::lock_guard<std::mutex> lk(listenerMtx_);
    listener_ = std::move(cb);
}

void TransportSession::setOperationTimeout(int ms) {
    std::lock_guard<std::mutex> lk(mtx_);
    timeoutMs_ = ms;
    if (opt_) opt_->timeout_ms = ms;
}

void TransportSession::notify(SessionState s, const std::string& reason) {
    StateListener cb;
    {
        std::lock_guard<std::mutex> lk(listenerMtx_);
        cb = listener_;
    }
    if (cb) cb(s, reason);
}

bool TransportSession::connect(const SessionOptions& opt, Error& err) {
    SessionOptions effective = opt;
    std::vector<std::shared_ptr<SftpClient>> idle;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_ == SessionState::Connected) return true;
        if (state_ == SessionState::Connecting) {
            err.set(ErrorKind::Io, "Connection already in progress");
            return false;
        }
        teardownLocked(SessionState::Connecting, std::string(), idle);
        effective.timeout_ms = timeoutMs_;
    }
    for (auto& c : idle) c->disconnect();
    notify(SessionState::Connecting, std::string());

    Error cerr;
    std::unique_ptr<SftpClient> first = factory_->newConnectionLike(effective, cerr);
    if (!first) {
        if (cerr.empty()) cerr.set(ErrorKind::NetworkUnreachable, "Connection failed");
        {
            std::lock_guard<std::mutex> lk(mtx_);
            state_ = SessionState::Failed;
            reason_ = cerr.describe();
        }
        LOGE("Session %s: connect failed (%s): %s", id_.c_str(), errorKindName(cerr.kind), cerr.message.c_str());
        notify(SessionState::Failed, cerr.describe());
        err = cerr;
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        slots_.push_back(Slot{std::shared_ptr<SftpClient>(std::move(first)), false});
        opt_ = effective;
        state_ = SessionState::Connected;
        reason_.clear();
        broken_ = false;
    }
    LOGI("Session %s connected to %s:%u", id_.c_str(), effective.host.c_str(), (unsigned)effective.port);
    notify(SessionState::Connected, std::string());
    return true;
}

void TransportSession::teardownLocked(SessionState next, const std::string& reason,
                                      std::vector<std::shared_ptr<SftpClient>>& idle) {
    state_ = next;
    reason_ = reason;
    broken_ = true;
    ++generation_;
    // Busy clients are dropped by release(); their lease holds the last reference.
    for (auto& s : slots_) {
        if (!s.busy) idle.push_back(s.client);
    }
    slots_.clear();
    cv_.notify_all();
}

void TransportSession::disconnect() {
    std::vector<std::shared_ptr<SftpClient>> idle;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_ == SessionState::Disconnected && slots_.empty()) return;
        teardownLocked(SessionState::Disconnected, "Disconnected", idle);
    }
    for (auto& c : idle) c->disconnect();
    LOGI("Session %s disconnected", id_.c_str());
    notify(SessionState::Disconnected, "Disconnected");
}

void TransportSession::markFailed(std::uint64_t generation, const std::string& reason) {
    std::vector<std::shared_ptr<SftpClient>> idle;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (generation != generation_ || state_ != SessionState::Connected) return;
        teardownLocked(SessionState::Failed, reason, idle);
    }
    for (auto& c : idle) c->disconnect();
    LOGE("Session %s failed: %s", id_.c_str(), reason.c_str());
    notify(SessionState::Failed, reason);
}

std::shared_ptr<SftpClient> TransportSession::acquire(std::uint64_t& generation, Error& err) {
    std::unique_lock<std::mutex> lk(mtx_);
    for (;;) {
        if (state_ != SessionState::Connected) {
            err.set(ErrorKind::Disconnected, reason_.empty() ? std::string("Session not connected") : reason_);
            return nullptr;
        }
        for (auto& s : slots_) {
            if (!s.busy) {
                s.busy = true;
                generation = generation_;
                return s.client;
            }
        }
        if (slots_.size() + opening_ < limit_) {
            ++opening_;
            const SessionOptions opt = *opt_;
            const std::uint64_t gen = generation_;
            lk.unlock();
            Error cerr;
            std::unique_ptr<SftpClient> c = factory_->newConnectionLike(opt, cerr);
            lk.lock();
            --opening_;
            if (!c) {
                if (slots_.empty() && opening_ == 0) {
                    err = cerr;
                    return nullptr;
                }
                // Server refuses more channels: shrink the pool to what it allows.
                limit_ = std::max<std::size_t>(1, slots_.size() + opening_);
                LOGW("Session %s: extra connection refused (%s); pool limited to %zu",
                     id_.c_str(), cerr.message.c_str(), limit_);
                continue;
            }
            if (gen != generation_ || state_ != SessionState::Connected) {
                c->disconnect();
                continue;
            }
            slots_.push_back(Slot{std::shared_ptr<SftpClient>(std::move(c)), true});
            generation = generation_;
            return slots_.back().client;
        }
        cv_.wait(lk);
    }
}

void TransportSession::release(const std::shared_ptr<SftpClient>& client, std::uint64_t generation) {
    bool orphan = true;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (generation == generation_) {
            for (auto it = slots_.begin(); it != slots_.end(); ++it) {
                if (it->client == client) {
                    orphan = false;
                    if (client->isConnected()) it->busy = false;
                    else slots_.erase(it);
                    break;
                }
            }
        }
        cv_.notify_all();
    }
    if (orphan) client->disconnect();
}

SftpClient::CancelCB TransportSession::wrapCancel(SftpClient::CancelCB user) const {
    return [this, user]() { return broken_.load() || (user && user()); };
}

void TransportSession::translateAbort(Error& err, const SftpClient::CancelCB& user) const {
    if (err.kind != ErrorKind::Cancelled || !broken_.load()) return;
    if (user && user()) return;
    std::string why;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        why = reason_;
    }
    err.set(ErrorKind::Disconnected, why.empty() ? std::string("Session lost") : "Session lost: " + why);
}

template <typename Fn>
bool TransportSession::run(Error& err, Fn&& fn) {
    Lease lease(*this);
    if (!lease.acquire(err)) return false;
    const bool ok = fn(lease.client());
    if (!ok && err.kind == ErrorKind::Disconnected) markFailed(lease.generation(), err.describe());
    return ok;
}

bool TransportSession::list(const std::string& path, std::vector<FileInfo>& out, Error& err) {
    return run(err, [&](SftpClient& c) { return c.list(path, out, err); });
}

bool TransportSession::stat(const std::string& path, FileInfo& info, Error& err) {
    return run(err, [&](SftpClient& c) { return c.stat(path, info, err); });
}

bool TransportSession::exists(const std::string& path, bool& isDir, Error& err) {
    return run(err, [&](SftpClient& c) { return c.exists(path, isDir, err); });
}

bool TransportSession::get(const std::string& remote, const std::string& local, Error& err,
                           SftpClient::ProgressCB progress, SftpClient::CancelCB shouldCancel,
                           bool resume) {
    return run(err, [&](SftpClient& c) {
        bool ok = c.get(remote, local, err, progress, wrapCancel(shouldCancel), resume);
        if (!ok) translateAbort(err, shouldCancel);
        return ok;
    });
}

bool TransportSession::put(const std::string& local, const std::string& remote, Error& err,
                           SftpClient::ProgressCB progress, SftpClient::CancelCB shouldCancel,
                           bool resume) {
    return run(err, [&](SftpClient& c) {
        bool ok = c.put(local, remote, err, progress, wrapCancel(shouldCancel), resume);
        if (!ok) translateAbort(err, shouldCancel);
        return ok;
    });
}

bool TransportSession::mkdir(const std::string& dir, Error& err, unsigned int mode) {
    return run(err, [&](SftpClient& c) { return c.mkdir(dir, err, mode); });
}

bool TransportSession::mkdirs(const std::string& dir, Error& err) {
    return run(err, [&](SftpClient& c) {
        std::string cur;
        for (const auto& seg : splitRemotePath(normalizeRemotePath(dir))) {
            cur += "/" + seg;
            bool isDir = false;
            Error e;
            if (c.exists(cur, isDir, e)) {
                if (!isDir) {
                    err.set(ErrorKind::Io, cur + " exists and is not a directory");
                    return false;
                }
                continue;
            }
            if (!e.empty()) {
                err = e;
                return false;
            }
            if (!c.mkdir(cur, e, 0755)) {
                // Another worker may have created it in the meantime.
                Error e2;
                if (c.exists(cur, isDir, e2) && isDir) continue;
                err = e;
                return false;
            }
        }
        return true;
    });
}

bool TransportSession::removeFile(const std::string& path, Error& err) {
    return run(err, [&](SftpClient& c) { return c.removeFile(path, err); });
}

bool TransportSession::removeDir(const std::string& dir, Error& err) {
    return run(err, [&](SftpClient& c) { return c.removeDir(dir, err); });
}

bool TransportSession::rename(const std::string& from, const std::string& to, Error& err,
                              bool overwrite) {
    return run(err, [&](SftpClient& c) { return c.rename(from, to, err, overwrite); });
}

} // namespace remotebridge
