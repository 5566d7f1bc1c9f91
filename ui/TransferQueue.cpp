// Scheduler implementation. Workers block on workCv_ and pull the oldest
// eligible record of their session; a record is eligible when it is Queued,
// its backoff expired and no other Running record targets the same destination.
#include "TransferQueue.hpp"
#include "RsyncTransport.hpp"
#include "remotebridge/Log.hpp"
#include "remotebridge/RemotePath.hpp"
#include "remotebridge/TransportSession.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <algorithm>

using remotebridge::Error;
using remotebridge::ErrorKind;
using remotebridge::TransportSession;
using Clock = std::chrono::steady_clock;

TransferQueue::TransferQueue(QObject* parent) : QObject(parent) {}

TransferQueue::~TransferQueue() {
    shutdown();
}

void TransferQueue::setOptions(const Options& o) {
    std::lock_guard<std::mutex> lk(mtx_);
    opt_ = o;
    if (opt_.workersPerSession < 1) opt_.workersPerSession = 1;
    if (opt_.maxAutoRetries < 0) opt_.maxAutoRetries = 0;
    if (opt_.retryBackoffMs < 0) opt_.retryBackoffMs = 0;
    if (opt_.progressIntervalMs < 0) opt_.progressIntervalMs = 0;
    progressIntervalMs_ = opt_.progressIntervalMs;
}

TransferQueue::Options TransferQueue::options() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return opt_;
}

void TransferQueue::setBulkSyncTransport(std::shared_ptr<RsyncTransport> t) {
    std::lock_guard<std::mutex> lk(mtx_);
    bulk_ = std::move(t);
}

std::string TransferQueue::destinationKey(const TransferRecord& r) const {
    if (r.direction == TransferRecord::Direction::Upload)
        return "r:" + r.sessionId.toStdString() + ":" + remotebridge::normalizeRemotePath(r.dst.toStdString());
    return "l:" + QDir::cleanPath(QFileInfo(r.dst).absoluteFilePath()).toStdString();
}

TransferQueue::EntryPtr TransferQueue::findLocked(quint64 id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
}

void TransferQueue::attachSession(const std::shared_ptr<TransportSession>& s) {
    const QString id = QString::fromStdString(s->id());
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = sessions_.find(id);
        if (it != sessions_.end()) {
            it->second.session = s;
        } else {
            SessionWorkers& sw = sessions_[id];
            sw.session = s;
            // Records queued while the session was detached keep their order.
            for (quint64 rid : order_) {
                EntryPtr e = findLocked(rid);
                std::lock_guard<std::mutex> elk(e->mtx);
                if (e->rec.sessionId == id && !e->rec.isDirectoryJob &&
                    e->rec.status == TransferRecord::Status::Queued)
                    sw.fifo.push_back(rid);
            }
            const int n = std::max(1, std::min<int>(opt_.workersPerSession, (int)s->maxConnections()));
            for (int i = 0; i < n; ++i) sw.threads.emplace_back(&TransferQueue::workerLoop, this, id);
            LOGI("Queue: session %s attached with %d workers", qPrintable(id), n);
        }
    }
    workCv_.notify_all();
}

void TransferQueue::detachSession(const QString& sessionId) {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return;
        it->second.stopping = true;
        threads.swap(it->second.threads);
    }
    workCv_.notify_all();
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        sessions_.erase(sessionId);
    }
    LOGI("Queue: session %s detached", qPrintable(sessionId));
}

std::shared_ptr<TransportSession> TransferQueue::session(const QString& sessionId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? nullptr : it->second.session;
}

quint64 TransferQueue::addLocked(const TransferRequest& req, quint64 parentId, bool directoryJob) {
    auto e = std::make_shared<Entry>();
    e->req = req;
    TransferRecord& r = e->rec;
    r.id = nextId_++;
    r.direction = req.direction;
    r.sessionId = req.sessionId;
    r.src = req.src;
    r.dst = req.dst;
    r.parentId = parentId;
    r.isDirectoryJob = directoryJob;
    r.bulkSync = req.bulkSync;
    r.retryCount = req.retryCount;
    r.created = r.updated = QDateTime::currentDateTimeUtc();
    entries_[r.id] = e;
    order_.push_back(r.id);
    if (!directoryJob) {
        auto it = sessions_.find(req.sessionId);
        if (it != sessions_.end()) it->second.fifo.push_back(r.id);
    }
    return r.id;
}

quint64 TransferQueue::enqueue(const TransferRequest& req) {
    quint64 id = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        id = addLocked(req, 0, false);
    }
    LOGI("Queue: #%llu %s %s -> %s", (unsigned long long)id, qPrintable(transferDirectionName(req.direction)),
         qPrintable(req.src), qPrintable(req.dst));
    emit transferChanged(id);
    emit transfersChanged();
    workCv_.notify_all();
    return id;
}

quint64 TransferQueue::enqueueDirectoryJob(const TransferRequest& job, const QVector<TransferRequest>& children) {
    quint64 pid = 0;
    std::vector<quint64> changed, finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        pid = addLocked(job, 0, true);
        EntryPtr p = findLocked(pid);
        for (const auto& c : children) {
            quint64 cid = addLocked(c, pid, false);
            std::lock_guard<std::mutex> plk(p->mtx);
            p->children.push_back(cid);
        }
        refreshParentLocked(pid, changed, finished);
    }
    LOGI("Queue: directory job #%llu with %d files", (unsigned long long)pid, (int)children.size());
    emitChanges(changed, finished);
    emit transfersChanged();
    workCv_.notify_all();
    return pid;
}

void TransferQueue::schedule() {
    workCv_.notify_all();
}

void TransferQueue::workerLoop(const QString& sessionId) {
    std::unique_lock<std::mutex> lk(mtx_);
    for (;;) {
        auto it = sessions_.find(sessionId);
        if (shuttingDown_ || it == sessions_.end() || it->second.stopping) return;
        SessionWorkers& sw = it->second;
        std::shared_ptr<TransportSession> session = sw.session;

        // Pending deletions of partial output from cancelled transfers.
        if (!sw.cleanups.empty() && session->isConnected()) {
            EntryPtr e = findLocked(sw.cleanups.front());
            sw.cleanups.pop_front();
            if (!e) continue;
            std::string key;
            quint64 ownGeneration = 0;
            {
                std::lock_guard<std::mutex> elk(e->mtx);
                key = destinationKey(e->rec);
                ownGeneration = e->writeGeneration;
            }
            if (busyDestinations_.count(key)) {
                sw.cleanups.push_back(e->rec.id);
                workCv_.wait_for(lk, std::chrono::milliseconds(100));
                continue;
            }
            if (destGeneration_[key] != ownGeneration) {
                // Another transfer has written there since; its output is not ours to delete.
                LOGI("Queue: keeping %s, replaced after #%llu stopped", key.c_str(),
                     (unsigned long long)e->rec.id);
                continue;
            }
            busyDestinations_.insert(key);
            lk.unlock();
            discardPartial(e, *session);
            lk.lock();
            busyDestinations_.erase(key);
            workCv_.notify_all();
            continue;
        }

        std::optional<Clock::time_point> wakeAt;
        EntryPtr e = pickNextLocked(sw, wakeAt);
        if (!e) {
            if (wakeAt) workCv_.wait_until(lk, *wakeAt);
            else workCv_.wait_for(lk, std::chrono::milliseconds(500)); // also polls session state
            continue;
        }
        lk.unlock();
        runTransfer(e, session);
        lk.lock();
    }
}

TransferQueue::EntryPtr TransferQueue::pickNextLocked(SessionWorkers& sw, std::optional<Clock::time_point>& wakeAt) {
    if (paused_.load() || !sw.session->isConnected()) return nullptr;
    const auto now = Clock::now();
    for (std::size_t i = 0; i < sw.fifo.size();) {
        EntryPtr e = findLocked(sw.fifo[i]);
        if (!e) {
            sw.fifo.erase(sw.fifo.begin() + (long)i);
            continue;
        }
        std::lock_guard<std::mutex> elk(e->mtx);
        if (e->rec.status != TransferRecord::Status::Queued) {
            // Stale: paused or cancelled while waiting
            sw.fifo.erase(sw.fifo.begin() + (long)i);
            continue;
        }
        if (e->notBefore > now) {
            if (!wakeAt || e->notBefore < *wakeAt) wakeAt = e->notBefore;
            ++i;
            continue;
        }
        const std::string key = destinationKey(e->rec);
        if (busyDestinations_.count(key)) {
            ++i;
            continue;
        }
        busyDestinations_.insert(key);
        quint64& gen = destGeneration_[key];
        // Partial data is only ours to continue if nobody used the destination in between.
        if (e->writeGeneration != gen) {
            e->wroteOutput = false;
            e->dstExisted.reset();
        }
        e->writeGeneration = ++gen;
        sw.fifo.erase(sw.fifo.begin() + (long)i);
        e->rec.status = TransferRecord::Status::Running;
        e->rec.attempts += 1;
        e->rec.updated = QDateTime::currentDateTimeUtc();
        if (!e->rec.started.isValid()) e->rec.started = e->rec.updated;
        e->pauseRequested = false;
        e->cancelRequested = false;
        return e;
    }
    return nullptr;
}

void TransferQueue::runTransfer(const EntryPtr& e, const std::shared_ptr<TransportSession>& s) {
    TransferRecord snapshot;
    bool resume = false;
    {
        std::lock_guard<std::mutex> elk(e->mtx);
        snapshot = e->rec;
        // A failed attempt that never wrote left the old destination in place: start over.
        resume = e->resumeHint && e->wroteOutput;
    }
    std::vector<quint64> changed, finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (snapshot.parentId) refreshParentLocked(snapshot.parentId, changed, finished);
    }
    emit transferStarted(snapshot.id);
    emit transferChanged(snapshot.id);
    emitChanges(changed, finished);

    Error err;
    bool ok = false;
    if (snapshot.bulkSync) ok = runBulkSync(e, *s, err);
    else if (snapshot.direction == TransferRecord::Direction::Upload) ok = runUpload(e, *s, resume, err);
    else ok = runDownload(e, *s, resume, err);
    finishAttempt(e, ok, err, *s);
}

void TransferQueue::throttle(const EntryPtr& e, quint64 done, quint64& lastDone, Clock::time_point& lastTick) {
    int taskLimit = 0;
    {
        std::lock_guard<std::mutex> elk(e->mtx);
        taskLimit = e->rec.speedLimitKBps;
    }
    const int globalLimit = globalSpeedKBps_.load();
    int effKBps = 0;
    if (taskLimit > 0 && globalLimit > 0) effKBps = std::min(taskLimit, globalLimit);
    else effKBps = taskLimit > 0 ? taskLimit : globalLimit;
    if (effKBps <= 0 || done <= lastDone) return;
    const auto now = Clock::now();
    const double expectedSec = double(done - lastDone) / (effKBps * 1024.0);
    const double elapsedSec = std::chrono::duration<double>(now - lastTick).count();
    if (elapsedSec < expectedSec) {
        const double sleepSec = expectedSec - elapsedSec;
        if (sleepSec > 0.0005) std::this_thread::sleep_for(std::chrono::duration<double>(sleepSec));
    }
    lastTick = Clock::now();
    lastDone = done;
}

void TransferQueue::onProgress(const EntryPtr& e, quint64 done, quint64 total) {
    bool emitNow = false;
    quint64 id = 0;
    qint64 totalOut = -1;
    {
        std::lock_guard<std::mutex> elk(e->mtx);
        e->rec.bytesTransferred = done;
        if (done > 0) e->wroteOutput = true;
        if (total > 0) e->rec.totalBytes = (qint64)total;
        const auto now = Clock::now();
        if (now - e->lastProgressEmit >= std::chrono::milliseconds(progressIntervalMs_.load()) ||
            (total > 0 && done >= total)) {
            e->lastProgressEmit = now;
            emitNow = true;
        }
        id = e->rec.id;
        totalOut = e->rec.totalBytes;
    }
    if (emitNow) emit transferProgress(id, done, totalOut);
}

bool TransferQueue::runUpload(const EntryPtr& e, TransportSession& s, bool resume, Error& err) {
    QString src, dst;
    {
        std::lock_guard<std::mutex> elk(e->mtx);
        src = e->rec.src;
        dst = e->rec.dst;
    }
    const std::string local = QFile::encodeName(src).toStdString();
    const std::string remote = dst.toStdString();

    QFileInfo lfi(src);
    if (!lfi.exists() || !lfi.isFile()) {
        err.set(ErrorKind::LocalIo, "Local file not found: " + local);
        return false;
    }
    {
        std::lock_guard<std::mutex> elk(e->mtx);
        e->rec.totalBytes = lfi.size();
    }

    remotebridge::FileInfo before{};
    Error serr;
    const bool remoteExists = s.stat(remote, before, serr);
    if (!remoteExists && serr.kind != ErrorKind::NotFound) {
        err = serr;
        return false;
    }

    bool checkPrecondition = false;
    {
        std::lock_guard<std::mutex> elk(e->mtx);
        if (!e->dstExisted) e->dstExisted = remoteExists;
        checkPrecondition = e->req.expectedRemote.has_value() && !e->preconditionPassed;
    }
    if (checkPrecondition) {
        const remotebridge::Fingerprint current = remoteExists ? remotebridge::Fingerprint::of(before)
                                                               : remotebridge::Fingerprint{};
        if (!e->req.expectedRemote->matches(current)) {
            err.set(ErrorKind::RemoteChangedSinceOpen, "Remote file changed since it was opened: " + remote);
            return false;
        }
        std::lock_guard<std::mutex> elk(e->mtx);
        e->preconditionPassed = true;
    }

    if (!remoteExists && !s.mkdirs(remotebridge::remoteParent(remote), err)) return false;

    quint64 lastDone = 0;
    auto lastTick = Clock::now();
    auto progress = [&](std::uint64_t done, std::uint64_t total) {
        onProgress(e, done, total);
        throttle(e, done, lastDone, lastTick);
    };
    auto shouldCancel = [this, e]() {
        return paused_.load() || e->cancelRequested.load() || e->pauseRequested.load();
    };
    if (!s.put(local, remote, err, progress, shouldCancel, resume && remoteExists)) return false;

    remotebridge::FileInfo after{};
    Error aerr;
    if (s.stat(remote, after, aerr)) {
        std::lock_guard<std::mutex> elk(e->mtx);
        e->rec.remoteFingerprint = remotebridge::Fingerprint::of(after);
    } else {
        LOGW("Queue: uploaded %s but could not stat it: %s", remote.c_str(), aerr.message.c_str());
    }
    return true;
}

bool TransferQueue::runDownload(const EntryPtr& e, TransportSession& s, bool resume, Error& err) {
    QString src, dst;
    {
        std::lock_guard<std::mutex> elk(e->mtx);
        src = e->rec.src;
        dst = e->rec.dst;
    }
    const std::string remote = src.toStdString();
    const std::string local = QFile::encodeName(dst).toStdString();

    remotebridge::FileInfo info{};
    if (!s.stat(remote, info, err)) return false;
    if (info.is_dir) {
        err.set(ErrorKind::Io, "Is a directory: " + remote);
        return false;
    }
    const bool localExists = QFileInfo::exists(dst);
    {
        std::lock_guard<std::mutex> elk(e->mtx);
        e->rec.totalBytes = (qint64)info.size;
        e->rec.remoteFingerprint = remotebridge::Fingerprint::of(info);
        if (!e->dstExisted) e->dstExisted = localExists;
    }
    if (!QDir().mkpath(QFileInfo(dst).absolutePath())) {
        err.set(ErrorKind::LocalIo, "Could not create local directory for " + local);
        return false;
    }

    quint64 lastDone = 0;
    auto lastTick = Clock::now();
    auto progress = [&](std::uint64_t done, std::uint64_t total) {
        onProgress(e, done, total);
        throttle(e, done, lastDone, lastTick);
    };
    auto shouldCancel = [this, e]() {
        return paused_.load() || e->cancelRequested.load() || e->pauseRequested.load();
    };
    return s.get(remote, local, err, progress, shouldCancel, resume && localExists);
}

bool TransferQueue::runBulkSync(const EntryPtr& e, TransportSession& s, Error& err) {
    std::shared_ptr<RsyncTransport> bulk;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        bulk = bulk_;
    }
    if (!bulk) {
        err.set(ErrorKind::Io, "Bulk sync is not available");
        return false;
    }
    TransferRecord snapshot;
    {
        std::lock_guard<std::mutex> elk(e->mtx);
        snapshot = e->rec;
    }
    // rsync creates the last component only.
    if (snapshot.direction == TransferRecord::Direction::Upload) {
        if (!s.mkdirs(snapshot.dst.toStdString(), err)) return false;
    } else if (!QDir().mkpath(snapshot.dst)) {
        err.set(ErrorKind::LocalIo, "Could not create local directory " + snapshot.dst.toStdString());
        return false;
    }
    auto progress = [&](quint64 done, qint64 total) {
        onProgress(e, done, total > 0 ? (quint64)total : 0);
    };
    auto shouldCancel = [this, e]() {
        return paused_.load() || e->cancelRequested.load() || e->pauseRequested.load();
    };
    return bulk->run(s.endpoint(), snapshot, progress, shouldCancel, err);
}

void TransferQueue::discardPartial(const EntryPtr& e, TransportSession& s) {
    TransferRecord r;
    bool existed = true;
    {
        std::lock_guard<std::mutex> elk(e->mtx);
        r = e->rec;
        existed = e->dstExisted.value_or(true);
    }
    // Data that was there before the transfer is never touched.
    if (existed || r.bulkSync) return;
    if (r.direction == TransferRecord::Direction::Upload) {
        Error derr;
        if (!s.removeFile(r.dst.toStdString(), derr) && derr.kind != ErrorKind::NotFound)
            LOGW("Queue: could not remove partial upload %s: %s", qPrintable(r.dst), derr.message.c_str());
    } else if (QFileInfo::exists(r.dst) && !QFile::remove(r.dst)) {
        LOGW("Queue: could not remove partial download %s", qPrintable(r.dst));
    }
}

void TransferQueue::finishAttempt(const EntryPtr& e, bool ok, const Error& err, TransportSession& s) {
    // Cancelled partial output goes while this record still owns the destination.
    if (!ok && err.kind == ErrorKind::Cancelled && e->cancelRequested.load()) discardPartial(e, s);

    std::vector<quint64> changed, finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        quint64 id = 0, parentId = 0;
        bool terminal = false;
        {
            std::lock_guard<std::mutex> elk(e->mtx);
            TransferRecord& r = e->rec;
            id = r.id;
            parentId = r.parentId;
            busyDestinations_.erase(destinationKey(r));
            r.updated = QDateTime::currentDateTimeUtc();
            if (ok) {
                r.status = TransferRecord::Status::Succeeded;
                if (r.totalBytes >= 0) r.bytesTransferred = (quint64)r.totalBytes;
                r.errorKind = ErrorKind::None;
                r.error.clear();
                e->resumeHint = false;
            } else if (err.kind == ErrorKind::Cancelled && e->cancelRequested.load()) {
                r.status = TransferRecord::Status::Cancelled;
                r.errorKind = ErrorKind::Cancelled;
                r.error = tr("Cancelled");
            } else if (err.kind == ErrorKind::Cancelled) {
                r.status = TransferRecord::Status::Paused;
                e->resumeHint = true;
            } else if (isAutoRetryable(err.kind) && e->autoRetries < opt_.maxAutoRetries) {
                e->autoRetries += 1;
                r.retryCount += 1;
                const long long delay = (long long)opt_.retryBackoffMs << (e->autoRetries - 1);
                e->notBefore = Clock::now() + std::chrono::milliseconds(delay);
                r.errorKind = err.kind;
                r.error = QString::fromStdString(err.describe());
                LOGW("Queue: #%llu failed (%s), retry %d in %lld ms", (unsigned long long)id,
                     err.message.c_str(), e->autoRetries, delay);
                requeueLocked(e, true);
            } else {
                r.status = TransferRecord::Status::Failed;
                r.errorKind = err.kind == ErrorKind::None ? ErrorKind::Io : err.kind;
                r.error = QString::fromStdString(err.describe());
                LOGE("Queue: #%llu failed (%s): %s", (unsigned long long)id, errorKindName(r.errorKind),
                     err.message.c_str());
            }
            terminal = r.isTerminal();
            if (terminal) r.finished = r.updated;
        }
        changed.push_back(id);
        if (terminal) finished.push_back(id);
        if (parentId) refreshParentLocked(parentId, changed, finished);
    }
    workCv_.notify_all();
    doneCv_.notify_all();
    emitChanges(changed, finished);
}

// Caller holds mtx_ and e->mtx.
void TransferQueue::requeueLocked(const EntryPtr& e, bool resumeHint) {
    e->rec.status = TransferRecord::Status::Queued;
    e->rec.updated = QDateTime::currentDateTimeUtc();
    e->rec.finished = QDateTime();
    e->resumeHint = resumeHint;
    e->cancelRequested = false;
    e->pauseRequested = false;
    auto it = sessions_.find(e->rec.sessionId);
    if (it != sessions_.end()) it->second.fifo.push_back(e->rec.id);
}

void TransferQueue::refreshParentLocked(quint64 parentId, std::vector<quint64>& changed,
                                        std::vector<quint64>& finished) {
    EntryPtr p = findLocked(parentId);
    if (!p) return;
    std::vector<quint64> kids;
    {
        std::lock_guard<std::mutex> plk(p->mtx);
        kids = p->children;
    }
    int succeeded = 0, failed = 0, cancelled = 0, running = 0, paused = 0;
    quint64 bytes = 0;
    qint64 totalBytes = 0;
    bool unknownSize = false;
    ErrorKind firstFailure = ErrorKind::None;
    QString firstError;
    QDateTime firstStart;
    for (quint64 cid : kids) {
        EntryPtr c = findLocked(cid);
        if (!c) continue;
        std::lock_guard<std::mutex> clk(c->mtx);
        switch (c->rec.status) {
            case TransferRecord::Status::Succeeded: ++succeeded; break;
            case TransferRecord::Status::Failed:
                if (!failed) {
                    firstFailure = c->rec.errorKind;
                    firstError = c->rec.error;
                }
                ++failed;
                break;
            case TransferRecord::Status::Cancelled: ++cancelled; break;
            case TransferRecord::Status::Running: ++running; break;
            case TransferRecord::Status::Paused: ++paused; break;
            case TransferRecord::Status::Queued: break;
        }
        bytes += c->rec.bytesTransferred;
        if (c->rec.started.isValid() && (!firstStart.isValid() || c->rec.started < firstStart))
            firstStart = c->rec.started;
        if (c->rec.totalBytes < 0) unknownSize = true;
        else totalBytes += c->rec.totalBytes;
    }

    const int total = (int)kids.size();
    const int done = succeeded + failed + cancelled;
    std::lock_guard<std::mutex> plk(p->mtx);
    TransferRecord& r = p->rec;
    const bool wasTerminal = r.isTerminal() && r.childCount == total &&
                             r.childSucceeded == succeeded && r.childFailed == failed;
    if (done == total) {
        if (failed) {
            r.status = TransferRecord::Status::Failed;
            r.errorKind = firstFailure;
            r.error = tr("%1 of %2 files failed (first: %3)").arg(failed).arg(total).arg(firstError);
        } else if (cancelled) {
            r.status = TransferRecord::Status::Cancelled;
            r.errorKind = ErrorKind::Cancelled;
            r.error = tr("%1 of %2 files cancelled").arg(cancelled).arg(total);
        } else {
            r.status = TransferRecord::Status::Succeeded;
            r.errorKind = ErrorKind::None;
            r.error.clear();
        }
    } else if (running > 0) {
        r.status = TransferRecord::Status::Running;
    } else if (paused > 0 && paused == total - done) {
        r.status = TransferRecord::Status::Paused;
    } else {
        r.status = done > 0 ? TransferRecord::Status::Running : TransferRecord::Status::Queued;
    }
    r.childCount = total;
    r.childSucceeded = succeeded;
    r.childFailed = failed;
    r.bytesTransferred = bytes;
    r.totalBytes = unknownSize ? -1 : totalBytes;
    r.updated = QDateTime::currentDateTimeUtc();
    if (!r.started.isValid() && firstStart.isValid()) r.started = firstStart;
    if (!r.isTerminal()) r.finished = QDateTime();
    else if (!wasTerminal || !r.finished.isValid()) r.finished = r.updated;
    changed.push_back(parentId);
    if (r.isTerminal() && !wasTerminal) finished.push_back(parentId);
}

void TransferQueue::emitChanges(const std::vector<quint64>& changed, const std::vector<quint64>& finished) {
    for (quint64 id : changed) emit transferChanged(id);
    for (quint64 id : finished) emit transferFinished(id);
}

// Caller holds mtx_.
bool TransferQueue::pauseLocked(const EntryPtr& e) {
    std::lock_guard<std::mutex> elk(e->mtx);
    if (e->rec.status == TransferRecord::Status::Queued) {
        e->rec.status = TransferRecord::Status::Paused;
        e->rec.updated = QDateTime::currentDateTimeUtc();
        e->resumeHint = true;
        return true;
    }
    if (e->rec.status == TransferRecord::Status::Running) {
        e->pauseRequested = true;
        return true;
    }
    return false;
}

bool TransferQueue::resumeLocked(const EntryPtr& e) {
    std::lock_guard<std::mutex> elk(e->mtx);
    if (e->rec.status == TransferRecord::Status::Running && e->pauseRequested.load()) {
        e->pauseRequested = false;
        return true;
    }
    if (e->rec.status != TransferRecord::Status::Paused) return false;
    requeueLocked(e, true);
    return true;
}

bool TransferQueue::cancelLocked(const EntryPtr& e, const QString& reason) {
    std::lock_guard<std::mutex> elk(e->mtx);
    TransferRecord& r = e->rec;
    if (r.isTerminal()) return false;
    if (r.status == TransferRecord::Status::Running) {
        e->cancelRequested = true;
        return true;
    }
    r.status = TransferRecord::Status::Cancelled;
    r.errorKind = ErrorKind::Cancelled;
    r.error = reason;
    r.updated = QDateTime::currentDateTimeUtc();
    r.finished = r.updated;
    // A paused or retried transfer may have left partial output behind.
    if (r.attempts > 0 && e->dstExisted.has_value() && !*e->dstExisted) {
        auto it = sessions_.find(r.sessionId);
        if (it != sessions_.end()) it->second.cleanups.push_back(r.id);
    }
    return true;
}

bool TransferQueue::retryLocked(const EntryPtr& e) {
    std::lock_guard<std::mutex> elk(e->mtx);
    if (e->rec.status != TransferRecord::Status::Failed && e->rec.status != TransferRecord::Status::Cancelled)
        return false;
    e->rec.retryCount += 1;
    e->rec.errorKind = ErrorKind::None;
    e->rec.error.clear();
    e->autoRetries = 0;
    e->notBefore = Clock::time_point{};
    requeueLocked(e, true);
    return true;
}

bool TransferQueue::pause(quint64 id) {
    bool ok = false;
    std::vector<quint64> changed, finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        EntryPtr e = findLocked(id);
        if (!e) return false;
        if (e->rec.isDirectoryJob) {
            for (quint64 cid : e->children) {
                if (EntryPtr c = findLocked(cid)) {
                    if (pauseLocked(c)) changed.push_back(cid);
                }
            }
            ok = !changed.empty();
            refreshParentLocked(id, changed, finished);
        } else {
            ok = pauseLocked(e);
            if (ok) changed.push_back(id);
            if (e->rec.parentId) refreshParentLocked(e->rec.parentId, changed, finished);
        }
    }
    emitChanges(changed, finished);
    doneCv_.notify_all();
    return ok;
}

bool TransferQueue::resume(quint64 id) {
    bool ok = false;
    std::vector<quint64> changed, finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        EntryPtr e = findLocked(id);
        if (!e) return false;
        if (e->rec.isDirectoryJob) {
            for (quint64 cid : e->children) {
                if (EntryPtr c = findLocked(cid)) {
                    if (resumeLocked(c)) changed.push_back(cid);
                }
            }
            ok = !changed.empty();
            refreshParentLocked(id, changed, finished);
        } else {
            ok = resumeLocked(e);
            if (ok) changed.push_back(id);
            if (e->rec.parentId) refreshParentLocked(e->rec.parentId, changed, finished);
        }
    }
    emitChanges(changed, finished);
    workCv_.notify_all();
    return ok;
}

bool TransferQueue::cancel(quint64 id) {
    bool ok = false;
    std::vector<quint64> changed, finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        EntryPtr e = findLocked(id);
        if (!e) return false;
        std::vector<EntryPtr> targets;
        if (e->rec.isDirectoryJob) {
            for (quint64 cid : e->children) {
                if (EntryPtr c = findLocked(cid)) targets.push_back(c);
            }
        } else {
            targets.push_back(e);
        }
        for (const auto& t : targets) {
            if (!cancelLocked(t, tr("Cancelled"))) continue;
            ok = true;
            std::lock_guard<std::mutex> tlk(t->mtx);
            changed.push_back(t->rec.id);
            if (t->rec.isTerminal()) finished.push_back(t->rec.id);
        }
        const quint64 parentId = e->rec.isDirectoryJob ? id : e->rec.parentId;
        if (parentId) refreshParentLocked(parentId, changed, finished);
    }
    emitChanges(changed, finished);
    workCv_.notify_all();
    doneCv_.notify_all();
    return ok;
}

bool TransferQueue::retry(quint64 id) {
    bool ok = false;
    std::vector<quint64> changed, finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        EntryPtr e = findLocked(id);
        if (!e) return false;
        if (e->rec.isDirectoryJob) {
            for (quint64 cid : e->children) {
                if (EntryPtr c = findLocked(cid)) {
                    if (retryLocked(c)) changed.push_back(cid);
                }
            }
            ok = !changed.empty();
            if (ok) {
                std::lock_guard<std::mutex> elk(e->mtx);
                e->rec.retryCount += 1;
            }
            refreshParentLocked(id, changed, finished);
        } else {
            ok = retryLocked(e);
            if (ok) changed.push_back(id);
            if (e->rec.parentId) refreshParentLocked(e->rec.parentId, changed, finished);
        }
    }
    emitChanges(changed, finished);
    workCv_.notify_all();
    return ok;
}

void TransferQueue::cancelAll() {
    std::vector<quint64> changed, finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<quint64> parents;
        for (quint64 id : order_) {
            EntryPtr e = findLocked(id);
            if (e->rec.isDirectoryJob) {
                parents.push_back(id);
                continue;
            }
            if (!cancelLocked(e, tr("Cancelled"))) continue;
            std::lock_guard<std::mutex> elk(e->mtx);
            changed.push_back(id);
            if (e->rec.isTerminal()) finished.push_back(id);
        }
        for (quint64 pid : parents) refreshParentLocked(pid, changed, finished);
    }
    emitChanges(changed, finished);
    workCv_.notify_all();
    doneCv_.notify_all();
}

void TransferQueue::cancelSession(const QString& sessionId, const QString& reason) {
    std::vector<quint64> changed, finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<quint64> parents;
        for (quint64 id : order_) {
            EntryPtr e = findLocked(id);
            if (e->rec.sessionId != sessionId) continue;
            if (e->rec.isDirectoryJob) {
                parents.push_back(id);
                continue;
            }
            if (!cancelLocked(e, reason)) continue;
            std::lock_guard<std::mutex> elk(e->mtx);
            changed.push_back(id);
            if (e->rec.isTerminal()) finished.push_back(id);
        }
        for (quint64 pid : parents) refreshParentLocked(pid, changed, finished);
    }
    emitChanges(changed, finished);
    workCv_.notify_all();
    doneCv_.notify_all();
}

void TransferQueue::setSpeedLimit(quint64 id, int kbps) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        EntryPtr e = findLocked(id);
        if (!e) return;
        std::lock_guard<std::mutex> elk(e->mtx);
        e->rec.speedLimitKBps = kbps;
    }
    emit transferChanged(id);
}

void TransferQueue::pauseAll() {
    paused_ = true;
    emit transfersChanged();
}

void TransferQueue::resumeAll() {
    paused_ = false;
    std::vector<quint64> changed, finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<quint64> parents;
        for (quint64 id : order_) {
            EntryPtr e = findLocked(id);
            if (e->rec.isDirectoryJob) {
                parents.push_back(id);
                continue;
            }
            if (resumeLocked(e)) changed.push_back(id);
        }
        for (quint64 pid : parents) refreshParentLocked(pid, changed, finished);
    }
    emitChanges(changed, finished);
    emit transfersChanged();
    workCv_.notify_all();
}

std::optional<TransferRecord> TransferQueue::record(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    EntryPtr e = findLocked(id);
    if (!e) return std::nullopt;
    std::lock_guard<std::mutex> elk(e->mtx);
    return e->rec;
}

QVector<TransferRecord> TransferQueue::records() const {
    std::lock_guard<std::mutex> lk(mtx_);
    QVector<TransferRecord> out;
    out.reserve((int)order_.size());
    for (quint64 id : order_) {
        EntryPtr e = findLocked(id);
        std::lock_guard<std::mutex> elk(e->mtx);
        out.push_back(e->rec);
    }
    return out;
}

QVector<TransferRecord> TransferQueue::children(quint64 parentId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    QVector<TransferRecord> out;
    EntryPtr p = findLocked(parentId);
    if (!p) return out;
    for (quint64 cid : p->children) {
        if (EntryPtr c = findLocked(cid)) {
            std::lock_guard<std::mutex> clk(c->mtx);
            out.push_back(c->rec);
        }
    }
    return out;
}

bool TransferQueue::waitForFinished(quint64 id, int timeoutMs) {
    std::unique_lock<std::mutex> lk(mtx_);
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
    return doneCv_.wait_until(lk, deadline, [&] {
        EntryPtr e = findLocked(id);
        if (!e) return true;
        std::lock_guard<std::mutex> elk(e->mtx);
        return e->rec.isTerminal() || e->rec.status == TransferRecord::Status::Paused;
    });
}

int TransferQueue::clearFinished(const QDateTime& olderThan) {
    int removed = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto removable = [&](const EntryPtr& e) {
            std::lock_guard<std::mutex> elk(e->mtx);
            if (!e->rec.isTerminal()) return false;
            return !olderThan.isValid() || e->rec.updated < olderThan;
        };
        std::unordered_set<quint64> drop;
        for (quint64 id : order_) {
            EntryPtr e = findLocked(id);
            if (e->rec.parentId) continue; // decided with the parent
            if (!removable(e)) continue;
            drop.insert(id);
            for (quint64 cid : e->children) drop.insert(cid);
        }
        std::vector<quint64> kept;
        for (quint64 id : order_) {
            if (drop.count(id)) entries_.erase(id);
            else kept.push_back(id);
        }
        removed = (int)drop.size();
        order_.swap(kept);
    }
    if (removed) emit transfersChanged();
    return removed;
}

void TransferQueue::reserveIds(quint64 maxUsedId) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (nextId_ <= maxUsedId) nextId_ = maxUsedId + 1;
}

void TransferQueue::shutdown() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (shuttingDown_) return;
        shuttingDown_ = true;
        // Running transfers stop at the next chunk and stay resumable.
        paused_ = true;
        for (auto& kv : sessions_) {
            kv.second.stopping = true;
            for (auto& t : kv.second.threads) threads.push_back(std::move(t));
            kv.second.threads.clear();
        }
    }
    workCv_.notify_all();
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    doneCv_.notify_all();
}
