// Transfer queue and scheduler: per-session worker pools, per-destination
// mutual exclusion, retry with backoff, pause/resume/cancel and throttled progress.
#pragma once
#include <QObject>
#include <QString>
#include <QVector>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "TransferTypes.hpp"

namespace remotebridge { class TransportSession; }
class RsyncTransport;

class TransferQueue : public QObject {
    Q_OBJECT
public:
    struct Options {
        int workersPerSession = 3;
        int maxAutoRetries = 3;
        int retryBackoffMs = 1000;     // doubled on every further attempt
        int progressIntervalMs = 100;  // at most one transferProgress per interval per record
    };

    explicit TransferQueue(QObject* parent = nullptr);
    ~TransferQueue() override;

    void setOptions(const Options& o);
    Options options() const;
    // Global speed limit (KB/s). 0 = unlimited
    void setGlobalSpeedLimitKBps(int kbps) { globalSpeedKBps_.store(kbps); }
    int globalSpeedLimitKBps() const { return globalSpeedKBps_.load(); }
    void setBulkSyncTransport(std::shared_ptr<RsyncTransport> t);

    // Sessions: each attached session gets its own pool of workers.
    void attachSession(const std::shared_ptr<remotebridge::TransportSession>& s);
    // Stops the session's workers. Running transfers fail with Disconnected; queued ones stay.
    void detachSession(const QString& sessionId);
    std::shared_ptr<remotebridge::TransportSession> session(const QString& sessionId) const;
    // Cancel every non-terminal record of a session (used when the session is removed).
    void cancelSession(const QString& sessionId, const QString& reason);

    quint64 enqueue(const TransferRequest& req);
    // Parent record plus one child per file; children compete for workers like plain records.
    quint64 enqueueDirectoryJob(const TransferRequest& job, const QVector<TransferRequest>& children);

    // Per-record controls; on a directory job they apply to every child.
    bool pause(quint64 id);
    bool resume(quint64 id);
    bool cancel(quint64 id);
    bool retry(quint64 id);
    void cancelAll();
    void setSpeedLimit(quint64 id, int kbps);

    // Whole queue
    void pauseAll();
    void resumeAll();
    bool isPaused() const { return paused_.load(); }

    std::optional<TransferRecord> record(quint64 id) const;
    // Snapshot in enqueue order
    QVector<TransferRecord> records() const;
    QVector<TransferRecord> children(quint64 parentId) const;
    // Block until the record is terminal (or paused). Returns false on timeout.
    bool waitForFinished(quint64 id, int timeoutMs);
    // Drop terminal records last updated before `olderThan` (invalid = all). Returns the count.
    int clearFinished(const QDateTime& olderThan = QDateTime());
    // Make sure new ids never collide with persisted ones.
    void reserveIds(quint64 maxUsedId);

    void shutdown();

signals:
    void transferStarted(quint64 id);
    void transferChanged(quint64 id);
    void transferProgress(quint64 id, quint64 done, qint64 total);
    void transferFinished(quint64 id);
    // Emitted when records are added or removed (to refresh list views)
    void transfersChanged();

public slots:
    // Wake workers (new work, reconnected session, expired backoff).
    void schedule();

private:
    struct Entry {
        mutable std::mutex mtx;        // guards rec and the fields below
        TransferRecord rec;
        TransferRequest req;
        bool resumeHint = false;
        bool wroteOutput = false;                      // some bytes of ours are in the destination
        quint64 writeGeneration = 0;                   // destination generation of our last attempt
        std::optional<bool> dstExisted;                // captured on the first attempt
        std::chrono::steady_clock::time_point notBefore{};
        std::chrono::steady_clock::time_point lastProgressEmit{};
        int autoRetries = 0;
        bool preconditionPassed = false;               // upload precondition holds once writing began
        std::vector<quint64> children;                 // directory jobs only
        std::atomic<bool> cancelRequested{false};
        std::atomic<bool> pauseRequested{false};
    };
    struct SessionWorkers {
        std::shared_ptr<remotebridge::TransportSession> session;
        std::deque<quint64> fifo;
        std::deque<quint64> cleanups;                  // cancelled records whose partial output must go
        std::vector<std::thread> threads;
        bool stopping = false;
    };
    using EntryPtr = std::shared_ptr<Entry>;

    void workerLoop(const QString& sessionId);
    EntryPtr pickNextLocked(SessionWorkers& sw, std::optional<std::chrono::steady_clock::time_point>& wakeAt);
    void runTransfer(const EntryPtr& e, const std::shared_ptr<remotebridge::TransportSession>& s);
    bool runUpload(const EntryPtr& e, remotebridge::TransportSession& s, bool resume, remotebridge::Error& err);
    bool runDownload(const EntryPtr& e, remotebridge::TransportSession& s, bool resume, remotebridge::Error& err);
    bool runBulkSync(const EntryPtr& e, remotebridge::TransportSession& s, remotebridge::Error& err);
    void finishAttempt(const EntryPtr& e, bool ok, const remotebridge::Error& err,
                       remotebridge::TransportSession& s);
    void discardPartial(const EntryPtr& e, remotebridge::TransportSession& s);
    void onProgress(const EntryPtr& e, quint64 done, quint64 total);
    void throttle(const EntryPtr& e, quint64 done, quint64& lastDone,
                  std::chrono::steady_clock::time_point& lastTick);
    void refreshParentLocked(quint64 parentId, std::vector<quint64>& changed, std::vector<quint64>& finished);
    void requeueLocked(const EntryPtr& e, bool resumeHint);
    bool pauseLocked(const EntryPtr& e);
    bool resumeLocked(const EntryPtr& e);
    bool cancelLocked(const EntryPtr& e, const QString& reason);
    bool retryLocked(const EntryPtr& e);
    std::string destinationKey(const TransferRecord& r) const;
    EntryPtr findLocked(quint64 id) const;
    quint64 addLocked(const TransferRequest& req, quint64 parentId, bool directoryJob);
    void emitChanges(const std::vector<quint64>& changed, const std::vector<quint64>& finished);

    mutable std::mutex mtx_;   // protects entries_, order_, sessions_, busyDestinations_
    std::condition_variable workCv_;
    std::condition_variable doneCv_;
    std::unordered_map<quint64, EntryPtr> entries_;
    std::vector<quint64> order_;
    std::map<QString, SessionWorkers> sessions_;
    std::unordered_set<std::string> busyDestinations_;
    // Bumped whenever a record starts on (or cleans up) a destination.
    std::unordered_map<std::string, quint64> destGeneration_;
    Options opt_;
    std::shared_ptr<RsyncTransport> bulk_;
    std::atomic<bool> paused_{false};
    std::atomic<int> globalSpeedKBps_{0};
    std::atomic<int> progressIntervalMs_{100};
    bool shuttingDown_ = false;
    quint64 nextId_ = 1;
};
