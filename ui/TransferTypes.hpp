// Transfer records shared by the queue, the history store and the views.
#pragma once
#include <QDateTime>
#include <QString>
#include <optional>
#include "remotebridge/SftpError.hpp"
#include "remotebridge/SftpTypes.hpp"

// One upload or download (or a directory job aggregating several).
struct TransferRecord {
    enum class Direction { Upload, Download };
    // Lifecycle:
    //  - Queued: waiting for a worker, a free destination or a connected session
    //  - Running: owned by exactly one worker
    //  - Paused: stopped by the user; resumes from the partial data
    //  - Succeeded / Failed / Cancelled: terminal (Failed and Cancelled may be retried)
    enum class Status { Queued, Running, Paused, Succeeded, Failed, Cancelled };

    quint64 id = 0;
    Direction direction = Direction::Upload;
    QString sessionId;
    QString src;     // local for uploads, remote for downloads
    QString dst;     // remote for uploads, local for downloads
    quint64 parentId = 0;         // owning directory job, 0 if none
    bool isDirectoryJob = false;
    bool bulkSync = false;        // runs through rsync instead of SFTP

    qint64 totalBytes = -1;       // -1 while unknown
    quint64 bytesTransferred = 0;
    Status status = Status::Queued;
    remotebridge::ErrorKind errorKind = remotebridge::ErrorKind::None;
    QString error;
    int retryCount = 0;
    int attempts = 0;
    int speedLimitKBps = 0;       // 0 = unlimited
    QDateTime created;
    QDateTime updated;
    QDateTime started;    // first attempt began
    QDateTime finished;   // reached a terminal status

    // Directory jobs only
    int childCount = 0;
    int childSucceeded = 0;
    int childFailed = 0;

    // Remote version observed by the transfer: before a download, after an upload.
    remotebridge::Fingerprint remoteFingerprint;

    bool isTerminal() const {
        return status == Status::Succeeded || status == Status::Failed || status == Status::Cancelled;
    }
    bool isActive() const { return !isTerminal(); }
    bool retryable() const {
        return status == Status::Cancelled ||
               (status == Status::Failed && errorKind != remotebridge::ErrorKind::AuthFailure &&
                errorKind != remotebridge::ErrorKind::HostKeyMismatch);
    }
    int progressPercent() const {
        if (totalBytes <= 0) return status == Status::Succeeded ? 100 : 0;
        return int((bytesTransferred * 100) / quint64(totalBytes));
    }
    // Milliseconds from start to finish (or until `now` while still active); -1 if never started.
    qint64 durationMs(const QDateTime& now = QDateTime::currentDateTimeUtc()) const {
        if (!started.isValid()) return -1;
        return started.msecsTo(finished.isValid() ? finished : now);
    }
    // Average rate over durationMs(); 0 when unknown.
    double bytesPerSecond(const QDateTime& now = QDateTime::currentDateTimeUtc()) const {
        const qint64 ms = durationMs(now);
        if (ms <= 0) return 0.0;
        return double(bytesTransferred) * 1000.0 / double(ms);
    }
};

// What a caller asks for; the queue turns it into a TransferRecord.
struct TransferRequest {
    TransferRecord::Direction direction = TransferRecord::Direction::Upload;
    QString sessionId;
    QString src;
    QString dst;
    bool bulkSync = false;
    int retryCount = 0;   // carried over when re-enqueuing a record from history
    // Upload precondition: the remote file must still match this version.
    std::optional<remotebridge::Fingerprint> expectedRemote;
};

QString transferStatusName(TransferRecord::Status s);
// "1.5 MB/s", "512 B/s"; empty for 0
QString formatTransferSpeed(double bytesPerSecond);
// "42s", "3m 05s", "1h 02m"; empty for a negative duration
QString formatTransferDuration(qint64 ms);
bool transferStatusFromName(const QString& s, TransferRecord::Status& out);
QString transferDirectionName(TransferRecord::Direction d);
bool transferDirectionFromName(const QString& s, TransferRecord::Direction& out);
