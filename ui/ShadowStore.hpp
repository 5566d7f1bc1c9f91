// Local shadow copies of remote files opened for editing.
// Lives on the Qt thread. Local edits flow back as uploads guarded by the
// remote fingerprint recorded at open or last sync.
#pragma once
#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QString>
#include <QVector>
#include <optional>
#include "remotebridge/SftpError.hpp"
#include "remotebridge/SftpTypes.hpp"

class TransferQueue;
class FileWatchDispatcher;

struct ShadowEntry {
    // Editing: downloaded, not modified since. Clean: last local edit is on the server.
    enum class Status { Clean, Editing, UploadPending, Uploading, Conflict, Orphaned };

    QString localPath;
    QString sessionId;
    QString remotePath;
    remotebridge::Fingerprint remoteFingerprint;   // at open or last successful upload
    QString localHash;                              // SHA-256 of the content last synced
    Status status = Status::Editing;
    quint64 pendingTransfer = 0;                    // upload in the queue, 0 if none
    QString pendingHash;                            // content hash when that upload was enqueued
    quint64 failedTransfer = 0;                     // last failed upload (can be retried manually)
    bool dirtyDuringUpload = false;
    QString lastError;
    QDateTime openedAt;
};

QString shadowStatusName(ShadowEntry::Status s);

class ShadowStore : public QObject {
    Q_OBJECT
public:
    enum class Resolution { OverwriteRemote, Redownload, UploadAsCopy };
    enum class CloseResult { Closed, UnsavedChanges, NotFound };

    ShadowStore(TransferQueue* queue, FileWatchDispatcher* watcher, QString root, QObject* parent = nullptr);

    // <system temp>/remotebridge-shadows
    static QString defaultRoot();
    const QString& root() const { return root_; }
    QString indexPath() const;
    // Deterministic: <root>/<session>/<remote path>
    QString shadowPathFor(const QString& sessionId, const QString& remotePath) const;

    // Check the remote fingerprint before each auto-upload (on by default).
    void setConflictCheck(bool on) { conflictCheck_ = on; }
    bool conflictCheck() const { return conflictCheck_; }
    // Wait budget for the blocking downloads of openForEdit/resolveConflict.
    void setDownloadTimeout(int ms) { downloadTimeoutMs_ = ms; }

    // Entries that survived a crash come back as Orphaned.
    bool loadIndex(QString* err = nullptr);

    // Blocks until the download finished. Reopening returns the existing entry's path.
    bool openForEdit(const QString& sessionId, const QString& remotePath, QString& localPath,
                     remotebridge::Error& err);
    // Returns true when an upload was enqueued.
    bool notifyLocalChange(const QString& localPath);
    bool resolveConflict(const QString& localPath, Resolution r, remotebridge::Error& err);
    CloseResult close(const QString& localPath, int flushTimeoutMs, bool force = false);

    // Session went away: entries keep their files but stop syncing.
    void orphanSession(const QString& sessionId);
    // Session is back: orphans resume and unsynced edits are uploaded. Returns the count.
    int reattachSession(const QString& sessionId);
    // Flush and close everything; entries that could not be flushed stay on disk as Orphaned.
    void shutdown(int flushTimeoutMs);

    std::optional<ShadowEntry> entry(const QString& localPath) const;
    std::optional<ShadowEntry> entryFor(const QString& sessionId, const QString& remotePath) const;
    QVector<ShadowEntry> entries() const;

    static QString hashFile(const QString& path);

signals:
    void entryChanged(const QString& localPath);
    void conflictDetected(const QString& localPath, const QString& remotePath);

private slots:
    void onTransferStarted(quint64 id);
    void onTransferFinished(quint64 id);

private:
    ShadowEntry* findEntry(const QString& localPath);
    ShadowEntry* findByTransfer(quint64 id);
    void enqueueUpload(ShadowEntry& e, const QString& hash, bool withPrecondition);
    bool downloadInto(ShadowEntry& e, remotebridge::Error& err);
    bool uploadAndWait(const QString& sessionId, const QString& local, const QString& remote,
                       remotebridge::Error& err);
    void applyFinished(ShadowEntry& e, quint64 id);
    bool flush(ShadowEntry& e, int timeoutMs);
    void removeEntry(const QString& localPath);
    void setStatus(ShadowEntry& e, ShadowEntry::Status s);
    void saveIndex();

    TransferQueue* queue_;
    FileWatchDispatcher* watcher_;
    QString root_;
    QHash<QString, ShadowEntry> entries_;
    bool conflictCheck_ = true;
    int downloadTimeoutMs_ = 120000;
};
