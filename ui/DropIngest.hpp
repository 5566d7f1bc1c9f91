// Turns a drop gesture (local paths onto a remote directory or the reverse)
// into transfer requests: directory expansion, collision policy, submission.
#pragma once
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>
#include <functional>
#include "TransferTypes.hpp"
#include "remotebridge/SftpError.hpp"

class TransferQueue;

enum class CollisionPolicy { Ask, Overwrite, Skip, AutoRename };

QString collisionPolicyName(CollisionPolicy p);
CollisionPolicy collisionPolicyFromName(const QString& s);

struct PlannedTransfer {
    QString src;
    QString dst;
    qint64 size = -1;
    bool collides = false;   // destination already exists
    bool skip = false;
    bool directory = false;  // whole directory through bulk sync
};

struct DropPlan {
    TransferRecord::Direction direction = TransferRecord::Direction::Upload;
    QString sessionId;
    QString destinationDir;
    QVector<PlannedTransfer> files;   // depth-first, sorted by name
    QStringList directories;          // destination directories to create, parents first
    QStringList droppedDirectories;   // top-level sources that are directories
    QStringList unreadable;           // sources that could not be expanded
    bool resolved = false;

    bool containsDirectory() const { return !droppedDirectories.isEmpty(); }
    int collisions() const;
    qint64 totalBytes() const;

    // Names present in each destination directory (listed once), plus names planned so far.
    QHash<QString, QSet<QString>> existing;
};

struct DropResult {
    quint64 jobId = 0;             // directory job, 0 for a plain file drop
    QVector<quint64> transferIds;  // leaf records (or bulk-sync records)
    int skipped = 0;
};

class DropIngest {
public:
    struct Options {
        CollisionPolicy policy = CollisionPolicy::Ask;
        int smallBatchLimit = 3;         // up to this many collisions are asked one by one
        bool bulkSyncDirectories = false;
    };
    // Answer once for the whole drop. Returning Ask counts as Skip.
    using BatchPrompt = std::function<CollisionPolicy(const DropPlan& plan, int collisions)>;
    using FilePrompt = std::function<CollisionPolicy(const PlannedTransfer& file)>;

    explicit DropIngest(TransferQueue* queue, Options opt = Options());

    void setOptions(const Options& o) { opt_ = o; }
    const Options& options() const { return opt_; }
    void setBatchPrompt(BatchPrompt p) { batchPrompt_ = std::move(p); }
    void setFilePrompt(FilePrompt p) { filePrompt_ = std::move(p); }

    bool planUpload(const QString& sessionId, const QStringList& localPaths, const QString& remoteDir,
                    DropPlan& out, remotebridge::Error& err);
    bool planDownload(const QString& sessionId, const QStringList& remotePaths, const QString& localDir,
                      DropPlan& out, remotebridge::Error& err);

    // Apply the policy (prompting as configured). Idempotent.
    void resolveCollisions(DropPlan& plan);
    bool submit(DropPlan& plan, DropResult& out, remotebridge::Error& err);

    // "name (n).ext" for the first n not in `taken`.
    static QString autoRenamed(const QString& name, const QSet<QString>& taken);

private:
    TransferQueue* queue_;
    Options opt_;
    BatchPrompt batchPrompt_;
    FilePrompt filePrompt_;
};
