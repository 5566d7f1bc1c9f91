#include "DropIngest.hpp"
#include "TransferQueue.hpp"
#include "remotebridge/Log.hpp"
#include "remotebridge/RemotePath.hpp"
#include "remotebridge/TransportSession.hpp"
#include <QDir>
#include <QFileInfo>
#include <algorithm>

using remotebridge::Error;
using remotebridge::ErrorKind;
using remotebridge::TransportSession;

QString collisionPolicyName(CollisionPolicy p) {
    switch (p) {
        case CollisionPolicy::Ask: return QStringLiteral("ask");
        case CollisionPolicy::Overwrite: return QStringLiteral("overwrite");
        case CollisionPolicy::Skip: return QStringLiteral("skip");
        case CollisionPolicy::AutoRename: return QStringLiteral("rename");
    }
    return QStringLiteral("ask");
}

CollisionPolicy collisionPolicyFromName(const QString& s) {
    if (s == QLatin1String("overwrite")) return CollisionPolicy::Overwrite;
    if (s == QLatin1String("skip")) return CollisionPolicy::Skip;
    if (s == QLatin1String("rename")) return CollisionPolicy::AutoRename;
    return CollisionPolicy::Ask;
}

int DropPlan::collisions() const {
    return (int)std::count_if(files.begin(), files.end(), [](const PlannedTransfer& f) { return f.collides; });
}

qint64 DropPlan::totalBytes() const {
    qint64 n = 0;
    for (const auto& f : files) {
        if (!f.skip && f.size > 0) n += f.size;
    }
    return n;
}

// Destination directory and file name, for either side.
static void splitDestination(const DropPlan& plan, const QString& dst, QString& dir, QString& name) {
    if (plan.direction == TransferRecord::Direction::Upload) {
        const std::string d = dst.toStdString();
        dir = QString::fromStdString(remotebridge::remoteParent(d));
        name = QString::fromStdString(remotebridge::remoteBaseName(d));
    } else {
        const QFileInfo fi(dst);
        dir = QDir::cleanPath(fi.absolutePath());
        name = fi.fileName();
    }
}

QString DropIngest::autoRenamed(const QString& name, const QSet<QString>& taken) {
    const int dot = name.lastIndexOf(QLatin1Char('.'));
    const QString stem = dot > 0 ? name.left(dot) : name;
    const QString ext = dot > 0 ? name.mid(dot) : QString();
    for (int n = 1;; ++n) {
        const QString candidate = QStringLiteral("%1 (%2)%3").arg(stem).arg(n).arg(ext);
        if (!taken.contains(candidate)) return candidate;
    }
}

DropIngest::DropIngest(TransferQueue* queue, Options opt) : queue_(queue), opt_(opt) {}

namespace {

// Remote side of an upload plan: each destination directory is listed at most once.
class RemoteNames {
public:
    RemoteNames(TransportSession& s, DropPlan& plan) : s_(s), plan_(plan) {}

    bool collides(const QString& dir, const QString& name, Error& err) {
        auto it = plan_.existing.find(dir);
        if (it == plan_.existing.end()) {
            QSet<QString> names;
            std::vector<remotebridge::FileInfo> entries;
            Error lerr;
            if (s_.list(dir.toStdString(), entries, lerr)) {
                for (const auto& e : entries) names.insert(QString::fromStdString(e.name));
            } else if (lerr.kind != ErrorKind::NotFound) {
                err = lerr;
                return false;
            }
            it = plan_.existing.insert(dir, names);
        }
        const bool hit = it->contains(name);
        it->insert(name);
        return hit;
    }

private:
    TransportSession& s_;
    DropPlan& plan_;
};

} // namespace

static bool expandLocal(const QFileInfo& fi, const QString& remoteTarget, DropPlan& plan, RemoteNames& names,
                        Error& err) {
    if (fi.isDir()) {
        plan.directories << remoteTarget;
        QDir d(fi.absoluteFilePath());
        const QFileInfoList children =
            d.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot, QDir::Name);
        for (const QFileInfo& c : children) {
            if (c.isSymLink() && c.isDir()) {
                LOGW("Drop: not following directory link %s", qPrintable(c.absoluteFilePath()));
                continue;
            }
            const QString target = QString::fromStdString(
                remotebridge::joinRemotePath(remoteTarget.toStdString(), c.fileName().toStdString()));
            if (!expandLocal(c, target, plan, names, err)) return false;
        }
        return true;
    }
    if (!fi.isFile()) {
        plan.unreadable << fi.absoluteFilePath();
        return true;
    }
    PlannedTransfer t;
    t.src = fi.absoluteFilePath();
    t.dst = remoteTarget;
    t.size = fi.size();
    QString dir, name;
    splitDestination(plan, remoteTarget, dir, name);
    if (!names.collides(dir, name, err)) {
        if (!err.empty()) return false;
    } else {
        t.collides = true;
    }
    plan.files.push_back(t);
    return true;
}

bool DropIngest::planUpload(const QString& sessionId, const QStringList& localPaths, const QString& remoteDir,
                            DropPlan& out, Error& err) {
    auto s = queue_->session(sessionId);
    if (!s || !s->isConnected()) {
        err.set(ErrorKind::Disconnected, "Session " + sessionId.toStdString() + " is not connected");
        return false;
    }
    DropPlan plan;
    plan.direction = TransferRecord::Direction::Upload;
    plan.sessionId = sessionId;
    plan.destinationDir = QString::fromStdString(remotebridge::normalizeRemotePath(remoteDir.toStdString()));
    RemoteNames names(*s, plan);

    for (const QString& p : localPaths) {
        const QFileInfo fi(p);
        if (!fi.exists()) {
            plan.unreadable << p;
            continue;
        }
        const QString target = QString::fromStdString(
            remotebridge::joinRemotePath(plan.destinationDir.toStdString(), fi.fileName().toStdString()));
        if (fi.isDir()) {
            plan.droppedDirectories << fi.absoluteFilePath();
            if (opt_.bulkSyncDirectories) {
                PlannedTransfer t;
                t.src = fi.absoluteFilePath();
                t.dst = target;
                t.directory = true;
                plan.files.push_back(t);
                continue;
            }
        }
        if (!expandLocal(fi, target, plan, names, err)) return false;
    }
    LOGI("Drop: %d files, %d directories onto %s:%s", (int)plan.files.size(), (int)plan.directories.size(),
         qPrintable(sessionId), qPrintable(plan.destinationDir));
    out = plan;
    return true;
}

namespace {

// Local side of a download plan.
class LocalNames {
public:
    explicit LocalNames(DropPlan& plan) : plan_(plan) {}

    bool collides(const QString& dir, const QString& name) {
        auto it = plan_.existing.find(dir);
        if (it == plan_.existing.end()) {
            QSet<QString> names;
            const QStringList present =
                QDir(dir).entryList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
            for (const QString& n : present) names.insert(n);
            it = plan_.existing.insert(dir, names);
        }
        const bool hit = it->contains(name);
        it->insert(name);
        return hit;
    }

private:
    DropPlan& plan_;
};

} // namespace

static bool expandRemote(TransportSession& s, const std::string& remote, const remotebridge::FileInfo& info,
                         const QString& localTarget, DropPlan& plan, LocalNames& names, Error& err) {
    if (info.is_dir) {
        plan.directories << localTarget;
        std::vector<remotebridge::FileInfo> entries;
        if (!s.list(remote, entries, err)) return false;
        std::sort(entries.begin(), entries.end(),
                  [](const remotebridge::FileInfo& a, const remotebridge::FileInfo& b) { return a.name < b.name; });
        for (const auto& c : entries) {
            if (c.name == "." || c.name == "..") continue;
            if (c.kind == remotebridge::EntryKind::Symlink && c.is_dir) continue;
            const QString target = QDir(localTarget).filePath(QString::fromStdString(c.name));
            if (!expandRemote(s, remotebridge::joinRemotePath(remote, c.name), c, target, plan, names, err))
                return false;
        }
        return true;
    }
    PlannedTransfer t;
    t.src = QString::fromStdString(remote);
    t.dst = localTarget;
    t.size = (qint64)info.size;
    QString dir, name;
    splitDestination(plan, localTarget, dir, name);
    t.collides = names.collides(dir, name);
    plan.files.push_back(t);
    return true;
}

bool DropIngest::planDownload(const QString& sessionId, const QStringList& remotePaths, const QString& localDir,
                              DropPlan& out, Error& err) {
    auto s = queue_->session(sessionId);
    if (!s || !s->isConnected()) {
        err.set(ErrorKind::Disconnected, "Session " + sessionId.toStdString() + " is not connected");
        return false;
    }
    DropPlan plan;
    plan.direction = TransferRecord::Direction::Download;
    plan.sessionId = sessionId;
    plan.destinationDir = QDir::cleanPath(QFileInfo(localDir).absoluteFilePath());
    LocalNames names(plan);

    for (const QString& p : remotePaths) {
        const std::string remote = remotebridge::normalizeRemotePath(p.toStdString());
        remotebridge::FileInfo info{};
        Error serr;
        if (!s->stat(remote, info, serr)) {
            if (serr.kind != ErrorKind::NotFound) {
                err = serr;
                return false;
            }
            plan.unreadable << QString::fromStdString(remote);
            continue;
        }
        const QString target =
            QDir(plan.destinationDir).filePath(QString::fromStdString(remotebridge::remoteBaseName(remote)));
        if (info.is_dir) {
            plan.droppedDirectories << QString::fromStdString(remote);
            if (opt_.bulkSyncDirectories) {
                PlannedTransfer t;
                t.src = QString::fromStdString(remote);
                t.dst = target;
                t.directory = true;
                plan.files.push_back(t);
                continue;
            }
        }
        if (!expandRemote(*s, remote, info, target, plan, names, err)) return false;
    }
    out = plan;
    return true;
}

void DropIngest::resolveCollisions(DropPlan& plan) {
    if (plan.resolved) return;
    plan.resolved = true;
    const int n = plan.collisions();
    if (!n) return;

    auto apply = [&plan](PlannedTransfer& f, CollisionPolicy p) {
        if (p == CollisionPolicy::Skip || p == CollisionPolicy::Ask) {
            f.skip = true;
        } else if (p == CollisionPolicy::AutoRename) {
            QString dir, name;
            splitDestination(plan, f.dst, dir, name);
            QSet<QString>& taken = plan.existing[dir];
            const QString renamed = autoRenamed(name, taken);
            taken.insert(renamed);
            if (plan.direction == TransferRecord::Direction::Upload)
                f.dst = QString::fromStdString(remotebridge::joinRemotePath(dir.toStdString(), renamed.toStdString()));
            else
                f.dst = QDir(dir).filePath(renamed);
        }
    };

    CollisionPolicy policy = opt_.policy;
    if (policy == CollisionPolicy::Ask && n <= opt_.smallBatchLimit && filePrompt_) {
        for (auto& f : plan.files) {
            if (f.collides) apply(f, filePrompt_(f));
        }
        return;
    }
    if (policy == CollisionPolicy::Ask) policy = batchPrompt_ ? batchPrompt_(plan, n) : CollisionPolicy::Skip;
    for (auto& f : plan.files) {
        if (f.collides) apply(f, policy);
    }
}

bool DropIngest::submit(DropPlan& plan, DropResult& out, Error& err) {
    resolveCollisions(plan);
    auto s = queue_->session(plan.sessionId);
    if (!s) {
        err.set(ErrorKind::Disconnected, "Unknown session " + plan.sessionId.toStdString());
        return false;
    }

    // Directories first, so empty ones exist even without any file inside.
    for (const QString& d : plan.directories) {
        if (plan.direction == TransferRecord::Direction::Upload) {
            if (!s->mkdirs(d.toStdString(), err)) return false;
        } else if (!QDir().mkpath(d)) {
            err.set(ErrorKind::LocalIo, "Cannot create local directory " + d.toStdString());
            return false;
        }
    }

    DropResult result;
    QVector<TransferRequest> leaves;
    for (const auto& f : plan.files) {
        if (f.skip) {
            ++result.skipped;
            continue;
        }
        TransferRequest req;
        req.direction = plan.direction;
        req.sessionId = plan.sessionId;
        req.src = f.src;
        req.dst = f.dst;
        req.bulkSync = f.directory;
        if (f.directory) result.transferIds.push_back(queue_->enqueue(req));
        else leaves.push_back(req);
    }

    if (plan.containsDirectory() && !leaves.isEmpty()) {
        TransferRequest job;
        job.direction = plan.direction;
        job.sessionId = plan.sessionId;
        job.src = plan.droppedDirectories.size() == 1 ? plan.droppedDirectories.first()
                                                      : plan.droppedDirectories.join(QStringLiteral(", "));
        job.dst = plan.destinationDir;
        result.jobId = queue_->enqueueDirectoryJob(job, leaves);
        for (const auto& c : queue_->children(result.jobId)) result.transferIds.push_back(c.id);
    } else {
        for (const auto& req : leaves) result.transferIds.push_back(queue_->enqueue(req));
    }
    LOGI("Drop: submitted %d transfers (%d skipped)", (int)result.transferIds.size(), result.skipped);
    out = result;
    return true;
}
