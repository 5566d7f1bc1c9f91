#include "ShadowStore.hpp"
#include "FileWatchDispatcher.hpp"
#include "TransferQueue.hpp"
#include "remotebridge/Log.hpp"
#include "remotebridge/RemotePath.hpp"
#include <QCryptographicHash>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSaveFile>

using remotebridge::Error;
using remotebridge::ErrorKind;

QString shadowStatusName(ShadowEntry::Status s) {
    switch (s) {
        case ShadowEntry::Status::Clean: return QStringLiteral("clean");
        case ShadowEntry::Status::Editing: return QStringLiteral("editing");
        case ShadowEntry::Status::UploadPending: return QStringLiteral("upload_pending");
        case ShadowEntry::Status::Uploading: return QStringLiteral("uploading");
        case ShadowEntry::Status::Conflict: return QStringLiteral("conflict");
        case ShadowEntry::Status::Orphaned: return QStringLiteral("orphaned");
    }
    return QStringLiteral("editing");
}

// "<stem>-copy<ext>" next to the original.
static QString copyPathFor(const QString& remotePath) {
    const std::string p = remotePath.toStdString();
    const QString parent = QString::fromStdString(remotebridge::remoteParent(p));
    const QString name = QString::fromStdString(remotebridge::remoteBaseName(p));
    const int dot = name.lastIndexOf(QLatin1Char('.'));
    const QString copy = dot > 0 ? name.left(dot) + QStringLiteral("-copy") + name.mid(dot)
                                 : name + QStringLiteral("-copy");
    return QString::fromStdString(remotebridge::joinRemotePath(parent.toStdString(), copy.toStdString()));
}

ShadowStore::ShadowStore(TransferQueue* queue, FileWatchDispatcher* watcher, QString root, QObject* parent)
    : QObject(parent), queue_(queue), watcher_(watcher),
      root_(QDir::cleanPath(QFileInfo(root.isEmpty() ? defaultRoot() : root).absoluteFilePath())) {
    connect(watcher_, &FileWatchDispatcher::changed, this, [this](const QString& p) { notifyLocalChange(p); });
    connect(queue_, &TransferQueue::transferStarted, this, &ShadowStore::onTransferStarted);
    connect(queue_, &TransferQueue::transferFinished, this, &ShadowStore::onTransferFinished);
}

QString ShadowStore::defaultRoot() {
    return QDir(QDir::tempPath()).filePath(QStringLiteral("remotebridge-shadows"));
}

QString ShadowStore::indexPath() const {
    return QDir(root_).filePath(QStringLiteral("shadow_index.json"));
}

QString ShadowStore::shadowPathFor(const QString& sessionId, const QString& remotePath) const {
    static const QRegularExpression unsafe(QStringLiteral("[^A-Za-z0-9._-]"));
    QString session = sessionId;
    session.replace(unsafe, QStringLiteral("_"));
    if (session.isEmpty() || session == QLatin1String(".") || session == QLatin1String(".."))
        session = QStringLiteral("_");
    const QString rel = QString::fromStdString(remotebridge::normalizeRemotePath(remotePath.toStdString())).mid(1);
    return QDir::cleanPath(root_ + QLatin1Char('/') + session + QLatin1Char('/') + rel);
}

QString ShadowStore::hashFile(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QString();
    QCryptographicHash h(QCryptographicHash::Sha256);
    if (!h.addData(&f)) return QString();
    return QString::fromLatin1(h.result().toHex());
}

ShadowEntry* ShadowStore::findEntry(const QString& localPath) {
    auto it = entries_.find(QDir::cleanPath(QFileInfo(localPath).absoluteFilePath()));
    return it == entries_.end() ? nullptr : &it.value();
}

ShadowEntry* ShadowStore::findByTransfer(quint64 id) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->pendingTransfer == id || it->failedTransfer == id) return &it.value();
    }
    return nullptr;
}

std::optional<ShadowEntry> ShadowStore::entry(const QString& localPath) const {
    auto it = entries_.find(QDir::cleanPath(QFileInfo(localPath).absoluteFilePath()));
    if (it == entries_.end()) return std::nullopt;
    return it.value();
}

std::optional<ShadowEntry> ShadowStore::entryFor(const QString& sessionId, const QString& remotePath) const {
    return entry(shadowPathFor(sessionId, remotePath));
}

QVector<ShadowEntry> ShadowStore::entries() const {
    QVector<ShadowEntry> out;
    for (const auto& e : entries_) out.push_back(e);
    return out;
}

void ShadowStore::setStatus(ShadowEntry& e, ShadowEntry::Status s) {
    if (e.status != s) {
        LOGI("Shadow: %s %s -> %s", qPrintable(e.remotePath), qPrintable(shadowStatusName(e.status)),
             qPrintable(shadowStatusName(s)));
    }
    e.status = s;
    saveIndex();
    emit entryChanged(e.localPath);
}

bool ShadowStore::openForEdit(const QString& sessionId, const QString& remotePath, QString& localPath,
                              Error& err) {
    const QString remote = QString::fromStdString(remotebridge::normalizeRemotePath(remotePath.toStdString()));
    const QString path = shadowPathFor(sessionId, remote);
    if (entries_.contains(path)) {
        localPath = path;
        return true;
    }
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        err.set(ErrorKind::LocalIo, "Cannot create shadow directory for " + path.toStdString());
        return false;
    }

    ShadowEntry e;
    e.localPath = path;
    e.sessionId = sessionId;
    e.remotePath = remote;
    e.openedAt = QDateTime::currentDateTimeUtc();
    const bool leftover = QFileInfo::exists(path);
    if (!downloadInto(e, err)) {
        if (!leftover) QFile::remove(path);
        return false;
    }
    e.status = ShadowEntry::Status::Editing;
    entries_.insert(path, e);
    if (!watcher_->watch(path)) LOGW("Shadow: %s is not watched, edits need a manual sync", qPrintable(path));
    saveIndex();
    LOGI("Shadow: opened %s:%s as %s", qPrintable(sessionId), qPrintable(remote), qPrintable(path));
    emit entryChanged(path);
    localPath = path;
    return true;
}

bool ShadowStore::downloadInto(ShadowEntry& e, Error& err) {
    TransferRequest req;
    req.direction = TransferRecord::Direction::Download;
    req.sessionId = e.sessionId;
    req.src = e.remotePath;
    req.dst = e.localPath;
    const quint64 id = queue_->enqueue(req);
    if (!queue_->waitForFinished(id, downloadTimeoutMs_)) {
        queue_->cancel(id);
        err.set(ErrorKind::Timeout, "Timed out downloading " + e.remotePath.toStdString());
        return false;
    }
    auto r = queue_->record(id);
    if (!r || r->status != TransferRecord::Status::Succeeded) {
        if (r && r->status == TransferRecord::Status::Paused) {
            queue_->cancel(id);
            err.set(ErrorKind::Cancelled, "Download of " + e.remotePath.toStdString() + " was paused");
        } else if (r) {
            err.set(r->errorKind == ErrorKind::None ? ErrorKind::Io : r->errorKind, r->error.toStdString());
        } else {
            err.set(ErrorKind::Io, "Download record disappeared");
        }
        return false;
    }
    e.remoteFingerprint = r->remoteFingerprint;
    e.localHash = hashFile(e.localPath);
    return true;
}

bool ShadowStore::uploadAndWait(const QString& sessionId, const QString& local, const QString& remote,
                                Error& err) {
    TransferRequest req;
    req.direction = TransferRecord::Direction::Upload;
    req.sessionId = sessionId;
    req.src = local;
    req.dst = remote;
    const quint64 id = queue_->enqueue(req);
    if (!queue_->waitForFinished(id, downloadTimeoutMs_)) {
        queue_->cancel(id);
        err.set(ErrorKind::Timeout, "Timed out uploading " + remote.toStdString());
        return false;
    }
    auto r = queue_->record(id);
    if (!r || r->status != TransferRecord::Status::Succeeded) {
        err.set(r && r->errorKind != ErrorKind::None ? r->errorKind : ErrorKind::Io,
                r ? r->error.toStdString() : std::string("Upload record disappeared"));
        return false;
    }
    return true;
}

void ShadowStore::enqueueUpload(ShadowEntry& e, const QString& hash, bool withPrecondition) {
    TransferRequest req;
    req.direction = TransferRecord::Direction::Upload;
    req.sessionId = e.sessionId;
    req.src = e.localPath;
    req.dst = e.remotePath;
    if (withPrecondition) req.expectedRemote = e.remoteFingerprint;
    e.pendingHash = hash;
    e.dirtyDuringUpload = false;
    e.lastError.clear();
    e.pendingTransfer = queue_->enqueue(req);
    setStatus(e, ShadowEntry::Status::UploadPending);
}

bool ShadowStore::notifyLocalChange(const QString& localPath) {
    ShadowEntry* e = findEntry(localPath);
    if (!e || !QFileInfo::exists(e->localPath)) return false;
    // Conflicts wait for the user; orphans are compared on reattach.
    if (e->status == ShadowEntry::Status::Conflict || e->status == ShadowEntry::Status::Orphaned) return false;
    if (e->pendingTransfer) {
        e->dirtyDuringUpload = true;
        return false;
    }
    const QString h = hashFile(e->localPath);
    if (h.isEmpty() || h == e->localHash) return false;
    enqueueUpload(*e, h, conflictCheck_);
    return true;
}

void ShadowStore::onTransferStarted(quint64 id) {
    ShadowEntry* e = findByTransfer(id);
    if (e && e->pendingTransfer == id && e->status == ShadowEntry::Status::UploadPending)
        setStatus(*e, ShadowEntry::Status::Uploading);
}

void ShadowStore::onTransferFinished(quint64 id) {
    if (ShadowEntry* e = findByTransfer(id)) applyFinished(*e, id);
}

void ShadowStore::applyFinished(ShadowEntry& e, quint64 id) {
    auto r = queue_->record(id);
    if (!r || !r->isTerminal()) return;
    const bool orphaned = e.status == ShadowEntry::Status::Orphaned;
    if (r->status == TransferRecord::Status::Succeeded) {
        if (r->remoteFingerprint.valid) e.remoteFingerprint = r->remoteFingerprint;
        e.localHash = e.pendingTransfer == id ? e.pendingHash : hashFile(e.localPath);
        e.pendingTransfer = 0;
        e.failedTransfer = 0;
        e.lastError.clear();
        if (e.dirtyDuringUpload && !orphaned) {
            e.dirtyDuringUpload = false;
            const QString h = hashFile(e.localPath);
            if (!h.isEmpty() && h != e.localHash) {
                enqueueUpload(e, h, conflictCheck_);
                return;
            }
        }
        setStatus(e, orphaned ? ShadowEntry::Status::Orphaned : ShadowEntry::Status::Clean);
        return;
    }
    if (e.pendingTransfer != id) return; // an older failure finishing again
    e.pendingTransfer = 0;
    e.dirtyDuringUpload = false;
    if (r->status == TransferRecord::Status::Cancelled) {
        setStatus(e, orphaned ? ShadowEntry::Status::Orphaned : ShadowEntry::Status::Editing);
        return;
    }
    e.failedTransfer = id;
    e.lastError = r->error;
    if (r->errorKind == ErrorKind::RemoteChangedSinceOpen) {
        LOGW("Shadow: %s changed on the server, auto-upload suspended", qPrintable(e.remotePath));
        setStatus(e, ShadowEntry::Status::Conflict);
        emit conflictDetected(e.localPath, e.remotePath);
        return;
    }
    LOGW("Shadow: upload of %s failed: %s", qPrintable(e.remotePath), qPrintable(r->error));
    setStatus(e, orphaned ? ShadowEntry::Status::Orphaned : ShadowEntry::Status::Editing);
}

bool ShadowStore::resolveConflict(const QString& localPath, Resolution r, Error& err) {
    ShadowEntry* e = findEntry(localPath);
    if (!e) {
        err.set(ErrorKind::NotFound, "No shadow entry for " + localPath.toStdString());
        return false;
    }
    if (e->status != ShadowEntry::Status::Conflict) {
        err.set(ErrorKind::Io, "No conflict to resolve for " + localPath.toStdString());
        return false;
    }
    switch (r) {
        case Resolution::OverwriteRemote:
            enqueueUpload(*e, hashFile(e->localPath), false);
            return true;
        case Resolution::UploadAsCopy: {
            const QString copy = copyPathFor(e->remotePath);
            if (!uploadAndWait(e->sessionId, e->localPath, copy, err)) return false;
            LOGI("Shadow: local edit of %s saved as %s", qPrintable(e->remotePath), qPrintable(copy));
            break; // then take the server version
        }
        case Resolution::Redownload:
            break;
    }
    if (!downloadInto(*e, err)) return false;
    e->failedTransfer = 0;
    e->lastError.clear();
    setStatus(*e, ShadowEntry::Status::Editing);
    return true;
}

bool ShadowStore::flush(ShadowEntry& e, int timeoutMs) {
    QElapsedTimer clock;
    clock.start();
    // A follow-up upload may be queued when edits arrived during the previous one.
    for (int round = 0; round < 3; ++round) {
        if (e.status == ShadowEntry::Status::Conflict || e.status == ShadowEntry::Status::Orphaned) break;
        if (!e.pendingTransfer) {
            const QString h = hashFile(e.localPath);
            if (h.isEmpty() || h == e.localHash) break;
            enqueueUpload(e, h, conflictCheck_);
        }
        const quint64 id = e.pendingTransfer;
        const qint64 left = timeoutMs - clock.elapsed();
        if (left <= 0 || !queue_->waitForFinished(id, int(left))) break;
        applyFinished(e, id);
        if (e.pendingTransfer == id || e.failedTransfer == id) break;
    }
    if (e.pendingTransfer) return false;
    return !QFileInfo::exists(e.localPath) || hashFile(e.localPath) == e.localHash;
}

ShadowStore::CloseResult ShadowStore::close(const QString& localPath, int flushTimeoutMs, bool force) {
    ShadowEntry* e = findEntry(localPath);
    if (!e) return CloseResult::NotFound;
    if (!flush(*e, flushTimeoutMs)) {
        if (!force) {
            e->lastError = tr("Unsaved changes");
            emit entryChanged(e->localPath);
            return CloseResult::UnsavedChanges;
        }
        LOGW("Shadow: closing %s with unsynced changes", qPrintable(e->localPath));
        if (e->pendingTransfer) queue_->cancel(e->pendingTransfer);
    }
    removeEntry(e->localPath);
    return CloseResult::Closed;
}

void ShadowStore::removeEntry(const QString& localPath) {
    const QString path = localPath;
    watcher_->unwatch(path);
    if (QFileInfo::exists(path) && !QFile::remove(path)) LOGW("Shadow: could not delete %s", qPrintable(path));
    // Prune now-empty directories up to the root.
    QDir dir = QFileInfo(path).absoluteDir();
    while (QDir::cleanPath(dir.absolutePath()).startsWith(root_ + QLatin1Char('/'))) {
        const QString here = dir.absolutePath();
        if (!dir.cdUp() || !dir.rmdir(QFileInfo(here).fileName())) break;
    }
    entries_.remove(path);
    saveIndex();
    emit entryChanged(path);
}

void ShadowStore::orphanSession(const QString& sessionId) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->sessionId == sessionId && it->status != ShadowEntry::Status::Orphaned)
            setStatus(it.value(), ShadowEntry::Status::Orphaned);
    }
}

int ShadowStore::reattachSession(const QString& sessionId) {
    int n = 0;
    const QStringList keys = entries_.keys();
    for (const QString& key : keys) {
        ShadowEntry* e = findEntry(key);
        if (!e || e->sessionId != sessionId || e->status != ShadowEntry::Status::Orphaned) continue;
        ++n;
        if (e->pendingTransfer) {
            auto r = queue_->record(e->pendingTransfer);
            if (r && !r->isTerminal()) {
                setStatus(*e, ShadowEntry::Status::UploadPending);
                continue;
            }
            e->pendingTransfer = 0;
        }
        watcher_->watch(e->localPath);
        const QString h = hashFile(e->localPath);
        if (!h.isEmpty() && h != e->localHash) {
            e->status = ShadowEntry::Status::Editing;
            enqueueUpload(*e, h, conflictCheck_);
        } else {
            setStatus(*e, ShadowEntry::Status::Editing);
        }
    }
    if (n) LOGI("Shadow: %d entries reattached to %s", n, qPrintable(sessionId));
    return n;
}

void ShadowStore::shutdown(int flushTimeoutMs) {
    const QStringList keys = entries_.keys();
    for (const QString& key : keys) {
        ShadowEntry* e = findEntry(key);
        if (!e) continue;
        if (flush(*e, flushTimeoutMs)) {
            removeEntry(key);
            continue;
        }
        // Kept for the next start.
        LOGW("Shadow: %s could not be flushed, kept for recovery", qPrintable(key));
        watcher_->unwatch(key);
        if (e->pendingTransfer) queue_->cancel(e->pendingTransfer);
        e->pendingTransfer = 0;
        setStatus(*e, ShadowEntry::Status::Orphaned);
    }
}

void ShadowStore::saveIndex() {
    QJsonArray arr;
    for (const auto& e : entries_) {
        QJsonObject o;
        o["localPath"] = e.localPath;
        o["session"] = e.sessionId;
        o["remotePath"] = e.remotePath;
        o["localHash"] = e.localHash;
        o["status"] = shadowStatusName(e.status);
        o["openedAt"] = e.openedAt.toString(Qt::ISODate);
        if (e.remoteFingerprint.valid) {
            QJsonObject fp;
            fp["size"] = double(e.remoteFingerprint.size);
            fp["mtime"] = double(e.remoteFingerprint.mtime);
            if (!e.remoteFingerprint.hash.empty()) fp["hash"] = QString::fromStdString(e.remoteFingerprint.hash);
            o["remoteFingerprint"] = fp;
        }
        arr.append(o);
    }
    QJsonObject root;
    root["version"] = 1;
    root["entries"] = arr;
    QDir().mkpath(root_);
    QSaveFile f(indexPath());
    if (!f.open(QIODevice::WriteOnly)) {
        LOGE("Shadow: cannot write %s: %s", qPrintable(indexPath()), qPrintable(f.errorString()));
        return;
    }
    f.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!f.commit()) LOGE("Shadow: cannot write %s: %s", qPrintable(indexPath()), qPrintable(f.errorString()));
}

bool ShadowStore::loadIndex(QString* err) {
    QFile f(indexPath());
    if (!f.exists()) return true;
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = f.errorString();
        return false;
    }
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = perr.errorString();
        LOGW("Shadow: ignoring corrupt index %s", qPrintable(indexPath()));
        return false;
    }
    int restored = 0;
    for (const auto& v : doc.object().value("entries").toArray()) {
        const QJsonObject o = v.toObject();
        ShadowEntry e;
        e.localPath = QDir::cleanPath(o.value("localPath").toString());
        e.sessionId = o.value("session").toString();
        e.remotePath = o.value("remotePath").toString();
        e.localHash = o.value("localHash").toString();
        e.openedAt = QDateTime::fromString(o.value("openedAt").toString(), Qt::ISODate);
        const QJsonObject fp = o.value("remoteFingerprint").toObject();
        if (!fp.isEmpty()) {
            e.remoteFingerprint.size = (std::uint64_t)fp.value("size").toDouble();
            e.remoteFingerprint.mtime = (std::uint64_t)fp.value("mtime").toDouble();
            e.remoteFingerprint.hash = fp.value("hash").toString().toStdString();
            e.remoteFingerprint.valid = true;
        }
        // Only files under our root that still exist are worth recovering.
        if (e.localPath.isEmpty() || e.sessionId.isEmpty() || !e.localPath.startsWith(root_ + QLatin1Char('/')) ||
            !QFileInfo::exists(e.localPath) || entries_.contains(e.localPath))
            continue;
        e.status = ShadowEntry::Status::Orphaned;
        entries_.insert(e.localPath, e);
        ++restored;
    }
    if (restored) LOGI("Shadow: recovered %d entries from %s", restored, qPrintable(indexPath()));
    saveIndex();
    return true;
}
