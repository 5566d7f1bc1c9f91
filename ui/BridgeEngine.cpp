#include "BridgeEngine.hpp"
#include "DropIngest.hpp"
#include "FileWatchDispatcher.hpp"
#include "RsyncTransport.hpp"
#include "ShadowStore.hpp"
#include "TransferHistory.hpp"
#include "TransferManager.hpp"
#include "TransferQueue.hpp"
#include "remotebridge/Libssh2SftpClient.hpp"
#include "remotebridge/Log.hpp"
#include <QCoreApplication>
#include <QMetaObject>

using remotebridge::Error;
using remotebridge::ErrorKind;
using remotebridge::SessionState;
using remotebridge::TransportSession;

BridgeEngine::BridgeEngine(const BridgeSettings& settings, const QString& historyPath, QObject* parent)
    : QObject(parent), settings_(settings) {
    factory_ = []() { return std::make_unique<remotebridge::Libssh2SftpClient>(); };
    queue_ = new TransferQueue(this);
    history_ = std::make_unique<TransferHistory>(historyPath);
    QString herr;
    if (!history_->load(&herr)) LOGW("History: %s", qPrintable(herr));
    manager_ = new TransferManager(queue_, history_.get(), this);
    watcher_ = new FileWatchDispatcher(this);
    shadows_ = new ShadowStore(queue_, watcher_, settings.shadowRoot, this);
    QString serr;
    if (!shadows_->loadIndex(&serr)) LOGW("Shadow: %s", qPrintable(serr));
    drops_ = std::make_unique<DropIngest>(queue_);
    rsync_ = std::make_shared<RsyncTransport>(settings.rsyncProgram);
    queue_->setBulkSyncTransport(rsync_);
    applySettings(settings);
}

BridgeEngine::~BridgeEngine() {
    shutdown();
}

void BridgeEngine::applySettings(const BridgeSettings& s) {
    settings_ = s;
    TransferQueue::Options qo;
    qo.workersPerSession = s.workersPerSession;
    qo.maxAutoRetries = s.maxAutoRetries;
    qo.retryBackoffMs = s.retryBackoffMs;
    qo.progressIntervalMs = s.progressIntervalMs;
    queue_->setOptions(qo);
    queue_->setGlobalSpeedLimitKBps(s.globalSpeedLimitKBps);
    history_->setRetention(s.historyMaxRecords, s.historyMaxAgeDays);
    watcher_->setDebounceInterval(s.debounceMs);
    shadows_->setConflictCheck(s.conflictCheck);
    DropIngest::Options dopt;
    dopt.policy = s.collisionPolicy;
    dopt.smallBatchLimit = s.smallBatchLimit;
    dopt.bulkSyncDirectories = s.bulkSyncDirectories;
    drops_->setOptions(dopt);
    rsync_->setProgram(s.rsyncProgram);
    for (auto& kv : sessions_) kv.second.session->setOperationTimeout(s.operationTimeoutMs);
}

QStringList BridgeEngine::sessionIds() const {
    QStringList out;
    for (const auto& kv : sessions_) out << kv.first;
    return out;
}

std::shared_ptr<TransportSession> BridgeEngine::session(const QString& id) const {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.session;
}

remotebridge::RemotePathResolver* BridgeEngine::resolver(const QString& id) {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.resolver.get();
}

bool BridgeEngine::connectSession(const remotebridge::SessionParams& params, Error& err,
                                  const std::optional<std::string>& trustedFingerprint) {
    const QString id = QString::fromStdString(params.id);
    if (id.isEmpty()) {
        err.set(ErrorKind::Io, "Session id is empty");
        return false;
    }
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        SessionSlot slot;
        slot.session = std::make_shared<TransportSession>(params.id, factory_(),
                                                          (std::size_t)settings_.workersPerSession);
        slot.session->setOperationTimeout(settings_.operationTimeoutMs);
        slot.session->setStateListener([this, id](SessionState st, const std::string& reason) {
            // Called from whichever thread noticed the transition.
            const QString why = QString::fromStdString(reason);
            QMetaObject::invokeMethod(this, [this, id, st, why]() { onSessionState(id, st, why); },
                                      Qt::QueuedConnection);
        });
        slot.resolver = std::make_unique<remotebridge::RemotePathResolver>("/");
        it = sessions_.emplace(id, std::move(slot)).first;
    } else if (it->second.session->isConnected()) {
        return true;
    }
    it->second.params = params;
    if (trustedFingerprint) it->second.trustedFingerprint = trustedFingerprint;
    return connectSlot(it->second, err);
}

bool BridgeEngine::connectSlot(SessionSlot& slot, Error& err) {
    std::optional<std::string> secret;
    if (credentials_) secret = credentials_->getCredential(slot.params);
    remotebridge::SessionOptions opt = remotebridge::toSessionOptions(slot.params, secret);
    opt.trusted_fingerprint = slot.trustedFingerprint;
    opt.hostkey_confirm_cb = hostKeyConfirm_;
    if (!slot.session->connect(opt, err)) return false;

    const QString id = QString::fromStdString(slot.params.id);
    if (!slot.attached) {
        queue_->attachSession(slot.session);
        slot.attached = true;
        // Start browsing in the user's home when there is one.
        bool isDir = false;
        Error herr;
        const std::string home = "/home/" + slot.params.username;
        if (!slot.params.username.empty() && slot.session->exists(home, isDir, herr) && isDir)
            slot.resolver = std::make_unique<remotebridge::RemotePathResolver>(home);
    }
    shadows_->reattachSession(id);
    queue_->schedule();
    return true;
}

void BridgeEngine::disconnectSession(const QString& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return;
    it->second.session->disconnect();
    shadows_->orphanSession(id);
}

bool BridgeEngine::reconnectSession(const QString& id, Error& err,
                                    const std::optional<std::string>& trustedFingerprint) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        err.set(ErrorKind::NotFound, "Unknown session " + id.toStdString());
        return false;
    }
    if (it->second.session->isConnected()) return true;
    if (trustedFingerprint) it->second.trustedFingerprint = trustedFingerprint;
    return connectSlot(it->second, err);
}

void BridgeEngine::removeSession(const QString& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return;
    queue_->cancelSession(id, tr("Session removed"));
    it->second.session->disconnect();
    if (it->second.attached) queue_->detachSession(id);
    shadows_->orphanSession(id);
    sessions_.erase(it);
    LOGI("Engine: session %s removed", qPrintable(id));
}

void BridgeEngine::onSessionState(const QString& id, SessionState state, const QString& reason) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return;
    // A late notification must not undo a reconnect that already happened.
    if ((state == SessionState::Failed || state == SessionState::Disconnected) &&
        !it->second.session->isConnected())
        shadows_->orphanSession(id);
    emit sessionStateChanged(id, QString::fromLatin1(remotebridge::sessionStateName(state)), reason);
}

bool BridgeEngine::listRemote(const QString& id, const QString& path, std::vector<remotebridge::FileInfo>& out,
                              Error& err) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        err.set(ErrorKind::NotFound, "Unknown session " + id.toStdString());
        return false;
    }
    const std::string target = it->second.resolver->resolve(path.isEmpty() ? std::string(".") : path.toStdString());
    return it->second.session->list(target, out, err);
}

bool BridgeEngine::changeDirectory(const QString& id, const QString& path, Error& err) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        err.set(ErrorKind::NotFound, "Unknown session " + id.toStdString());
        return false;
    }
    const std::string target = it->second.resolver->resolve(path.toStdString());
    remotebridge::FileInfo info{};
    if (!it->second.session->stat(target, info, err)) return false;
    if (!info.is_dir) {
        err.set(ErrorKind::Io, target + " is not a directory");
        return false;
    }
    it->second.resolver->cd(target);
    return true;
}

void BridgeEngine::shutdown() {
    if (shutDown_) return;
    shutDown_ = true;
    shadows_->shutdown(settings_.flushTimeoutMs);
    queue_->shutdown();
    // Deliver the last finished notifications so the history sees them.
    QCoreApplication::sendPostedEvents(nullptr, QEvent::MetaCall);
    for (auto& kv : sessions_) kv.second.session->disconnect();
    LOGI("Engine: shut down");
}
