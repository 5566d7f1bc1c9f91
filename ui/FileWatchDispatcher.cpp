#include "FileWatchDispatcher.hpp"
#include "remotebridge/Log.hpp"
#include <QFileInfo>
#include <QTimer>

FileWatchDispatcher::FileWatchDispatcher(QObject* parent) : QObject(parent) {
    connect(&watcher_, &QFileSystemWatcher::fileChanged, this, &FileWatchDispatcher::notifyRawEvent);
}

bool FileWatchDispatcher::watch(const QString& path) {
    const QString p = QFileInfo(path).absoluteFilePath();
    if (timers_.contains(p)) return true;
    if (!QFileInfo::exists(p)) return false;
    if (!watcher_.addPath(p)) {
        LOGW("Watch: could not watch %s", qPrintable(p));
        return false;
    }
    auto* t = new QTimer(this);
    t->setSingleShot(true);
    t->setInterval(debounceMs_);
    connect(t, &QTimer::timeout, this, [this, p]() { onTimeout(p); });
    timers_.insert(p, t);
    return true;
}

void FileWatchDispatcher::unwatch(const QString& path) {
    const QString p = QFileInfo(path).absoluteFilePath();
    watcher_.removePath(p);
    if (QTimer* t = timers_.take(p)) {
        t->stop();
        t->deleteLater();
    }
}

void FileWatchDispatcher::setDebounceInterval(int ms) {
    debounceMs_ = ms < 0 ? 0 : ms;
    for (QTimer* t : timers_) t->setInterval(debounceMs_);
}

void FileWatchDispatcher::notifyRawEvent(const QString& path) {
    const QString p = QFileInfo(path).absoluteFilePath();
    QTimer* t = timers_.value(p, nullptr);
    if (!t) return;
    // Rename-replace saves drop the inotify watch; re-arm it.
    if (!watcher_.files().contains(p) && QFileInfo::exists(p)) watcher_.addPath(p);
    t->start();
}

void FileWatchDispatcher::onTimeout(const QString& path) {
    if (!timers_.contains(path)) return;
    if (!QFileInfo::exists(path)) {
        LOGI("Watch: %s vanished, event dropped", qPrintable(path));
        return;
    }
    if (!watcher_.files().contains(path)) watcher_.addPath(path);
    emit changed(path);
}
