// Debounced file change notifications for shadow files.
// Lives on the Qt event loop; one single-shot timer per watched path.
#pragma once
#include <QFileSystemWatcher>
#include <QHash>
#include <QObject>
#include <QStringList>

class QTimer;

class FileWatchDispatcher : public QObject {
    Q_OBJECT
public:
    explicit FileWatchDispatcher(QObject* parent = nullptr);

    bool watch(const QString& path);
    void unwatch(const QString& path);
    QStringList watched() const { return timers_.keys(); }
    bool isWatching(const QString& path) const { return timers_.contains(path); }

    void setDebounceInterval(int ms);
    int debounceInterval() const { return debounceMs_; }

signals:
    // One per quiet period after a burst of writes.
    void changed(const QString& path);

public slots:
    // Entry point for raw events (the watcher feeds it; tests may call it directly).
    void notifyRawEvent(const QString& path);

private slots:
    void onTimeout(const QString& path);

private:
    QFileSystemWatcher watcher_;
    QHash<QString, QTimer*> timers_;
    int debounceMs_ = 500;
};
