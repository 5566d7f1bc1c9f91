// Helpers shared by the tests: event pumping, local files, mock sessions.
#pragma once
#include <doctest/doctest.h>

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QThread>
#include <memory>
#include <string>

#include "remotebridge/MockSftpClient.hpp"
#include "remotebridge/TransportSession.hpp"

namespace testsupport {

// Pump the Qt event loop until `pred` holds or the timeout expires.
template <typename Pred>
bool waitUntil(Pred pred, int timeoutMs = 5000) {
    QElapsedTimer t;
    t.start();
    while (!pred()) {
        if (t.elapsed() > timeoutMs) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(2);
    }
    return true;
}

// Keep the event loop running for a fixed time.
inline void pump(int ms) {
    QElapsedTimer t;
    t.start();
    while (t.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(2);
    }
}

inline bool writeLocal(const QString& path, const QByteArray& data) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) return false;
    return f.write(data) == data.size();
}

inline QByteArray readLocal(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

inline std::string remoteData(const std::shared_ptr<remotebridge::MockRemoteFs>& fs, const std::string& path) {
    std::string out;
    fs->readFile(path, out);
    return out;
}

inline remotebridge::SessionOptions mockOptions() {
    remotebridge::SessionOptions o;
    o.host = "mock";
    o.username = "demo";
    return o;
}

inline std::shared_ptr<remotebridge::TransportSession> connectedSession(
    const std::shared_ptr<remotebridge::MockRemoteFs>& fs, const std::string& id = "s1",
    std::size_t maxConnections = 3) {
    auto s = std::make_shared<remotebridge::TransportSession>(
        id, std::make_unique<remotebridge::MockSftpClient>(fs), maxConnections);
    remotebridge::Error err;
    REQUIRE_MESSAGE(s->connect(mockOptions(), err), err.describe());
    return s;
}

} // namespace testsupport
