#include "RsyncTransport.hpp"
#include "remotebridge/Log.hpp"
#include <QFileInfo>
#include <QProcess>
#include <QRegularExpression>
#include <algorithm>
#include <string>

using remotebridge::ErrorKind;

RsyncTransport::RsyncTransport(QString program) : program_(std::move(program)) {}

// rsync splits the -e command itself: single quotes keep a word together,
// an embedded ' is written as '"'"'.
static QString shellWord(const QString& s) {
    static const QRegularExpression special(QStringLiteral("[\\s'\"\\\\]"));
    if (!s.isEmpty() && !s.contains(special)) return s;
    QString out = s;
    out.replace(QLatin1Char('\''), QStringLiteral("'\"'\"'"));
    return QLatin1Char('\'') + out + QLatin1Char('\'');
}

static QString sshCommand(const remotebridge::SessionOptions& ep) {
    QStringList parts;
    parts << QStringLiteral("ssh") << QStringLiteral("-p") << QString::number(ep.port);
    if (ep.private_key_path && !ep.private_key_path->empty())
        parts << QStringLiteral("-i") << QString::fromStdString(*ep.private_key_path);
    if (ep.known_hosts_path && !ep.known_hosts_path->empty())
        parts << QStringLiteral("-o") << QStringLiteral("UserKnownHostsFile=") + QString::fromStdString(*ep.known_hosts_path);
    switch (ep.known_hosts_policy) {
        case remotebridge::KnownHostsPolicy::Strict:
            parts << QStringLiteral("-o") << QStringLiteral("StrictHostKeyChecking=yes");
            break;
        case remotebridge::KnownHostsPolicy::AcceptNew:
            parts << QStringLiteral("-o") << QStringLiteral("StrictHostKeyChecking=accept-new");
            break;
        case remotebridge::KnownHostsPolicy::Off:
            parts << QStringLiteral("-o") << QStringLiteral("StrictHostKeyChecking=no");
            break;
    }
    // Never prompt: there is no terminal behind the child.
    parts << QStringLiteral("-o") << QStringLiteral("BatchMode=yes");
    for (QString& p : parts) p = shellWord(p);
    return parts.join(QLatin1Char(' '));
}

QStringList RsyncTransport::buildArguments(const remotebridge::SessionOptions& endpoint,
                                           TransferRecord::Direction direction,
                                           const QString& src, const QString& dst, bool srcIsDir) {
    const QString userHost = endpoint.username.empty()
                                 ? QString::fromStdString(endpoint.host)
                                 : QString::fromStdString(endpoint.username + "@" + endpoint.host);
    // Trailing slash: copy the directory's contents into dst, not dst/<name>.
    QString source = src;
    if (srcIsDir && !source.endsWith(QLatin1Char('/'))) source += QLatin1Char('/');

    QStringList args;
    args << QStringLiteral("-a") << QStringLiteral("--partial") << QStringLiteral("--info=progress2")
         << QStringLiteral("-e") << sshCommand(endpoint);
    if (direction == TransferRecord::Direction::Upload) {
        args << source << userHost + QLatin1Char(':') + dst;
    } else {
        args << userHost + QLatin1Char(':') + source << dst;
    }
    return args;
}

bool RsyncTransport::parseProgress(const QString& line, quint64& bytes, int& percent) {
    static const QRegularExpression re(QStringLiteral("^\\s*([\\d,]+)\\s+(\\d+)%"));
    const auto m = re.match(line);
    if (!m.hasMatch()) return false;
    QString digits = m.captured(1);
    digits.remove(QLatin1Char(','));
    bool ok = false;
    const quint64 b = digits.toULongLong(&ok);
    if (!ok) return false;
    bytes = b;
    percent = std::min(100, m.captured(2).toInt());
    return true;
}

ErrorKind RsyncTransport::classifyFailure(int exitCode, const QString& stderrText) {
    const QString s = stderrText.toLower();
    if (s.contains(QStringLiteral("host key verification failed"))) return ErrorKind::HostKeyMismatch;
    if (s.contains(QStringLiteral("permission denied (publickey")) ||
        s.contains(QStringLiteral("too many authentication failures")))
        return ErrorKind::AuthFailure;
    if (s.contains(QStringLiteral("permission denied"))) return ErrorKind::PermissionDenied;
    if (s.contains(QStringLiteral("no such file or directory"))) return ErrorKind::NotFound;
    if (s.contains(QStringLiteral("could not resolve hostname")) ||
        s.contains(QStringLiteral("connection refused")) || s.contains(QStringLiteral("no route to host")) ||
        s.contains(QStringLiteral("network is unreachable")))
        return ErrorKind::NetworkUnreachable;
    if (s.contains(QStringLiteral("timed out"))) return ErrorKind::Timeout;
    switch (exitCode) {
        case 30: // timeout in data send/receive
        case 35: // timeout waiting for daemon connection
            return ErrorKind::Timeout;
        case 10: // socket I/O
        case 255: // ssh itself failed
            return ErrorKind::Disconnected;
        default:
            return ErrorKind::Io;
    }
}

bool RsyncTransport::run(const remotebridge::SessionOptions& endpoint, const TransferRecord& rec,
                         ProgressCB progress, CancelCB shouldCancel, remotebridge::Error& err) {
    const bool srcIsDir = rec.direction == TransferRecord::Direction::Upload ? QFileInfo(rec.src).isDir() : true;
    const QStringList args = buildArguments(endpoint, rec.direction, rec.src, rec.dst, srcIsDir);

    QProcess proc;
    proc.setProgram(program_);
    proc.setArguments(args);
    proc.start();
    if (!proc.waitForStarted(5000)) {
        err.set(ErrorKind::Io, "Could not start " + program_.toStdString() + ": " + proc.errorString().toStdString());
        return false;
    }
    LOGI("Rsync: #%llu %s %s", (unsigned long long)rec.id, qPrintable(program_), qPrintable(args.join(QLatin1Char(' '))));

    QByteArray pending;
    QByteArray errText;
    auto drain = [&]() {
        pending += proc.readAllStandardOutput();
        errText += proc.readAllStandardError();
        // progress2 rewrites its line with '\r'
        for (;;) {
            int cut = -1;
            for (int i = 0; i < pending.size(); ++i) {
                if (pending[i] == '\r' || pending[i] == '\n') {
                    cut = i;
                    break;
                }
            }
            if (cut < 0) break;
            const QString line = QString::fromUtf8(pending.left(cut));
            pending.remove(0, cut + 1);
            quint64 bytes = 0;
            int percent = 0;
            if (progress && parseProgress(line, bytes, percent)) {
                const qint64 total = percent > 0 ? qint64(bytes * 100 / quint64(percent)) : -1;
                progress(bytes, total);
            }
        }
    };

    while (!proc.waitForFinished(100)) {
        drain();
        if (proc.state() == QProcess::NotRunning) break;
        if (shouldCancel && shouldCancel()) {
            proc.terminate();
            if (!proc.waitForFinished(2000)) {
                proc.kill();
                proc.waitForFinished(2000);
            }
            err.set(ErrorKind::Cancelled, "Cancelled");
            return false;
        }
    }
    drain();

    if (proc.exitStatus() != QProcess::NormalExit) {
        err.set(ErrorKind::Io, program_.toStdString() + " crashed");
        return false;
    }
    if (proc.exitCode() != 0) {
        const QString text = QString::fromUtf8(errText).trimmed();
        err.set(classifyFailure(proc.exitCode(), text),
                text.isEmpty() ? "rsync exited with code " + std::to_string(proc.exitCode())
                               : text.section(QLatin1Char('\n'), 0, 0).toStdString());
        LOGE("Rsync: #%llu exit %d: %s", (unsigned long long)rec.id, proc.exitCode(), qPrintable(text));
        return false;
    }
    return true;
}
