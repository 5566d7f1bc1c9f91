#include "TransferTypes.hpp"

QString transferStatusName(TransferRecord::Status s) {
    switch (s) {
        case TransferRecord::Status::Queued: return QStringLiteral("queued");
        case TransferRecord::Status::Running: return QStringLiteral("running");
        case TransferRecord::Status::Paused: return QStringLiteral("paused");
        case TransferRecord::Status::Succeeded: return QStringLiteral("succeeded");
        case TransferRecord::Status::Failed: return QStringLiteral("failed");
        case TransferRecord::Status::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("queued");
}

bool transferStatusFromName(const QString& s, TransferRecord::Status& out) {
    static const TransferRecord::Status all[] = {
        TransferRecord::Status::Queued, TransferRecord::Status::Running,
        TransferRecord::Status::Paused, TransferRecord::Status::Succeeded,
        TransferRecord::Status::Failed, TransferRecord::Status::Cancelled,
    };
    for (auto st : all) {
        if (transferStatusName(st) == s) {
            out = st;
            return true;
        }
    }
    return false;
}

QString transferDirectionName(TransferRecord::Direction d) {
    return d == TransferRecord::Direction::Upload ? QStringLiteral("upload") : QStringLiteral("download");
}

bool transferDirectionFromName(const QString& s, TransferRecord::Direction& out) {
    if (s == QLatin1String("upload")) {
        out = TransferRecord::Direction::Upload;
        return true;
    }
    if (s == QLatin1String("download")) {
        out = TransferRecord::Direction::Download;
        return true;
    }
    return false;
}

QString formatTransferSpeed(double bytesPerSecond) {
    if (bytesPerSecond <= 0.0) return QString();
    static const char* units[] = { "B/s", "KB/s", "MB/s", "GB/s" };
    int u = 0;
    double v = bytesPerSecond;
    while (v >= 1024.0 && u < 3) {
        v /= 1024.0;
        ++u;
    }
    return u == 0 ? QStringLiteral("%1 %2").arg(qRound64(v)).arg(QLatin1String(units[u]))
                  : QStringLiteral("%1 %2").arg(v, 0, 'f', 1).arg(QLatin1String(units[u]));
}

QString formatTransferDuration(qint64 ms) {
    if (ms < 0) return QString();
    const qint64 secs = ms / 1000;
    if (secs < 60) return QStringLiteral("%1s").arg(secs);
    if (secs < 3600) return QStringLiteral("%1m %2s").arg(secs / 60).arg(secs % 60, 2, 10, QLatin1Char('0'));
    return QStringLiteral("%1h %2m").arg(secs / 3600).arg((secs % 3600) / 60, 2, 10, QLatin1Char('0'));
}
