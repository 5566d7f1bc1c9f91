#include "TransferHistory.hpp"
#include "remotebridge/Log.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>
#include <algorithm>

static constexpr int kFormatVersion = 1;

TransferHistory::TransferHistory(QString path) : path_(path.isEmpty() ? defaultPath() : std::move(path)) {}

QString TransferHistory::defaultPath() {
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(base).filePath(QStringLiteral("transfer_history.json"));
}

void TransferHistory::setRetention(int maxRecords, int maxAgeDays) {
    maxRecords_ = std::max(1, maxRecords);
    maxAgeDays_ = std::max(0, maxAgeDays);
    prune();
}

QJsonObject TransferHistory::toJson(const TransferRecord& r) {
    QJsonObject o;
    o["id"] = QString::number(r.id);
    o["direction"] = transferDirectionName(r.direction);
    o["session"] = r.sessionId;
    o["src"] = r.src;
    o["dst"] = r.dst;
    if (r.parentId) o["parentId"] = QString::number(r.parentId);
    if (r.isDirectoryJob) {
        o["directoryJob"] = true;
        o["childCount"] = r.childCount;
        o["childSucceeded"] = r.childSucceeded;
        o["childFailed"] = r.childFailed;
    }
    if (r.bulkSync) o["bulkSync"] = true;
    o["totalBytes"] = double(r.totalBytes);
    o["bytesTransferred"] = double(r.bytesTransferred);
    o["status"] = transferStatusName(r.status);
    if (r.errorKind != remotebridge::ErrorKind::None) o["errorKind"] = remotebridge::errorKindName(r.errorKind);
    if (!r.error.isEmpty()) o["error"] = r.error;
    o["retryCount"] = r.retryCount;
    o["attempts"] = r.attempts;
    o["created"] = r.created.toString(Qt::ISODateWithMs);
    o["updated"] = r.updated.toString(Qt::ISODateWithMs);
    if (r.started.isValid()) o["started"] = r.started.toString(Qt::ISODateWithMs);
    if (r.finished.isValid()) o["finished"] = r.finished.toString(Qt::ISODateWithMs);
    if (r.remoteFingerprint.valid) {
        QJsonObject fp;
        fp["size"] = double(r.remoteFingerprint.size);
        fp["mtime"] = double(r.remoteFingerprint.mtime);
        if (!r.remoteFingerprint.hash.empty()) fp["hash"] = QString::fromStdString(r.remoteFingerprint.hash);
        o["remoteFingerprint"] = fp;
    }
    return o;
}

bool TransferHistory::fromJson(const QJsonObject& o, TransferRecord& out) {
    TransferRecord r;
    bool ok = false;
    r.id = o.value("id").toString().toULongLong(&ok);
    if (!ok || r.id == 0) return false;
    if (!transferDirectionFromName(o.value("direction").toString(), r.direction)) return false;
    // Unknown statuses from newer versions are skipped, not guessed.
    if (!transferStatusFromName(o.value("status").toString(), r.status)) return false;
    r.sessionId = o.value("session").toString();
    r.src = o.value("src").toString();
    r.dst = o.value("dst").toString();
    r.parentId = o.value("parentId").toString().toULongLong();
    r.isDirectoryJob = o.value("directoryJob").toBool();
    r.childCount = o.value("childCount").toInt();
    r.childSucceeded = o.value("childSucceeded").toInt();
    r.childFailed = o.value("childFailed").toInt();
    r.bulkSync = o.value("bulkSync").toBool();
    r.totalBytes = (qint64)o.value("totalBytes").toDouble(-1);
    r.bytesTransferred = (quint64)o.value("bytesTransferred").toDouble();
    r.errorKind = remotebridge::errorKindFromName(o.value("errorKind").toString().toStdString());
    r.error = o.value("error").toString();
    r.retryCount = o.value("retryCount").toInt();
    r.attempts = o.value("attempts").toInt();
    r.created = QDateTime::fromString(o.value("created").toString(), Qt::ISODateWithMs);
    r.updated = QDateTime::fromString(o.value("updated").toString(), Qt::ISODateWithMs);
    if (!r.updated.isValid()) r.updated = r.created;
    r.started = QDateTime::fromString(o.value("started").toString(), Qt::ISODateWithMs);
    r.finished = QDateTime::fromString(o.value("finished").toString(), Qt::ISODateWithMs);
    const QJsonObject fp = o.value("remoteFingerprint").toObject();
    if (!fp.isEmpty()) {
        r.remoteFingerprint.size = (std::uint64_t)fp.value("size").toDouble();
        r.remoteFingerprint.mtime = (std::uint64_t)fp.value("mtime").toDouble();
        r.remoteFingerprint.hash = fp.value("hash").toString().toStdString();
        r.remoteFingerprint.valid = true;
    }
    out = r;
    return true;
}

bool TransferHistory::load(QString* err) {
    records_.clear();
    QFile f(path_);
    if (!f.exists()) return true;
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = QStringLiteral("Cannot read %1: %2").arg(path_, f.errorString());
        return false;
    }
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = QStringLiteral("Corrupt history file %1: %2").arg(path_, perr.errorString());
        LOGW("History: ignoring corrupt file %s", qPrintable(path_));
        return false;
    }
    const QJsonArray arr = doc.object().value("records").toArray();
    int skipped = 0;
    for (const auto& v : arr) {
        TransferRecord r;
        if (fromJson(v.toObject(), r)) records_.push_back(r);
        else ++skipped;
    }
    if (skipped) LOGW("History: skipped %d unreadable records", skipped);
    std::stable_sort(records_.begin(), records_.end(),
                     [](const TransferRecord& a, const TransferRecord& b) { return a.updated > b.updated; });
    prune();
    return true;
}

bool TransferHistory::save(QString* err) const {
    QDir().mkpath(QFileInfo(path_).absolutePath());
    QJsonArray arr;
    for (const auto& r : records_) arr.append(toJson(r));
    QJsonObject root;
    root["version"] = kFormatVersion;
    root["records"] = arr;

    QSaveFile f(path_);
    if (!f.open(QIODevice::WriteOnly)) {
        if (err) *err = QStringLiteral("Cannot write %1: %2").arg(path_, f.errorString());
        return false;
    }
    f.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!f.commit()) {
        if (err) *err = QStringLiteral("Cannot write %1: %2").arg(path_, f.errorString());
        LOGE("History: save failed: %s", qPrintable(f.errorString()));
        return false;
    }
    return true;
}

bool TransferHistory::upsert(const TransferRecord& r, QString* err) {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const TransferRecord& x) { return x.id == r.id; });
    if (it != records_.end()) records_.erase(it);
    records_.prepend(r);
    prune();
    return save(err);
}

std::optional<TransferRecord> TransferHistory::find(quint64 id) const {
    for (const auto& r : records_) {
        if (r.id == id) return r;
    }
    return std::nullopt;
}

int TransferHistory::clear(const QDateTime& olderThan, QString* err) {
    const int before = records_.size();
    if (!olderThan.isValid()) {
        records_.clear();
    } else {
        records_.erase(std::remove_if(records_.begin(), records_.end(),
                                      [&](const TransferRecord& r) { return r.updated < olderThan; }),
                       records_.end());
    }
    const int removed = before - records_.size();
    if (removed) save(err);
    return removed;
}

quint64 TransferHistory::maxId() const {
    quint64 m = 0;
    for (const auto& r : records_) m = std::max(m, r.id);
    return m;
}

void TransferHistory::prune() {
    if (maxAgeDays_ > 0) {
        const QDateTime cutoff = QDateTime::currentDateTimeUtc().addDays(-maxAgeDays_);
        records_.erase(std::remove_if(records_.begin(), records_.end(),
                                      [&](const TransferRecord& r) {
                                          return r.updated.isValid() && r.updated < cutoff;
                                      }),
                       records_.end());
    }
    // Newest first, so the tail is the oldest.
    if (records_.size() > maxRecords_) records_.resize(maxRecords_);
}
