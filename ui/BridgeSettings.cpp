#include "BridgeSettings.hpp"
#include <QSettings>
#include <algorithm>

static int clamped(const QSettings& s, const char* key, int def, int lo, int hi) {
    bool ok = false;
    const int v = s.value(key, def).toInt(&ok);
    return ok ? std::clamp(v, lo, hi) : def;
}

BridgeSettings BridgeSettings::load(QSettings& s) {
    BridgeSettings b;
    b.workersPerSession = clamped(s, "Transfers/workersPerSession", b.workersPerSession, 1, 16);
    b.maxAutoRetries = clamped(s, "Transfers/maxAutoRetries", b.maxAutoRetries, 0, 10);
    b.retryBackoffMs = clamped(s, "Transfers/retryBackoffMs", b.retryBackoffMs, 0, 60000);
    b.progressIntervalMs = clamped(s, "Transfers/progressIntervalMs", b.progressIntervalMs, 0, 5000);
    b.operationTimeoutMs = clamped(s, "Transfers/operationTimeoutMs", b.operationTimeoutMs, 1000, 600000);
    b.globalSpeedLimitKBps = clamped(s, "Transfers/globalSpeedLimitKBps", 0, 0, 1024 * 1024);
    b.collisionPolicy = collisionPolicyFromName(s.value("Transfers/collisionPolicy", "ask").toString());
    b.smallBatchLimit = clamped(s, "Transfers/smallBatchLimit", b.smallBatchLimit, 0, 100);
    b.bulkSyncDirectories = s.value("Transfers/bulkSyncDirectories", false).toBool();
    b.rsyncProgram = s.value("Transfers/rsyncProgram", b.rsyncProgram).toString();
    if (b.rsyncProgram.isEmpty()) b.rsyncProgram = QStringLiteral("rsync");

    b.debounceMs = clamped(s, "Edit/debounceMs", b.debounceMs, 50, 5000);
    b.conflictCheck = s.value("Edit/conflictCheck", true).toBool();
    b.shadowRoot = s.value("Edit/shadowRoot").toString();
    b.flushTimeoutMs = clamped(s, "Edit/flushTimeoutMs", b.flushTimeoutMs, 0, 600000);

    b.historyMaxRecords = clamped(s, "History/maxRecords", b.historyMaxRecords, 1, 100000);
    b.historyMaxAgeDays = clamped(s, "History/maxAgeDays", b.historyMaxAgeDays, 0, 3650);
    return b;
}

void BridgeSettings::save(QSettings& s) const {
    s.setValue("Transfers/workersPerSession", workersPerSession);
    s.setValue("Transfers/maxAutoRetries", maxAutoRetries);
    s.setValue("Transfers/retryBackoffMs", retryBackoffMs);
    s.setValue("Transfers/progressIntervalMs", progressIntervalMs);
    s.setValue("Transfers/operationTimeoutMs", operationTimeoutMs);
    s.setValue("Transfers/globalSpeedLimitKBps", globalSpeedLimitKBps);
    s.setValue("Transfers/collisionPolicy", collisionPolicyName(collisionPolicy));
    s.setValue("Transfers/smallBatchLimit", smallBatchLimit);
    s.setValue("Transfers/bulkSyncDirectories", bulkSyncDirectories);
    s.setValue("Transfers/rsyncProgram", rsyncProgram);
    s.setValue("Edit/debounceMs", debounceMs);
    s.setValue("Edit/conflictCheck", conflictCheck);
    s.setValue("Edit/shadowRoot", shadowRoot);
    s.setValue("Edit/flushTimeoutMs", flushTimeoutMs);
    s.setValue("History/maxRecords", historyMaxRecords);
    s.setValue("History/maxAgeDays", historyMaxAgeDays);
    s.sync();
}

BridgeSettings BridgeSettings::load() {
    QSettings s("RemoteBridge", "RemoteBridge");
    return load(s);
}

void BridgeSettings::save() const {
    QSettings s("RemoteBridge", "RemoteBridge");
    save(s);
}
