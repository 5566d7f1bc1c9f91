// User-tunable engine settings, persisted with QSettings.
#pragma once
#include <QString>
#include "DropIngest.hpp"

class QSettings;

struct BridgeSettings {
    // Transfers/*
    int workersPerSession = 3;
    int maxAutoRetries = 3;
    int retryBackoffMs = 1000;
    int progressIntervalMs = 100;
    int operationTimeoutMs = 20000;
    int globalSpeedLimitKBps = 0;
    CollisionPolicy collisionPolicy = CollisionPolicy::Ask;
    int smallBatchLimit = 3;
    bool bulkSyncDirectories = false;
    QString rsyncProgram = QStringLiteral("rsync");

    // Edit/*
    int debounceMs = 500;
    bool conflictCheck = true;
    QString shadowRoot;           // empty: system temp
    int flushTimeoutMs = 10000;

    // History/*
    int historyMaxRecords = 200;
    int historyMaxAgeDays = 30;

    // Out-of-range values are clamped, unknown policies fall back to Ask.
    static BridgeSettings load(QSettings& s);
    void save(QSettings& s) const;

    // QSettings("RemoteBridge", "RemoteBridge")
    static BridgeSettings load();
    void save() const;
};
