// Persisted ledger of finished transfers (JSON, written atomically).
#pragma once
#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>
#include <optional>
#include "TransferTypes.hpp"

class TransferHistory {
public:
    explicit TransferHistory(QString path = QString());

    // Default location: <AppConfigLocation>/transfer_history.json
    static QString defaultPath();

    const QString& path() const { return path_; }
    void setRetention(int maxRecords, int maxAgeDays);
    int maxRecords() const { return maxRecords_; }
    int maxAgeDays() const { return maxAgeDays_; }

    // Missing file is not an error. A corrupt file is reported and left untouched.
    bool load(QString* err = nullptr);
    bool save(QString* err = nullptr) const;

    // Insert or replace by id, prune, then save.
    bool upsert(const TransferRecord& r, QString* err = nullptr);
    // Newest first
    QVector<TransferRecord> records() const { return records_; }
    std::optional<TransferRecord> find(quint64 id) const;
    // Remove records last updated before `olderThan` (invalid = all). Returns the count.
    int clear(const QDateTime& olderThan = QDateTime(), QString* err = nullptr);
    quint64 maxId() const;

    static QJsonObject toJson(const TransferRecord& r);
    static bool fromJson(const QJsonObject& o, TransferRecord& out);

private:
    void prune();

    QString path_;
    QVector<TransferRecord> records_;
    int maxRecords_ = 200;
    int maxAgeDays_ = 30;
};
