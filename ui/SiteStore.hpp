// Saved connection parameters (no secrets), kept as a QSettings array.
#pragma once
#include <QString>
#include <QVector>
#include <optional>
#include "remotebridge/SftpTypes.hpp"

class QSettings;

class SiteStore {
public:
    // Default: QSettings("RemoteBridge", "RemoteBridge")
    SiteStore();
    explicit SiteStore(QSettings* settings);   // not owned

    void load();
    void save() const;

    const QVector<remotebridge::SessionParams>& sites() const { return sites_; }
    std::optional<remotebridge::SessionParams> find(const QString& id) const;
    // Insert or replace by id.
    void upsert(const remotebridge::SessionParams& p);
    bool remove(const QString& id);

private:
    QSettings* external_ = nullptr;
    QVector<remotebridge::SessionParams> sites_;
};
