#include "SiteStore.hpp"
#include <QSettings>
#include <memory>

SiteStore::SiteStore() = default;

SiteStore::SiteStore(QSettings* settings) : external_(settings) {}

void SiteStore::load() {
    std::unique_ptr<QSettings> own;
    QSettings* s = external_;
    if (!s) {
        own = std::make_unique<QSettings>("RemoteBridge", "RemoteBridge");
        s = own.get();
    }
    sites_.clear();
    int n = s->beginReadArray("sites");
    for (int i = 0; i < n; ++i) {
        s->setArrayIndex(i);
        remotebridge::SessionParams p;
        p.id = s->value("name").toString().toStdString();
        if (p.id.empty()) continue;
        p.host = s->value("host").toString().toStdString();
        p.port = (std::uint16_t)s->value("port", 22).toUInt();
        p.username = s->value("user").toString().toStdString();
        p.auth = remotebridge::authMethodFromName(s->value("auth", "agent").toString().toStdString());
        // Password and passphrase never live here; they are fetched from SecretStore when connecting
        const QString kp = s->value("keyPath").toString();
        if (!kp.isEmpty()) p.private_key_path = kp.toStdString();
        const QString kh = s->value("knownHosts").toString();
        if (!kh.isEmpty()) p.known_hosts_path = kh.toStdString();
        p.known_hosts_policy = (remotebridge::KnownHostsPolicy)s->value(
            "khPolicy", (int)remotebridge::KnownHostsPolicy::Strict).toInt();
        p.credential_ref = s->value("credentialRef").toString().toStdString();
        sites_.push_back(p);
    }
    s->endArray();
}

void SiteStore::save() const {
    std::unique_ptr<QSettings> own;
    QSettings* s = external_;
    if (!s) {
        own = std::make_unique<QSettings>("RemoteBridge", "RemoteBridge");
        s = own.get();
    }
    // Clear previous array to avoid stale entries after deletions
    s->remove("sites");
    s->beginWriteArray("sites");
    for (int i = 0; i < sites_.size(); ++i) {
        s->setArrayIndex(i);
        const auto& p = sites_[i];
        s->setValue("name", QString::fromStdString(p.id));
        s->setValue("host", QString::fromStdString(p.host));
        s->setValue("port", (int)p.port);
        s->setValue("user", QString::fromStdString(p.username));
        s->setValue("auth", QString::fromLatin1(remotebridge::authMethodName(p.auth)));
        s->setValue("keyPath", p.private_key_path ? QString::fromStdString(*p.private_key_path) : QString());
        s->setValue("knownHosts", p.known_hosts_path ? QString::fromStdString(*p.known_hosts_path) : QString());
        s->setValue("khPolicy", (int)p.known_hosts_policy);
        s->setValue("credentialRef", QString::fromStdString(p.credential_ref));
    }
    s->endArray();
    s->sync();
}

std::optional<remotebridge::SessionParams> SiteStore::find(const QString& id) const {
    const std::string key = id.toStdString();
    for (const auto& p : sites_) {
        if (p.id == key) return p;
    }
    return std::nullopt;
}

void SiteStore::upsert(const remotebridge::SessionParams& p) {
    for (auto& cur : sites_) {
        if (cur.id == p.id) {
            cur = p;
            return;
        }
    }
    sites_.push_back(p);
}

bool SiteStore::remove(const QString& id) {
    const std::string key = id.toStdString();
    for (int i = 0; i < sites_.size(); ++i) {
        if (sites_[i].id == key) {
            sites_.removeAt(i);
            return true;
        }
    }
    return false;
}
