// SecretStore implementation: optional fallback with QSettings.
#include "SecretStore.hpp"
#include <QSettings>
#include <QVariant>
#include <cstdlib>

static bool fallbackEnabledEnv() {
    const char* v = std::getenv("REMOTE_BRIDGE_ENABLE_INSECURE_FALLBACK");
    return v && *v == '1';
}

void SecretStore::setSecret(const QString& key, const QString& value) {
#ifdef REMOTE_BRIDGE_BUILD_SECURE_ONLY
    Q_UNUSED(key); Q_UNUSED(value);
    return; // disabled by secure build
#else
    if (!fallbackEnabledEnv()) return;
    QSettings s("RemoteBridge", "Secrets");
    s.setValue(key, value);
#endif
}

std::optional<QString> SecretStore::getSecret(const QString& key) const {
#ifdef REMOTE_BRIDGE_BUILD_SECURE_ONLY
    Q_UNUSED(key);
    return std::nullopt;
#else
    if (!fallbackEnabledEnv()) return std::nullopt;
    QSettings s("RemoteBridge", "Secrets");
    QVariant v = s.value(key);
    if (!v.isValid()) return std::nullopt;
    return v.toString();
#endif
}

void SecretStore::removeSecret(const QString& key) {
#ifdef REMOTE_BRIDGE_BUILD_SECURE_ONLY
    Q_UNUSED(key);
    return;
#else
    if (!fallbackEnabledEnv()) return;
    QSettings s("RemoteBridge", "Secrets");
    s.remove(key);
#endif
}

QString SecretStore::keyFor(const remotebridge::SessionParams& p) {
    if (!p.credential_ref.empty()) return QString::fromStdString(p.credential_ref);
    const QString id = QString::fromStdString(p.id);
    if (p.auth == remotebridge::AuthMethod::PrivateKey) return QStringLiteral("site:%1:keypass").arg(id);
    return QStringLiteral("site:%1:password").arg(id);
}

std::optional<std::string> SecretStore::getCredential(const remotebridge::SessionParams& params) {
    if (params.auth == remotebridge::AuthMethod::Agent) return std::nullopt;
    auto v = getSecret(keyFor(params));
    if (!v || v->isEmpty()) return std::nullopt;
    return v->toStdString();
}

bool SecretStore::insecureFallbackActive() {
#ifdef REMOTE_BRIDGE_BUILD_SECURE_ONLY
    return false;
#else
    return fallbackEnabledEnv();
#endif
}
