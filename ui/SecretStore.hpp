// Secret storage for saved sites.
// The only backend is an insecure QSettings fallback, enabled via env var;
// without it no secret is ever stored or returned.
#pragma once
#include <QString>
#include <optional>
#include "remotebridge/CredentialProvider.hpp"

class SecretStore : public remotebridge::CredentialProvider {
public:
    // Store a secret under a logical key (e.g. "site:Name:password").
    void setSecret(const QString& key, const QString& value);

    // Retrieve a secret if present.
    std::optional<QString> getSecret(const QString& key) const;

    void removeSecret(const QString& key);

    // Key for a site's secret: the explicit credential reference, or
    // "site:<id>:keypass" for key auth and "site:<id>:password" otherwise.
    static QString keyFor(const remotebridge::SessionParams& p);

    std::optional<std::string> getCredential(const remotebridge::SessionParams& params) override;

    // Whether the insecure fallback is active (REMOTE_BRIDGE_ENABLE_INSECURE_FALLBACK=1).
    static bool insecureFallbackActive();
};
