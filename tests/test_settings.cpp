#include "TestSupport.hpp"

#include <QSettings>
#include "BridgeSettings.hpp"
#include "SecretStore.hpp"
#include "SiteStore.hpp"

using namespace remotebridge;

TEST_CASE("engine settings") {
    QTemporaryDir tmp;
    QSettings ini(tmp.filePath("settings.ini"), QSettings::IniFormat);

    SUBCASE("defaults") {
        const BridgeSettings b = BridgeSettings::load(ini);
        CHECK(b.workersPerSession == 3);
        CHECK(b.maxAutoRetries == 3);
        CHECK(b.debounceMs == 500);
        CHECK(b.collisionPolicy == CollisionPolicy::Ask);
        CHECK(b.conflictCheck);
        CHECK(b.rsyncProgram == "rsync");
        CHECK(b.historyMaxRecords == 200);
    }
    SUBCASE("out of range values are clamped") {
        ini.setValue("Transfers/workersPerSession", 100);
        ini.setValue("Transfers/maxAutoRetries", -4);
        ini.setValue("Edit/debounceMs", 1);
        ini.setValue("History/maxRecords", 0);
        ini.setValue("Transfers/retryBackoffMs", "soon");
        ini.setValue("Transfers/collisionPolicy", "shred");
        ini.setValue("Transfers/rsyncProgram", "");
        const BridgeSettings b = BridgeSettings::load(ini);
        CHECK(b.workersPerSession == 16);
        CHECK(b.maxAutoRetries == 0);
        CHECK(b.debounceMs == 50);
        CHECK(b.historyMaxRecords == 1);
        CHECK(b.retryBackoffMs == 1000);
        CHECK(b.collisionPolicy == CollisionPolicy::Ask);
        CHECK(b.rsyncProgram == "rsync");
    }
    SUBCASE("round trip") {
        BridgeSettings b;
        b.workersPerSession = 5;
        b.collisionPolicy = CollisionPolicy::AutoRename;
        b.bulkSyncDirectories = true;
        b.debounceMs = 250;
        b.conflictCheck = false;
        b.shadowRoot = tmp.filePath("shadows");
        b.historyMaxAgeDays = 7;
        b.save(ini);
        CHECK(ini.value("Transfers/collisionPolicy").toString() == "rename");

        const BridgeSettings r = BridgeSettings::load(ini);
        CHECK(r.workersPerSession == 5);
        CHECK(r.collisionPolicy == CollisionPolicy::AutoRename);
        CHECK(r.bulkSyncDirectories);
        CHECK(r.debounceMs == 250);
        CHECK_FALSE(r.conflictCheck);
        CHECK(r.shadowRoot == tmp.filePath("shadows"));
        CHECK(r.historyMaxAgeDays == 7);
    }
}

TEST_CASE("collision policy names") {
    for (CollisionPolicy p : { CollisionPolicy::Ask, CollisionPolicy::Overwrite, CollisionPolicy::Skip,
                               CollisionPolicy::AutoRename })
        CHECK(collisionPolicyFromName(collisionPolicyName(p)) == p);
    CHECK(collisionPolicyFromName("") == CollisionPolicy::Ask);
}

TEST_CASE("saved sites") {
    QTemporaryDir tmp;
    QSettings ini(tmp.filePath("sites.ini"), QSettings::IniFormat);

    SessionParams a;
    a.id = "prod";
    a.host = "prod.example.org";
    a.port = 2200;
    a.username = "deploy";
    a.auth = AuthMethod::PrivateKey;
    a.private_key_path = std::string("/keys/deploy");
    a.known_hosts_policy = KnownHostsPolicy::AcceptNew;
    SessionParams b;
    b.id = "lab";
    b.host = "10.0.0.5";
    b.username = "me";
    b.auth = AuthMethod::Password;
    b.credential_ref = "vault:lab";

    {
        SiteStore store(&ini);
        store.upsert(a);
        store.upsert(b);
        b.port = 2022;
        store.upsert(b);
        CHECK(store.sites().size() == 2);
        store.save();
    }
    SiteStore store(&ini);
    store.load();
    REQUIRE(store.sites().size() == 2);
    auto prod = store.find("prod");
    REQUIRE(prod.has_value());
    CHECK(prod->host == "prod.example.org");
    CHECK(prod->port == 2200);
    CHECK(prod->auth == AuthMethod::PrivateKey);
    CHECK(prod->private_key_path.value_or("") == "/keys/deploy");
    CHECK(prod->known_hosts_policy == KnownHostsPolicy::AcceptNew);
    CHECK_FALSE(prod->known_hosts_path.has_value());
    auto lab = store.find("lab");
    REQUIRE(lab.has_value());
    CHECK(lab->port == 2022);
    CHECK(lab->credential_ref == "vault:lab");

    CHECK(store.remove("prod"));
    CHECK_FALSE(store.remove("prod"));
    store.save();
    SiteStore again(&ini);
    again.load();
    CHECK(again.sites().size() == 1);
    CHECK_FALSE(again.find("prod").has_value());
}

TEST_CASE("secret keys") {
    SessionParams p;
    p.id = "prod";
    p.auth = AuthMethod::Password;
    CHECK(SecretStore::keyFor(p) == "site:prod:password");
    p.auth = AuthMethod::PrivateKey;
    CHECK(SecretStore::keyFor(p) == "site:prod:keypass");
    p.credential_ref = "vault:prod";
    CHECK(SecretStore::keyFor(p) == "vault:prod");

    SecretStore store;
    p.auth = AuthMethod::Agent;
    CHECK_FALSE(store.getCredential(p).has_value());
}

TEST_CASE("secrets are only kept when the fallback is enabled") {
    SecretStore store;
    SessionParams p;
    p.id = "lab";
    p.auth = AuthMethod::Password;

    qunsetenv("REMOTE_BRIDGE_ENABLE_INSECURE_FALLBACK");
    CHECK_FALSE(SecretStore::insecureFallbackActive());
    store.setSecret(SecretStore::keyFor(p), "hunter2");
    CHECK_FALSE(store.getCredential(p).has_value());

#ifndef REMOTE_BRIDGE_BUILD_SECURE_ONLY
    qputenv("REMOTE_BRIDGE_ENABLE_INSECURE_FALLBACK", "1");
    CHECK(SecretStore::insecureFallbackActive());
    store.setSecret(SecretStore::keyFor(p), "hunter2");
    CHECK(store.getCredential(p).value_or("") == "hunter2");
    store.removeSecret(SecretStore::keyFor(p));
    CHECK_FALSE(store.getSecret(SecretStore::keyFor(p)).has_value());
    qunsetenv("REMOTE_BRIDGE_ENABLE_INSECURE_FALLBACK");
#endif
}
