// Session registry and wiring of the transfer, history, watch and shadow components.
// Lives on the Qt thread.
#pragma once
#include <QObject>
#include <QStringList>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include "BridgeSettings.hpp"
#include "remotebridge/CredentialProvider.hpp"
#include "remotebridge/RemotePath.hpp"
#include "remotebridge/SftpClient.hpp"
#include "remotebridge/TransportSession.hpp"

class TransferQueue;
class TransferHistory;
class TransferManager;
class FileWatchDispatcher;
class ShadowStore;
class DropIngest;
class RsyncTransport;

class BridgeEngine : public QObject {
    Q_OBJECT
public:
    // Produces the (never connected) prototype each session clones its connections from.
    using ClientFactory = std::function<std::unique_ptr<remotebridge::SftpClient>()>;

    // Empty historyPath: TransferHistory::defaultPath().
    explicit BridgeEngine(const BridgeSettings& settings, const QString& historyPath = QString(),
                          QObject* parent = nullptr);
    ~BridgeEngine() override;

    void setClientFactory(ClientFactory f) { factory_ = std::move(f); }
    // Not owned. Without one, sessions connect with agent/key auth only.
    void setCredentialProvider(remotebridge::CredentialProvider* p) { credentials_ = p; }
    // Asked when known_hosts has no entry and the policy is AcceptNew.
    void setHostKeyConfirm(std::function<bool(const std::string&, std::uint16_t, const std::string&,
                                              const std::string&)> cb) { hostKeyConfirm_ = std::move(cb); }

    void applySettings(const BridgeSettings& s);
    const BridgeSettings& settings() const { return settings_; }

    TransferQueue* queue() const { return queue_; }
    TransferHistory* history() const { return history_.get(); }
    TransferManager* manager() const { return manager_; }
    FileWatchDispatcher* watcher() const { return watcher_; }
    ShadowStore* shadows() const { return shadows_; }
    DropIngest* drops() const { return drops_.get(); }

    // Registers the session on first use. `trustedFingerprint` accepts a changed host key explicitly.
    bool connectSession(const remotebridge::SessionParams& params, remotebridge::Error& err,
                        const std::optional<std::string>& trustedFingerprint = std::nullopt);
    // In-flight transfers fail with Disconnected; queued ones wait for a reconnect.
    void disconnectSession(const QString& id);
    bool reconnectSession(const QString& id, remotebridge::Error& err,
                          const std::optional<std::string>& trustedFingerprint = std::nullopt);
    // Cancels the session's transfers and forgets it.
    void removeSession(const QString& id);

    QStringList sessionIds() const;
    std::shared_ptr<remotebridge::TransportSession> session(const QString& id) const;
    remotebridge::RemotePathResolver* resolver(const QString& id);

    // Relative paths resolve against the session's current directory.
    bool listRemote(const QString& id, const QString& path, std::vector<remotebridge::FileInfo>& out,
                    remotebridge::Error& err);
    bool changeDirectory(const QString& id, const QString& path, remotebridge::Error& err);

    // Flush shadows, stop workers, disconnect everything.
    void shutdown();

signals:
    void sessionStateChanged(const QString& id, const QString& state, const QString& reason);

private:
    struct SessionSlot {
        remotebridge::SessionParams params;
        std::shared_ptr<remotebridge::TransportSession> session;
        std::unique_ptr<remotebridge::RemotePathResolver> resolver;
        std::optional<std::string> trustedFingerprint;
        bool attached = false;
    };

    bool connectSlot(SessionSlot& slot, remotebridge::Error& err);
    void onSessionState(const QString& id, remotebridge::SessionState state, const QString& reason);

    BridgeSettings settings_;
    ClientFactory factory_;
    remotebridge::CredentialProvider* credentials_ = nullptr;
    std::function<bool(const std::string&, std::uint16_t, const std::string&, const std::string&)> hostKeyConfirm_;

    TransferQueue* queue_ = nullptr;
    std::unique_ptr<TransferHistory> history_;
    TransferManager* manager_ = nullptr;
    FileWatchDispatcher* watcher_ = nullptr;
    ShadowStore* shadows_ = nullptr;
    std::unique_ptr<DropIngest> drops_;
    std::shared_ptr<RsyncTransport> rsync_;
    std::map<QString, SessionSlot> sessions_;
    bool shutDown_ = false;
};
