// One authenticated SSH endpoint with a bounded pool of SFTP connections.
// Thread-safe: transfer workers call it concurrently; each call borrows one
// pooled connection for its duration.
#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace remotebridge {

enum class SessionState { Disconnected, Connecting, Connected, Failed };

const char* sessionStateName(SessionState s);

class TransportSession {
public:
    using StateListener = std::function<void(SessionState state, const std::string& reason)>;

    // `factory` is never connected itself; every pooled connection comes from
    // factory->newConnectionLike(). maxConnections bounds concurrent operations.
    TransportSession(std::string id, std::unique_ptr<SftpClient> factory, std::size_t maxConnections = 3);
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    const std::string& id() const { return id_; }
    std::size_t maxConnections() const;
    SessionState state() const;
    std::string failureReason() const;
    bool isConnected() const { return state() == SessionState::Connected; }
    // Endpoint of the last connect, secrets stripped (for ssh/rsync command lines).
    SessionOptions endpoint() const;

    // Called on every transition, possibly from a worker thread.
    void setStateListener(StateListener cb);
    // Deadline for each blocking network call; applies to connections opened afterwards.
    void setOperationTimeout(int ms);

    bool connect(const SessionOptions& opt, Error& err);
    // Explicit teardown: in-flight operations abort with Disconnected.
    void disconnect();

    bool list(const std::string& path, std::vector<FileInfo>& out, Error& err);
    bool stat(const std::string& path, FileInfo& info, Error& err);
    bool exists(const std::string& path, bool& isDir, Error& err);
    bool get(const std::string& remote, const std::string& local, Error& err,
             SftpClient::ProgressCB progress = {}, SftpClient::CancelCB shouldCancel = {},
             bool resume = false);
    bool put(const std::string& local, const std::string& remote, Error& err,
             SftpClient::ProgressCB progress = {}, SftpClient::CancelCB shouldCancel = {},
             bool resume = false);
    bool mkdir(const std::string& dir, Error& err, unsigned int mode = 0755);
    // Create every missing component of `dir`.
    bool mkdirs(const std::string& dir, Error& err);
    bool removeFile(const std::string& path, Error& err);
    bool removeDir(const std::string& dir, Error& err);
    bool rename(const std::string& from, const std::string& to, Error& err, bool overwrite = false);

private:
    struct Slot {
        std::shared_ptr<SftpClient> client;
        bool busy = false;
    };
    class Lease;

    std::shared_ptr<SftpClient> acquire(std::uint64_t& generation, Error& err);
    void release(const std::shared_ptr<SftpClient>& client, std::uint64_t generation);
    void markFailed(std::uint64_t generation, const std::string& reason);
    void teardownLocked(SessionState next, const std::string& reason,
                        std::vector<std::shared_ptr<SftpClient>>& idle);
    void notify(SessionState s, const std::string& reason);
    template <typename Fn> bool run(Error& err, Fn&& fn);
    SftpClient::CancelCB wrapCancel(SftpClient::CancelCB user) const;
    void translateAbort(Error& err, const SftpClient::CancelCB& user) const;

    const std::string id_;
    std::unique_ptr<SftpClient> factory_;
    std::size_t limit_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<Slot> slots_;
    std::size_t opening_ = 0;
    SessionState state_ = SessionState::Disconnected;
    std::string reason_;
    std::optional<SessionOptions> opt_;
    int timeoutMs_ = 20000;
    std::uint64_t generation_ = 0;
    std::atomic<bool> broken_{false};
    std::mutex listenerMtx_;
    StateListener listener_;
};

} // namespace remotebridge
