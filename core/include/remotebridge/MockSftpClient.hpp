// Simulated SFTP backend for tests and offline runs (--mock).
// Every client created from the same MockRemoteFs (including through
// newConnectionLike) sees the same files, so a pooled session behaves like
// several connections to one server.
#pragma once
#include "SftpClient.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>

namespace remotebridge {

class MockRemoteFs {
public:
    MockRemoteFs();

    // Small browsable tree used by the --mock command line option.
    static std::shared_ptr<MockRemoteFs> demo();

    // Seeding and inspection. writeFile creates missing parent directories.
    void addDir(const std::string& path);
    void writeFile(const std::string& path, const std::string& data);
    bool readFile(const std::string& path, std::string& out) const;
    bool exists(const std::string& path) const;
    bool statPath(const std::string& path, FileInfo& out) const;
    void remove(const std::string& path);

    // Fault injection. times < 0 means "until cleared".
    void failTransfers(const std::string& path, ErrorKind kind, int times = -1);
    void clearFailures();
    void setConnectError(ErrorKind kind, const std::string& message = std::string());
    void setRequiredPassword(const std::optional<std::string>& pw);
    // Non-empty: the presented host key differs from the known one.
    void setHostKeyMismatch(const std::string& presentedFingerprint);
    void setChunkSize(std::size_t bytes);
    void setChunkDelay(std::chrono::milliseconds delay);
    // Drop every live connection once the given number of payload bytes has moved.
    void dropConnectionsAfter(std::uint64_t bytes);
    void dropConnections();

    // Observation
    int maxConcurrentWrites(const std::string& path) const;
    int completedPuts(const std::string& path) const;
    int maxConcurrentOps() const;
    int connectCount() const;

private:
    friend class MockSftpClient;

    struct Node {
        bool dir = false;
        std::string data;
        std::uint64_t mtime = 0;
        std::uint32_t mode = 0644;
    };
    struct Failure {
        ErrorKind kind = ErrorKind::None;
        int remaining = -1;
    };

    std::uint64_t tickLocked();
    void addDirLocked(const std::string& path);
    bool takeFailure(const std::string& path, Error& err);
    void countBytes(std::uint64_t n);
    std::uint64_t generation() const;
    void beginOp();
    void endOp();
    void beginWrite(const std::string& path);
    void endWrite(const std::string& path);

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    std::map<std::string, Failure> failures_;
    std::map<std::string, int> activeWrites_;
    std::map<std::string, int> maxWrites_;
    std::map<std::string, int> completedPuts_;
    ErrorKind connectError_ = ErrorKind::None;
    std::string connectMessage_;
    std::optional<std::string> requiredPassword_;
    std::string mismatchFingerprint_;
    std::size_t chunkSize_ = 64 * 1024;
    std::chrono::milliseconds chunkDelay_{0};
    std::uint64_t clock_ = 1700000000;
    std::uint64_t generation_ = 1;
    std::uint64_t dropAfter_ = 0;
    std::uint64_t bytesSinceArm_ = 0;
    int activeOps_ = 0;
    int maxOps_ = 0;
    int connects_ = 0;
};

class MockSftpClient : public SftpClient {
public:
    MockSftpClient();
    explicit MockSftpClient(std::shared_ptr<MockRemoteFs> fs);

    const std::shared_ptr<MockRemoteFs>& fs() const { return fs_; }

    bool connect(const SessionOptions& opt, Error& err) override;
    void disconnect() override;
    bool isConnected() const override;

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              Error& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             Error& err,
             ProgressCB progress,
             CancelCB shouldCancel,
             bool resume) override;

    bool put(const std::string& local,
             const std::string& remote,
             Error& err,
             ProgressCB progress,
             CancelCB shouldCancel,
             bool resume) override;

    bool exists(const std::string& remote_path,
                bool& isDir,
                Error& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              Error& err) override;

    bool mkdir(const std::string& remote_dir,
               Error& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path,
                    Error& err) override;

    bool removeDir(const std::string& remote_dir,
                   Error& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                Error& err,
                bool overwrite = false) override;

    std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                  Error& err) override;

private:
    bool checkAlive(Error& err) const;

    std::shared_ptr<MockRemoteFs> fs_;
    bool connected_ = false;
    std::uint64_t generation_ = 0;
};

} // namespace remotebridge
