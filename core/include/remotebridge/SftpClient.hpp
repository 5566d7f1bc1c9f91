// Abstract interface for SFTP operations. Concrete implementations (libssh2, mock)
// follow this API so the transfer engine stays decoupled from the backend.
// One instance is one connection and is not thread-safe; TransportSession pools them.
#pragma once
#include "SftpTypes.hpp"
#include "SftpError.hpp"
#include <functional>
#include <memory>

namespace remotebridge {

class SftpClient {
public:
    using ProgressCB = std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, Error& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Remote directory listing
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      Error& err) = 0;

    // Download a remote file to local; if resume=true, try to continue a partial download.
    // A cancelled copy returns false with ErrorKind::Cancelled.
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     Error& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {},
                     bool resume = false) = 0;

    // Upload a local file to remote; if resume=true, try to continue a partial upload
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     Error& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {},
                     bool resume = false) = 0;

    // Check existence (leave err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        Error& err) = 0;

    // Detailed metadata (stat). Missing paths return false with ErrorKind::NotFound.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      Error& err) = 0;

    // Remote file/folder operations
    virtual bool mkdir(const std::string& remote_dir,
                       Error& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            Error& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           Error& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        Error& err,
                        bool overwrite = false) = 0;

    // Create a new connection of the same type with the given options.
    virtual std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                          Error& err) = 0;
};

} // namespace remotebridge
