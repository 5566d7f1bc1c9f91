// POSIX-style remote path helpers and the per-session "current directory".
#pragma once
#include <string>
#include <vector>

namespace remotebridge {

// Collapse "//", "." and ".." segments. Relative input is resolved against "/".
// The result is absolute and has no trailing slash (except "/").
std::string normalizeRemotePath(const std::string& path);

// Join a base directory and a child (absolute children replace the base).
std::string joinRemotePath(const std::string& base, const std::string& child);

// Parent directory ("/" for "/" and top-level entries).
std::string remoteParent(const std::string& path);

// Last component ("" for "/").
std::string remoteBaseName(const std::string& path);

// Segments of a normalized path, e.g. "/a/b" -> {"a","b"}.
std::vector<std::string> splitRemotePath(const std::string& path);

// Tracks the browsed directory of one session. Not thread-safe; lives on the UI thread.
class RemotePathResolver {
public:
    explicit RemotePathResolver(std::string home = "/");

    const std::string& cwd() const { return cwd_; }
    const std::string& home() const { return home_; }

    // Absolute normalized form of "path" relative to cwd ("~" expands to home).
    std::string resolve(const std::string& path) const;
    // Change directory; returns the new cwd.
    const std::string& cd(const std::string& path);
    const std::string& up();

private:
    std::string home_;
    std::string cwd_;
};

} // namespace remotebridge
