// Remote path normalization (always POSIX separators, independent of the local OS).
#include "remotebridge/RemotePath.hpp"

namespace remotebridge {

std::vector<std::string> splitRemotePath(const std::string& path) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

std::string normalizeRemotePath(const std::string& path) {
    std::vector<std::string> out;
    for (const auto& seg : splitRemotePath(path)) {
        if (seg == ".") continue;
        if (seg == "..") {
            if (!out.empty()) out.pop_back(); // ".." above root stays at root
            continue;
        }
        out.push_back(seg);
    }
    if (out.empty()) return "/";
    std::string res;
    for (const auto& seg : out) {
        res += '/';
        res += seg;
    }
    return res;
}

std::string joinRemotePath(const std::string& base, const std::string& child) {
    if (child.empty()) return normalizeRemotePath(base);
    if (child.front() == '/') return normalizeRemotePath(child);
    if (base.empty()) return normalizeRemotePath(child);
    return normalizeRemotePath(base + "/" + child);
}

std::string remoteParent(const std::string& path) {
    const std::string n = normalizeRemotePath(path);
    auto pos = n.find_last_of('/');
    if (pos == 0 || pos == std::string::npos) return "/";
    return n.substr(0, pos);
}

std::string remoteBaseName(const std::string& path) {
    const std::string n = normalizeRemotePath(path);
    if (n == "/") return std::string();
    return n.substr(n.find_last_of('/') + 1);
}

RemotePathResolver::RemotePathResolver(std::string home)
    : home_(normalizeRemotePath(home)), cwd_(home_) {}

std::string RemotePathResolver::resolve(const std::string& path) const {
    if (path.empty()) return cwd_;
    if (path == "~") return home_;
    if (path.rfind("~/", 0) == 0) return joinRemotePath(home_, path.substr(2));
    return joinRemotePath(cwd_, path);
}

const std::string& RemotePathResolver::cd(const std::string& path) {
    cwd_ = resolve(path);
    return cwd_;
}

const std::string& RemotePathResolver::up() {
    cwd_ = remoteParent(cwd_);
    return cwd_;
}

} // namespace remotebridge
