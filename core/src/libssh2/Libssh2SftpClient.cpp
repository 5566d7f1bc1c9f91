// libssh2 backend: manages TCP socket, SSH session, and SFTP channel.
// Includes keepalive, known_hosts validation, per-operation timeouts and resume support.
#include "remotebridge/Libssh2SftpClient.hpp"
#include "remotebridge/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <cstring>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <mutex>
#include <cstdlib>
#include <cstdio>
#include <sstream>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace remotebridge {

// Global libssh2 initialization (once per process)
static std::once_flag g_libssh2_once;

// Context for keyboard-interactive: respond with username/password based on the prompt
struct KbdIntCtx {
    const char* user;
    const char* pass;
    const KbdIntPromptsCB* cb; // optional: UI callback for prompts
};

static char* dupResponse(const char* s, std::size_t len, unsigned int& outLen) {
    outLen = 0;
    if (!s || len == 0) return nullptr;
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    outLen = (unsigned int)len;
    return buf;
}

// Keyboard-interactive callback: respond to prompts with username/password based on the text
static void kbint_password_callback(const char* name, int name_len,
                                    const char* instruction, int instruction_len,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                                    void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    // If a UI callback is provided, give it a chance to answer the prompts.
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> ptxts;
        for (int i = 0; i < num_prompts; ++i) {
            const char* pt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
            ptxts.emplace_back(pt);
        }
        std::vector<std::string> answers;
        std::string nm = (name && name_len > 0) ? std::string(name, (size_t)name_len) : std::string();
        std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, (size_t)instruction_len) : std::string();
        if ((*(ctx->cb))(nm, ins, ptxts, answers) && (int)answers.size() >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i) {
                const std::string& a = answers[(size_t)i];
                responses[i].text = dupResponse(a.data(), a.size(), responses[i].length);
            }
            return;
        }
    }
    // Heuristic: prompts mentioning "user" or "name" get the username, the rest the password.
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        for (auto& c : prompt) c = (char)std::tolower((unsigned char)c);
        const bool wantUser = prompt.find("user") != std::string::npos || prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        responses[i].text = dupResponse(ans, ans ? std::strlen(ans) : 0, responses[i].length);
    }
}

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] {
        if (libssh2_init(0) != 0) LOGE("libssh2_init failed");
    });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::requireConnected(Error& err) {
    if (!connected_ || !sftp_) {
        err.set(ErrorKind::Disconnected, "Not connected");
        return false;
    }
    return true;
}

void Libssh2SftpClient::fail(Error& err, int rc, const std::string& what) {
    if (rc == 0 && session_) rc = libssh2_session_last_errno(session_);
    ErrorKind kind = ErrorKind::Io;
    std::string detail = "libssh2 error " + std::to_string(rc);
    switch (rc) {
        case LIBSSH2_ERROR_TIMEOUT:
            kind = ErrorKind::Timeout;
            detail = "operation timed out";
            break;
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
            kind = ErrorKind::Disconnected;
            detail = "connection lost";
            break;
        case LIBSSH2_ERROR_SFTP_PROTOCOL: {
            unsigned long fx = sftp_ ? libssh2_sftp_last_error(sftp_) : 0;
            switch (fx) {
                case LIBSSH2_FX_NO_SUCH_FILE:
                case LIBSSH2_FX_NO_SUCH_PATH:
                    kind = ErrorKind::NotFound;
                    detail = "no such file or directory";
                    break;
                case LIBSSH2_FX_PERMISSION_DENIED:
                case LIBSSH2_FX_WRITE_PROTECT:
                    kind = ErrorKind::PermissionDenied;
                    detail = "permission denied";
                    break;
                case LIBSSH2_FX_NO_CONNECTION:
                case LIBSSH2_FX_CONNECTION_LOST:
                    kind = ErrorKind::Disconnected;
                    detail = "connection lost";
                    break;
                case LIBSSH2_FX_FILE_ALREADY_EXISTS:
                    detail = "already exists";
                    break;
                case LIBSSH2_FX_DIR_NOT_EMPTY:
                    detail = "directory not empty";
                    break;
                case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
                case LIBSSH2_FX_QUOTA_EXCEEDED:
                    detail = "no space left on remote filesystem";
                    break;
                default:
                    detail = "SFTP status " + std::to_string(fx);
                    break;
            }
            break;
        }
        default:
            break;
    }
    // A timeout can strike mid-packet; the session state is unknown afterwards.
    if (kind == ErrorKind::Disconnected || kind == ErrorKind::Timeout) connected_ = false;
    err.set(kind, what + ": " + detail);
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, Error& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::NetworkUnreachable, std::string("getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // Timeouts are handled by libssh2_session_set_timeout, not SO_RCVTIMEO,
        // which interferes with userauth on some servers.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __linux__
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err.set(ErrorKind::NetworkUnreachable, "Could not connect to " + host + ":" + portStr);
    return false;
}

static std::string hostKeyFingerprint(LIBSSH2_SESSION* session) {
    std::ostringstream oss;
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
    const int len = 32;
    oss << "SHA256:";
#else
    const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA1);
    const int len = 20;
    oss << "SHA1:";
#endif
    if (!h) return std::string();
    for (int i = 0; i < len; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
        oss << b;
    }
    return oss.str();
}

static int knownHostAlgorithm(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default: return 0;
    }
}

static const char* hostKeyAlgorithmName(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
        case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
        default: return "UNKNOWN";
    }
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, Error& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::Io, "Could not initialize known_hosts");
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char* home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::HostKeyMismatch, "known_hosts missing or unreadable (strict policy)");
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Io, "Could not obtain host key");
        return false;
    }

    const int alg = knownHostAlgorithm(keytype);
    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    const std::string fp = hostKeyFingerprint(session_);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(nh);
        // A changed key only passes when the caller hands back the exact fingerprint.
        if (opt.trusted_fingerprint && *opt.trusted_fingerprint == fp) {
            LOGW("Host key for %s changed; accepted explicitly (%s)", opt.host.c_str(), fp.c_str());
            return true;
        }
        err.set(ErrorKind::HostKeyMismatch, "Host key does not match known_hosts (presented " + fp + ")");
        return false;
    }

    if (opt.known_hosts_policy != KnownHostsPolicy::AcceptNew) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::HostKeyMismatch, "Unknown host in known_hosts (presented " + fp + ")");
        return false;
    }

    // TOFU: ask the user for confirmation if a callback is available
    bool confirmed = opt.trusted_fingerprint && *opt.trusted_fingerprint == fp;
    if (!confirmed && opt.hostkey_confirm_cb) {
        confirmed = opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyAlgorithmName(keytype), fp);
    }
    if (!confirmed) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::HostKeyMismatch, "Unknown host: fingerprint not confirmed (" + fp + ")");
        return false;
    }
    if (khPath.empty()) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Io, "known_hosts path not defined");
        return false;
    }
    const int addMask = (opt.known_hosts_hash_names ? LIBSSH2_KNOWNHOST_TYPE_SHA1 : LIBSSH2_KNOWNHOST_TYPE_PLAIN) |
                        LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey, keylen,
                                       nullptr, 0, addMask, nullptr);
    if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Io, "Could not add host to known_hosts");
        return false;
    }
    libssh2_knownhost_free(nh);
    return true;
}

bool Libssh2SftpClient::agentAuth(const std::string& user) {
    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3; // servers drop the session after too many attempts
        while (libssh2_agent_get_identity(agent, &identity, prev) == 0 && tries < kMaxAgentTries) {
            prev = identity;
            ++tries;
            int arc = -1;
            for (;;) {
                arc = libssh2_agent_userauth(agent, user.c_str(), identity);
                if (arc != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (arc == 0) {
                authed = true;
                break;
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

bool Libssh2SftpClient::authenticate(const SessionOptions& opt, Error& err) {
    // Prefer the method explicitly provided: key, then password/kbd-int, then agent.
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_, opt.username.c_str(), nullptr,
                                                     opt.private_key_path->c_str(), passphrase);
        if (rc != 0) {
            err.set(ErrorKind::AuthFailure, "Public key authentication failed");
            return false;
        }
        return true;
    }

    std::string authlist;
    auto loadMethods = [&]() {
        if (!authlist.empty()) return;
        char* methods = libssh2_userauth_list(session_, opt.username.c_str(), (unsigned)opt.username.size());
        authlist = methods ? std::string(methods) : std::string();
    };
    auto hasMethod = [&](const char* m) { return authlist.find(m) != std::string::npos; };

    if (opt.password.has_value()) {
        // Password first, to avoid exhausting attempts with 'none' or the agent.
        int rc_pw = -1;
        for (;;) {
            rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
            if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (rc_pw == 0) return true;
        if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
            rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
            err.set(ErrorKind::AuthFailure, "Server closed the connection after the password attempt");
            return false;
        }
        loadMethods();
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str(), &opt.keyboard_interactive_cb};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            int rc_kbd = -1;
            for (;;) {
                rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_password_callback);
                if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs) *abs = nullptr;
            if (rc_kbd == 0) return true;
        }
    }

    loadMethods();
    if (hasMethod("publickey") && agentAuth(opt.username)) return true;

    char* emsgPtr = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    std::string msg = opt.password ? "Password authentication failed" : "No usable credentials (key/agent/password)";
    if (!authlist.empty()) msg += " (methods: " + authlist + ")";
    if (emsgPtr && emlen > 0) msg += ": " + std::string(emsgPtr, (size_t)emlen);
    err.set(ErrorKind::AuthFailure, msg);
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, Error& err) {
    if (connected_) {
        err.set(ErrorKind::Io, "Already connected");
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err)) return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorKind::Io, "libssh2_session_init failed");
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.timeout_ms > 0 ? opt.timeout_ms : 0);
    if (libssh2_session_handshake(session_, sock_) != 0) {
        fail(err, 0, "SSH handshake failed");
        if (err.kind == ErrorKind::Io) err.kind = ErrorKind::NetworkUnreachable;
        disconnect();
        return false;
    }
    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        fail(err, 0, "Could not initialize SFTP");
        disconnect();
        return false;
    }
    connected_ = true;
    LOGI("Connected to %s@%s:%u", opt.username.c_str(), opt.host.c_str(), (unsigned)opt.port);
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

static void fillInfo(FileInfo& fi, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        fi.mode = attrs.permissions;
        const unsigned long type = attrs.permissions & LIBSSH2_SFTP_S_IFMT;
        fi.is_dir = type == LIBSSH2_SFTP_S_IFDIR;
        fi.kind = fi.is_dir ? EntryKind::Directory
                            : (type == LIBSSH2_SFTP_S_IFLNK ? EntryKind::Symlink : EntryKind::File);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        fi.uid = attrs.uid;
        fi.gid = attrs.gid;
    }
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             Error& err) {
    if (!requireConnected(err)) return false;

    std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        fail(err, 0, "Could not open directory " + path);
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename, rc);
            if (fi.name == "." || fi.name == "..") continue;
            fillInfo(fi, attrs);
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            fail(err, rc, "Could not read directory " + path);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

// Download a remote file to local. Reports progress and supports cooperative cancellation.
bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            Error& err,
                            ProgressCB progress,
                            CancelCB shouldCancel,
                            bool resume) {
    if (!requireConnected(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int src = libssh2_sftp_stat_ex(sftp_, remote.c_str(), (unsigned)remote.size(), LIBSSH2_SFTP_STAT, &st);
    if (src != 0) {
        fail(err, src, "Could not stat " + remote);
        return false;
    }
    const std::uint64_t total = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)st.filesize : 0;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                                                  LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        fail(err, 0, "Could not open " + remote + " for reading");
        return false;
    }

    FILE* lf = nullptr;
    std::uint64_t offset = 0;
    if (resume) {
        lf = std::fopen(local.c_str(), "ab");
        if (lf) {
            long cur = std::ftell(lf);
            if (cur > 0 && (std::uint64_t)cur < total) {
                offset = (std::uint64_t)cur;
                libssh2_sftp_seek64(rh, (libssh2_uint64_t)offset);
            } else if (cur > 0) {
                // Local copy is not a prefix we can continue from; start over.
                std::fclose(lf);
                lf = nullptr;
            }
        }
    }
    if (!lf) lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err.set(ErrorKind::LocalIo, "Could not open local file for writing: " + local);
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::uint64_t done = offset;

    while (true) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled");
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return false;
        }
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                err.set(ErrorKind::LocalIo, "Local write failed: " + local);
                std::fclose(lf);
                libssh2_sftp_close(rh);
                return false;
            }
            done += (std::uint64_t)n;
            if (progress) progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            fail(err, (int)n, "Remote read failed for " + remote);
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return false;
        }
    }

    std::fclose(lf);
    libssh2_sftp_close(rh);
    return true;
}

// Upload a local file to remote (create/truncate). Reports progress and supports cancellation.
bool Libssh2SftpClient::put(const std::string& local,
                            const std::string& remote,
                            Error& err,
                            ProgressCB progress,
                            CancelCB shouldCancel,
                            bool resume) {
    if (!requireConnected(err)) return false;

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err.set(ErrorKind::LocalIo, "Could not open local file for reading: " + local);
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::uint64_t total = fsz > 0 ? (std::uint64_t)fsz : 0;

    long startOffset = 0;
    if (resume) {
        LIBSSH2_SFTP_ATTRIBUTES stR{};
        if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), (unsigned)remote.size(), LIBSSH2_SFTP_STAT, &stR) == 0 &&
            (stR.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
            startOffset = (long)stR.filesize;
        }
    }
    const bool continuing = resume && startOffset > 0 && (std::uint64_t)startOffset < total;
    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | (continuing ? 0 : LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                                                  flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        fail(err, 0, "Could not open " + remote + " for writing");
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::uint64_t done = 0;

    if (continuing) {
        libssh2_sftp_seek64(wh, (libssh2_uint64_t)startOffset);
        if (std::fseek(lf, startOffset, SEEK_SET) != 0) {
            err.set(ErrorKind::LocalIo, "Could not seek local file: " + local);
            libssh2_sftp_close(wh);
            std::fclose(lf);
            return false;
        }
        done = (std::uint64_t)startOffset;
    }

    while (true) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err.set(ErrorKind::LocalIo, "Local read failed: " + local);
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            break; // EOF
        }
        char* p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                err.set(ErrorKind::Cancelled, "Cancelled");
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                fail(err, (int)w, "Remote write failed for " + remote);
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            remain -= (size_t)w;
            p += w;
            done += (std::uint64_t)w;
            if (progress) progress(done, total);
        }
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    return true;
}

// Lightweight existence check using sftp_stat.
bool Libssh2SftpClient::exists(const std::string& remote_path,
                               bool& isDir,
                               Error& err) {
    isDir = false;
    if (!requireConnected(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc == 0) {
        if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            isDir = ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR);
        }
        return true;
    }
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_FAILURE) {
            err.clear();
            return false; // does not exist
        }
    }
    fail(err, rc, "Could not stat " + remote_path);
    return false;
}

bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             Error& err) {
    if (!requireConnected(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        fail(err, rc, "Could not stat " + remote_path);
        return false;
    }
    info = FileInfo{};
    auto slash = remote_path.find_last_of('/');
    info.name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    fillInfo(info, st);
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir,
                              Error& err,
                              unsigned int mode) {
    if (!requireConnected(err)) return false;
    int rc = libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode);
    if (rc != 0) {
        fail(err, rc, "Could not create directory " + remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   Error& err) {
    if (!requireConnected(err)) return false;
    int rc = libssh2_sftp_unlink(sftp_, remote_path.c_str());
    if (rc != 0) {
        fail(err, rc, "Could not remove " + remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string& remote_dir,
                                  Error& err) {
    if (!requireConnected(err)) return false;
    int rc = libssh2_sftp_rmdir(sftp_, remote_dir.c_str());
    if (rc != 0) {
        fail(err, rc, "Could not remove directory " + remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string& from,
                               const std::string& to,
                               Error& err,
                               bool overwrite) {
    if (!requireConnected(err)) return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    int rc = libssh2_sftp_rename_ex(sftp_, from.c_str(), (unsigned)from.size(),
                                    to.c_str(), (unsigned)to.size(), flags);
    if (rc != 0) {
        fail(err, rc, "Could not rename " + from + " to " + to);
        return false;
    }
    return true;
}

std::unique_ptr<SftpClient> Libssh2SftpClient::newConnectionLike(const SessionOptions& opt,
                                                                 Error& err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace remotebridge
