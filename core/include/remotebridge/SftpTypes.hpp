// Basic types shared between the engine and core for SFTP sessions and metadata.
// Kept simple and copyable so they can cross thread and layer boundaries.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>

namespace remotebridge {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

enum class EntryKind { File, Directory, Symlink };

// One remote directory entry. Never persisted.
struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    EntryKind     kind  = EntryKind::File;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;
};

// Identity of a remote file version: size + mtime, optionally a content hash.
struct Fingerprint {
    std::uint64_t size  = 0;
    std::uint64_t mtime = 0;
    std::string   hash;   // hex digest; empty when not computed
    bool          valid = false;

    static Fingerprint of(const FileInfo& fi) {
        Fingerprint f;
        f.size = fi.size;
        f.mtime = fi.mtime;
        f.valid = true;
        return f;
    }

    // Hashes win when both sides carry one; otherwise size+mtime.
    bool matches(const Fingerprint& o) const {
        if (!valid || !o.valid) return valid == o.valid;
        if (!hash.empty() && !o.hash.empty()) return hash == o.hash;
        return size == o.size && mtime == o.mtime;
    }
};

// Callback to answer keyboard-interactive prompts.
// Must return true and fill "responses" with one entry per prompt if the user provided input.
// If it returns false, the backend uses a heuristic (username/password) as a fallback.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

// Fully resolved connection options, secrets included. Built right before connecting.
struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;
    // Whether to hash hostnames when saving to known_hosts (OpenSSH hashed hosts)
    bool known_hosts_hash_names = true;
    // Host key the user explicitly accepted after a mismatch ("SHA256:AA:BB:...").
    std::optional<std::string> trusted_fingerprint;

    // Per-operation deadline applied to every blocking libssh2 call.
    int timeout_ms = 20000;

    // Host key confirmation (TOFU) when known_hosts lacks an entry.
    // Return true to accept and save, false to reject.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    // Custom handling for keyboard-interactive (e.g., OTP/2FA). Optional.
    KbdIntPromptsCB keyboard_interactive_cb;
};

enum class AuthMethod { Agent, Password, PrivateKey, KeyboardInteractive };

// Persistable connection parameters. Holds a credential reference, never the secret.
struct SessionParams {
    std::string id;               // session/site name
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    AuthMethod auth = AuthMethod::Agent;
    std::optional<std::string> private_key_path;
    std::optional<std::string> known_hosts_path;
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;
    std::string credential_ref;   // empty: derived from id
};

// Merge parameters with a secret obtained from a CredentialProvider.
inline SessionOptions toSessionOptions(const SessionParams& p,
                                       const std::optional<std::string>& secret) {
    SessionOptions o;
    o.host = p.host;
    o.port = p.port;
    o.username = p.username;
    o.private_key_path = p.private_key_path;
    o.known_hosts_path = p.known_hosts_path;
    o.known_hosts_policy = p.known_hosts_policy;
    if (secret) {
        if (p.auth == AuthMethod::PrivateKey) o.private_key_passphrase = secret;
        else if (p.auth != AuthMethod::Agent) o.password = secret;
    }
    return o;
}

inline const char* authMethodName(AuthMethod m) {
    switch (m) {
        case AuthMethod::Agent: return "agent";
        case AuthMethod::Password: return "password";
        case AuthMethod::PrivateKey: return "key";
        case AuthMethod::KeyboardInteractive: return "keyboard-interactive";
    }
    return "agent";
}

inline AuthMethod authMethodFromName(const std::string& s) {
    if (s == "password") return AuthMethod::Password;
    if (s == "key") return AuthMethod::PrivateKey;
    if (s == "keyboard-interactive") return AuthMethod::KeyboardInteractive;
    return AuthMethod::Agent;
}

} // namespace remotebridge
