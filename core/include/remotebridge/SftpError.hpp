// Error taxonomy shared by the transport, queue and shadow layers.
// Operations return bool and fill an Error out-parameter.
#pragma once
#include <string>
#include <utility>

namespace remotebridge {

enum class ErrorKind {
    None,
    // connect
    AuthFailure,
    NetworkUnreachable,
    HostKeyMismatch,
    // transport
    Timeout,
    Disconnected,
    PermissionDenied,
    NotFound,
    Io,
    // local filesystem side of a transfer
    LocalIo,
    // shadow sync precondition
    RemoteChangedSinceOpen,
    Cancelled
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::AuthFailure: return "auth_failure";
        case ErrorKind::NetworkUnreachable: return "network_unreachable";
        case ErrorKind::HostKeyMismatch: return "host_key_mismatch";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Disconnected: return "disconnected";
        case ErrorKind::PermissionDenied: return "permission_denied";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Io: return "io";
        case ErrorKind::LocalIo: return "local_io";
        case ErrorKind::RemoteChangedSinceOpen: return "remote_changed_since_open";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "none";
}

inline ErrorKind errorKindFromName(const std::string& s) {
    for (int i = 0; i <= static_cast<int>(ErrorKind::Cancelled); ++i) {
        ErrorKind k = static_cast<ErrorKind>(i);
        if (s == errorKindName(k)) return k;
    }
    return ErrorKind::None;
}

// Worth retrying at all (possibly after reconnecting).
inline bool isRetryable(ErrorKind k) {
    return k == ErrorKind::Timeout || k == ErrorKind::Io ||
           k == ErrorKind::Disconnected || k == ErrorKind::NetworkUnreachable;
}

// Retried by the scheduler without user action. A lost session needs a reconnect first.
inline bool isAutoRetryable(ErrorKind k) {
    return k == ErrorKind::Timeout || k == ErrorKind::Io;
}

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool empty() const { return kind == ErrorKind::None && message.empty(); }
    void clear() { kind = ErrorKind::None; message.clear(); }
    void set(ErrorKind k, std::string msg) { kind = k; message = std::move(msg); }
    bool retryable() const { return isRetryable(kind); }
    std::string describe() const {
        if (message.empty()) return errorKindName(kind);
        return message;
    }
};

} // namespace remotebridge
