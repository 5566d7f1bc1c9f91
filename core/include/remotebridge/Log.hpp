// Minimal logging utility (header-only) shared by core and the engine.
// Enabled by setting REMOTE_BRIDGE_LOG to anything but "0".
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>

namespace remotebridge {

inline bool logEnabled() {
    const char* v = std::getenv("REMOTE_BRIDGE_LOG");
    return v && *v && *v != '0';
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[RemoteBridge][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace remotebridge

#define LOGI(fmt, ...) \
    do { \
        if (remotebridge::logEnabled()) \
            remotebridge::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (remotebridge::logEnabled()) \
            remotebridge::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (remotebridge::logEnabled()) \
            remotebridge::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
