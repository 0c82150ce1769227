#include "log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

static std::atomic<int> g_log_level{SWARM_LOG_LEVEL_INFO};
static std::mutex g_log_mutex;
static swarm_log_callback g_log_callback;

const char * swarm_log_level_to_str(swarm_log_level level) {
    switch (level) {
        case SWARM_LOG_LEVEL_DEBUG: return "D";
        case SWARM_LOG_LEVEL_INFO:  return "I";
        case SWARM_LOG_LEVEL_WARN:  return "W";
        case SWARM_LOG_LEVEL_ERROR: return "E";
        default:                    return "-";
    }
}

void swarm_log_set_level(swarm_log_level level) {
    g_log_level.store(level);
}

swarm_log_level swarm_log_get_level() {
    return static_cast<swarm_log_level>(g_log_level.load());
}

void swarm_log_set_callback(swarm_log_callback callback) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_callback = std::move(callback);
}

void swarm_log_printf(swarm_log_level level, const char * fmt, ...) {
    va_list args;
    va_start(args, fmt);

    va_list args_copy;
    va_copy(args_copy, args);
    const int n = vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    std::string text;
    if (n > 0) {
        std::vector<char> buf(n + 1);
        vsnprintf(buf.data(), buf.size(), fmt, args);
        text.assign(buf.data(), n);
    }
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_callback) {
        g_log_callback(level, text);
        return;
    }

    fprintf(stderr, "%s %s", swarm_log_level_to_str(level), text.c_str());
    fflush(stderr);
}
