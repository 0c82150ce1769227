#pragma once

#include <functional>
#include <string>

//
// Leveled printf-style logging shared by the swarm library, examples and tests
//

#if defined(__GNUC__)
#    define SWARM_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#else
#    define SWARM_ATTRIBUTE_FORMAT(...)
#endif

enum swarm_log_level {
    SWARM_LOG_LEVEL_DEBUG,
    SWARM_LOG_LEVEL_INFO,
    SWARM_LOG_LEVEL_WARN,
    SWARM_LOG_LEVEL_ERROR,
    SWARM_LOG_LEVEL_NONE
};

// receives every formatted record at or above the threshold (text includes the trailing newline)
using swarm_log_callback = std::function<void(swarm_log_level level, const std::string & text)>;

const char * swarm_log_level_to_str(swarm_log_level level);

void swarm_log_set_level(swarm_log_level level);
swarm_log_level swarm_log_get_level();

// pass nullptr to restore the default stderr sink
void swarm_log_set_callback(swarm_log_callback callback);

void swarm_log_printf(swarm_log_level level, const char * fmt, ...) SWARM_ATTRIBUTE_FORMAT(2, 3);

#define LOG_TMPL(level, ...) \
    do { \
        if ((level) >= swarm_log_get_level()) { \
            swarm_log_printf((level), __VA_ARGS__); \
        } \
    } while (0)

#define LOG_DBG(...) LOG_TMPL(SWARM_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_INF(...) LOG_TMPL(SWARM_LOG_LEVEL_INFO,  __VA_ARGS__)
#define LOG_WRN(...) LOG_TMPL(SWARM_LOG_LEVEL_WARN,  __VA_ARGS__)
#define LOG_ERR(...) LOG_TMPL(SWARM_LOG_LEVEL_ERROR, __VA_ARGS__)
