#pragma once

enum toolwire_log_level {
    TOOLWIRE_LOG_LEVEL_ERROR = 2,
    TOOLWIRE_LOG_LEVEL_WARN  = 3,
    TOOLWIRE_LOG_LEVEL_INFO  = 4,
    TOOLWIRE_LOG_LEVEL_DEBUG = 5,
};

typedef void (*toolwire_log_callback)(enum toolwire_log_level level, const char * text, void * user_data);

// Set the log callback for all toolwire output. Pass nullptr to restore the default (stderr).
void toolwire_log_set(toolwire_log_callback log_callback, void * user_data);

#ifdef __GNUC__
#    define TOOLWIRE_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#else
#    define TOOLWIRE_ATTRIBUTE_FORMAT(...)
#endif

TOOLWIRE_ATTRIBUTE_FORMAT(2, 3)
void toolwire_log_internal(enum toolwire_log_level level, const char * format, ...);

#define TOOLWIRE_LOG_ERROR(...) toolwire_log_internal(TOOLWIRE_LOG_LEVEL_ERROR, __VA_ARGS__)
#define TOOLWIRE_LOG_WARN(...)  toolwire_log_internal(TOOLWIRE_LOG_LEVEL_WARN , __VA_ARGS__)
#define TOOLWIRE_LOG_INFO(...)  toolwire_log_internal(TOOLWIRE_LOG_LEVEL_INFO , __VA_ARGS__)
#define TOOLWIRE_LOG_DEBUG(...) toolwire_log_internal(TOOLWIRE_LOG_LEVEL_DEBUG, __VA_ARGS__)
