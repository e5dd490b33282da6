#include "log.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace {

void toolwire_log_callback_default(enum toolwire_log_level level, const char * text, void * user_data) {
    (void) level;
    (void) user_data;
    fputs(text, stderr);
    fflush(stderr);
}

struct log_state {
    std::mutex            mutex;
    toolwire_log_callback callback  = toolwire_log_callback_default;
    void *                user_data = nullptr;
};

log_state & g_log() {
    static log_state state;
    return state;
}

} // namespace

void toolwire_log_set(toolwire_log_callback log_callback, void * user_data) {
    log_state & state = g_log();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.callback  = log_callback ? log_callback : toolwire_log_callback_default;
    state.user_data = user_data;
}

void toolwire_log_internal(enum toolwire_log_level level, const char * format, ...) {
    va_list args;
    va_start(args, format);
    va_list args_copy;
    va_copy(args_copy, args);

    char buffer[1024];
    int len = vsnprintf(buffer, sizeof(buffer), format, args);

    log_state & state = g_log();
    toolwire_log_callback callback;
    void * user_data;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        callback  = state.callback;
        user_data = state.user_data;
    }

    if (len >= 0 && len < (int) sizeof(buffer)) {
        callback(level, buffer, user_data);
    } else if (len >= 0) {
        char * buffer2 = new char[len + 1];
        vsnprintf(buffer2, len + 1, format, args_copy);
        buffer2[len] = 0;
        callback(level, buffer2, user_data);
        delete[] buffer2;
    }

    va_end(args_copy);
    va_end(args);
}
