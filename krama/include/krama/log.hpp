#pragma once
// Logging: tagged lines on stderr
//
// [HH:MM:SS.mmm][Component] message
// Debug lines only appear in verbose mode; info can be silenced.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace krama {

namespace detail {
inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline std::atomic<bool>& quiet_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void log_line(const char* level, const char* component, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    char msg_buf[1024];
    std::vsnprintf(msg_buf, sizeof(msg_buf), fmt, args);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << component << "]" << level << " " << msg_buf << "\n";
}
} // namespace detail

inline void set_verbose(bool on) { detail::verbose_flag() = on; }
inline bool verbose() { return detail::verbose_flag(); }

inline void set_quiet(bool on) { detail::quiet_flag() = on; }

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!detail::verbose_flag()) return;
    va_list args;
    va_start(args, fmt);
    detail::log_line("", component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    if (detail::quiet_flag()) return;
    va_list args;
    va_start(args, fmt);
    detail::log_line("", component, fmt, args);
    va_end(args);
}

// Warnings always print
inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::log_line(" WARN:", component, fmt, args);
    va_end(args);
}

} // namespace krama
