#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace kott {
namespace Logger {

enum class Level { DEBUG, INFO, WARN, ERROR, OFF };

namespace detail {
    constexpr const char* names[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};

    inline std::atomic<int>& threshold() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline std::mutex& outputMutex() {
        static std::mutex mutex;
        return mutex;
    }

    /** Wall-clock time string (HH:MM:SS) */
    inline void getTimestamp(char* buffer, size_t size) {
        time_t now = time(nullptr);
        struct tm local;
        localtime_r(&now, &local);
        strftime(buffer, size, "%H:%M:%S", &local);
    }

    template<typename... Args>
    void log(Level level, const char* tag, const char* message, Args... args) {
        if (static_cast<int>(level) < threshold().load(std::memory_order_relaxed)) {
            return;
        }

        char buf[1024];
        char timeBuf[16];
        getTimestamp(timeBuf, sizeof(timeBuf));

        int n = snprintf(buf, sizeof(buf), "%s [%s] [%s] ",
                         timeBuf, names[static_cast<int>(level)], tag);
        if (n < 0) return;
        int m = snprintf(buf + n, sizeof(buf) - n, message, args...);
        if (m < 0) return;
        n = std::min<int>(n + m, static_cast<int>(sizeof(buf)) - 2);
        buf[n++] = '\n';

        std::lock_guard<std::mutex> lock(outputMutex());
        fwrite(buf, 1, n, stderr);
    }

    // Plain message, no format arguments
    inline void log(Level level, const char* tag, const char* message) {
        log(level, tag, "%s", message);
    }
} // namespace detail

inline void setLevel(Level level) {
    detail::threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline Level getLevel() {
    return static_cast<Level>(detail::threshold().load(std::memory_order_relaxed));
}

/** Parse "debug" / "info" / "warn" / "error" / "off"; returns false if unknown */
inline bool parseLevel(const std::string& text, Level& out) {
    if (text == "debug") { out = Level::DEBUG; return true; }
    if (text == "info")  { out = Level::INFO;  return true; }
    if (text == "warn")  { out = Level::WARN;  return true; }
    if (text == "error") { out = Level::ERROR; return true; }
    if (text == "off")   { out = Level::OFF;   return true; }
    return false;
}

template<typename... Args>
void debug(const char* tag, const char* message, Args... args) {
    detail::log(Level::DEBUG, tag, message, args...);
}

template<typename... Args>
void info(const char* tag, const char* message, Args... args) {
    detail::log(Level::INFO, tag, message, args...);
}

template<typename... Args>
void warn(const char* tag, const char* message, Args... args) {
    detail::log(Level::WARN, tag, message, args...);
}

template<typename... Args>
void error(const char* tag, const char* message, Args... args) {
    detail::log(Level::ERROR, tag, message, args...);
}

} // namespace Logger
} // namespace kott

#endif // LOGGER_HPP
