#include "log.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace cl {
namespace log {

namespace {

bool stderrIsTerminal() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

std::atomic<Level> g_minLevel{Level::Info};
std::atomic<bool> g_color{stderrIsTerminal()};
std::mutex g_sinkMutex;
std::ofstream g_file;

struct LevelStyle {
    const char* tag;
    const char* color;
};

LevelStyle styleOf(Level level) {
    switch (level) {
        case Level::Debug:
            return {"DEBUG", "\033[36m"};
        case Level::Info:
            return {"INFO ", "\033[32m"};
        case Level::Warning:
            return {"WARN ", "\033[33m"};
        case Level::Error:
            return {"ERROR", "\033[31m"};
    }
    return {"?????", ""};
}

// HH:MM:SS.mmm, local time
std::string clockStamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000);

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    char stamp[16];
    std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d.%03ld", local.tm_hour, local.tm_min,
                  local.tm_sec, millis);
    return stamp;
}

void emit(Level level, std::string_view module, std::string_view message) {
    if (level < g_minLevel.load()) {
        return;
    }

    LevelStyle style = styleOf(level);
    std::string stamp = clockStamp();

    // [HH:MM:SS.mmm] [LEVEL] [module] message
    std::string prefix = "[" + stamp + "] [" + style.tag + "] ";

    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (g_color.load()) {
        std::cerr << style.color << prefix << "\033[0m";
    } else {
        std::cerr << prefix;
    }
    std::cerr << '[' << module << "] " << message << '\n';

    if (g_file.is_open()) {
        g_file << prefix << '[' << module << "] " << message << '\n';
        g_file.flush();
    }
}

std::string vformat(const char* format, std::va_list args) {
    std::va_list measure;
    va_copy(measure, args);
    int needed = std::vsnprintf(nullptr, 0, format, measure);
    va_end(measure);

    if (needed < 0) {
        return format;
    }
    std::string text(static_cast<size_t>(needed) + 1, '\0');
    std::vsnprintf(text.data(), text.size(), format, args);
    text.resize(static_cast<size_t>(needed));
    return text;
}

} // namespace

void setLevel(Level level) {
    g_minLevel.store(level);
}

Level getLevel() {
    return g_minLevel.load();
}

Level levelFromInt(int value) {
    if (value <= static_cast<int>(Level::Debug)) {
        return Level::Debug;
    }
    if (value >= static_cast<int>(Level::Error)) {
        return Level::Error;
    }
    return static_cast<Level>(value);
}

void debug(std::string_view module, std::string_view message) {
    emit(Level::Debug, module, message);
}

void info(std::string_view module, std::string_view message) {
    emit(Level::Info, module, message);
}

void warning(std::string_view module, std::string_view message) {
    emit(Level::Warning, module, message);
}

void error(std::string_view module, std::string_view message) {
    emit(Level::Error, module, message);
}

void debugf(const char* module, const char* format, ...) {
    if (Level::Debug < g_minLevel.load()) {
        return;
    }
    std::va_list args;
    va_start(args, format);
    std::string message = vformat(format, args);
    va_end(args);
    emit(Level::Debug, module, message);
}

void infof(const char* module, const char* format, ...) {
    if (Level::Info < g_minLevel.load()) {
        return;
    }
    std::va_list args;
    va_start(args, format);
    std::string message = vformat(format, args);
    va_end(args);
    emit(Level::Info, module, message);
}

void warningf(const char* module, const char* format, ...) {
    if (Level::Warning < g_minLevel.load()) {
        return;
    }
    std::va_list args;
    va_start(args, format);
    std::string message = vformat(format, args);
    va_end(args);
    emit(Level::Warning, module, message);
}

void errorf(const char* module, const char* format, ...) {
    std::va_list args;
    va_start(args, format);
    std::string message = vformat(format, args);
    va_end(args);
    emit(Level::Error, module, message);
}

void setColorEnabled(bool enabled) {
    g_color.store(enabled);
}

bool setLogFile(const Path& path) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (g_file.is_open()) {
        g_file.close();
    }
    g_file.open(path, std::ios::out | std::ios::app);
    if (!g_file.is_open()) {
        std::cerr << "Cannot open log file " << path.string() << '\n';
        return false;
    }
    return true;
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (g_file.is_open()) {
        g_file.close();
    }
}

} // namespace log
} // namespace cl
