#pragma once

#include <string_view>

#include "../types.h"

#if defined(__GNUC__) || defined(__clang__)
#define CL_PRINTF_FORMAT(fmtIndex, firstArg) __attribute__((format(printf, fmtIndex, firstArg)))
#else
#define CL_PRINTF_FORMAT(fmtIndex, firstArg)
#endif

namespace cl {
namespace log {

enum class Level { Debug, Info, Warning, Error };

// Messages below the minimum level are dropped before formatting (default: Info)
void setLevel(Level level);
Level getLevel();

// Config stores the level as 0 (Debug) .. 3 (Error); anything outside is clamped
Level levelFromInt(int value);

void debug(std::string_view module, std::string_view message);
void info(std::string_view module, std::string_view message);
void warning(std::string_view module, std::string_view message);
void error(std::string_view module, std::string_view message);

// printf-style variants. Long messages are never truncated.
void debugf(const char* module, const char* format, ...) CL_PRINTF_FORMAT(2, 3);
void infof(const char* module, const char* format, ...) CL_PRINTF_FORMAT(2, 3);
void warningf(const char* module, const char* format, ...) CL_PRINTF_FORMAT(2, 3);
void errorf(const char* module, const char* format, ...) CL_PRINTF_FORMAT(2, 3);

// Console output goes to stderr so stdout stays clean for report JSON.
// Colors are on only when stderr is a terminal.
void setColorEnabled(bool enabled);

// Mirror every emitted line, uncolored, into an appended file
bool setLogFile(const Path& path);
void closeLogFile();

} // namespace log
} // namespace cl
