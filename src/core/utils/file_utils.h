#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../types.h"

namespace cl {
namespace file {

// Whole-file read. Logs and returns nullopt when the file cannot be opened.
Result<std::string> readText(const Path& path);

// Truncating write in place
[[nodiscard]] bool writeText(const Path& path, std::string_view content);

// Writes "<path>.tmp" next to the target and renames it over the target, so
// readers never see a half-written report or config
[[nodiscard]] bool replaceText(const Path& path, std::string_view content);

bool exists(const Path& path);
bool isDirectory(const Path& path);

// Creates the directory that will hold `path` (no-op for bare filenames)
[[nodiscard]] bool ensureParentDirectory(const Path& path);

// Regular files directly inside `directory` whose extension matches
// `extension` case-insensitively, sorted by path
std::vector<Path> listFiles(const Path& directory, std::string_view extension);

std::string getStem(const Path& path);

} // namespace file
} // namespace cl
