#include "file_utils.h"

#include <algorithm>
#include <fstream>
#include <iterator>

#include "log.h"
#include "string_utils.h"

namespace cl {
namespace file {

namespace {

constexpr const char* LOG_MODULE = "FileIO";

void logFsError(const char* action, const Path& path, const std::error_code& ec) {
    log::errorf(LOG_MODULE, "Cannot %s %s: %s", action, path.string().c_str(),
                ec.message().c_str());
}

bool extensionMatches(const Path& path, std::string_view wanted) {
    std::string ext = path.extension().string();
    if (ext.size() < 2) {
        return false;
    }
    return str::toLower(std::string_view(ext).substr(1)) == str::toLower(wanted);
}

} // namespace

Result<std::string> readText(const Path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        log::errorf(LOG_MODULE, "Cannot open %s for reading", path.string().c_str());
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool writeText(const Path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        log::errorf(LOG_MODULE, "Cannot open %s for writing", path.string().c_str());
        return false;
    }
    out << content;
    out.flush();
    if (!out) {
        log::errorf(LOG_MODULE, "Short write to %s", path.string().c_str());
        return false;
    }
    return true;
}

bool replaceText(const Path& path, std::string_view content) {
    Path staging = path;
    staging += ".tmp";
    if (!writeText(staging, content)) {
        return false;
    }

    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        logFsError("move into place", path, ec);
        std::error_code cleanup;
        if (!fs::remove(staging, cleanup) && cleanup) {
            logFsError("remove", staging, cleanup);
        }
        return false;
    }
    return true;
}

bool exists(const Path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool isDirectory(const Path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool ensureParentDirectory(const Path& path) {
    Path parent = path.parent_path();
    if (parent.empty() || isDirectory(parent)) {
        return true;
    }

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        logFsError("create directory", parent, ec);
        return false;
    }
    return true;
}

std::vector<Path> listFiles(const Path& directory, std::string_view extension) {
    std::vector<Path> matches;

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        log::warningf(LOG_MODULE, "Cannot list %s: %s", directory.string().c_str(),
                      ec.message().c_str());
        return matches;
    }

    for (const auto& entry : it) {
        std::error_code typeEc;
        if (entry.is_regular_file(typeEc) && extensionMatches(entry.path(), extension)) {
            matches.push_back(entry.path());
        }
    }

    // Iteration order is filesystem-dependent
    std::sort(matches.begin(), matches.end());
    return matches;
}

std::string getStem(const Path& path) {
    return path.stem().string();
}

} // namespace file
} // namespace cl
