#include "string_utils.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace cl {
namespace str {

namespace {

constexpr std::string_view BLANKS = " \t\r\n\f\v";

bool isBlank(char c) {
    return BLANKS.find(c) != std::string_view::npos;
}

} // namespace

std::string trim(std::string_view s) {
    size_t first = s.find_first_not_of(BLANKS);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = s.find_last_not_of(BLANKS);
    return std::string(s.substr(first, last - first + 1));
}

std::string toLower(std::string_view s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower;
}

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

bool splitKeyValue(std::string_view line, std::string& key, std::string& value) {
    size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
        return false;
    }
    std::string k = trim(line.substr(0, eq));
    if (k.empty()) {
        return false;
    }
    key = std::move(k);
    value = trim(line.substr(eq + 1));
    return true;
}

bool parseInt(std::string_view s, int& out) {
    int value = 0;
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return false;
    }
    out = value;
    return true;
}

bool parseDouble(std::string_view s, double& out) {
    // strtod would skip leading blanks and accept "inf"/"nan"
    if (s.empty() || isBlank(s.front())) {
        return false;
    }
    std::string text(s);
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

bool parseBool(std::string_view s, bool& out) {
    const std::string word = toLower(trim(s));
    for (const char* yes : {"true", "1", "yes", "on"}) {
        if (word == yes) {
            out = true;
            return true;
        }
    }
    for (const char* no : {"false", "0", "no", "off"}) {
        if (word == no) {
            out = false;
            return true;
        }
    }
    return false;
}

std::string formatMm(double value) {
    char buffer[64];
    int len = std::snprintf(buffer, sizeof(buffer), "%.3f", value);
    if (len <= 0 || static_cast<size_t>(len) >= sizeof(buffer)) {
        return std::to_string(value);
    }

    std::string text(buffer, static_cast<size_t>(len));
    size_t keep = text.find_last_not_of('0');
    if (text[keep] == '.') {
        --keep;
    }
    text.erase(keep + 1);
    return text == "-0" ? "0" : text;
}

} // namespace str
} // namespace cl
