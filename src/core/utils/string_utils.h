#pragma once

#include <string>
#include <string_view>

namespace cl {
namespace str {

// Strips ASCII whitespace from both ends
std::string trim(std::string_view s);

std::string toLower(std::string_view s);

bool startsWith(std::string_view s, std::string_view prefix);

// Splits an INI line at the first '=' and trims both halves.
// False when there is no '=' or the key is empty.
bool splitKeyValue(std::string_view line, std::string& key, std::string& value);

// Strict parsers: the whole input must be a number, with no surrounding
// blanks. `out` is untouched on failure.
bool parseInt(std::string_view s, int& out);
bool parseDouble(std::string_view s, double& out);

// true/false, 1/0, yes/no, on/off in any case, surrounding blanks allowed
bool parseBool(std::string_view s, bool& out);

// Millimeter value with at most three decimals and no trailing zeros ("600", "2.5")
std::string formatMm(double value);

} // namespace str
} // namespace cl
