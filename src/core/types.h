#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace cl {

namespace fs = std::filesystem;
using Path = fs::path;

using u64 = std::uint64_t;
using f64 = double;
using usize = std::size_t;

// Empty when the operation failed; the failure has already been logged
template <typename T>
using Result = std::optional<T>;

// Lengths are millimeters everywhere inside the library. Areas leave it in
// square meters.
inline constexpr f64 MM2_PER_M2 = 1e6;

constexpr f64 mm2ToM2(f64 mm2) {
    return mm2 / MM2_PER_M2;
}

} // namespace cl
