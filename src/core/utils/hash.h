#pragma once

#include <string_view>

#include "../types.h"

namespace cl {
namespace hash {

inline constexpr u64 FNV1A_OFFSET = 0xcbf29ce484222325ULL;
inline constexpr u64 FNV1A_PRIME = 0x100000001b3ULL;

// 64-bit FNV-1a over the bytes of `text`. Platform independent, so anything
// derived from a part name (its colour tag) is the same on every machine.
constexpr u64 fnv1a(std::string_view text) {
    u64 h = FNV1A_OFFSET;
    for (char c : text) {
        h ^= static_cast<unsigned char>(c);
        h *= FNV1A_PRIME;
    }
    return h;
}

} // namespace hash
} // namespace cl
