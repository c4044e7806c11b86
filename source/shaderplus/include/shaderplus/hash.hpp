#pragma once

#include <xxhash.h>

#include <cstdint>
#include <string_view>

namespace shaderplus
{
    inline uint64_t xxhash64(const void* data, size_t len, uint64_t seed = 0) { return XXH64(data, len, seed); }
    inline uint64_t xxhash64(std::string_view s, uint64_t seed = 0) { return XXH64(s.data(), s.size(), seed); }
} // namespace shaderplus
