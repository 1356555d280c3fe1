#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

// xxHash64 of a byte range
uint64_t xxHash64(const void* data, size_t length, uint64_t seed = 0);

// Content fingerprint used as the cache key: xxHash64 (seed 0) of the raw
// bytes as 16 lower-case hex digits.
std::string fingerprint(const std::string& bytes);
