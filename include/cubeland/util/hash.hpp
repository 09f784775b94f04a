#pragma once

#include <cubeland/visibility.hpp>

#include <cstdint>

namespace cubeland
{

// Collection of hash utilities
namespace Hash
{

// Fixed-size (64-bit input) XXH64 with zero seed, can be useful to make
// well-distributed bits out of anything. XXH64 is bijective for 64-bit inputs
// so you can even directly compare hashes instead of keys <= 8 bytes.
CUBELAND_API uint64_t xxh64Fixed(uint64_t data) noexcept;

// Hash a pair of 64-bit values into one. Order-sensitive, `combine(a, b) != combine(b, a)`
// in general. Not bijective, collisions are possible but well-distributed.
CUBELAND_API uint64_t combine(uint64_t first, uint64_t second) noexcept;

} // namespace Hash

} // namespace cubeland
