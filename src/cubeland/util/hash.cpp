#include <cubeland/util/hash.hpp>

#include <bit>

namespace cubeland
{

namespace Hash
{

uint64_t xxh64Fixed(uint64_t data) noexcept
{
	constexpr uint64_t PRIME1 = 11400714785074694791ULL;
	constexpr uint64_t PRIME2 = 14029467366897019727ULL;
	constexpr uint64_t PRIME3 = 1609587929392839161ULL;
	constexpr uint64_t PRIME4 = 9650029242287828579ULL;
	// `prime5` + fixed 8-byte size
	constexpr uint64_t INIT = 2870177450012600261ULL + 8ULL;

	// Perform one single 64-bit processing step
	data = std::rotl(data * PRIME2, 31) * PRIME1;
	uint64_t result = std::rotl(INIT ^ data, 27) * PRIME1 + PRIME4;
	result ^= result >> 33;
	result *= PRIME2;
	result ^= result >> 29;
	result *= PRIME3;
	result ^= result >> 32;
	return result;
}

uint64_t combine(uint64_t first, uint64_t second) noexcept
{
	// Rotation breaks the symmetry so swapped pairs land on different hashes
	return xxh64Fixed(std::rotl(xxh64Fixed(first), 17) ^ second);
}

} // namespace Hash

} // namespace cubeland
