#pragma once

#include <cubeland/visibility.hpp>

#include <cstdint>

namespace cubeland::land
{

// Seeded 2D simplex noise. Lattice gradients are derived by hashing
// lattice point coordinates together with the seed, so any number of
// independent noise fields can be created without permutation tables.
//
// Sampling is pure and deterministic: the same seed and coordinates
// always give the same value, on any platform with IEEE doubles.
class CUBELAND_API SimplexNoise2D {
public:
	explicit SimplexNoise2D(uint64_t seed) noexcept;

	// Sample the noise field, result is in `[-1; 1]`
	double sample(double x, double z) const noexcept;

	uint64_t seed() const noexcept { return m_seed; }

private:
	uint64_t m_seed = 0;
	// Pre-hashed seed mixed into every lattice point hash
	uint64_t m_seed_hash = 0;

	double gradDot(int64_t ix, int64_t iz, double dx, double dz) const noexcept;
};

} // namespace cubeland::land
