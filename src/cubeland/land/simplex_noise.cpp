#include <cubeland/land/simplex_noise.hpp>

#include <cubeland/util/hash.hpp>

#include <glm/geometric.hpp>
#include <glm/vec2.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace cubeland::land
{

namespace
{

// Skew/unskew factors for 2D: (sqrt(3) - 1) / 2 and (3 - sqrt(3)) / 6
constexpr double SKEW = 0.3660254037844386;
constexpr double UNSKEW = 0.21132486540518713;

// Brings the sum of three kernel contributions to roughly `[-1; 1]`
constexpr double OUTPUT_SCALE = 70.0;

constexpr double DIAG = 0.7071067811865476;

// Eight unit gradient directions, evenly spaced
const std::array<glm::dvec2, 8> GRADIENTS = {
	glm::dvec2(1.0, 0.0),
	glm::dvec2(DIAG, DIAG),
	glm::dvec2(0.0, 1.0),
	glm::dvec2(-DIAG, DIAG),
	glm::dvec2(-1.0, 0.0),
	glm::dvec2(-DIAG, -DIAG),
	glm::dvec2(0.0, -1.0),
	glm::dvec2(DIAG, -DIAG),
};

} // namespace

SimplexNoise2D::SimplexNoise2D(uint64_t seed) noexcept : m_seed(seed), m_seed_hash(Hash::xxh64Fixed(seed)) {}

double SimplexNoise2D::gradDot(int64_t ix, int64_t iz, double dx, double dz) const noexcept
{
	double falloff = 0.5 - dx * dx - dz * dz;
	if (falloff <= 0.0) {
		return 0.0;
	}

	uint64_t h = Hash::xxh64Fixed(Hash::combine(uint64_t(ix), uint64_t(iz)) ^ m_seed_hash);
	// Top bits of XXH64 output are the best distributed ones
	const glm::dvec2 &grad = GRADIENTS[h >> 61];

	falloff *= falloff;
	return falloff * falloff * glm::dot(grad, glm::dvec2(dx, dz));
}

double SimplexNoise2D::sample(double x, double z) const noexcept
{
	const double skew = (x + z) * SKEW;
	const double x0d = std::floor(x + skew);
	const double z0d = std::floor(z + skew);
	const int64_t x0 = static_cast<int64_t>(x0d);
	const int64_t z0 = static_cast<int64_t>(z0d);

	// Offsets from the first simplex corner in unskewed space
	const double unskew = (x0d + z0d) * UNSKEW;
	const double dx0 = x - (x0d - unskew);
	const double dz0 = z - (z0d - unskew);

	// Middle corner depends on which triangle of the skewed cell we are in
	const int64_t step_x = dx0 >= dz0 ? 1 : 0;
	const int64_t step_z = 1 - step_x;

	const double dx1 = dx0 - double(step_x) + UNSKEW;
	const double dz1 = dz0 - double(step_z) + UNSKEW;
	const double dx2 = dx0 - 1.0 + 2.0 * UNSKEW;
	const double dz2 = dz0 - 1.0 + 2.0 * UNSKEW;

	double result = gradDot(x0, z0, dx0, dz0);
	result += gradDot(x0 + step_x, z0 + step_z, dx1, dz1);
	result += gradDot(x0 + 1, z0 + 1, dx2, dz2);

	return std::clamp(OUTPUT_SCALE * result, -1.0, 1.0);
}

} // namespace cubeland::land
