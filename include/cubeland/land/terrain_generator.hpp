#pragma once

#include <cubeland/land/land_public_consts.hpp>
#include <cubeland/land/simplex_noise.hpp>
#include <cubeland/land/voxel_grid.hpp>
#include <cubeland/visibility.hpp>

#include <cstdint>

namespace cubeland::land
{

// Fills chunk block grids from layered 2D noise.
//
// Every column depends only on the seed and its world-space X/Z position,
// so terrain is continuous across chunk boundaries and any chunk can be
// regenerated at any time with identical results.
class CUBELAND_API TerrainGenerator {
public:
	// Result of sampling one terrain column
	struct ColumnSample {
		// Number of solid blocks in the column, in `[1; chunk_size - 1]`
		int32_t height;
		// Soil (dirt + grass) thickness, only used when `height` is low enough
		double soil_thickness;
	};

	explicit TerrainGenerator(uint32_t seed) noexcept;

	// Sample column at world-space block coordinates.
	// `chunk_size` bounds the resulting height from above.
	ColumnSample sampleColumn(int64_t world_x, int64_t world_z,
		uint32_t chunk_size = Consts::CHUNK_SIZE) const noexcept;

	// Overwrite every block of `grid` with terrain of the chunk whose
	// origin is at world-space block coordinates `(chunk_x, chunk_z)`
	void generate(int64_t chunk_x, int64_t chunk_z, VoxelGrid &grid) const noexcept;
	// Same as above but creates a new grid of the given size
	VoxelGrid generate(int64_t chunk_x, int64_t chunk_z, uint32_t chunk_size = Consts::CHUNK_SIZE) const;

	uint32_t seed() const noexcept { return m_seed; }

private:
	uint32_t m_seed;

	// Fields are seeded with `seed`, `seed*7`, `seed*13` and `seed*17` to avoid correlation
	SimplexNoise2D m_detail_noise;
	SimplexNoise2D m_soil_noise;
	SimplexNoise2D m_mountain_noise;
	SimplexNoise2D m_offset_noise;
};

} // namespace cubeland::land
