#include <cubeland/land/terrain_generator.hpp>

#include <algorithm>
#include <cmath>

namespace cubeland::land
{

TerrainGenerator::TerrainGenerator(uint32_t seed) noexcept
	: m_seed(seed)
	, m_detail_noise(uint64_t(seed))
	, m_soil_noise(uint64_t(seed) * 7)
	, m_mountain_noise(uint64_t(seed) * 13)
	, m_offset_noise(uint64_t(seed) * 17)
{}

TerrainGenerator::ColumnSample TerrainGenerator::sampleColumn(int64_t world_x, int64_t world_z,
	uint32_t chunk_size) const noexcept
{
	const double x = double(world_x);
	const double z = double(world_z);

	const double detail = m_detail_noise.sample(x * 0.07, z * 0.04);
	const double soil = m_soil_noise.sample(x * 0.05, z * 0.05);
	const double mountain = m_mountain_noise.sample(x * 0.005, z * 0.005);
	const double offset = m_offset_noise.sample(x * 0.001, z * 0.001);

	// Noise is clamped to [-1; 1] so the base of `pow` is never negative
	const double mountain_mask = std::pow(mountain + 1.0, Consts::MOUNTAIN_MASK_EXPONENT);
	const double raw_height = Consts::BASE_HEIGHT + offset * Consts::HEIGHT_OFFSET_AMPLITUDE
		+ Consts::BASE_VARIANCE * mountain_mask * detail;

	const int64_t max_height = std::max<int64_t>(1, int64_t(chunk_size) - 1);
	const int64_t height = std::clamp<int64_t>(int64_t(std::round(raw_height)), 1, max_height);

	return ColumnSample {
		.height = int32_t(height),
		.soil_thickness = Consts::SOIL_BASE_THICKNESS + soil * Consts::SOIL_THICKNESS_VARIANCE,
	};
}

void TerrainGenerator::generate(int64_t chunk_x, int64_t chunk_z, VoxelGrid &grid) const noexcept
{
	const uint32_t size = grid.size();
	grid.fill(Block { BlockType::Air });

	for (uint32_t block_x = 0; block_x < size; block_x++) {
		for (uint32_t block_z = 0; block_z < size; block_z++) {
			const ColumnSample column = sampleColumn(chunk_x + block_x, chunk_z + block_z, size);
			const int32_t height = std::min<int32_t>(column.height, int32_t(size));
			const bool has_soil = height <= Consts::SOIL_MAX_HEIGHT;

			for (int32_t y = 0; y < height; y++) {
				BlockType type = BlockType::Stone;

				if (has_soil && double(y) + column.soil_thickness >= double(height)) {
					type = y >= height - Consts::GRASS_LAYERS ? BlockType::Grass : BlockType::Dirt;
				}

				grid.store(block_x, uint32_t(y), block_z, Block { type });
			}

			const int32_t water_top = std::min<int32_t>(Consts::WATER_LEVEL, int32_t(size));
			for (int32_t y = height; y < water_top; y++) {
				grid.store(block_x, uint32_t(y), block_z, Block { BlockType::Water });
			}
		}
	}
}

VoxelGrid TerrainGenerator::generate(int64_t chunk_x, int64_t chunk_z, uint32_t chunk_size) const
{
	VoxelGrid grid(chunk_size);
	generate(chunk_x, chunk_z, grid);
	return grid;
}

} // namespace cubeland::land
