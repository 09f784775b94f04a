#pragma once

#include <cstddef>
#include <cstdint>

namespace cubeland::land
{

// Terrain constants shared by generation, meshing and chunk caching, all in one place
class Consts final {
public:
	Consts() = delete;

	// --- Chunk geometry ---

	// Number of blocks along each edge of a chunk. Chunks are cubes
	// and cover the whole world height, there is no vertical chunking.
	constexpr static uint32_t CHUNK_SIZE = 32;

	// --- Caching ---

	// Radius (in chunks) around the viewer that the renderer keeps visible
	constexpr static uint32_t VISIBLE_RADIUS = 8;
	// Default chunk cache capacity: twice the number of chunks in the visible square
	constexpr static size_t MAX_CHUNKS = size_t(2 * VISIBLE_RADIUS) * size_t(2 * VISIBLE_RADIUS) * 2;

	// --- Terrain shape ---

	// Baseline column height, in blocks
	constexpr static double BASE_HEIGHT = 15.0;
	// Amplitude of the "mountainous" height component
	constexpr static double BASE_VARIANCE = 10.0;
	// Amplitude of the low-frequency height offset
	constexpr static double HEIGHT_OFFSET_AMPLITUDE = 10.0;
	// Exponent applied to the mountain mask noise
	constexpr static double MOUNTAIN_MASK_EXPONENT = 2.5;
	// Sea level. Cells below it which are not solid get filled with water.
	constexpr static int32_t WATER_LEVEL = 10;
	// Columns taller than this are bare stone, no soil on top
	constexpr static int32_t SOIL_MAX_HEIGHT = 20;
	// Soil thickness is `SOIL_BASE_THICKNESS + noise * SOIL_THICKNESS_VARIANCE`
	constexpr static double SOIL_BASE_THICKNESS = 4.0;
	constexpr static double SOIL_THICKNESS_VARIANCE = 8.0;
	// Number of top soil layers that are grass instead of dirt
	constexpr static int32_t GRASS_LAYERS = 2;

	// --- Meshing ---

	// Capacity hint for per-chunk vertex arrays. Performance tuning only.
	constexpr static size_t EXPECTED_VERTICES = 70000;
	// Capacity hint for per-chunk index arrays (6 indices per 4 vertices)
	constexpr static size_t EXPECTED_INDICES = EXPECTED_VERTICES * 3 / 2;
};

} // namespace cubeland::land
