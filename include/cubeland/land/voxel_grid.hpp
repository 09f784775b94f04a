#pragma once

#include <cubeland/land/block.hpp>
#include <cubeland/land/land_public_consts.hpp>
#include <cubeland/visibility.hpp>

#include <glm/vec3.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace cubeland::land
{

// Cubic XYZ-ordered 3D array of blocks with equal dimensions.
// Stores blocks of one chunk in a flat buffer, linear index is `x*S*S + y*S + z`.
//
// Element access comes in two flavors: unchecked `load`/`store`/`operator[]`
// for loops that already know their bounds, and checked `tryLoad` taking signed
// coordinates which returns `std::nullopt` for anything outside the grid.
class CUBELAND_API VoxelGrid {
public:
	// Create a grid of `size`^3 Air blocks.
	// Throws `Exception(InvalidData)` if `size` is zero.
	explicit VoxelGrid(uint32_t size = Consts::CHUNK_SIZE);

	bool operator==(const VoxelGrid &other) const = default;

	// Number of blocks along each edge
	uint32_t size() const noexcept { return m_size; }
	// Total number of blocks, `size()`^3
	size_t numBlocks() const noexcept { return m_blocks.size(); }

	bool contains(int64_t x, int64_t y, int64_t z) const noexcept
	{
		return x >= 0 && y >= 0 && z >= 0 && x < m_size && y < m_size && z < m_size;
	}

	size_t linearIndex(uint32_t x, uint32_t y, uint32_t z) const noexcept
	{
		return (size_t(x) * m_size + y) * m_size + z;
	}

	Block load(uint32_t x, uint32_t y, uint32_t z) const noexcept { return m_blocks[linearIndex(x, y, z)]; }
	void store(uint32_t x, uint32_t y, uint32_t z, Block value) noexcept { m_blocks[linearIndex(x, y, z)] = value; }

	Block operator[](glm::uvec3 c) const noexcept { return load(c.x, c.y, c.z); }
	Block &operator[](glm::uvec3 c) noexcept { return m_blocks[linearIndex(c.x, c.y, c.z)]; }

	// Checked access, returns `std::nullopt` when coordinates are outside of the grid
	std::optional<Block> tryLoad(int64_t x, int64_t y, int64_t z) const noexcept;
	std::optional<Block> tryLoad(glm::ivec3 c) const noexcept { return tryLoad(c.x, c.y, c.z); }

	void fill(Block value) noexcept;
	// Fill axis-aligned box `[begin; begin + extent)`, parts outside of the grid are ignored
	void fill(glm::uvec3 begin, glm::uvec3 extent, Block value) noexcept;

	// Count blocks of the given type, mostly useful for diagnostics
	size_t count(BlockType type) const noexcept;

	std::span<const Block> blocks() const noexcept { return m_blocks; }

private:
	uint32_t m_size = 0;
	std::vector<Block> m_blocks;
};

} // namespace cubeland::land
