#include <cubeland/land/voxel_grid.hpp>

#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/exception.hpp>

#include <glm/common.hpp>
#include <glm/ext/vector_uint3_sized.hpp>

#include <algorithm>

namespace cubeland::land
{

VoxelGrid::VoxelGrid(uint32_t size) : m_size(size)
{
	if (size == 0) {
		throw Exception::fromError(CubelandErrc::InvalidData, "voxel grid size must be positive");
	}

	m_blocks.resize(size_t(size) * size * size);
}

std::optional<Block> VoxelGrid::tryLoad(int64_t x, int64_t y, int64_t z) const noexcept
{
	if (!contains(x, y, z)) {
		return std::nullopt;
	}

	return load(uint32_t(x), uint32_t(y), uint32_t(z));
}

void VoxelGrid::fill(Block value) noexcept
{
	std::fill(m_blocks.begin(), m_blocks.end(), value);
}

void VoxelGrid::fill(glm::uvec3 begin, glm::uvec3 extent, Block value) noexcept
{
	// Clip the box to the grid, computing in 64 bits to not overflow
	const glm::u64vec3 end = glm::min(glm::u64vec3(begin) + glm::u64vec3(extent), glm::u64vec3(m_size));

	for (uint64_t x = begin.x; x < end.x; x++) {
		for (uint64_t y = begin.y; y < end.y; y++) {
			if (begin.z >= end.z) {
				continue;
			}

			auto first = m_blocks.begin() + ptrdiff_t(linearIndex(uint32_t(x), uint32_t(y), begin.z));
			std::fill_n(first, end.z - begin.z, value);
		}
	}
}

size_t VoxelGrid::count(BlockType type) const noexcept
{
	return size_t(std::count_if(m_blocks.begin(), m_blocks.end(),
		[type](const Block &b) { return b.blocktype == type; }));
}

} // namespace cubeland::land
