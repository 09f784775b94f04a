#include <cubeland/land/greedy_mesher.hpp>

#include <cubeland/land/land_public_consts.hpp>

#include <glm/vec3.hpp>

#include <algorithm>

namespace cubeland::land
{

namespace
{

size_t reserveHint(size_t expected, const VoxelGrid &grid, size_t per_face) noexcept
{
	// Every block has at most 6 faces, don't overallocate for small grids
	return std::min(expected, grid.numBlocks() * NUM_FACE_ORIENTATIONS * per_face);
}

} // namespace

namespace GreedyMesher
{

bool blockExists(const VoxelGrid &grid, int64_t x, int64_t y, int64_t z) noexcept
{
	if (y < 0) {
		return true;
	}

	std::optional<Block> block = grid.tryLoad(x, y, z);
	return block.has_value() && block->isOpaque();
}

bool isFaceExposed(const VoxelGrid &grid, glm::uvec3 cell, FaceOrientation orientation) noexcept
{
	if (!grid[cell].isOpaque()) {
		return false;
	}

	glm::ivec3 n = glm::ivec3(cell) + faceInfo(orientation).normal;
	return !blockExists(grid, n.x, n.y, n.z);
}

std::vector<uint8_t> buildExposureMask(const VoxelGrid &grid, FaceOrientation orientation)
{
	const uint32_t size = grid.size();
	std::vector<uint8_t> mask(grid.numBlocks(), 0);

	for (uint32_t x = 0; x < size; x++) {
		for (uint32_t y = 0; y < size; y++) {
			for (uint32_t z = 0; z < size; z++) {
				mask[grid.linearIndex(x, y, z)] = isFaceExposed(grid, glm::uvec3(x, y, z), orientation) ? 1 : 0;
			}
		}
	}

	return mask;
}

std::vector<MeshQuad> mergeFaces(const VoxelGrid &grid, FaceOrientation orientation)
{
	const FaceInfo &face = faceInfo(orientation);
	const uint32_t size = grid.size();

	std::vector<uint8_t> mask = buildExposureMask(grid, orientation);
	std::vector<MeshQuad> quads;

	auto cellAt = [&](uint32_t i, uint32_t j, uint32_t k) { return face.di * i + face.dj * j + face.dk * k; };
	auto maskIndex = [&](glm::uvec3 c) { return grid.linearIndex(c.x, c.y, c.z); };
	auto mergeable = [&](glm::uvec3 c, BlockType type) {
		return mask[maskIndex(c)] != 0 && grid[c].blocktype == type;
	};

	for (uint32_t i = 0; i < size; i++) {
		for (uint32_t j = 0; j < size; j++) {
			for (uint32_t k = 0; k < size; k++) {
				const glm::uvec3 start = cellAt(i, j, k);
				if (mask[maskIndex(start)] == 0) {
					continue;
				}

				const BlockType type = grid[start].blocktype;

				// Extend along K as far as possible
				uint32_t run_k = 1;
				while (k + run_k < size && mergeable(cellAt(i, j, k + run_k), type)) {
					run_k++;
				}

				// Then along J, limited by the shortest run of every K row
				uint32_t run_j = size - j;
				for (uint32_t dk = 0; dk < run_k; dk++) {
					uint32_t r = 1;
					while (r < run_j && mergeable(cellAt(i, j + r, k + dk), type)) {
						r++;
					}
					run_j = r;
				}

				for (uint32_t dj = 0; dj < run_j; dj++) {
					for (uint32_t dk = 0; dk < run_k; dk++) {
						mask[maskIndex(cellAt(i, j + dj, k + dk))] = 0;
					}
				}

				quads.emplace_back(MeshQuad {
					.origin = start,
					.extent_j = run_j,
					.extent_k = run_k,
					.blocktype = type,
				});
			}
		}
	}

	return quads;
}

ChunkMeshData build(int64_t chunk_x, int64_t chunk_z, const VoxelGrid &grid)
{
	ChunkMeshData data;
	const size_t vertex_hint = reserveHint(Consts::EXPECTED_VERTICES, grid, 4);
	data.positions.reserve(vertex_hint);
	data.normals.reserve(vertex_hint);
	data.block_types.reserve(vertex_hint);
	data.indices.reserve(reserveHint(Consts::EXPECTED_INDICES, grid, QUAD_INDICES.size()));

	const glm::vec3 chunk_offset(float(chunk_x), 0.0f, float(chunk_z));

	for (FaceOrientation orientation : ALL_FACE_ORIENTATIONS) {
		const FaceInfo &face = faceInfo(orientation);
		const glm::vec3 normal(face.normal);

		IndexRange &range = data.ranges[faceIndex(orientation)];
		range.first_index = uint32_t(data.indices.size());

		for (const MeshQuad &quad : mergeFaces(grid, orientation)) {
			const glm::vec3 scale = glm::vec3(1.0f) + glm::vec3(face.dj) * float(quad.extent_j - 1)
				+ glm::vec3(face.dk) * float(quad.extent_k - 1);
			const glm::vec3 translation = glm::vec3(quad.origin) + chunk_offset;
			const uint32_t base_vertex = uint32_t(data.positions.size());

			for (const glm::vec3 &vertex : face.vertices) {
				data.positions.emplace_back(vertex * scale + translation);
				data.normals.emplace_back(normal);
				data.block_types.emplace_back(float(uint8_t(quad.blocktype)));
			}

			for (uint32_t index : QUAD_INDICES) {
				data.indices.emplace_back(base_vertex + index);
			}
		}

		range.num_indices = uint32_t(data.indices.size()) - range.first_index;
	}

	return data;
}

} // namespace GreedyMesher

} // namespace cubeland::land
