#pragma once

#include <cubeland/land/block.hpp>
#include <cubeland/land/chunk_mesh_data.hpp>
#include <cubeland/land/face_table.hpp>
#include <cubeland/land/voxel_grid.hpp>
#include <cubeland/visibility.hpp>

#include <glm/vec3.hpp>

#include <cstdint>
#include <vector>

namespace cubeland::land
{

// Rectangle of coplanar same-type block faces merged into one quad.
// Extents are counted in blocks along the orientation's `dj` and `dk` axes.
struct MeshQuad {
	glm::uvec3 origin;
	uint32_t extent_j;
	uint32_t extent_k;
	BlockType blocktype;
};

// Greedy meshing of a single chunk, without looking at its neighbors.
//
// Neighbor policy for faces on the chunk border: anything below the grid
// (`y < 0`) is solid ground, anything else outside the grid is empty.
// So the chunk bottom is never rendered while its sides and top always are.
namespace GreedyMesher
{

// Whether a block "exists" at signed grid coordinates for the purpose of face culling
CUBELAND_API bool blockExists(const VoxelGrid &grid, int64_t x, int64_t y, int64_t z) noexcept;

// Whether the face of block `cell` in direction `orientation` has to be drawn.
// True iff the block is opaque and its neighbor in that direction does not exist.
CUBELAND_API bool isFaceExposed(const VoxelGrid &grid, glm::uvec3 cell, FaceOrientation orientation) noexcept;

// Per-cell exposure flags of one orientation, indexed like `VoxelGrid::linearIndex`
CUBELAND_API std::vector<uint8_t> buildExposureMask(const VoxelGrid &grid, FaceOrientation orientation);

// Merge exposed faces of one orientation into maximal-run rectangles.
// Every exposed face ends up in exactly one quad, quads never overlap.
CUBELAND_API std::vector<MeshQuad> mergeFaces(const VoxelGrid &grid, FaceOrientation orientation);

// Build complete chunk geometry. Vertex positions are offset by `(chunk_x, 0, chunk_z)`.
CUBELAND_API ChunkMeshData build(int64_t chunk_x, int64_t chunk_z, const VoxelGrid &grid);

} // namespace GreedyMesher

} // namespace cubeland::land
