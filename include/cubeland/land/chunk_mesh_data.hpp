#pragma once

#include <cubeland/land/face_table.hpp>

#include <glm/vec3.hpp>

#include <array>
#include <cstdint>
#include <vector>

namespace cubeland::land
{

// Contiguous subrange of a chunk's index buffer
struct IndexRange {
	uint32_t first_index = 0;
	uint32_t num_indices = 0;

	bool operator==(const IndexRange &other) const noexcept = default;
};

// CPU-side chunk geometry produced by meshing, ready to be uploaded.
//
// Vertex attributes are stored as separate arrays of equal length (one
// element per vertex). Indices reference them and are grouped by face
// orientation: all quads facing one direction form one contiguous range.
struct ChunkMeshData {
	std::vector<glm::vec3> positions;
	std::vector<glm::vec3> normals;
	// Numeric `BlockType` value of each vertex, consumed as a float vertex attribute
	std::vector<float> block_types;
	std::vector<uint32_t> indices;
	// Indexed by `faceIndex(FaceOrientation)`
	std::array<IndexRange, NUM_FACE_ORIENTATIONS> ranges = {};

	bool empty() const noexcept { return indices.empty(); }
	size_t numVertices() const noexcept { return positions.size(); }
	size_t numIndices() const noexcept { return indices.size(); }
	size_t numQuads() const noexcept { return indices.size() / QUAD_INDICES.size(); }

	const IndexRange &range(FaceOrientation orientation) const noexcept { return ranges[faceIndex(orientation)]; }
};

} // namespace cubeland::land
