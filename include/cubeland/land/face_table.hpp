#pragma once

#include <cubeland/visibility.hpp>

#include <glm/vec3.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace cubeland::land
{

// One of six axis-aligned directions a block face (and a mesh quad) can face.
// Values index `MeshBatches::ranges` and are stable.
enum class FaceOrientation : uint32_t {
	Front = 0,  // +Z
	Back = 1,   // -Z
	Right = 2,  // +X
	Left = 3,   // -X
	Top = 4,    // +Y
	Bottom = 5, // -Y
};

constexpr uint32_t NUM_FACE_ORIENTATIONS = 6;

constexpr std::array<FaceOrientation, NUM_FACE_ORIENTATIONS> ALL_FACE_ORIENTATIONS = {
	FaceOrientation::Front,
	FaceOrientation::Back,
	FaceOrientation::Right,
	FaceOrientation::Left,
	FaceOrientation::Top,
	FaceOrientation::Bottom,
};

// Indices of two triangles forming a quad, relative to its first vertex
constexpr std::array<uint32_t, 6> QUAD_INDICES = { 0, 1, 2, 3, 2, 1 };

// Static description of one face orientation.
//
// Meshing works in the orientation's own basis: `di` is the sweep axis
// (along the normal), `dj` and `dk` span the face plane. All three are
// non-negative unit vectors, so one algorithm serves all six orientations.
struct FaceInfo {
	glm::ivec3 normal;
	glm::uvec3 di;
	glm::uvec3 dj;
	glm::uvec3 dk;
	// Unit square of the face within the block's [0; 1]^3 cube, in triangle strip
	// order. Components along `dj`/`dk` are 0 or 1 so scaling them stretches the quad.
	std::array<glm::vec3, 4> vertices;
	std::string_view name;
};

CUBELAND_API const FaceInfo &faceInfo(FaceOrientation orientation) noexcept;

constexpr uint32_t faceIndex(FaceOrientation orientation) noexcept
{
	return static_cast<uint32_t>(orientation);
}

} // namespace cubeland::land
