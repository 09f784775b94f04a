#include <cubeland/land/face_table.hpp>

namespace cubeland::land
{

namespace
{

const glm::uvec3 AXIS_X(1, 0, 0);
const glm::uvec3 AXIS_Y(0, 1, 0);
const glm::uvec3 AXIS_Z(0, 0, 1);

const std::array<FaceInfo, NUM_FACE_ORIENTATIONS> FACE_TABLE = {
	FaceInfo {
		.normal = glm::ivec3(0, 0, 1),
		.di = AXIS_Z,
		.dj = AXIS_X,
		.dk = AXIS_Y,
		.vertices = {
			glm::vec3(0.0f, 0.0f, 1.0f), // bottom left
			glm::vec3(1.0f, 0.0f, 1.0f), // bottom right
			glm::vec3(0.0f, 1.0f, 1.0f), // top left
			glm::vec3(1.0f, 1.0f, 1.0f), // top right
		},
		.name = "front",
	},
	FaceInfo {
		.normal = glm::ivec3(0, 0, -1),
		.di = AXIS_Z,
		.dj = AXIS_X,
		.dk = AXIS_Y,
		.vertices = {
			glm::vec3(1.0f, 0.0f, 0.0f), // bottom right
			glm::vec3(0.0f, 0.0f, 0.0f), // bottom left
			glm::vec3(1.0f, 1.0f, 0.0f), // top right
			glm::vec3(0.0f, 1.0f, 0.0f), // top left
		},
		.name = "back",
	},
	FaceInfo {
		.normal = glm::ivec3(1, 0, 0),
		.di = AXIS_X,
		.dj = AXIS_Z,
		.dk = AXIS_Y,
		.vertices = {
			glm::vec3(1.0f, 0.0f, 1.0f), // bottom front
			glm::vec3(1.0f, 0.0f, 0.0f), // bottom back
			glm::vec3(1.0f, 1.0f, 1.0f), // top front
			glm::vec3(1.0f, 1.0f, 0.0f), // top back
		},
		.name = "right",
	},
	FaceInfo {
		.normal = glm::ivec3(-1, 0, 0),
		.di = AXIS_X,
		.dj = AXIS_Z,
		.dk = AXIS_Y,
		.vertices = {
			glm::vec3(0.0f, 0.0f, 0.0f), // bottom back
			glm::vec3(0.0f, 0.0f, 1.0f), // bottom front
			glm::vec3(0.0f, 1.0f, 0.0f), // top back
			glm::vec3(0.0f, 1.0f, 1.0f), // top front
		},
		.name = "left",
	},
	FaceInfo {
		.normal = glm::ivec3(0, 1, 0),
		.di = AXIS_Y,
		.dj = AXIS_X,
		.dk = AXIS_Z,
		.vertices = {
			glm::vec3(0.0f, 1.0f, 1.0f), // front left
			glm::vec3(1.0f, 1.0f, 1.0f), // front right
			glm::vec3(0.0f, 1.0f, 0.0f), // back left
			glm::vec3(1.0f, 1.0f, 0.0f), // back right
		},
		.name = "top",
	},
	FaceInfo {
		.normal = glm::ivec3(0, -1, 0),
		.di = AXIS_Y,
		.dj = AXIS_X,
		.dk = AXIS_Z,
		.vertices = {
			glm::vec3(0.0f, 0.0f, 0.0f), // back left
			glm::vec3(1.0f, 0.0f, 0.0f), // back right
			glm::vec3(0.0f, 0.0f, 1.0f), // front left
			glm::vec3(1.0f, 0.0f, 1.0f), // front right
		},
		.name = "bottom",
	},
};

} // namespace

const FaceInfo &faceInfo(FaceOrientation orientation) noexcept
{
	return FACE_TABLE[faceIndex(orientation)];
}

} // namespace cubeland::land
