#include <cubeland/land/greedy_mesher.hpp>

#include <cubeland/land/terrain_generator.hpp>
#include <cubeland/util/hash.hpp>

#include "../../cubeland_test_common.hpp"

#include <set>
#include <tuple>

namespace cubeland::land
{

namespace
{

using CellSet = std::set<std::tuple<uint32_t, uint32_t, uint32_t>>;

CellSet naiveExposedFaces(const VoxelGrid &grid, FaceOrientation orientation)
{
	const FaceInfo &face = faceInfo(orientation);
	const int64_t size = grid.size();
	CellSet cells;

	for (int64_t x = 0; x < size; x++) {
		for (int64_t y = 0; y < size; y++) {
			for (int64_t z = 0; z < size; z++) {
				if (!grid.load(uint32_t(x), uint32_t(y), uint32_t(z)).isOpaque()) {
					continue;
				}

				const int64_t nx = x + face.normal.x;
				const int64_t ny = y + face.normal.y;
				const int64_t nz = z + face.normal.z;

				bool neighbor_exists;
				if (ny < 0) {
					neighbor_exists = true;
				} else if (nx < 0 || nz < 0 || nx >= size || ny >= size || nz >= size) {
					neighbor_exists = false;
				} else {
					neighbor_exists = grid.load(uint32_t(nx), uint32_t(ny), uint32_t(nz)).isOpaque();
				}

				if (!neighbor_exists) {
					cells.emplace(uint32_t(x), uint32_t(y), uint32_t(z));
				}
			}
		}
	}

	return cells;
}

// Check that quads cover exactly the naively computed exposed faces, don't overlap
// and contain only blocks of their own type
void checkCoverage(const VoxelGrid &grid)
{
	for (FaceOrientation orientation : ALL_FACE_ORIENTATIONS) {
		const FaceInfo &face = faceInfo(orientation);
		INFO("Orientation: " << face.name);

		CellSet covered;
		for (const MeshQuad &quad : GreedyMesher::mergeFaces(grid, orientation)) {
			REQUIRE(quad.extent_j >= 1);
			REQUIRE(quad.extent_k >= 1);

			for (uint32_t j = 0; j < quad.extent_j; j++) {
				for (uint32_t k = 0; k < quad.extent_k; k++) {
					const glm::uvec3 c = quad.origin + face.dj * j + face.dk * k;
					REQUIRE(grid.contains(c.x, c.y, c.z));
					REQUIRE(grid[c].blocktype == quad.blocktype);
					// Insertion fails on overlap
					REQUIRE(covered.emplace(c.x, c.y, c.z).second);
				}
			}
		}

		REQUIRE(covered == naiveExposedFaces(grid, orientation));
	}
}

VoxelGrid makeNoiseGrid(uint32_t size, uint64_t seed, uint32_t air_chance_pct)
{
	static constexpr std::array<BlockType, 4> TYPES = { BlockType::Stone, BlockType::Dirt, BlockType::Grass,
		BlockType::Water };

	VoxelGrid grid(size);
	uint64_t state = seed;

	for (uint32_t x = 0; x < size; x++) {
		for (uint32_t y = 0; y < size; y++) {
			for (uint32_t z = 0; z < size; z++) {
				state = Hash::xxh64Fixed(state);
				if (state % 100 < air_chance_pct) {
					continue;
				}
				grid.store(x, y, z, Block { TYPES[(state >> 32) % TYPES.size()] });
			}
		}
	}

	return grid;
}

VoxelGrid makeColumnGrid(uint32_t y_begin, uint32_t y_end)
{
	VoxelGrid grid(4);
	for (uint32_t y = y_begin; y < y_end; y++) {
		grid.store(0, y, 0, Block { BlockType::Stone });
	}
	return grid;
}

} // namespace

TEST_CASE("'GreedyMesher' face exposure policy", "[cubeland::land::greedy_mesher]")
{
	VoxelGrid grid(4);
	grid.fill(glm::uvec3(0), glm::uvec3(4, 1, 4), Block { BlockType::Stone });
	grid.store(1, 1, 1, Block { BlockType::Dirt });

	// Below the grid is solid, everything else outside is absent
	CHECK(GreedyMesher::blockExists(grid, 0, -1, 0));
	CHECK(GreedyMesher::blockExists(grid, 100, -5, -100));
	CHECK_FALSE(GreedyMesher::blockExists(grid, -1, 0, 0));
	CHECK_FALSE(GreedyMesher::blockExists(grid, 0, 0, 4));
	CHECK_FALSE(GreedyMesher::blockExists(grid, 0, 4, 0));
	CHECK(GreedyMesher::blockExists(grid, 1, 1, 1));
	CHECK_FALSE(GreedyMesher::blockExists(grid, 2, 1, 1));

	CHECK_FALSE(GreedyMesher::isFaceExposed(grid, glm::uvec3(0, 0, 0), FaceOrientation::Bottom));
	CHECK(GreedyMesher::isFaceExposed(grid, glm::uvec3(0, 0, 0), FaceOrientation::Left));
	CHECK(GreedyMesher::isFaceExposed(grid, glm::uvec3(0, 0, 0), FaceOrientation::Top));
	CHECK_FALSE(GreedyMesher::isFaceExposed(grid, glm::uvec3(0, 0, 0), FaceOrientation::Right));
	CHECK_FALSE(GreedyMesher::isFaceExposed(grid, glm::uvec3(1, 0, 1), FaceOrientation::Top));
	CHECK(GreedyMesher::isFaceExposed(grid, glm::uvec3(1, 1, 1), FaceOrientation::Front));
	// Air faces are never exposed
	CHECK_FALSE(GreedyMesher::isFaceExposed(grid, glm::uvec3(2, 2, 2), FaceOrientation::Top));

	std::vector<uint8_t> mask = GreedyMesher::buildExposureMask(grid, FaceOrientation::Top);
	REQUIRE(mask.size() == grid.numBlocks());
	CHECK(mask[grid.linearIndex(1, 1, 1)] == 1);
	CHECK(mask[grid.linearIndex(1, 0, 1)] == 0);
	CHECK(mask[grid.linearIndex(2, 0, 1)] == 1);
}

TEST_CASE("'GreedyMesher' all-air grid gives empty mesh", "[cubeland::land::greedy_mesher]")
{
	VoxelGrid grid(4);

	for (FaceOrientation orientation : ALL_FACE_ORIENTATIONS) {
		CHECK(GreedyMesher::mergeFaces(grid, orientation).empty());
	}

	ChunkMeshData data = GreedyMesher::build(0, 0, grid);
	CHECK(data.empty());
	CHECK(data.positions.empty());
	CHECK(data.normals.empty());
	CHECK(data.block_types.empty());
	for (const IndexRange &range : data.ranges) {
		CHECK(range.num_indices == 0);
	}
}

TEST_CASE("'GreedyMesher' single column", "[cubeland::land::greedy_mesher]")
{
	VoxelGrid grid = makeColumnGrid(0, 3);

	SECTION("Top face is a single 1x1 quad")
	{
		auto quads = GreedyMesher::mergeFaces(grid, FaceOrientation::Top);
		REQUIRE(quads.size() == 1);
		CHECK(quads[0].origin == glm::uvec3(0, 2, 0));
		CHECK(quads[0].extent_j == 1);
		CHECK(quads[0].extent_k == 1);
		CHECK(quads[0].blocktype == BlockType::Stone);
	}

	SECTION("Bottom face is on the floor and is not rendered")
	{
		CHECK(GreedyMesher::mergeFaces(grid, FaceOrientation::Bottom).empty());
	}

	SECTION("Side faces are single 1x3 quads")
	{
		for (FaceOrientation orientation :
			{ FaceOrientation::Front, FaceOrientation::Back, FaceOrientation::Right, FaceOrientation::Left }) {
			auto quads = GreedyMesher::mergeFaces(grid, orientation);
			REQUIRE(quads.size() == 1);
			CHECK(quads[0].origin == glm::uvec3(0, 0, 0));
			CHECK(quads[0].extent_j == 1);
			CHECK(quads[0].extent_k == 3);
		}
	}

	SECTION("Floating column has a bottom face")
	{
		VoxelGrid floating = makeColumnGrid(1, 3);
		auto quads = GreedyMesher::mergeFaces(floating, FaceOrientation::Bottom);
		REQUIRE(quads.size() == 1);
		CHECK(quads[0].origin == glm::uvec3(0, 1, 0));
		CHECK(quads[0].extent_j == 1);
		CHECK(quads[0].extent_k == 1);
	}

	SECTION("Neighbor column occludes side faces")
	{
		grid.store(1, 0, 0, Block { BlockType::Stone });
		grid.store(1, 1, 0, Block { BlockType::Stone });

		auto right = GreedyMesher::mergeFaces(grid, FaceOrientation::Right);
		// Only the top block of the first column plus the whole second column side
		REQUIRE(right.size() == 2);
		CHECK(GreedyMesher::mergeFaces(grid, FaceOrientation::Front).size() == 2);

		checkCoverage(grid);
	}
}

TEST_CASE("'GreedyMesher' single column mesh data", "[cubeland::land::greedy_mesher]")
{
	VoxelGrid grid = makeColumnGrid(0, 3);
	ChunkMeshData data = GreedyMesher::build(8, -4, grid);

	// Five quads: top and four sides
	REQUIRE(data.numQuads() == 5);
	REQUIRE(data.numVertices() == 20);
	REQUIRE(data.normals.size() == 20);
	REQUIRE(data.block_types.size() == 20);
	REQUIRE(data.numIndices() == 30);

	CHECK(data.range(FaceOrientation::Bottom).num_indices == 0);

	const IndexRange &top = data.range(FaceOrientation::Top);
	REQUIRE(top.num_indices == 6);

	// Quad vertices are consecutive, first index of a quad points at its first vertex
	const uint32_t base = data.indices[top.first_index];
	CHECK(data.positions[base + 0] == glm::vec3(8.0f, 3.0f, -3.0f));
	CHECK(data.positions[base + 1] == glm::vec3(9.0f, 3.0f, -3.0f));
	CHECK(data.positions[base + 2] == glm::vec3(8.0f, 3.0f, -4.0f));
	CHECK(data.positions[base + 3] == glm::vec3(9.0f, 3.0f, -4.0f));
	CHECK(data.normals[base] == glm::vec3(0.0f, 1.0f, 0.0f));
	CHECK(data.block_types[base] == float(uint8_t(BlockType::Stone)));

	for (uint32_t i = 0; i < 6; i++) {
		CHECK(data.indices[top.first_index + i] == base + QUAD_INDICES[i]);
	}

	// Side quad is stretched over the column height
	const IndexRange &front = data.range(FaceOrientation::Front);
	REQUIRE(front.num_indices == 6);
	const uint32_t front_base = data.indices[front.first_index];
	CHECK(data.positions[front_base + 0] == glm::vec3(8.0f, 0.0f, -3.0f));
	CHECK(data.positions[front_base + 1] == glm::vec3(9.0f, 0.0f, -3.0f));
	CHECK(data.positions[front_base + 2] == glm::vec3(8.0f, 3.0f, -3.0f));
	CHECK(data.positions[front_base + 3] == glm::vec3(9.0f, 3.0f, -3.0f));
}

TEST_CASE("'GreedyMesher' merges uniform surfaces", "[cubeland::land::greedy_mesher]")
{
	VoxelGrid grid(4);
	grid.fill(Block { BlockType::Stone });

	// Top, four sides and no bottom, each one full 4x4 quad
	for (FaceOrientation orientation : ALL_FACE_ORIENTATIONS) {
		auto quads = GreedyMesher::mergeFaces(grid, orientation);
		if (orientation == FaceOrientation::Bottom) {
			CHECK(quads.empty());
			continue;
		}

		REQUIRE(quads.size() == 1);
		CHECK(quads[0].extent_j == 4);
		CHECK(quads[0].extent_k == 4);
	}

	SECTION("Different block types are not merged")
	{
		grid.fill(glm::uvec3(0, 3, 0), glm::uvec3(2, 1, 4), Block { BlockType::Grass });

		auto quads = GreedyMesher::mergeFaces(grid, FaceOrientation::Top);
		REQUIRE(quads.size() == 2);
		CHECK(quads[0].blocktype != quads[1].blocktype);
		CHECK(quads[0].extent_j * quads[0].extent_k == 8);
		CHECK(quads[1].extent_j * quads[1].extent_k == 8);

		checkCoverage(grid);
	}

	SECTION("Hole in the surface")
	{
		grid.store(1, 3, 1, Block { BlockType::Air });
		checkCoverage(grid);

		// The hole exposes four inner side faces and a top face below it
		CHECK(GreedyMesher::isFaceExposed(grid, glm::uvec3(1, 2, 1), FaceOrientation::Top));
		CHECK(GreedyMesher::isFaceExposed(grid, glm::uvec3(0, 3, 1), FaceOrientation::Right));
		CHECK(GreedyMesher::isFaceExposed(grid, glm::uvec3(2, 3, 1), FaceOrientation::Left));
		CHECK(GreedyMesher::isFaceExposed(grid, glm::uvec3(1, 3, 0), FaceOrientation::Front));
		CHECK(GreedyMesher::isFaceExposed(grid, glm::uvec3(1, 3, 2), FaceOrientation::Back));
	}
}

TEST_CASE("'GreedyMesher' coverage matches naive face set", "[cubeland::land::greedy_mesher]")
{
	SECTION("Random grids")
	{
		for (uint64_t seed = 1; seed <= 6; seed++) {
			for (uint32_t air_pct : { 10u, 50u, 85u }) {
				INFO("Seed " << seed << ", air " << air_pct << "%");
				checkCoverage(makeNoiseGrid(7, seed, air_pct));
				checkCoverage(makeNoiseGrid(6, seed, air_pct));
			}
		}
	}

	SECTION("Generated terrain")
	{
		TerrainGenerator gen(42);
		checkCoverage(gen.generate(0, 0, 16));
		checkCoverage(gen.generate(-160, 48, 16));
		checkCoverage(gen.generate(0, 0));
	}
}

TEST_CASE("'GreedyMesher' mesh data layout", "[cubeland::land::greedy_mesher]")
{
	TerrainGenerator gen(5);
	VoxelGrid grid = gen.generate(64, 96, 16);
	ChunkMeshData data = GreedyMesher::build(64, 96, grid);

	REQUIRE_FALSE(data.empty());
	REQUIRE(data.normals.size() == data.positions.size());
	REQUIRE(data.block_types.size() == data.positions.size());
	REQUIRE(data.numIndices() == data.numQuads() * 6);
	REQUIRE(data.numVertices() == data.numQuads() * 4);

	// Ranges are contiguous, in orientation order and cover all indices
	uint32_t expected_first = 0;
	for (FaceOrientation orientation : ALL_FACE_ORIENTATIONS) {
		const IndexRange &range = data.range(orientation);
		CHECK(range.first_index == expected_first);
		CHECK(range.num_indices % 6 == 0);
		CHECK(range.num_indices / 6 == GreedyMesher::mergeFaces(grid, orientation).size());
		expected_first += range.num_indices;

		const glm::vec3 normal(faceInfo(orientation).normal);
		for (uint32_t i = range.first_index; i < range.first_index + range.num_indices; i++) {
			REQUIRE(data.indices[i] < data.numVertices());
			REQUIRE(data.normals[data.indices[i]] == normal);
		}
	}
	CHECK(expected_first == data.numIndices());

	// Everything is within the chunk box in world space
	for (const glm::vec3 &p : data.positions) {
		REQUIRE(p.x >= 64.0f);
		REQUIRE(p.x <= 80.0f);
		REQUIRE(p.y >= 0.0f);
		REQUIRE(p.y <= 16.0f);
		REQUIRE(p.z >= 96.0f);
		REQUIRE(p.z <= 112.0f);
	}

	// Vertex material IDs are never Air
	for (float type : data.block_types) {
		REQUIRE(type != float(uint8_t(BlockType::Air)));
	}
}

} // namespace cubeland::land
