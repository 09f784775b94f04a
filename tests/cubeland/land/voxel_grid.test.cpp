#include <cubeland/land/voxel_grid.hpp>

#include "../../cubeland_test_common.hpp"

namespace cubeland::land
{

TEST_CASE("'VoxelGrid' sanity check", "[cubeland::land::voxel_grid]")
{
	VoxelGrid grid(6);
	CHECK(grid.size() == 6);
	CHECK(grid.numBlocks() == 6 * 6 * 6);
	CHECK(grid.count(BlockType::Air) == grid.numBlocks());

	// Flat XYZ layout
	CHECK(grid.linearIndex(0, 0, 1) == 1);
	CHECK(grid.linearIndex(0, 1, 0) == 6);
	CHECK(grid.linearIndex(1, 0, 0) == 36);
	CHECK(grid.linearIndex(5, 5, 5) == grid.numBlocks() - 1);

	grid.store(1, 2, 3, Block { BlockType::Stone });
	CHECK(grid.load(1, 2, 3).blocktype == BlockType::Stone);
	CHECK(grid[glm::uvec3(1, 2, 3)].blocktype == BlockType::Stone);
	CHECK(grid.blocks()[grid.linearIndex(1, 2, 3)].blocktype == BlockType::Stone);

	grid[glm::uvec3(3, 2, 1)] = Block { BlockType::Dirt };
	CHECK(grid.load(3, 2, 1).blocktype == BlockType::Dirt);
	CHECK(grid.load(1, 2, 3).blocktype == BlockType::Stone);

	CHECK(grid.count(BlockType::Stone) == 1);
	CHECK(grid.count(BlockType::Dirt) == 1);
}

TEST_CASE("'VoxelGrid' checked access", "[cubeland::land::voxel_grid]")
{
	VoxelGrid grid(4);
	grid.fill(Block { BlockType::Water });

	CHECK(grid.tryLoad(0, 0, 0) == Block { BlockType::Water });
	CHECK(grid.tryLoad(3, 3, 3) == Block { BlockType::Water });
	CHECK(grid.tryLoad(glm::ivec3(2, 1, 0)) == Block { BlockType::Water });

	CHECK_FALSE(grid.tryLoad(-1, 0, 0).has_value());
	CHECK_FALSE(grid.tryLoad(0, -1, 0).has_value());
	CHECK_FALSE(grid.tryLoad(0, 0, -1).has_value());
	CHECK_FALSE(grid.tryLoad(4, 0, 0).has_value());
	CHECK_FALSE(grid.tryLoad(0, 4, 0).has_value());
	CHECK_FALSE(grid.tryLoad(0, 0, 4).has_value());
	CHECK_FALSE(grid.tryLoad(INT64_MIN, INT64_MAX, 0).has_value());
}

TEST_CASE("'VoxelGrid' box fill", "[cubeland::land::voxel_grid]")
{
	constexpr Block A { BlockType::Stone };
	constexpr Block B { BlockType::Grass };

	VoxelGrid grid(8);
	grid.fill(A);
	grid.fill(glm::uvec3(1, 2, 3), glm::uvec3(3), B);

	// "Lower corner" of updated region
	CHECK(grid.load(1, 2, 3) == B);
	// "Upper corner" of updated region
	CHECK(grid.load(3, 4, 5) == B);

	// "Below" and "above" updated region
	CHECK(grid.load(0, 2, 3) == A);
	CHECK(grid.load(1, 1, 3) == A);
	CHECK(grid.load(1, 2, 2) == A);
	CHECK(grid.load(4, 4, 5) == A);
	CHECK(grid.load(3, 5, 5) == A);
	CHECK(grid.load(3, 4, 6) == A);

	CHECK(grid.count(BlockType::Grass) == 27);
}

TEST_CASE("'VoxelGrid' box fill is clipped to grid", "[cubeland::land::voxel_grid]")
{
	VoxelGrid grid(4);
	grid.fill(glm::uvec3(2, 0, 3), glm::uvec3(5, 1, 100), Block { BlockType::Dirt });

	CHECK(grid.load(2, 0, 3).blocktype == BlockType::Dirt);
	CHECK(grid.load(3, 0, 3).blocktype == BlockType::Dirt);
	CHECK(grid.count(BlockType::Dirt) == 2);

	// Fully outside, nothing changes
	grid.fill(glm::uvec3(4, 0, 0), glm::uvec3(1), Block { BlockType::Stone });
	CHECK(grid.count(BlockType::Stone) == 0);
}

TEST_CASE("'VoxelGrid' rejects zero size", "[cubeland::land::voxel_grid]")
{
	CHECK_THROWS_MATCHES(VoxelGrid(0), Exception, test::errcExceptionMatcher(CubelandErrc::InvalidData));
}

TEST_CASE("'VoxelGrid' comparison", "[cubeland::land::voxel_grid]")
{
	VoxelGrid a(4);
	VoxelGrid b(4);
	CHECK(a == b);

	b.store(0, 0, 0, Block { BlockType::Stone });
	CHECK_FALSE(a == b);

	CHECK_FALSE(VoxelGrid(4) == VoxelGrid(5));
}

} // namespace cubeland::land
