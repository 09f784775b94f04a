#include <cubeland/gfx/mesh_uploader.hpp>

#include "../../cubeland_test_common.hpp"

namespace cubeland::gfx
{

namespace
{

land::ChunkMeshData makeTriangleMesh()
{
	land::ChunkMeshData data;
	data.positions = { glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f) };
	data.normals = { glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(0.0f, 0.0f, 1.0f) };
	data.block_types = { 2.0f, 2.0f, 2.0f };
	data.indices = { 0, 1, 2 };
	return data;
}

} // namespace

TEST_CASE("'MeshBuffers' releases exactly once", "[cubeland::gfx::mesh_buffers]")
{
	test::RecordingMeshUploader uploader;
	const land::ChunkMeshData data = makeTriangleMesh();

	SECTION("Destruction")
	{
		{
			MeshBuffers buffers(uploader, uploader.upload(data));
			CHECK_FALSE(buffers.empty());
			CHECK(uploader.isLive(buffers.handles()));
		}

		CHECK(uploader.releases() == 1);
		CHECK(uploader.liveSets() == 0);
	}

	SECTION("Move construction and assignment")
	{
		MeshBuffers a(uploader, uploader.upload(data));
		const BufferHandleSet handles = a.handles();

		MeshBuffers b(std::move(a));
		CHECK(a.empty());
		CHECK(b.handles() == handles);
		CHECK(uploader.releases() == 0);

		MeshBuffers c(uploader, uploader.upload(data));
		// Overwriting releases the previous contents of `c`
		c = std::move(b);
		CHECK(uploader.releases() == 1);
		CHECK(c.handles() == handles);

		c.reset();
		CHECK(c.empty());
		CHECK(uploader.releases() == 2);

		// Resetting empty object is a no-op
		c.reset();
		CHECK(uploader.releases() == 2);
	}

	SECTION("Default-constructed object owns nothing")
	{
		MeshBuffers buffers;
		CHECK(buffers.empty());
		CHECK(buffers.handles().empty());
	}

	CHECK(uploader.doubleReleases() == 0);
}

} // namespace cubeland::gfx
