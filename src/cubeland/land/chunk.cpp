#include <cubeland/land/chunk.hpp>

#include <cubeland/land/greedy_mesher.hpp>
#include <cubeland/land/terrain_generator.hpp>
#include <cubeland/util/elapsed_timer.hpp>
#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/exception.hpp>
#include <cubeland/util/log.hpp>

namespace cubeland::land
{

uint32_t MeshBatches::numIndices() const noexcept
{
	uint32_t total = 0;
	for (const IndexRange &r : ranges) {
		total += r.num_indices;
	}
	return total;
}

Chunk::Chunk(ChunkCoord coord, VoxelGrid grid, MeshBatches mesh) noexcept
	: m_coord(coord), m_grid(std::move(grid)), m_mesh(std::move(mesh))
{}

Chunk::~Chunk() noexcept
{
	Log::debug("Unloading chunk ({}, {})", m_coord.x, m_coord.z);
}

std::unique_ptr<Chunk> Chunk::create(const TerrainGenerator &generator, ChunkCoord coord,
	gfx::MeshUploader &uploader, uint32_t chunk_size)
{
	ElapsedTimer timer;
	VoxelGrid grid = generator.generate(coord.x, coord.z, chunk_size);
	return meshAndUpload(coord, std::move(grid), uploader, timer.lapMicros());
}

std::unique_ptr<Chunk> Chunk::createFromGrid(ChunkCoord coord, VoxelGrid grid, gfx::MeshUploader &uploader)
{
	return meshAndUpload(coord, std::move(grid), uploader, 0);
}

std::unique_ptr<Chunk> Chunk::meshAndUpload(ChunkCoord coord, VoxelGrid grid, gfx::MeshUploader &uploader,
	int64_t terrain_us)
{
	ElapsedTimer timer;

	ChunkMeshData data = GreedyMesher::build(coord.x, coord.z, grid);
	const int64_t mesh_us = timer.lapMicros();

	MeshBatches mesh;
	mesh.ranges = data.ranges;
	if (!data.empty()) {
		const gfx::BufferHandleSet handles = uploader.upload(data);
		if (handles.empty()) {
			Log::error("Uploader returned no buffers for chunk ({}, {}) with {} indices", coord.x, coord.z,
				data.numIndices());
			throw Exception::fromError(CubelandErrc::GfxFailure, "mesh upload returned null buffer handles");
		}

		mesh.buffers = gfx::MeshBuffers(uploader, handles);
	}
	const int64_t upload_us = timer.lapMicros();

	Log::trace("Chunk ({}, {}): terrain={}us mesh={}us upload={}us vertices={} indices={}", coord.x, coord.z,
		terrain_us, mesh_us, upload_us, data.numVertices(), data.numIndices());

	return std::make_unique<Chunk>(coord, std::move(grid), std::move(mesh));
}

} // namespace cubeland::land
