#pragma once

#include <cubeland/gfx/mesh_uploader.hpp>
#include <cubeland/land/chunk_coord.hpp>
#include <cubeland/land/chunk_mesh_data.hpp>
#include <cubeland/land/face_table.hpp>
#include <cubeland/land/land_public_consts.hpp>
#include <cubeland/land/voxel_grid.hpp>
#include <cubeland/util/tagged_tick_id.hpp>
#include <cubeland/visibility.hpp>

#include <array>
#include <cstdint>
#include <memory>

namespace cubeland::land
{

class TerrainGenerator;

// Tag type for chunk access timeline
struct ChunkAccessTag {};

// Uploaded geometry of one chunk: per-orientation index ranges
// and ownership of the buffers they index into
struct MeshBatches {
	std::array<IndexRange, NUM_FACE_ORIENTATIONS> ranges = {};
	gfx::MeshBuffers buffers;

	const IndexRange &range(FaceOrientation orientation) const noexcept { return ranges[faceIndex(orientation)]; }
	uint32_t numIndices() const noexcept;
	// No faces to draw. Non-empty batches always own uploaded buffers.
	bool empty() const noexcept { return numIndices() == 0; }
};

// Generated, meshed and uploaded chunk. Owns its mesh buffers,
// they are released exactly once when the chunk is destroyed.
class CUBELAND_API Chunk {
public:
	using TickId = TaggedTickId<ChunkAccessTag>;

	Chunk(ChunkCoord coord, VoxelGrid grid, MeshBatches mesh) noexcept;
	Chunk(Chunk &&) = delete;
	Chunk(const Chunk &) = delete;
	Chunk &operator=(Chunk &&) = delete;
	Chunk &operator=(const Chunk &) = delete;
	~Chunk() noexcept;

	// Run the whole pipeline: generate terrain, mesh it and upload the mesh.
	// Upload is skipped for chunks without any visible faces.
	// Exceptions thrown by `uploader` propagate, nothing stays allocated in that case.
	static std::unique_ptr<Chunk> create(const TerrainGenerator &generator, ChunkCoord coord,
		gfx::MeshUploader &uploader, uint32_t chunk_size = Consts::CHUNK_SIZE);
	// Same as above but skips terrain generation, meshing an already filled grid
	static std::unique_ptr<Chunk> createFromGrid(ChunkCoord coord, VoxelGrid grid, gfx::MeshUploader &uploader);

	ChunkCoord coord() const noexcept { return m_coord; }
	const VoxelGrid &grid() const noexcept { return m_grid; }
	const MeshBatches &mesh() const noexcept { return m_mesh; }

	TickId lastTouched() const noexcept { return m_last_touched; }
	void touch(TickId tick) noexcept { m_last_touched = tick; }

private:
	ChunkCoord m_coord;
	VoxelGrid m_grid;
	MeshBatches m_mesh;
	TickId m_last_touched = TickId::INVALID;

	static std::unique_ptr<Chunk> meshAndUpload(ChunkCoord coord, VoxelGrid grid, gfx::MeshUploader &uploader,
		int64_t terrain_us);
};

} // namespace cubeland::land
