#pragma once

#include <cubeland/land/chunk.hpp>
#include <cubeland/land/chunk_coord.hpp>
#include <cubeland/land/land_public_consts.hpp>
#include <cubeland/land/terrain_generator.hpp>
#include <cubeland/util/lru_visit_ordering.hpp>
#include <cubeland/visibility.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <unordered_map>

namespace cubeland::land
{

// Bounded collection of loaded chunks with least-recently-used eviction.
//
// Every `load` regenerates the chunk from scratch (terrain, mesh, upload)
// and replaces any previously loaded chunk at the same position. Whenever
// the number of chunks exceeds capacity, the chunk touched least recently
// is unloaded, releasing its mesh buffers.
//
// Not thread-safe, intended to be driven from the render loop thread.
class CUBELAND_API ChunkCache final {
public:
	using TickId = Chunk::TickId;

	// `uploader` must outlive the cache.
	// Throws `Exception(InvalidData)` if `capacity` or `chunk_size` is zero.
	ChunkCache(uint32_t seed, gfx::MeshUploader &uploader, size_t capacity = Consts::MAX_CHUNKS,
		uint32_t chunk_size = Consts::CHUNK_SIZE);
	ChunkCache(ChunkCache &&) = delete;
	ChunkCache(const ChunkCache &) = delete;
	ChunkCache &operator=(ChunkCache &&) = delete;
	ChunkCache &operator=(const ChunkCache &) = delete;
	~ChunkCache() noexcept;

	// Capacity which keeps a square of `(2 * radius)^2` chunks loaded with twice the headroom
	constexpr static size_t capacityForRadius(uint32_t radius) noexcept
	{
		return size_t(2 * radius) * size_t(2 * radius) * 2;
	}

	// Generate, mesh and upload the chunk with origin at `(x, z)`, then mark it most recently used.
	// On exception the cache is left unchanged (a previously loaded chunk stays in place).
	void load(int64_t x, int64_t z) { load(ChunkCoord { x, z }); }
	void load(ChunkCoord coord);

	// Mark a chunk as most recently used. Returns false if it's not loaded.
	bool touch(int64_t x, int64_t z) noexcept { return touch(ChunkCoord { x, z }); }
	bool touch(ChunkCoord coord) noexcept;

	// Loaded chunk or null
	const Chunk *find(int64_t x, int64_t z) const noexcept { return find(ChunkCoord { x, z }); }
	const Chunk *find(ChunkCoord coord) const noexcept;
	bool contains(ChunkCoord coord) const noexcept { return m_chunks.contains(coord); }

	// Call `fn(const Chunk &)` for every loaded chunk in unspecified order,
	// e.g. to submit draw commands. `fn` must not modify the cache.
	template<typename F>
		requires std::is_invocable_v<F, const Chunk &>
	void forEachChunk(F &&fn) const
	{
		for (const auto &[coord, chunk] : m_chunks) {
			fn(*chunk);
		}
	}

	// Unload all chunks
	void clear() noexcept;

	size_t size() const noexcept { return m_chunks.size(); }
	size_t capacity() const noexcept { return m_capacity; }
	uint32_t seed() const noexcept { return m_generator.seed(); }
	uint32_t chunkSize() const noexcept { return m_chunk_size; }

private:
	TerrainGenerator m_generator;
	gfx::MeshUploader &m_uploader;
	const size_t m_capacity;
	const uint32_t m_chunk_size;

	std::unordered_map<ChunkCoord, std::unique_ptr<Chunk>> m_chunks;
	LruVisitOrdering<ChunkCoord, ChunkAccessTag> m_lru;
	TickId m_last_tick = TickId::INVALID;

	// Monotonic clock reading, strictly greater than any previously returned one
	TickId nextTick() noexcept;
	void evictOverCapacity() noexcept;
};

} // namespace cubeland::land
