#include <cubeland/land/chunk_cache.hpp>

#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/exception.hpp>
#include <cubeland/util/log.hpp>

#include <algorithm>
#include <chrono>

namespace cubeland::land
{

namespace
{

uint32_t validatedChunkSize(uint32_t chunk_size)
{
	if (chunk_size == 0) {
		throw Exception::fromError(CubelandErrc::InvalidData, "chunk size must be positive");
	}
	return chunk_size;
}

size_t validatedCapacity(size_t capacity)
{
	if (capacity == 0) {
		throw Exception::fromError(CubelandErrc::InvalidData, "chunk cache capacity must be positive");
	}
	return capacity;
}

} // namespace

ChunkCache::ChunkCache(uint32_t seed, gfx::MeshUploader &uploader, size_t capacity, uint32_t chunk_size)
	: m_generator(seed)
	, m_uploader(uploader)
	, m_capacity(validatedCapacity(capacity))
	, m_chunk_size(validatedChunkSize(chunk_size))
{
	m_chunks.reserve(m_capacity + 1);
	Log::debug("Created chunk cache: seed {}, capacity {}, chunk size {}", seed, m_capacity, m_chunk_size);
}

ChunkCache::~ChunkCache() noexcept
{
	Log::debug("Destroying chunk cache with {} chunks", m_chunks.size());
	clear();
}

void ChunkCache::load(ChunkCoord coord)
{
	Log::debug("Loading chunk ({}, {})", coord.x, coord.z);

	// Build everything before touching containers
	std::unique_ptr<Chunk> chunk = Chunk::create(m_generator, coord, m_uploader, m_chunk_size);

	const TickId tick = nextTick();
	chunk->touch(tick);

	auto iter = m_chunks.find(coord);
	if (iter != m_chunks.end()) {
		// Old chunk is destroyed here, its LRU entry is lower than `tick` and will be re-prioritized
		iter->second = std::move(chunk);
		return;
	}

	// Add to LRU first - a dangling LRU entry is harmless, an untracked chunk is not
	m_lru.addKey(coord, tick);
	m_chunks.emplace(coord, std::move(chunk));

	evictOverCapacity();
}

bool ChunkCache::touch(ChunkCoord coord) noexcept
{
	auto iter = m_chunks.find(coord);
	if (iter == m_chunks.end()) {
		return false;
	}

	iter->second->touch(nextTick());
	return true;
}

const Chunk *ChunkCache::find(ChunkCoord coord) const noexcept
{
	auto iter = m_chunks.find(coord);
	return iter != m_chunks.end() ? iter->second.get() : nullptr;
}

void ChunkCache::clear() noexcept
{
	m_chunks.clear();
	m_lru.clear();
}

ChunkCache::TickId ChunkCache::nextTick() noexcept
{
	const auto now = std::chrono::steady_clock::now().time_since_epoch();
	const int64_t ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();

	m_last_tick = TickId(std::max(ns, m_last_tick.value + 1));
	return m_last_tick;
}

void ChunkCache::evictOverCapacity() noexcept
{
	auto visitor = [this](const ChunkCoord &coord, TickId stored_tick) -> TickId {
		auto iter = m_chunks.find(coord);
		if (iter == m_chunks.end()) {
			// Stale entry of an already removed chunk
			return TickId::INVALID;
		}

		const TickId actual_tick = iter->second->lastTouched();
		if (actual_tick > stored_tick) {
			// Touched or reloaded since the entry was added
			return actual_tick;
		}

		m_chunks.erase(iter);
		return TickId::INVALID;
	};

	while (m_chunks.size() > m_capacity && !m_lru.empty()) {
		m_lru.visitOldest(visitor);
	}

	if (m_chunks.size() > m_capacity) {
		Log::error("Chunk cache is over capacity ({}/{}) with no LRU entries left", m_chunks.size(), m_capacity);
	}
}

} // namespace cubeland::land
