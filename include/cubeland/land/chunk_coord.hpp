#pragma once

#include <cubeland/land/land_public_consts.hpp>
#include <cubeland/util/hash.hpp>

#include <compare>
#include <cstdint>
#include <functional>

namespace cubeland::land
{

// Horizontal position of a chunk. Chunks are full-height columns so there is no Y.
//
// Components are world-space block coordinates of the chunk origin (its minimal
// X/Z corner), the same values terrain generation adds block offsets to.
// Usable as a search key for associative containers.
struct ChunkCoord {
	int64_t x = 0;
	int64_t z = 0;

	constexpr auto operator<=>(const ChunkCoord &other) const = default;

	// Origin of the chunk with grid-aligned index `(ix, iz)`
	constexpr static ChunkCoord fromChunkIndex(int64_t ix, int64_t iz,
		uint32_t chunk_size = Consts::CHUNK_SIZE) noexcept
	{
		return ChunkCoord { ix * int64_t(chunk_size), iz * int64_t(chunk_size) };
	}

	uint64_t hash() const noexcept { return Hash::combine(uint64_t(x), uint64_t(z)); }
};

} // namespace cubeland::land

namespace std
{

template<>
struct hash<cubeland::land::ChunkCoord> {
	size_t operator()(const cubeland::land::ChunkCoord &cc) const noexcept { return size_t(cc.hash()); }
};

} // namespace std
