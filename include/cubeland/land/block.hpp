#pragma once

#include <cubeland/visibility.hpp>

#include <cstdint>
#include <string_view>

namespace cubeland::land
{

// Material tag of a single voxel. Values are stable and are passed to
// the renderer as-is (per-vertex material ID), append new types at the end.
enum class BlockType : uint8_t {
	Air = 0,
	Grass = 1,
	Stone = 2,
	Dirt = 3,
	Water = 4,
};

// Human-readable lower-case name ("air", "grass" etc.)
CUBELAND_API std::string_view blockTypeName(BlockType type) noexcept;

struct Block {
	BlockType blocktype = BlockType::Air;

	// Air is never rendered and never occludes its neighbors,
	// any other block type does both
	constexpr bool isOpaque() const noexcept { return blocktype != BlockType::Air; }

	constexpr bool operator==(const Block &other) const noexcept = default;
};

} // namespace cubeland::land
