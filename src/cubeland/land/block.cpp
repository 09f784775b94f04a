#include <cubeland/land/block.hpp>

namespace cubeland::land
{

std::string_view blockTypeName(BlockType type) noexcept
{
	using namespace std::string_view_literals;

	switch (type) {
	case BlockType::Air:
		return "air"sv;
	case BlockType::Grass:
		return "grass"sv;
	case BlockType::Stone:
		return "stone"sv;
	case BlockType::Dirt:
		return "dirt"sv;
	case BlockType::Water:
		return "water"sv;
	} // No `default` to make `-Werror -Wswitch` protection work

	return "unknown"sv;
}

} // namespace cubeland::land
