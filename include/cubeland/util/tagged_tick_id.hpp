#pragma once

#include <compare>
#include <cstdint>

namespace cubeland
{

// Helper to make `INVALID` constant work, does not define any timeline
struct InvalidTickTag {};

// Semantic typing for tick values from different timelines (defined by tag types).
// Prevents accidental comparison of values from incomparable timelines,
// e.g. chunk access ticks against some frame counter.
template<typename Tag>
struct TaggedTickId {
	// Any tick ID with negative value is treated as invalid, i.e. not representing any time point
	constexpr static InvalidTickTag INVALID {};

	constexpr TaggedTickId() = default;
	// Explicit ctor - don't accidentally cast untagged value to tagged one
	constexpr explicit TaggedTickId(int64_t val) noexcept : value(val) {}
	// Implicit helper ctor of invalid tick ID
	constexpr TaggedTickId(InvalidTickTag) noexcept : value(-1) {}

	constexpr auto operator<=>(const TaggedTickId &other) const = default;

	constexpr bool valid() const noexcept { return value >= 0; }
	constexpr bool invalid() const noexcept { return value < 0; }

	// Difference of two tick IDs is not a tick ID
	constexpr int64_t operator-(TaggedTickId d) const noexcept { return value - d.value; }

	int64_t value = 0;
};

} // namespace cubeland
