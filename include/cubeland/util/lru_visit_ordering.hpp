#pragma once

#include <cubeland/util/tagged_tick_id.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <type_traits>
#include <utility>
#include <vector>

namespace cubeland
{

// Helper for LRU (least recently used) key visit ordering based on `std::priority_queue`.
//
// Intended to be used together with a key-value container tracking access ticks.
// The ordering itself never learns about accesses: a stored tick is only a lower
// bound of the real last-access tick. Visiting the oldest entry lets the owner
// compare it against the real value and either re-prioritize the key (it was
// accessed since), or remove it (it really is the oldest, or it's gone already).
//
// Stores all key-tick pairs in `std::vector` (as a heap) so it has O(n) space overhead.
// This container provides strong exception safety.
template<typename Key, typename Tag>
class LruVisitOrdering {
public:
	using TickId = TaggedTickId<Tag>;
	using Item = std::pair<TickId, Key>;

	// Add key to be visited on the specified tick.
	// It is valid, though discouraged, to add the same key multiple times.
	//
	// Only add keys when they are first inserted in the key-value container,
	// further accesses are picked up from the visitor callback (see `visitOldest`).
	void addKey(Key key, TickId tick) { m_queue.emplace(tick, std::move(key)); }

	// Apply visitor callback to up to `count` oldest keys or until the queue is empty.
	// Visiting also stops once stored ticks become larger than `tick_cutoff`.
	//
	// Visitor callback should have this or compatible call signature:
	//
	//     TickId callback(const Key &key, TickId stored_tick)
	//
	// If the returned tick ID is invalid then the key is removed.
	// Only one key entry is removed if it was added multiple times.
	//
	// Otherwise the key is re-prioritized to be visited when it becomes the
	// "oldest" again. Returning a tick not greater than `stored_tick` keeps
	// the key the oldest one, and it will be visited again immediately
	// (counting towards `count`).
	template<typename F>
		requires std::is_invocable_r_v<TickId, F, const Key &, TickId>
	void visitOldest(F &&fn, size_t count = 1, TickId tick_cutoff = TickId(INT64_MAX))
	{
		static_assert(std::is_nothrow_copy_constructible_v<Key>, "Key must be nothrow copy constructible");

		for (size_t i = 0; i < count && !m_queue.empty(); i++) {
			const Item &item = m_queue.top();
			if (item.first > tick_cutoff) {
				return;
			}

			TickId new_tick = fn(item.second, item.first);

			if (new_tick.invalid()) {
				m_queue.pop();
			} else {
				// `top()` is const, so this is a copy even for movable keys
				Key key = m_queue.top().second;
				m_queue.pop();
				m_queue.emplace(new_tick, std::move(key));
			}
		}
	}

	bool empty() const noexcept { return m_queue.empty(); }
	// Number of stored entries, including duplicates and stale ones
	size_t size() const noexcept { return m_queue.size(); }
	void clear() noexcept { m_queue = {}; }

private:
	std::priority_queue<Item, std::vector<Item>, std::greater<Item>> m_queue;
};

} // namespace cubeland
