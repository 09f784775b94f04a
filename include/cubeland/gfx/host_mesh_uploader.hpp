#pragma once

#include <cubeland/gfx/mesh_uploader.hpp>
#include <cubeland/visibility.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace cubeland::gfx
{

// Mesh uploader keeping buffer contents in host memory.
// Used by headless tools and tests, and as a reference for real graphics backends.
//
// Optional byte budget emulates limited video memory: an upload which
// would make live buffers exceed it fails with `CubelandErrc::OutOfResource`.
class CUBELAND_API HostMeshUploader final : public MeshUploader {
public:
	struct Stats {
		uint64_t uploads = 0;
		uint64_t releases = 0;
		size_t live_buffers = 0;
		size_t live_bytes = 0;
	};

	// Zero `byte_budget` means unlimited
	explicit HostMeshUploader(size_t byte_budget = 0) noexcept;
	~HostMeshUploader() noexcept override;

	BufferHandleSet upload(const land::ChunkMeshData &data) override;
	void release(const BufferHandleSet &handles) noexcept override;

	// Contents of a live buffer, empty span for unknown handles
	std::span<const std::byte> buffer(BufferHandle handle) const noexcept;
	bool isLive(BufferHandle handle) const noexcept { return m_buffers.contains(handle); }

	const Stats &stats() const noexcept { return m_stats; }
	size_t byteBudget() const noexcept { return m_byte_budget; }

private:
	size_t m_byte_budget;
	BufferHandle m_next_handle = 1;
	Stats m_stats;
	std::unordered_map<BufferHandle, std::vector<std::byte>> m_buffers;

	template<typename T>
	BufferHandle store(const std::vector<T> &data);
	void releaseOne(BufferHandle handle) noexcept;
};

} // namespace cubeland::gfx
