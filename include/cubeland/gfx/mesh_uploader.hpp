#pragma once

#include <cubeland/land/chunk_mesh_data.hpp>
#include <cubeland/visibility.hpp>

#include <cstdint>

namespace cubeland::gfx
{

// Opaque identifier of a GPU-side buffer. Zero is never a valid handle.
using BufferHandle = uint64_t;
constexpr BufferHandle NULL_BUFFER_HANDLE = 0;

// Handles of one uploaded chunk mesh: three vertex attribute buffers and an index buffer
struct BufferHandleSet {
	BufferHandle positions = NULL_BUFFER_HANDLE;
	BufferHandle normals = NULL_BUFFER_HANDLE;
	BufferHandle block_types = NULL_BUFFER_HANDLE;
	BufferHandle indices = NULL_BUFFER_HANDLE;

	bool empty() const noexcept
	{
		return positions == NULL_BUFFER_HANDLE && normals == NULL_BUFFER_HANDLE
			&& block_types == NULL_BUFFER_HANDLE && indices == NULL_BUFFER_HANDLE;
	}

	bool operator==(const BufferHandleSet &other) const noexcept = default;
};

// Boundary between chunk meshing and the graphics API.
//
// Implementations copy mesh arrays into GPU (or any other) storage and
// later free it. Uploading is all-or-nothing: on failure nothing must stay
// allocated and an `Exception` (usually `CubelandErrc::GfxFailure` or
// `CubelandErrc::OutOfResource`) is thrown.
class CUBELAND_API MeshUploader {
public:
	MeshUploader() = default;
	MeshUploader(MeshUploader &&) = delete;
	MeshUploader(const MeshUploader &) = delete;
	MeshUploader &operator=(MeshUploader &&) = delete;
	MeshUploader &operator=(const MeshUploader &) = delete;
	virtual ~MeshUploader() noexcept;

	// Never called with empty mesh data
	virtual BufferHandleSet upload(const land::ChunkMeshData &data) = 0;
	// Called exactly once for every set returned from `upload`
	virtual void release(const BufferHandleSet &handles) noexcept = 0;
};

// Owning wrapper of an uploaded handle set, releases it on destruction.
// Default-constructed (or moved-from) object owns nothing.
class CUBELAND_API MeshBuffers {
public:
	MeshBuffers() = default;
	// Takes ownership of `handles`, `uploader` must outlive this object
	MeshBuffers(MeshUploader &uploader, BufferHandleSet handles) noexcept;
	MeshBuffers(MeshBuffers &&other) noexcept;
	MeshBuffers(const MeshBuffers &) = delete;
	MeshBuffers &operator=(MeshBuffers &&other) noexcept;
	MeshBuffers &operator=(const MeshBuffers &) = delete;
	~MeshBuffers() noexcept;

	// Release owned handles (if any) now
	void reset() noexcept;

	bool empty() const noexcept { return m_handles.empty(); }
	const BufferHandleSet &handles() const noexcept { return m_handles; }

private:
	MeshUploader *m_uploader = nullptr;
	BufferHandleSet m_handles;
};

} // namespace cubeland::gfx
