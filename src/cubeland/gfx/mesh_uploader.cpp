#include <cubeland/gfx/mesh_uploader.hpp>

#include <utility>

namespace cubeland::gfx
{

MeshUploader::~MeshUploader() noexcept = default;

MeshBuffers::MeshBuffers(MeshUploader &uploader, BufferHandleSet handles) noexcept
	: m_uploader(&uploader), m_handles(handles)
{}

MeshBuffers::MeshBuffers(MeshBuffers &&other) noexcept
	: m_uploader(std::exchange(other.m_uploader, nullptr)), m_handles(std::exchange(other.m_handles, {}))
{}

MeshBuffers &MeshBuffers::operator=(MeshBuffers &&other) noexcept
{
	if (this != &other) {
		reset();
		m_uploader = std::exchange(other.m_uploader, nullptr);
		m_handles = std::exchange(other.m_handles, {});
	}

	return *this;
}

MeshBuffers::~MeshBuffers() noexcept
{
	reset();
}

void MeshBuffers::reset() noexcept
{
	if (m_uploader && !m_handles.empty()) {
		m_uploader->release(m_handles);
	}

	m_uploader = nullptr;
	m_handles = {};
}

} // namespace cubeland::gfx
