#include <cubeland/gfx/host_mesh_uploader.hpp>

#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/exception.hpp>
#include <cubeland/util/log.hpp>

#include <cstring>

namespace cubeland::gfx
{

namespace
{

template<typename T>
size_t byteSize(const std::vector<T> &data) noexcept
{
	return data.size() * sizeof(T);
}

} // namespace

HostMeshUploader::HostMeshUploader(size_t byte_budget) noexcept : m_byte_budget(byte_budget) {}

HostMeshUploader::~HostMeshUploader() noexcept
{
	if (!m_buffers.empty()) {
		Log::warn("Destroying mesh uploader with {} live buffers ({} bytes) - leaked mesh handles?",
			m_stats.live_buffers, m_stats.live_bytes);
	}
}

BufferHandleSet HostMeshUploader::upload(const land::ChunkMeshData &data)
{
	if (data.empty()) {
		throw Exception::fromError(CubelandErrc::InvalidData, "uploading empty chunk mesh");
	}

	if (data.normals.size() != data.positions.size() || data.block_types.size() != data.positions.size()) {
		throw Exception::fromError(CubelandErrc::InvalidData, "vertex attribute arrays have different lengths");
	}

	const size_t total_bytes = byteSize(data.positions) + byteSize(data.normals) + byteSize(data.block_types)
		+ byteSize(data.indices);
	if (m_byte_budget != 0 && m_stats.live_bytes + total_bytes > m_byte_budget) {
		Log::debug("Mesh upload of {} bytes exceeds budget ({}/{} bytes used)", total_bytes, m_stats.live_bytes,
			m_byte_budget);
		throw Exception::fromError(CubelandErrc::OutOfResource, "mesh buffer budget exhausted");
	}

	BufferHandleSet handles;
	try {
		handles.positions = store(data.positions);
		handles.normals = store(data.normals);
		handles.block_types = store(data.block_types);
		handles.indices = store(data.indices);
	}
	catch (...) {
		// Don't leave partial uploads behind
		releaseOne(handles.positions);
		releaseOne(handles.normals);
		releaseOne(handles.block_types);
		throw;
	}

	m_stats.uploads++;
	return handles;
}

void HostMeshUploader::release(const BufferHandleSet &handles) noexcept
{
	releaseOne(handles.positions);
	releaseOne(handles.normals);
	releaseOne(handles.block_types);
	releaseOne(handles.indices);
	m_stats.releases++;
}

std::span<const std::byte> HostMeshUploader::buffer(BufferHandle handle) const noexcept
{
	auto iter = m_buffers.find(handle);
	if (iter == m_buffers.end()) {
		return {};
	}

	return iter->second;
}

template<typename T>
BufferHandle HostMeshUploader::store(const std::vector<T> &data)
{
	std::vector<std::byte> bytes(byteSize(data));
	std::memcpy(bytes.data(), data.data(), bytes.size());

	BufferHandle handle = m_next_handle++;
	m_buffers.emplace(handle, std::move(bytes));

	m_stats.live_buffers++;
	m_stats.live_bytes += byteSize(data);
	return handle;
}

void HostMeshUploader::releaseOne(BufferHandle handle) noexcept
{
	if (handle == NULL_BUFFER_HANDLE) {
		return;
	}

	auto iter = m_buffers.find(handle);
	if (iter == m_buffers.end()) {
		Log::error("Releasing unknown mesh buffer handle {} (double release?)", handle);
		return;
	}

	m_stats.live_buffers--;
	m_stats.live_bytes -= iter->second.size();
	m_buffers.erase(iter);
}

} // namespace cubeland::gfx
