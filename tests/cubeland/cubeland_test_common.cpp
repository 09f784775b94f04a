#include "../cubeland_test_common.hpp"

#include <fmt/format.h>

namespace cubeland::test
{

RecordingMeshUploader::~RecordingMeshUploader() noexcept = default;

gfx::BufferHandleSet RecordingMeshUploader::upload(const land::ChunkMeshData &data)
{
	if (m_fail_count > 0) {
		m_fail_count--;
		m_failed_uploads++;
		throw Exception::fromError(m_fail_errc, "injected upload failure");
	}

	gfx::BufferHandleSet handles;
	handles.positions = m_next_handle++;
	handles.normals = m_next_handle++;
	handles.block_types = m_next_handle++;
	handles.indices = m_next_handle++;

	m_live.insert(handles.positions);
	m_last_uploaded = data;
	m_uploads++;
	return handles;
}

void RecordingMeshUploader::release(const gfx::BufferHandleSet &handles) noexcept
{
	m_releases++;
	if (m_live.erase(handles.positions) == 0) {
		m_double_releases++;
	}
}

} // namespace cubeland::test

namespace Catch
{

std::string StringMaker<cubeland::land::ChunkCoord>::convert(cubeland::land::ChunkCoord coord)
{
	return fmt::format("({}, {})", coord.x, coord.z);
}

std::string StringMaker<cubeland::land::BlockType>::convert(cubeland::land::BlockType type)
{
	return std::string(cubeland::land::blockTypeName(type));
}

} // namespace Catch
