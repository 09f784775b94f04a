#include <cubeland/util/elapsed_timer.hpp>

namespace cubeland
{

ElapsedTimer::ElapsedTimer() noexcept : m_start(Clock::now()), m_lap_start(m_start) {}

int64_t ElapsedTimer::lapMicros() noexcept
{
	const auto now = Clock::now();
	const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(now - m_lap_start);
	m_lap_start = now;
	return elapsed.count();
}

int64_t ElapsedTimer::totalMicros() const noexcept
{
	return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - m_start).count();
}

} // namespace cubeland
