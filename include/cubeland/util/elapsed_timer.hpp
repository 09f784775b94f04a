#pragma once

#include <cubeland/visibility.hpp>

#include <chrono>
#include <cstdint>

namespace cubeland
{

/**
 * Lap timer for multi-stage code segment measurements.
 * Starts counting on construction, each `lapMicros()` returns the time
 * spent since the previous lap (or construction) and starts a new lap.
 * Should be used like this:
 *    ElapsedTimer timer;
 *    <stage 1 code here>
 *    int64_t stage1_us = timer.lapMicros();
 *    <stage 2 code here>
 *    int64_t stage2_us = timer.lapMicros();
 */
class CUBELAND_API ElapsedTimer {
public:
	using Clock = std::chrono::steady_clock;

	ElapsedTimer() noexcept;
	ElapsedTimer(const ElapsedTimer &other) = delete;
	ElapsedTimer(ElapsedTimer &&other) = delete;
	ElapsedTimer &operator=(const ElapsedTimer &other) = delete;
	ElapsedTimer &operator=(ElapsedTimer &&other) = delete;
	~ElapsedTimer() = default;

	// Microseconds since the previous lap, restarts the lap
	int64_t lapMicros() noexcept;
	// Microseconds since construction, does not affect laps
	int64_t totalMicros() const noexcept;

private:
	Clock::time_point m_start;
	Clock::time_point m_lap_start;
};

} // namespace cubeland
