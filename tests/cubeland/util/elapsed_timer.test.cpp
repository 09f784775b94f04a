#include <cubeland/util/elapsed_timer.hpp>

#include "../../test_common.hpp"

#include <thread>

namespace cubeland
{

TEST_CASE("'ElapsedTimer' laps", "[cubeland::elapsed_timer]")
{
	ElapsedTimer timer;

	std::this_thread::sleep_for(std::chrono::milliseconds(2));
	const int64_t lap1 = timer.lapMicros();
	const int64_t lap2 = timer.lapMicros();

	CHECK(lap1 >= 2000);
	CHECK(lap2 >= 0);
	CHECK(timer.totalMicros() >= lap1 + lap2);
}

} // namespace cubeland
