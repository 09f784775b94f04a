#include <cubeland/util/log.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <system_error>

namespace cubeland
{

Log::Level Log::m_current_level = Log::Level::Trace;

// Reused between prints to avoid allocating on every log line.
// FMT can still do temporary internal allocations but we can't control that.
static thread_local fmt::memory_buffer t_message_buffer;

static fmt::text_style styleForLevel(Log::Level level) noexcept
{
	switch (level) {
	case Log::Level::Trace:
		return fmt::fg(fmt::color::wheat);
	case Log::Level::Debug:
		return fmt::fg(fmt::color::light_sea_green);
	case Log::Level::Info:
		return fmt::fg(fmt::color::green);
	case Log::Level::Warn:
		return fmt::fg(fmt::color::yellow);
	case Log::Level::Error:
		return fmt::fg(fmt::color::red);
	case Log::Level::Fatal:
		return fmt::emphasis::bold | fmt::fg(fmt::color::white) | fmt::bg(fmt::color::red);
	case Log::Level::Off:
		break;
	} // No `default` to make `-Werror -Wswitch` protection work

	return {};
}

void Log::doLog(Level level, std::source_location where, std::string_view format_str,
	fmt::format_args format_args) noexcept
{
	std::string_view text;

	try {
		auto &msgbuf = t_message_buffer;

		try {
			msgbuf.clear();
			fmt::vformat_to(std::back_inserter(msgbuf), format_str, format_args);
		}
		catch (const fmt::format_error &err) {
			// Malformed format string is a bug at the call site, make it visible
			level = std::max(level, Level::Error);
			msgbuf.clear();
			fmt::format_to(std::back_inserter(msgbuf), "Caught fmt::format_error when trying to log: {}", err.what());
		}
		catch (const std::bad_alloc &err) {
			level = std::max(level, Level::Error);
			msgbuf.clear();
			// `msgbuf` inline storage fits this string without allocating again
			fmt::format_to(std::back_inserter(msgbuf), "Caught std::bad_alloc when trying to log: {}", err.what());
		}

		text = { msgbuf.data(), msgbuf.size() };
	}
	catch (const std::exception &) {
		// Formatting the failure message failed too, nothing potentially-throwing is allowed here
		level = std::max(level, Level::Error);
		text = "Caught exception when formatting a failure message";
	}

	const auto pid = getpid();
	const auto tid = gettid();

	try {
		// Info and below go to stdout, Warn and above to stderr
		FILE *sink = stdout;
		if (level >= Level::Warn) {
			// Keep ordering sane when both streams end up in the same terminal
			fflush(stdout);
			sink = stderr;
		}

		fmt::print(sink, "[{:%F %T}][{} {}][{:s}:{:d}][{:s}] {:s}\n", std::chrono::system_clock::now(), pid, tid,
			where.file_name(), where.line(), fmt::styled(levelName(level), styleForLevel(level)), text);
	}
	catch (const std::system_error &err) {
		// Printing to `sink` failed for system reasons, retry plainly on stderr
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%s:%u][ERROR] std::system_error when printing log: %s:%d (%s)\n",
			pid, tid, where.file_name(), where.line(), err.code().category().name(), err.code().value(), err.what());
	}
	catch (const std::exception &err) {
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%s:%u][ERROR] Exception when printing log: %s\n", pid, tid,
			where.file_name(), where.line(), err.what());
	}
}

void Log::setLevel(Level level) noexcept
{
	m_current_level = level;
	info("Changing log level to [{}]", levelName(level));
}

std::string_view Log::levelName(Level level) noexcept
{
	using namespace std::string_view_literals;

	switch (level) {
	case Level::Trace:
		return "TRACE"sv;
	case Level::Debug:
		return "DEBUG"sv;
	case Level::Info:
		return "INFO"sv;
	case Level::Warn:
		return "WARN"sv;
	case Level::Error:
		return "ERROR"sv;
	case Level::Fatal:
		return "FATAL"sv;
	case Level::Off:
		return "OFF"sv;
	} // No `default` to make `-Werror -Wswitch` protection work

	return "UNKNOWN"sv;
}

std::optional<Log::Level> Log::levelFromName(std::string_view name) noexcept
{
	constexpr std::array LEVELS = { Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Fatal,
		Level::Off };

	for (Level lvl : LEVELS) {
		std::string_view expected = levelName(lvl);
		if (expected.size() != name.size()) {
			continue;
		}

		bool equal = std::equal(name.begin(), name.end(), expected.begin(), [](char a, char b) {
			return std::toupper(static_cast<unsigned char>(a)) == static_cast<unsigned char>(b);
		});

		if (equal) {
			return lvl;
		}
	}

	return std::nullopt;
}

} // namespace cubeland
