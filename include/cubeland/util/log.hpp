#pragma once

#include <cubeland/visibility.hpp>

#include <fmt/core.h>

#include <optional>
#include <source_location>
#include <string_view>
#include <type_traits>

namespace cubeland
{

class CUBELAND_API Log {
public:
	// Log levels are defined by increasing severity - it's valid to compare them as integers
	enum class Level : int {
		/* Implementation details of some specific action, e.g. per-stage timings of every
		 * chunk load. Too noisy to be enabled outside of a focused debugging session. */
		Trace,
		/* Low-level program workflow, e.g. individual chunks being loaded and unloaded. */
		Debug,
		/* High-level program workflow, e.g. cache creation or a summary of a batch of loads. */
		Info,
		/* An error happened, but the current action can still be completed,
		 * though with some negative impact (e.g. config file could not be saved). */
		Warn,
		/* An error happened which makes completing the current action impossible
		 * (e.g. graphics upload failed for a chunk) but the program can go on. */
		Error,
		/* An error happened which makes further program execution impossible. */
		Fatal,

		Off // Not actually a logging level, use it with `setLevel` to disable logging completely
	};

	// Format string bundled with the location of the call site.
	// Implicitly constructible from anything convertible to `std::string_view`,
	// so that `Log::info("x = {}", x)` picks up the caller location for free.
	struct FormatString {
		template<typename S>
			requires std::is_convertible_v<const S &, std::string_view>
		FormatString(const S &str, std::source_location loc = std::source_location::current()) noexcept
			: str(str), where(loc)
		{}

		std::string_view str;
		std::source_location where;
	};

	template<typename... Args>
	static void log(Level level, std::source_location where, std::string_view format_str, Args &&...args) noexcept
	{
		if (!willBeLogged(level)) {
			return;
		}
		doLog(level, where, format_str, fmt::make_format_args(args...));
	}

	template<typename... Args>
	static void trace(FormatString format, Args &&...args) noexcept
	{
		log(Level::Trace, format.where, format.str, args...);
	}

	template<typename... Args>
	static void debug(FormatString format, Args &&...args) noexcept
	{
		log(Level::Debug, format.where, format.str, args...);
	}

	template<typename... Args>
	static void info(FormatString format, Args &&...args) noexcept
	{
		log(Level::Info, format.where, format.str, args...);
	}

	template<typename... Args>
	static void warn(FormatString format, Args &&...args) noexcept
	{
		log(Level::Warn, format.where, format.str, args...);
	}

	template<typename... Args>
	static void error(FormatString format, Args &&...args) noexcept
	{
		log(Level::Error, format.where, format.str, args...);
	}

	template<typename... Args>
	static void fatal(FormatString format, Args &&...args) noexcept
	{
		log(Level::Fatal, format.where, format.str, args...);
	}

	// Returns the current logging level.
	// Initially it is set to `Trace` regardless of build type (i.e. everything is logged).
	static Level level() noexcept { return m_current_level; }
	// Changes the current logging level
	static void setLevel(Level level) noexcept;
	// Returns whether logging with the given level will ultimately output something
	static bool willBeLogged(Level level) noexcept { return level >= m_current_level; }

	// Upper-case name of the level as printed in log lines ("TRACE", "INFO" etc.)
	static std::string_view levelName(Level level) noexcept;
	// Parse level from its name, case-insensitive. Returns `std::nullopt` for unknown names.
	static std::optional<Level> levelFromName(std::string_view name) noexcept;

private:
	Log() = delete;

	static Level m_current_level;

	static void doLog(Level level, std::source_location where, std::string_view format_str,
		fmt::format_args format_args) noexcept;
};

} // namespace cubeland
