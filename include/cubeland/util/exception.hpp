#pragma once

#include <cubeland/visibility.hpp>

#include <exception>
#include <source_location>
#include <string>
#include <system_error>

namespace cubeland
{

// Base exception class for all exceptions thrown by the library.
//
// Use it directly rather than subclassing per subsystem; reacting on the
// error kind is done through the stored `std::error_condition` (`error()`),
// usually compared against `CubelandErrc` values.
//
// Terrain generation and meshing never throw for well-formed inputs.
// Exceptions are reserved for failures of external collaborators (geometry
// upload, config files) and for invalid construction parameters.
class CUBELAND_API Exception : public std::exception {
public:
	using Location = std::source_location;

	Exception() = delete;
	Exception(Exception &&) = default;
	Exception(const Exception &) = default;
	Exception &operator=(Exception &&) = default;
	Exception &operator=(const Exception &) = default;
	~Exception() override;

	const char *what() const noexcept override { return m_what.c_str(); }
	const std::error_condition &error() const noexcept { return m_error; }
	// Source location where the exception was thrown.
	// Pass it to `Log::log` to make the log line point at the throw site.
	const Location &where() const noexcept { return m_where; }

	// Construct exception from `std::error_code` returned by a platform/library call.
	// `what()` is formatted as "<details> (code [<ec.category>:<ec>] <ec.message>)"
	static Exception fromErrorCode(std::error_code ec, const char *details, Location loc = Location::current());

	// Construct exception from `std::error_condition`, normally a `CubelandErrc` value.
	// `what()` is formatted as "<details> (cond [<ec.category>:<ec>] <ec.message>)"
	static Exception fromError(std::error_condition ec, const char *details, Location loc = Location::current());

protected:
	Exception(std::string what, std::error_condition error, Location loc);

private:
	std::string m_what;
	std::error_condition m_error;
	Location m_where;
};

} // namespace cubeland
