#pragma once

#include <cubeland/visibility.hpp>

#include <system_error>

namespace cubeland
{

// This error code is supplemental to exception classes and is
// intended to be tested and reacted on by exception handling.
enum class CubelandErrc : int {
	// Error happened in graphics subsystem (e.g. geometry upload failed)
	GfxFailure = 1,
	// A finite resource was exhausted
	OutOfResource = 2,
	// Input data is invalid and can't be used
	InvalidData = 3,
	// A config object has no requested option but user assumes it exists
	OptionMissing = 4,
	// Requested file does not exist or is inaccessible
	FileNotFound = 5,
	// Error is unknown or unexpected here
	UnknownError = 6,
};

// ADL-accessible factory for `std::error_condition { CubelandErrc }`
CUBELAND_API std::error_condition make_error_condition(CubelandErrc errc) noexcept;

} // namespace cubeland

namespace std
{

// Mark `CubelandErrc` as eligible for `std::error_condition`
template<>
struct is_error_condition_enum<cubeland::CubelandErrc> : true_type {};

} // namespace std
