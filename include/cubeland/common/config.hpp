#pragma once

#include <cubeland/visibility.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#define SI_CONVERT_GENERIC
#include <simpleini/SimpleIni.h>

namespace cubeland
{

// INI-backed set of typed options described by a scheme.
//
// Options missing from the file are filled with scheme defaults (and written
// back with their description as a comment), so the file saved on destruction
// always documents every known option.
class CUBELAND_API Config {
public:
	using Location = std::source_location;
	using option_t = std::variant<std::string, int64_t>;

	struct SchemeEntry {
		std::string section;
		std::string parameter_name;
		std::string description;
		option_t default_value;
	};
	using Scheme = std::vector<SchemeEntry>;

	// Loads options from `config_filepath` if it exists, missing file is not an error.
	// Throws `Exception(InvalidData)` if a value in the file can't be parsed as its scheme type.
	Config(std::filesystem::path config_filepath, Scheme scheme);
	Config(Config &&) = delete;
	Config(const Config &) = delete;
	Config &operator=(Config &&) = delete;
	Config &operator=(const Config &) = delete;
	// Saves the file, creating parent directories. Failures are logged, not thrown.
	~Config() noexcept;

	// Throws `Exception(OptionMissing)` if there is no such option,
	// `Exception(InvalidData)` if `value_string` does not parse as the option type
	void patch(std::string_view section, std::string_view parameter_name, std::string_view value_string,
		bool save_to_config_file = false, Location loc = Location::current());

	std::optional<std::string> optionString(std::string_view section, std::string_view parameter_name) const;
	std::optional<int64_t> optionInt64(std::string_view section, std::string_view parameter_name) const;

	// Same as `option*` but throw `Exception(OptionMissing)` instead of returning `std::nullopt`
	std::string getString(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	int64_t getInt64(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;

	const std::filesystem::path &path() const noexcept { return m_path; }

public:
	// Options understood by the chunk tools
	static Scheme mainConfigScheme();

	static std::string optionToString(const option_t &value);
	// `type` is the variant index of the expected alternative.
	// Throws `Exception(InvalidData)` if the string does not parse.
	static option_t optionFromString(std::string_view s, size_t type, Location loc = Location::current());

private:
	std::map<std::string, std::map<std::string, option_t, std::less<>>, std::less<>> m_data;
	std::filesystem::path m_path;
	CSimpleIniA m_ini;

	const option_t *findOption(std::string_view section, std::string_view parameter_name) const noexcept;
};

} // namespace cubeland
