#include <cubeland/common/config.hpp>

#include <cubeland/land/land_public_consts.hpp>
#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/exception.hpp>
#include <cubeland/util/log.hpp>

#include <charconv>
#include <system_error>

using std::string_view;

namespace cubeland
{

Config::Config(std::filesystem::path config_filepath, Scheme scheme) : m_path(std::move(config_filepath))
{
	m_ini.SetUnicode();

	const std::string filepath = m_path.string();
	SI_Error load_res = m_ini.LoadFile(filepath.c_str());
	if (load_res == SI_FILE) {
		// Missing file is expected on the first run, it will be created on save
		Log::debug("Config file '{}' could not be opened, using defaults", filepath);
	} else if (load_res < 0) {
		Log::warn("Config file '{}' failed to load (SI_Error {}), using defaults", filepath, int(load_res));
	}

	for (const SchemeEntry &entry : scheme) {
		option_t value;
		const char *value_ptr = m_ini.GetValue(entry.section.c_str(), entry.parameter_name.c_str());
		if (!value_ptr) {
			const std::string value_str = optionToString(entry.default_value);
			// One-line descriptions only, multiline comments need '; ' on every line
			const std::string comment = "; " + entry.description;
			m_ini.SetValue(entry.section.c_str(), entry.parameter_name.c_str(), value_str.c_str(), comment.c_str());
			value = entry.default_value;
		} else {
			value = optionFromString(string_view(value_ptr), entry.default_value.index());
		}

		m_data[entry.section][entry.parameter_name] = std::move(value);
	}
}

Config::~Config() noexcept
{
	std::error_code ec;
	if (m_path.has_parent_path()) {
		std::filesystem::create_directories(m_path.parent_path(), ec);
	}

	if (ec) {
		Log::warn("Can't create directories for config file '{}': {}", m_path.string(), ec.message());
		return;
	}

	if (SI_Error res = m_ini.SaveFile(m_path.string().c_str()); res < 0) {
		Log::warn("Can't save config file '{}' (SI_Error {})", m_path.string(), int(res));
	}
}

Config::Scheme Config::mainConfigScheme()
{
	Config::Scheme s;

	s.push_back({ "world", "seed", "World generation seed (unsigned 32-bit)", int64_t(42) });
	s.push_back({ "world", "visible_radius", "Visible radius in chunks, defines chunk cache capacity",
		int64_t(land::Consts::VISIBLE_RADIUS) });
	s.push_back({ "log", "level", "Log level: trace, debug, info, warn, error, fatal or off", std::string("info") });

	return s;
}

const Config::option_t *Config::findOption(string_view section, string_view parameter_name) const noexcept
{
	auto it_ext = m_data.find(section);
	if (it_ext == m_data.end()) {
		return nullptr;
	}

	auto it_inter = it_ext->second.find(parameter_name);
	if (it_inter == it_ext->second.end()) {
		return nullptr;
	}

	return &it_inter->second;
}

std::optional<std::string> Config::optionString(string_view section, string_view parameter_name) const
{
	if (const option_t *opt = findOption(section, parameter_name); opt) {
		return std::get<std::string>(*opt);
	}
	return std::nullopt;
}

std::optional<int64_t> Config::optionInt64(string_view section, string_view parameter_name) const
{
	if (const option_t *opt = findOption(section, parameter_name); opt) {
		return std::get<int64_t>(*opt);
	}
	return std::nullopt;
}

std::string Config::getString(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionString(section, parameter_name); opt.has_value()) {
		return std::move(*opt);
	}

	Log::error("Option {}/{} (string) not found", section, parameter_name);
	throw Exception::fromError(CubelandErrc::OptionMissing, "missing config option assumed existing", loc);
}

int64_t Config::getInt64(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionInt64(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (int64) not found", section, parameter_name);
	throw Exception::fromError(CubelandErrc::OptionMissing, "missing config option assumed existing", loc);
}

void Config::patch(string_view section, string_view parameter_name, string_view value_string,
	bool save_to_config_file, Location loc)
{
	if (auto it_ext = m_data.find(section); it_ext != m_data.end()) {
		if (auto it_inter = it_ext->second.find(parameter_name); it_inter != it_ext->second.end()) {
			it_inter->second = optionFromString(value_string, it_inter->second.index(), loc);

			if (save_to_config_file) {
				const std::string str = optionToString(it_inter->second);
				m_ini.SetValue(it_ext->first.c_str(), it_inter->first.c_str(), str.c_str());
			}

			return;
		}
	}

	Log::error("Option {}/{} not found for patching", section, parameter_name);
	throw Exception::fromError(CubelandErrc::OptionMissing, "missing config option for patching", loc);
}

std::string Config::optionToString(const option_t &value)
{
	switch (value.index()) {
	case 0:
		static_assert(std::is_same_v<std::string, std::variant_alternative_t<0, Config::option_t>>);
		return std::get<std::string>(value);

	case 1:
		static_assert(std::is_same_v<int64_t, std::variant_alternative_t<1, Config::option_t>>);
		return std::to_string(std::get<int64_t>(value));

	default:
		static_assert(std::variant_size_v<Config::option_t> == 2);
		return "";
	}
}

template<typename T>
static T parseNumber(string_view s, Config::Location loc)
{
	T value {};
	const char *end = s.data() + s.size();
	auto [ptr, ec] = std::from_chars(s.data(), end, value);

	if (ec != std::errc() || ptr != end) {
		Log::error("Can't parse config value '{}' as a number", s);
		throw Exception::fromError(CubelandErrc::InvalidData, "malformed numeric config value", loc);
	}

	return value;
}

Config::option_t Config::optionFromString(string_view s, size_t type, Location loc)
{
	switch (type) {
	case 0:
		return std::string(s);

	case 1:
		return parseNumber<int64_t>(s, loc);

	default:
		static_assert(std::variant_size_v<Config::option_t> == 2);
		throw Exception::fromError(CubelandErrc::InvalidData, "unknown config option type", loc);
	}
}

} // namespace cubeland
