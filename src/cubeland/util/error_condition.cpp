#include <cubeland/util/error_condition.hpp>

namespace cubeland
{

namespace
{

struct CubelandErrorCategory : std::error_category {
	const char *name() const noexcept override { return "Cubeland error"; }

	std::string message(int code) const override
	{
		switch (static_cast<CubelandErrc>(code)) {
		case CubelandErrc::GfxFailure: return "Error happened in graphics subsystem";
		case CubelandErrc::OutOfResource: return "A finite resource was exhausted";
		case CubelandErrc::InvalidData: return "Input data is invalid and can't be used";
		case CubelandErrc::OptionMissing: return "A config object has no requested option but user assumes it exists";
		case CubelandErrc::FileNotFound: return "Requested file does not exist or is inaccessible";
		case CubelandErrc::UnknownError: return "Unknown or unexpected error";
		// No `default` to make `-Werror -Wswitch` protection work
		}

		return "Unknown error";
	}
};

const CubelandErrorCategory g_category;

} // anonymous namespace

std::error_condition make_error_condition(CubelandErrc errc) noexcept
{
	return { static_cast<int>(errc), g_category };
}

} // namespace cubeland
