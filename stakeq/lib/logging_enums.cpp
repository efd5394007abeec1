#define MAGIC_ENUM_RANGE_MIN 0
#define MAGIC_ENUM_RANGE_MAX 256

#include <stakeq/lib/logging_enums.hpp>

#include <magic_enum.hpp>

#include <stdexcept>
#include <string>

std::string_view stakeq::to_string (stakeq::log::type tag)
{
	return magic_enum::enum_name (tag);
}

std::string_view stakeq::to_string (stakeq::log::detail detail)
{
	return magic_enum::enum_name (detail);
}

std::string_view stakeq::to_string (stakeq::log::level level)
{
	return magic_enum::enum_name (level);
}

namespace
{
template <class Enum>
Enum parse_enum (std::string_view name, char const * what)
{
	// Names starting with an underscore are reserved
	if (!name.empty () && name.front () != '_')
	{
		if (auto value = magic_enum::enum_cast<Enum> (name))
		{
			return *value;
		}
	}
	throw std::invalid_argument (std::string{ "Invalid " } + what + ": " + std::string{ name });
}
}

stakeq::log::level stakeq::log::parse_level (std::string_view name)
{
	return parse_enum<stakeq::log::level> (name, "log level");
}

stakeq::log::type stakeq::log::parse_type (std::string_view name)
{
	return parse_enum<stakeq::log::type> (name, "log type");
}

stakeq::log::detail stakeq::log::parse_detail (std::string_view name)
{
	return parse_enum<stakeq::log::detail> (name, "log detail");
}

std::vector<stakeq::log::level> const & stakeq::log::all_levels ()
{
	static std::vector<stakeq::log::level> all = [] () {
		auto values = magic_enum::enum_values<stakeq::log::level> ();
		return std::vector<stakeq::log::level>{ values.begin (), values.end () };
	}();
	return all;
}

std::vector<stakeq::log::type> const & stakeq::log::all_types ()
{
	static std::vector<stakeq::log::type> all = [] () {
		auto values = magic_enum::enum_values<stakeq::log::type> ();
		return std::vector<stakeq::log::type>{ values.begin (), values.end () };
	}();
	return all;
}
