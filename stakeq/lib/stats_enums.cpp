#define MAGIC_ENUM_RANGE_MIN 0
#define MAGIC_ENUM_RANGE_MAX 256

#include <stakeq/lib/stats_enums.hpp>

#include <magic_enum.hpp>

std::string_view stakeq::stat::to_string (stakeq::stat::type type)
{
	return magic_enum::enum_name (type);
}

std::string_view stakeq::stat::to_string (stakeq::stat::detail detail)
{
	return magic_enum::enum_name (detail);
}

namespace
{
template <class Enum>
std::vector<Enum> valid_values ()
{
	std::vector<Enum> result;
	for (auto value : magic_enum::enum_values<Enum> ())
	{
		// Skip reserved values
		if (!magic_enum::enum_name (value).starts_with ("_"))
		{
			result.push_back (value);
		}
	}
	return result;
}
}

std::vector<stakeq::stat::type> const & stakeq::stat::all_types ()
{
	static std::vector<stakeq::stat::type> all = valid_values<stakeq::stat::type> ();
	return all;
}

std::vector<stakeq::stat::detail> const & stakeq::stat::all_details ()
{
	static std::vector<stakeq::stat::detail> all = valid_values<stakeq::stat::detail> ();
	return all;
}
