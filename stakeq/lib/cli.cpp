#include <stakeq/lib/cli.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include <algorithm>
#include <cctype>

namespace
{
/** Booleans and integers are valid toml as they are, everything else is a string */
bool is_toml_literal (std::string const & value)
{
	if (value == "true" || value == "false")
	{
		return true;
	}
	auto digits = boost::algorithm::trim_left_copy_if (value, boost::algorithm::is_any_of ("+-"));
	return !digits.empty () && digits.size () + 1 >= value.size () && std::all_of (digits.begin (), digits.end (), [] (unsigned char ch) { return std::isdigit (ch); });
}

std::string to_toml_value (std::string const & value)
{
	if (is_toml_literal (value) || value.find ('\"') != std::string::npos)
	{
		return value;
	}
	return (boost::format ("\"%1%\"") % value).str ();
}

/** `[a,1]` becomes `["a",1]` */
std::string to_toml_array (std::string const & value)
{
	auto start = value.find ('[');
	auto end = value.find (']', start);
	auto inner = value.substr (start + 1, end == std::string::npos ? std::string::npos : end - start - 1);

	std::vector<std::string> elements;
	boost::algorithm::split (elements, inner, boost::algorithm::is_any_of (","));
	for (auto & element : elements)
	{
		element = to_toml_value (boost::algorithm::trim_copy (element));
	}
	return "[" + boost::algorithm::join (elements, ",") + "]";
}
}

stakeq::config_overrides_t stakeq::make_config_overrides (stakeq::cli_config_overrides_t const & config_overrides)
{
	stakeq::config_overrides_t overrides;
	for (auto const & [key, value] : config_overrides)
	{
		overrides[key] = value.find ('[') != std::string::npos ? to_toml_array (value) : to_toml_value (value);
	}
	return overrides;
}

std::vector<std::string> stakeq::config_overrides_to_lines (stakeq::config_overrides_t const & config_overrides)
{
	std::vector<std::string> lines;
	lines.reserve (config_overrides.size ());
	for (auto const & [key, value] : config_overrides)
	{
		lines.push_back ((boost::format ("%1%=%2%") % key % value).str ());
	}
	return lines;
}

std::istream & stakeq::operator>> (std::istream & is, stakeq::config_key_value_pair & into)
{
	char ch;
	while (is >> ch && ch != '=')
	{
		into.key += ch;
	}
	return is >> into.value;
}
