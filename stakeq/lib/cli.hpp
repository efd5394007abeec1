#pragma once

#include <stakeq/lib/config.hpp>

#include <istream>
#include <string>
#include <vector>

namespace stakeq
{
struct config_key_value_pair
{
	std::string key;
	std::string value;
};
std::istream & operator>> (std::istream & is, stakeq::config_key_value_pair & into);

/// Type used by boost::program_options to store config key/value pairs
using cli_config_overrides_t = std::vector<config_key_value_pair>;

/// Convert key/value pairs from boost::program_options to toml values, quoting strings and leaving numbers and booleans as literals
stakeq::config_overrides_t make_config_overrides (stakeq::cli_config_overrides_t const & raw_config_overrides);

/// Convert overrides to `key=value` lines as accepted by stakeq::tomlconfig::read_with_overrides
std::vector<std::string> config_overrides_to_lines (stakeq::config_overrides_t const & config_overrides);
}
