#include <stakeq/lib/config.hpp>
#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/tomlconfig.hpp>
#include <stakeq/node/registry_config.hpp>

namespace
{
/** Reads \p key as text, plain toml integers such as command line overrides are accepted too */
void read_text (stakeq::tomlconfig & toml, std::string const & key, std::string & text)
{
	if (auto number = toml.get_tree ()->get_as<int64_t> (key); number && *number >= 0)
	{
		text = std::to_string (*number);
	}
	else
	{
		toml.get<std::string> (key, text);
	}
}

void read_amount (stakeq::tomlconfig & toml, std::string const & key, stakeq::uint128_t & target)
{
	std::string text = stakeq::to_string (target);
	read_text (toml, key, text);
	if (stakeq::decode_dec (text, target))
	{
		toml.get_error ().set ("Invalid amount for " + key + ": " + text, stakeq::error_config::invalid_value);
	}
}

void read_account (stakeq::tomlconfig & toml, std::string const & key, stakeq::account & target)
{
	std::string text = target.to_string ();
	read_text (toml, key, text);
	if (target.decode (text))
	{
		toml.get_error ().set ("Invalid account for " + key + ": " + text, stakeq::error_config::invalid_value);
	}
}
}

stakeq::error stakeq::registry_config::serialize (stakeq::tomlconfig & toml) const
{
	toml.put ("interval", interval);
	toml.put ("regular_rate", stakeq::to_string (regular_rate));
	toml.put ("restricted_rate", stakeq::to_string (restricted_rate));
	toml.put ("owner", owner.to_string ());
	toml.put ("controller", controller.to_string ());
	return toml.get_error ();
}

stakeq::error stakeq::registry_config::deserialize (stakeq::tomlconfig & toml)
{
	toml.get ("interval", interval);
	read_amount (toml, "regular_rate", regular_rate);
	read_amount (toml, "restricted_rate", restricted_rate);
	read_account (toml, "owner", owner);
	read_account (toml, "controller", controller);

	if (!toml.get_error () && interval == 0)
	{
		toml.get_error ().set ("interval must be greater than zero", stakeq::error_config::invalid_value);
	}
	return toml.get_error ();
}

stakeq::ledger_constants stakeq::registry_config::ledger_constants () const
{
	stakeq::ledger_constants result;
	result.interval = interval;
	result.regular_rate = regular_rate;
	result.restricted_rate = restricted_rate;
	return result;
}

/*
 * daemon_config
 */

stakeq::daemon_config::daemon_config (std::filesystem::path const & data_path_a) :
	data_path{ data_path_a }
{
}

stakeq::error stakeq::daemon_config::serialize_toml (stakeq::tomlconfig & toml) const
{
	stakeq::tomlconfig registry_l;
	registry.serialize (registry_l);
	toml.put_child ("registry", registry_l);
	return toml.get_error ();
}

stakeq::error stakeq::daemon_config::deserialize_toml (stakeq::tomlconfig & toml)
{
	if (auto registry_l = toml.get_optional_child ("registry"))
	{
		registry.deserialize (*registry_l);
	}
	return toml.get_error ();
}

stakeq::error stakeq::read_daemon_config_toml (std::filesystem::path const & data_path, stakeq::daemon_config & config, std::vector<std::string> const & overrides)
{
	stakeq::tomlconfig toml;
	auto error = toml.read_with_overrides (stakeq::get_config_path (data_path), overrides);
	if (!error)
	{
		error = config.deserialize_toml (toml);
	}
	return error;
}

stakeq::error stakeq::generate_config (std::filesystem::path const & data_path, std::string const & which, stakeq::tomlconfig & toml)
{
	if (which == "stakeq")
	{
		stakeq::daemon_config config{ data_path };
		return config.serialize_toml (toml);
	}
	if (which == "log")
	{
		stakeq::tomlconfig log_l;
		auto error = stakeq::log_config::cli_default ().serialize (log_l);
		if (!error)
		{
			toml.put_child ("log", log_l);
		}
		return error;
	}
	stakeq::error error;
	error.set ("Unknown config type: " + which + ". Must be one of: stakeq, log", stakeq::error_config::invalid_value);
	return error;
}
