#pragma once

#include <stakeq/lib/errors.hpp>
#include <stakeq/lib/numbers.hpp>
#include <stakeq/secure/ledger.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace stakeq
{
class tomlconfig;

class registry_config final
{
public:
	stakeq::error serialize (stakeq::tomlconfig &) const;
	stakeq::error deserialize (stakeq::tomlconfig &);

	stakeq::ledger_constants ledger_constants () const;

public:
	/** Seconds per accrual interval */
	stakeq::seconds_t interval{ 10 };
	/** Raw units credited to the regular balance per interval */
	stakeq::uint128_t regular_rate{ 10 * stakeq::token_ratio };
	/** Raw units credited to the restricted balance per interval */
	stakeq::uint128_t restricted_rate{ 5 * stakeq::token_ratio };
	stakeq::account owner{ 1 };
	stakeq::account controller{ 1 };
};

class daemon_config final
{
public:
	daemon_config () = default;
	explicit daemon_config (std::filesystem::path const & data_path);

	stakeq::error serialize_toml (stakeq::tomlconfig &) const;
	stakeq::error deserialize_toml (stakeq::tomlconfig &);

	std::filesystem::path data_path;
	stakeq::registry_config registry;
};

/** Reads config-stakeq.toml from \p data_path if present, overrides are `key=value` toml lines taking precedence */
stakeq::error read_daemon_config_toml (std::filesystem::path const & data_path, stakeq::daemon_config & config, std::vector<std::string> const & overrides);

/**
 * Fills \p toml with the default configuration of type \p which, `stakeq` for config-stakeq.toml or `log` for config-log.toml.
 * Any other type is an error_config::invalid_value and leaves \p toml empty.
 */
stakeq::error generate_config (std::filesystem::path const & data_path, std::string const & which, stakeq::tomlconfig & toml);
}
