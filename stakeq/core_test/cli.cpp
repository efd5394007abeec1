#include <stakeq/lib/cli.hpp>
#include <stakeq/lib/tomlconfig.hpp>

#include <gtest/gtest.h>

#include <sstream>

namespace
{
stakeq::cli_config_overrides_t parse_pairs (std::vector<std::string> const & arguments)
{
	stakeq::cli_config_overrides_t result;
	for (auto const & argument : arguments)
	{
		std::stringstream stream{ argument };
		stakeq::config_key_value_pair pair;
		stream >> pair;
		result.push_back (pair);
	}
	return result;
}
}

TEST (cli, key_value_pair)
{
	std::stringstream stream{ "registry.interval=5" };
	stakeq::config_key_value_pair pair;
	stream >> pair;
	ASSERT_EQ ("registry.interval", pair.key);
	ASSERT_EQ ("5", pair.value);
}

TEST (cli, quoting)
{
	auto overrides = stakeq::make_config_overrides (parse_pairs ({ "registry.interval=5", "log.level=debug", "log.console.enable=false", "registry.owner=\"acc_0000000000000001\"" }));
	ASSERT_EQ ("5", overrides["registry.interval"]);
	ASSERT_EQ ("\"debug\"", overrides["log.level"]);
	ASSERT_EQ ("false", overrides["log.console.enable"]);
	// Values that are already quoted are left alone
	ASSERT_EQ ("\"acc_0000000000000001\"", overrides["registry.owner"]);
}

TEST (cli, arrays)
{
	auto overrides = stakeq::make_config_overrides (parse_pairs ({ "a.numbers=[1,2,3]", "a.names=[x,y]" }));
	ASSERT_EQ ("[1,2,3]", overrides["a.numbers"]);
	ASSERT_EQ ("[\"x\",\"y\"]", overrides["a.names"]);
}

TEST (cli, overrides_to_lines)
{
	auto overrides = stakeq::make_config_overrides (parse_pairs ({ "registry.interval=7", "log.level=trace" }));
	auto lines = stakeq::config_overrides_to_lines (overrides);
	ASSERT_EQ (2, lines.size ());
	ASSERT_EQ ("log.level=\"trace\"", lines[0]);
	ASSERT_EQ ("registry.interval=7", lines[1]);

	// Without a file on disk only the overrides are read
	stakeq::tomlconfig toml;
	toml.read_with_overrides ("/nonexistent/stakeq/config.toml", lines);
	ASSERT_FALSE (toml.get_error ());
	ASSERT_EQ (7, toml.get_required_child ("registry").get<int64_t> ("interval"));
	ASSERT_EQ ("trace", toml.get_required_child ("log").get<std::string> ("level"));
}

TEST (cli, signed_and_plain_numbers)
{
	auto overrides = stakeq::make_config_overrides (parse_pairs ({ "a.negative=-3", "a.sign_only=-", "a.mixed=1x" }));
	ASSERT_EQ ("-3", overrides["a.negative"]);
	ASSERT_EQ ("\"-\"", overrides["a.sign_only"]);
	ASSERT_EQ ("\"1x\"", overrides["a.mixed"]);
}
