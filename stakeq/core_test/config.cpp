#include <stakeq/lib/config.hpp>
#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/tomlconfig.hpp>
#include <stakeq/node/registry_config.hpp>
#include <stakeq/test_common/testutil.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace
{
/** Creates a unique empty directory that is removed on destruction */
class temporary_directory final
{
public:
	temporary_directory () :
		path{ std::filesystem::temp_directory_path () / ("stakeq_test_" + std::to_string (std::rand ())) }
	{
		std::filesystem::remove_all (path);
		std::filesystem::create_directories (path);
	}

	~temporary_directory ()
	{
		std::error_code ec;
		std::filesystem::remove_all (path, ec);
	}

	std::filesystem::path const path;
};
}

TEST (registry_config, defaults)
{
	stakeq::registry_config config;
	ASSERT_EQ (10, config.interval);
	ASSERT_EQ (stakeq::test::tokens (10), config.regular_rate);
	ASSERT_EQ (stakeq::test::tokens (5), config.restricted_rate);

	auto constants = config.ledger_constants ();
	ASSERT_EQ (config.interval, constants.interval);
	ASSERT_EQ (config.regular_rate, constants.regular_rate);
	ASSERT_EQ (config.restricted_rate, constants.restricted_rate);
}

TEST (registry_config, serialize_round_trip)
{
	stakeq::registry_config config;
	config.interval = 60;
	config.regular_rate = std::numeric_limits<stakeq::uint128_t>::max ();
	config.restricted_rate = 7;
	config.owner = 0xabcdef;
	config.controller = 42;

	stakeq::tomlconfig toml;
	ASSERT_FALSE (config.serialize (toml));

	// Amounts are stored as strings since toml integers are 64 bit
	std::stringstream stream;
	toml.write (stream);
	stakeq::tomlconfig parsed;
	parsed.read (stream);

	stakeq::registry_config loaded;
	ASSERT_FALSE (loaded.deserialize (parsed));
	ASSERT_EQ (config.interval, loaded.interval);
	ASSERT_EQ (config.regular_rate, loaded.regular_rate);
	ASSERT_EQ (config.restricted_rate, loaded.restricted_rate);
	ASSERT_EQ (config.owner, loaded.owner);
	ASSERT_EQ (config.controller, loaded.controller);
}

TEST (registry_config, deserialize_partial)
{
	std::stringstream stream;
	stream << R"toml(
	interval = 5
	regular_rate = "20000000000000000000"
	controller = "acc_00000000000000ff"
	)toml";

	stakeq::tomlconfig toml;
	toml.read (stream);
	stakeq::registry_config config;
	ASSERT_FALSE (config.deserialize (toml));
	ASSERT_EQ (5, config.interval);
	ASSERT_EQ (stakeq::test::tokens (20), config.regular_rate);
	ASSERT_EQ (stakeq::test::tokens (5), config.restricted_rate);
	ASSERT_EQ (stakeq::account{ 1 }, config.owner);
	ASSERT_EQ (stakeq::account{ 0xff }, config.controller);
}

TEST (registry_config, deserialize_integers)
{
	std::stringstream stream;
	stream << R"toml(
	regular_rate = 1000
	owner = 12
	)toml";

	stakeq::tomlconfig toml;
	toml.read (stream);
	stakeq::registry_config config;
	ASSERT_FALSE (config.deserialize (toml));
	ASSERT_EQ (1000, config.regular_rate);
	ASSERT_EQ (stakeq::account{ 12 }, config.owner);
}

TEST (registry_config, invalid_values)
{
	{
		std::stringstream stream;
		stream << "interval = 0";
		stakeq::tomlconfig toml;
		toml.read (stream);
		stakeq::registry_config config;
		auto error = config.deserialize (toml);
		ASSERT_TRUE (error);
		ASSERT_EQ (error, stakeq::error_config::invalid_value);
	}
	{
		std::stringstream stream;
		stream << "regular_rate = \"ten\"";
		stakeq::tomlconfig toml;
		toml.read (stream);
		stakeq::registry_config config;
		ASSERT_TRUE (config.deserialize (toml));
	}
	{
		std::stringstream stream;
		stream << "owner = \"acc_xyz\"";
		stakeq::tomlconfig toml;
		toml.read (stream);
		stakeq::registry_config config;
		ASSERT_TRUE (config.deserialize (toml));
	}
	{
		std::stringstream stream;
		stream << "interval = \"often\"";
		stakeq::tomlconfig toml;
		toml.read (stream);
		stakeq::registry_config config;
		ASSERT_TRUE (config.deserialize (toml));
	}
}

TEST (daemon_config, missing_file_uses_defaults)
{
	temporary_directory directory;
	stakeq::daemon_config config{ directory.path };
	ASSERT_FALSE (stakeq::read_daemon_config_toml (directory.path, config, {}));
	ASSERT_EQ (10, config.registry.interval);
}

TEST (daemon_config, file_and_overrides)
{
	temporary_directory directory;
	{
		std::ofstream file{ stakeq::get_config_path (directory.path) };
		file << "[registry]\ninterval = 30\nrestricted_rate = \"1\"\n";
	}

	stakeq::daemon_config config{ directory.path };
	ASSERT_FALSE (stakeq::read_daemon_config_toml (directory.path, config, { "registry.interval=15" }));
	// Overrides win over the file, untouched keys come from the file
	ASSERT_EQ (15, config.registry.interval);
	ASSERT_EQ (1, config.registry.restricted_rate);
}

TEST (daemon_config, malformed_file)
{
	temporary_directory directory;
	{
		std::ofstream file{ stakeq::get_config_path (directory.path) };
		file << "[registry\ninterval = 30\n";
	}

	stakeq::daemon_config config{ directory.path };
	auto error = stakeq::read_daemon_config_toml (directory.path, config, {});
	ASSERT_TRUE (error);
	ASSERT_EQ (error, stakeq::error_common::parse_failed);
}

TEST (daemon_config, serialize_round_trip)
{
	stakeq::daemon_config config;
	config.registry.interval = 3;
	config.registry.controller = 9;

	stakeq::tomlconfig toml;
	ASSERT_FALSE (config.serialize_toml (toml));
	ASSERT_TRUE (toml.has_key ("registry"));

	std::stringstream stream;
	toml.write (stream);
	stakeq::tomlconfig parsed;
	parsed.read (stream);

	stakeq::daemon_config loaded;
	ASSERT_FALSE (loaded.deserialize_toml (parsed));
	ASSERT_EQ (3, loaded.registry.interval);
	ASSERT_EQ (stakeq::account{ 9 }, loaded.registry.controller);
}

TEST (log_config, file_and_overrides)
{
	temporary_directory directory;
	{
		std::ofstream file{ stakeq::get_log_toml_config_path (directory.path) };
		file << "[log]\nlevel = \"warn\"\n[log.levels]\nqueue = \"trace\"\n";
	}

	stakeq::log_config config;
	ASSERT_FALSE (stakeq::read_log_config_toml (directory.path, config, { "log.console.enable=false" }));
	ASSERT_EQ (stakeq::log::level::warn, config.default_level);
	ASSERT_FALSE (config.console.enable);
	auto queue_level = config.levels.find ({ stakeq::log::type::queue, stakeq::log::detail::all });
	ASSERT_NE (config.levels.end (), queue_level);
	ASSERT_EQ (stakeq::log::level::trace, queue_level->second);
}

TEST (log_config, missing_file_keeps_preset)
{
	temporary_directory directory;
	auto config = stakeq::log_config::cli_default ();
	ASSERT_FALSE (stakeq::read_log_config_toml (directory.path, config, {}));
	ASSERT_TRUE (config.console.to_cerr);
	ASSERT_EQ (stakeq::log::level::info, config.default_level);
}

TEST (config, paths)
{
	std::filesystem::path data_path{ "/tmp/stakeq" };
	ASSERT_EQ (data_path / "config-stakeq.toml", stakeq::get_config_path (data_path));
	ASSERT_EQ (data_path / "config-log.toml", stakeq::get_log_toml_config_path (data_path));
}

TEST (generate_config, stakeq)
{
	temporary_directory directory;
	stakeq::tomlconfig toml;
	ASSERT_FALSE (stakeq::generate_config (directory.path, "stakeq", toml));
	ASSERT_TRUE (toml.has_key ("registry"));

	// The generated document, written as config-stakeq.toml, reads back as the defaults
	{
		std::ofstream file{ stakeq::get_config_path (directory.path) };
		file << toml.to_string ();
	}
	stakeq::daemon_config defaults;
	stakeq::daemon_config config{ directory.path };
	config.registry.interval = 99;
	ASSERT_FALSE (stakeq::read_daemon_config_toml (directory.path, config, {}));
	ASSERT_EQ (defaults.registry.interval, config.registry.interval);
	ASSERT_EQ (defaults.registry.regular_rate, config.registry.regular_rate);
	ASSERT_EQ (defaults.registry.controller, config.registry.controller);
}

TEST (generate_config, log)
{
	temporary_directory directory;
	stakeq::tomlconfig toml;
	ASSERT_FALSE (stakeq::generate_config (directory.path, "log", toml));
	auto log_l = toml.get_optional_child ("log");
	ASSERT_TRUE (log_l);
	ASSERT_TRUE (log_l->has_key ("level"));
	ASSERT_TRUE (log_l->has_key ("console"));

	{
		std::ofstream file{ stakeq::get_log_toml_config_path (directory.path) };
		file << toml.to_string ();
	}
	stakeq::log_config config;
	ASSERT_FALSE (config.console.to_cerr);
	ASSERT_FALSE (stakeq::read_log_config_toml (directory.path, config, {}));
	// The command line preset is what gets written
	ASSERT_TRUE (config.console.to_cerr);
}

TEST (generate_config, unknown_type)
{
	temporary_directory directory;
	stakeq::tomlconfig toml;
	auto error = stakeq::generate_config (directory.path, "node", toml);
	ASSERT_TRUE (error);
	ASSERT_EQ (error, stakeq::error_config::invalid_value);
	ASSERT_NE (std::string::npos, error.get_message ().find ("node"));
	ASSERT_TRUE (toml.empty ());
}
