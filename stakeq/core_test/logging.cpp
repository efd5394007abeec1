#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/tomlconfig.hpp>

#include <gtest/gtest.h>

#include <sstream>

TEST (log_parse, parse_level)
{
	ASSERT_EQ (stakeq::log::parse_level ("error"), stakeq::log::level::error);
	ASSERT_EQ (stakeq::log::parse_level ("off"), stakeq::log::level::off);
	ASSERT_THROW (stakeq::log::parse_level ("enumnotpresent"), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_level (""), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_level ("_error"), std::invalid_argument);
}

TEST (log_parse, parse_type)
{
	ASSERT_EQ (stakeq::log::parse_type ("queue"), stakeq::log::type::queue);
	ASSERT_EQ (stakeq::log::parse_type ("notifications"), stakeq::log::type::notifications);
	ASSERT_THROW (stakeq::log::parse_type ("enumnotpresent"), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_type (""), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_type ("_queue"), std::invalid_argument);
}

TEST (log_parse, parse_detail)
{
	ASSERT_EQ (stakeq::log::parse_detail ("all"), stakeq::log::detail::all);
	ASSERT_EQ (stakeq::log::parse_detail ("burn"), stakeq::log::detail::burn);
	ASSERT_THROW (stakeq::log::parse_detail ("enumnotpresent"), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_detail (""), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_detail ("_all"), std::invalid_argument);
}

TEST (log_parse, parse_logger_id)
{
	ASSERT_EQ (stakeq::log::parse_logger_id ("ledger"), std::make_pair (stakeq::log::type::ledger, stakeq::log::detail::all));
	ASSERT_EQ (stakeq::log::parse_logger_id ("ledger::all"), std::make_pair (stakeq::log::type::ledger, stakeq::log::detail::all));
	ASSERT_EQ (stakeq::log::parse_logger_id ("ledger::burn"), std::make_pair (stakeq::log::type::ledger, stakeq::log::detail::burn));
	ASSERT_THROW (stakeq::log::parse_logger_id ("ledger::enumnotpresent"), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_logger_id ("ledger::"), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_logger_id ("ledger::_all"), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_logger_id ("enumnotpresent"), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_logger_id ("::"), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_logger_id ("::all"), std::invalid_argument);
	ASSERT_THROW (stakeq::log::parse_logger_id (""), std::invalid_argument);
}

TEST (log_config, round_trip)
{
	stakeq::log_config config;
	config.default_level = stakeq::log::level::debug;
	config.console.colors = false;
	config.file.enable = true;
	config.file.rotation_count = 2;
	config.levels[{ stakeq::log::type::queue, stakeq::log::detail::all }] = stakeq::log::level::trace;
	config.levels[{ stakeq::log::type::ledger, stakeq::log::detail::burn }] = stakeq::log::level::warn;

	stakeq::tomlconfig toml;
	ASSERT_FALSE (config.serialize (toml));

	stakeq::tomlconfig parsed;
	parsed.read (toml.to_string ());
	stakeq::log_config loaded;
	ASSERT_FALSE (loaded.deserialize (parsed));
	ASSERT_EQ (stakeq::log::level::debug, loaded.default_level);
	ASSERT_FALSE (loaded.console.colors);
	ASSERT_TRUE (loaded.file.enable);
	ASSERT_EQ (2, loaded.file.rotation_count);
	ASSERT_EQ (config.levels, loaded.levels);
}

TEST (log_config, invalid_level)
{
	std::stringstream stream;
	stream << "level = \"loud\"\n";
	stakeq::tomlconfig toml;
	toml.read (stream);

	stakeq::log_config config;
	auto error = config.deserialize (toml);
	ASSERT_TRUE (error);
	ASSERT_EQ (error, stakeq::error_config::invalid_value);
	ASSERT_EQ (stakeq::log::level::info, config.default_level);
}

TEST (log_config, presets)
{
	ASSERT_TRUE (stakeq::log_config::cli_default ().console.to_cerr);
	ASSERT_EQ (stakeq::log::level::critical, stakeq::log_config::tests_default ().default_level);
}

TEST (logger, levels)
{
	auto config = stakeq::log_config::tests_default ();
	config.console.enable = false;
	stakeq::logger logger{ config, "levels" };
	// Nothing reaches a sink, only checks formatting compiles and runs for every level
	logger.trace (stakeq::log::type::test, "trace {}", 1);
	logger.debug (stakeq::log::type::test, "debug {}", "two");
	logger.info (stakeq::log::type::test, "info {}", 3.0);
	logger.warn (stakeq::log::type::test, "warn");
	logger.error (stakeq::log::type::test, "error {} {}", 5, 6);
	logger.critical (stakeq::log::type::test, "critical");
	logger.log (stakeq::log::level::info, stakeq::log::type::test, "log {}", 7);
	logger.flush ();
}

TEST (logger, level_for)
{
	auto config = stakeq::log_config::tests_default ();
	config.console.enable = false;
	config.levels[{ stakeq::log::type::ledger, stakeq::log::detail::all }] = stakeq::log::level::info;
	config.levels[{ stakeq::log::type::ledger, stakeq::log::detail::burn }] = stakeq::log::level::trace;
	stakeq::logger logger{ config };

	ASSERT_EQ (stakeq::log::level::trace, logger.level_for ({ stakeq::log::type::ledger, stakeq::log::detail::burn }));
	ASSERT_EQ (stakeq::log::level::info, logger.level_for ({ stakeq::log::type::ledger, stakeq::log::detail::mint }));
	ASSERT_EQ (stakeq::log::level::info, logger.level_for ({ stakeq::log::type::ledger, stakeq::log::detail::all }));
	ASSERT_EQ (stakeq::log::level::critical, logger.level_for ({ stakeq::log::type::queue, stakeq::log::detail::all }));
	logger.log (stakeq::log::level::trace, stakeq::log::logger_id{ stakeq::log::type::ledger, stakeq::log::detail::burn }, "burned {}", 1);
}

TEST (log_parse, logger_id_to_string)
{
	ASSERT_EQ ("ledger", stakeq::log::to_string (stakeq::log::logger_id{ stakeq::log::type::ledger, stakeq::log::detail::all }));
	ASSERT_EQ ("ledger::burn", stakeq::log::to_string (stakeq::log::logger_id{ stakeq::log::type::ledger, stakeq::log::detail::burn }));
	auto id = stakeq::log::parse_logger_id ("notifications::item_dequeued");
	ASSERT_EQ ("notifications::item_dequeued", stakeq::log::to_string (id));
}

TEST (logger, to_spdlog_level)
{
	ASSERT_EQ (spdlog::level::err, stakeq::to_spdlog_level (stakeq::log::level::error));
	ASSERT_EQ (spdlog::level::off, stakeq::to_spdlog_level (stakeq::log::level::off));
	for (auto level : stakeq::log::all_levels ())
	{
		ASSERT_EQ (std::string{ stakeq::to_string (level) }, std::string{ stakeq::to_string (stakeq::log::parse_level (stakeq::to_string (level))) });
	}
}
