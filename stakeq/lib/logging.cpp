#include <stakeq/lib/assert.hpp>
#include <stakeq/lib/config.hpp>
#include <stakeq/lib/logging.hpp>

#include <fmt/chrono.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <atomic>
#include <iostream>

namespace
{
std::atomic<bool> logging_initialized{ false };

spdlog::sink_ptr make_console_sink (stakeq::log_config::console_config const & console)
{
	if (console.to_cerr)
	{
		return std::make_shared<spdlog::sinks::stderr_sink_mt> ();
	}
	if (console.colors)
	{
		return std::make_shared<spdlog::sinks::stdout_color_sink_mt> ();
	}
	return std::make_shared<spdlog::sinks::stdout_sink_mt> ();
}

spdlog::sink_ptr make_file_sink (stakeq::log_config::file_config const & file, std::string const & identifier)
{
	std::filesystem::create_directories (file.directory);

	auto time = std::chrono::system_clock::to_time_t (std::chrono::system_clock::now ());
	auto prefix = identifier.empty () ? std::string{ "stakeq" } : fmt::format ("stakeq_{}", identifier);
	auto log_path = file.directory / fmt::format ("{}_{:%Y%m%d_%H%M%S}.log", prefix, fmt::localtime (time));

	std::cerr << "Logging to file: " << log_path << std::endl;

	// Rotation needs both a size and a count
	if (file.max_size == 0 || file.rotation_count == 0)
	{
		std::cerr << "WARNING: Log file rotation disabled" << std::endl;
		return std::make_shared<spdlog::sinks::basic_file_sink_mt> (log_path.string (), true);
	}
	return std::make_shared<spdlog::sinks::rotating_file_sink_mt> (log_path.string (), file.max_size, file.rotation_count);
}
}

stakeq::logger & stakeq::default_logger ()
{
	static stakeq::logger logger{ stakeq::log_config::cli_default () };
	return logger;
}

void stakeq::initialize_logging ()
{
	debug_assert (!logging_initialized, "initialize_logging must only be called once");

	spdlog::set_automatic_registration (false);
	spdlog::set_level (spdlog::level::trace);
	spdlog::cfg::load_env_levels ();

	logging_initialized = true;
}

void stakeq::release_logging ()
{
	logging_initialized = false;

	spdlog::shutdown ();
}

/*
 * logger
 */

stakeq::logger::logger (stakeq::log_config config_a, std::string identifier_a) :
	config{ std::move (config_a) },
	identifier{ std::move (identifier_a) }
{
	if (config.console.enable)
	{
		sinks.push_back (make_console_sink (config.console));
	}
	if (config.file.enable)
	{
		sinks.push_back (make_file_sink (config.file, identifier));
	}
}

void stakeq::logger::flush ()
{
	std::shared_lock lock{ mutex };
	for (auto & [id, spd_logger] : spd_loggers)
	{
		spd_logger->flush ();
	}
}

stakeq::log::level stakeq::logger::level_for (stakeq::log::logger_id const & id) const
{
	if (auto it = config.levels.find (id); it != config.levels.end ())
	{
		return it->second;
	}
	if (auto it = config.levels.find ({ id.first, stakeq::log::detail::all }); it != config.levels.end ())
	{
		return it->second;
	}
	return config.default_level;
}

spdlog::logger & stakeq::logger::get_logger (stakeq::log::logger_id const & id)
{
	{
		std::shared_lock lock{ mutex };
		if (auto it = spd_loggers.find (id); it != spd_loggers.end ())
		{
			return *it->second;
		}
	}
	std::unique_lock lock{ mutex };
	auto [it, inserted] = spd_loggers.try_emplace (id, nullptr);
	if (inserted)
	{
		it->second = make_logger (id);
	}
	return *it->second;
}

std::shared_ptr<spdlog::logger> stakeq::logger::make_logger (stakeq::log::logger_id const & id) const
{
	auto name = identifier.empty () ? stakeq::log::to_string (id) : fmt::format ("{}::{}", identifier, stakeq::log::to_string (id));
	auto spd_logger = std::make_shared<spdlog::logger> (name, sinks.begin (), sinks.end ());
	spdlog::initialize_logger (spd_logger);
	spd_logger->set_level (to_spdlog_level (level_for (id)));
	spd_logger->flush_on (spdlog::level::err);
	return spd_logger;
}

spdlog::level::level_enum stakeq::to_spdlog_level (stakeq::log::level level)
{
	switch (level)
	{
		case stakeq::log::level::off:
			return spdlog::level::off;
		case stakeq::log::level::critical:
			return spdlog::level::critical;
		case stakeq::log::level::error:
			return spdlog::level::err;
		case stakeq::log::level::warn:
			return spdlog::level::warn;
		case stakeq::log::level::info:
			return spdlog::level::info;
		case stakeq::log::level::debug:
			return spdlog::level::debug;
		case stakeq::log::level::trace:
			return spdlog::level::trace;
	}
	debug_assert (false, "Invalid log level");
	return spdlog::level::off;
}

/*
 * log_config
 */

stakeq::log_config stakeq::log_config::cli_default ()
{
	log_config config;
	config.console.to_cerr = true;
	return config;
}

stakeq::log_config stakeq::log_config::tests_default ()
{
	log_config config;
	config.default_level = stakeq::log::level::critical;
	return config;
}

stakeq::error stakeq::log_config::serialize (stakeq::tomlconfig & toml) const
{
	toml.put ("level", std::string{ to_string (default_level) });

	stakeq::tomlconfig console_l;
	console_l.put ("enable", console.enable);
	console_l.put ("colors", console.colors);
	console_l.put ("to_cerr", console.to_cerr);
	toml.put_child ("console", console_l);

	stakeq::tomlconfig file_l;
	file_l.put ("enable", file.enable);
	file_l.put ("directory", file.directory.string ());
	file_l.put ("max_size", file.max_size);
	file_l.put ("rotation_count", file.rotation_count);
	toml.put_child ("file", file_l);

	stakeq::tomlconfig levels_l;
	for (auto const & [id, level] : levels)
	{
		levels_l.put (stakeq::log::to_string (id), std::string{ to_string (level) });
	}
	toml.put_child ("levels", levels_l);

	return toml.get_error ();
}

stakeq::error stakeq::log_config::deserialize (stakeq::tomlconfig & toml)
{
	try
	{
		if (toml.has_key ("level"))
		{
			default_level = stakeq::log::parse_level (toml.get<std::string> ("level"));
		}
		if (auto console_l = toml.get_optional_child ("console"))
		{
			console_l->get ("enable", console.enable);
			console_l->get ("colors", console.colors);
			console_l->get ("to_cerr", console.to_cerr);
		}
		if (auto file_l = toml.get_optional_child ("file"))
		{
			file_l->get ("enable", file.enable);
			auto directory = file.directory.string ();
			file_l->get ("directory", directory);
			file.directory = directory;
			file_l->get ("max_size", file.max_size);
			file_l->get ("rotation_count", file.rotation_count);
		}
		if (auto levels_l = toml.get_optional_child ("levels"))
		{
			for (auto const & [key, value] : levels_l->get_values<std::string> ())
			{
				levels[stakeq::log::parse_logger_id (key)] = stakeq::log::parse_level (value);
			}
		}
	}
	catch (std::runtime_error const & ex)
	{
		toml.get_error ().set (ex.what (), stakeq::error_config::invalid_value);
	}
	catch (std::invalid_argument const & ex)
	{
		toml.get_error ().set (ex.what (), stakeq::error_config::invalid_value);
	}
	return toml.get_error ();
}

stakeq::log::logger_id stakeq::log::parse_logger_id (std::string const & name)
{
	auto pos = name.find ("::");
	if (pos == std::string::npos)
	{
		return { stakeq::log::parse_type (name), stakeq::log::detail::all };
	}
	return { stakeq::log::parse_type (name.substr (0, pos)), stakeq::log::parse_detail (name.substr (pos + 2)) };
}

std::string stakeq::log::to_string (stakeq::log::logger_id const & id)
{
	auto const & [type, detail] = id;
	if (detail == stakeq::log::detail::all)
	{
		return std::string{ stakeq::to_string (type) };
	}
	return fmt::format ("{}::{}", stakeq::to_string (type), stakeq::to_string (detail));
}

stakeq::error stakeq::read_log_config_toml (std::filesystem::path const & data_path, stakeq::log_config & config, std::vector<std::string> const & overrides)
{
	stakeq::tomlconfig toml;
	auto error = toml.read_with_overrides (stakeq::get_log_toml_config_path (data_path), overrides);
	if (!error)
	{
		if (auto log_l = toml.get_optional_child ("log"))
		{
			error = config.deserialize (*log_l);
		}
	}
	return error;
}
