#pragma once

#include <stakeq/lib/logging_enums.hpp>
#include <stakeq/lib/tomlconfig.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace stakeq::log
{
using logger_id = std::pair<stakeq::log::type, stakeq::log::detail>;

/// Parses `type` or `type::detail`, throws std::invalid_argument on malformed input
logger_id parse_logger_id (std::string const &);
std::string to_string (logger_id const &);
}

namespace stakeq
{
class log_config final
{
public:
	stakeq::error serialize (stakeq::tomlconfig &) const;
	stakeq::error deserialize (stakeq::tomlconfig &);

public:
	stakeq::log::level default_level{ stakeq::log::level::info };

	/// Levels per `type` or per `type::detail`, the more specific entry wins
	std::map<stakeq::log::logger_id, stakeq::log::level> levels;

	struct console_config
	{
		bool enable{ true };
		bool colors{ true };
		bool to_cerr{ false };
	};

	struct file_config
	{
		bool enable{ false };
		std::filesystem::path directory{ "log" };
		std::size_t max_size{ 32 * 1024 * 1024 };
		std::size_t rotation_count{ 4 };
	};

	console_config console;
	file_config file;

public: // Presets
	static log_config cli_default ();
	static log_config tests_default ();
};

/// Reads the `log` table from `config-log.toml` in \p data_path, command line overrides take precedence
stakeq::error read_log_config_toml (std::filesystem::path const & data_path, stakeq::log_config & config, std::vector<std::string> const & overrides);

void initialize_logging ();
void release_logging ();

spdlog::level::level_enum to_spdlog_level (stakeq::log::level);

/**
 * Writes tagged messages to the console and file sinks selected by a log_config.
 * Each `type` (or `type::detail`) gets its own spdlog logger sharing the same sinks, created on first use.
 */
class logger final
{
public:
	explicit logger (stakeq::log_config, std::string identifier = "");

	logger (logger const &) = delete;

public:
	template <class... Args>
	void log (stakeq::log::level level, stakeq::log::logger_id id, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (id).log (to_spdlog_level (level), fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void log (stakeq::log::level level, stakeq::log::type tag, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		log (level, stakeq::log::logger_id{ tag, stakeq::log::detail::all }, fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void trace (stakeq::log::type tag, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		log (stakeq::log::level::trace, tag, fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void debug (stakeq::log::type tag, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		log (stakeq::log::level::debug, tag, fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void info (stakeq::log::type tag, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		log (stakeq::log::level::info, tag, fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void warn (stakeq::log::type tag, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		log (stakeq::log::level::warn, tag, fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void error (stakeq::log::type tag, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		log (stakeq::log::level::error, tag, fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void critical (stakeq::log::type tag, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		log (stakeq::log::level::critical, tag, fmt, std::forward<Args> (args)...);
	}

	/// Level a message tagged \p id is filtered at: `type::detail`, then `type`, then the default level
	stakeq::log::level level_for (stakeq::log::logger_id const & id) const;

	void flush ();

private:
	stakeq::log_config const config;
	std::string const identifier;

	std::vector<spdlog::sink_ptr> sinks;
	std::map<stakeq::log::logger_id, std::shared_ptr<spdlog::logger>> spd_loggers;
	mutable std::shared_mutex mutex;

private:
	spdlog::logger & get_logger (stakeq::log::logger_id const & id);
	std::shared_ptr<spdlog::logger> make_logger (stakeq::log::logger_id const & id) const;
};

stakeq::logger & default_logger ();
}
