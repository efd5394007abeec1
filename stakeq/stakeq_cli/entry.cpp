#include <stakeq/lib/cli.hpp>
#include <stakeq/lib/config.hpp>
#include <stakeq/lib/logging.hpp>
#include <stakeq/lib/stats.hpp>
#include <stakeq/lib/tomlconfig.hpp>
#include <stakeq/node/registry.hpp>
#include <stakeq/node/registry_config.hpp>
#include <stakeq/node/script.hpp>

#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>

namespace
{
int run_script (std::filesystem::path const & data_path, std::filesystem::path const & script_path, std::vector<std::string> const & overrides, bool dump_stats)
{
	stakeq::log_config log_config = stakeq::log_config::cli_default ();
	if (auto error = stakeq::read_log_config_toml (data_path, log_config, overrides))
	{
		std::cerr << "Error reading log config: " << error.get_message () << std::endl;
		return 1;
	}
	stakeq::logger logger{ log_config, "cli" };

	stakeq::daemon_config config{ data_path };
	if (auto error = stakeq::read_daemon_config_toml (data_path, config, overrides))
	{
		logger.critical (stakeq::log::type::config, "Error reading config: {}", error.get_message ());
		return 1;
	}

	std::ifstream script{ script_path };
	if (!script)
	{
		logger.critical (stakeq::log::type::cli, "Unable to open script: {}", script_path.string ());
		return 1;
	}

	stakeq::stats stats;
	stakeq::registry registry{ config.registry, stats, logger };
	stakeq::log_notifications (registry.notifications, logger);

	stakeq::script_runner runner{ registry, std::cout, stats, logger };
	auto error = runner.run (script);

	logger.info (stakeq::log::type::cli, "Executed {} commands", runner.executed ());
	if (dump_stats)
	{
		std::cout << stats.dump ();
		registry.container_info ().print (std::cout, "registry");
	}
	logger.flush ();

	if (error)
	{
		std::cerr << "Script failed at " << error.get_message () << std::endl;
		return 1;
	}
	return 0;
}

int generate_config (std::filesystem::path const & data_path, std::string const & which)
{
	stakeq::tomlconfig toml;
	if (auto error = stakeq::generate_config (data_path, which, toml))
	{
		std::cerr << error.get_message () << std::endl;
		return 1;
	}
	std::cout << toml.to_string () << std::endl;
	return 0;
}
}

int main (int argc, char * const * argv)
{
	stakeq::initialize_logging ();

	boost::program_options::options_description description ("Command line options");
	// clang-format off
	description.add_options ()
		("help", "Print out options")
		("data_path", boost::program_options::value<std::string> (), "Use the supplied path as the data directory")
		("config", boost::program_options::value<std::vector<stakeq::config_key_value_pair>>()->multitoken (), "Pass configuration values. This takes precedence over any values in the configuration file. This option can be repeated multiple times.")
		("generate_config", boost::program_options::value<std::string> (), "Write configuration to stdout, populated with defaults. Argument: stakeq or log")
		("script", boost::program_options::value<std::string> (), "Replay the operations in the given script file")
		("stats", "Print statistics and container sizes after the script finished");
	// clang-format on

	boost::program_options::variables_map vm;
	try
	{
		boost::program_options::store (boost::program_options::parse_command_line (argc, argv, description), vm);
	}
	catch (boost::program_options::error const & err)
	{
		std::cerr << err.what () << std::endl;
		return 1;
	}
	boost::program_options::notify (vm);

	auto data_path = vm.count ("data_path") ? std::filesystem::path (vm["data_path"].as<std::string> ()) : stakeq::working_path ();

	std::vector<std::string> overrides;
	if (vm.count ("config"))
	{
		auto config_overrides = stakeq::make_config_overrides (vm["config"].as<std::vector<stakeq::config_key_value_pair>> ());
		overrides = stakeq::config_overrides_to_lines (config_overrides);
	}

	int result = 0;
	if (vm.count ("generate_config"))
	{
		result = generate_config (data_path, vm["generate_config"].as<std::string> ());
	}
	else if (vm.count ("script"))
	{
		result = run_script (data_path, vm["script"].as<std::string> (), overrides, vm.count ("stats") > 0);
	}
	else
	{
		std::cout << description << std::endl;
		result = vm.count ("help") ? 0 : 1;
	}

	stakeq::release_logging ();
	return result;
}
