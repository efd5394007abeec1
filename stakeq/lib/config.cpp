#include <stakeq/lib/config.hpp>

std::filesystem::path stakeq::get_config_path (std::filesystem::path const & data_path)
{
	return data_path / "config-stakeq.toml";
}

std::filesystem::path stakeq::get_log_toml_config_path (std::filesystem::path const & data_path)
{
	return data_path / "config-log.toml";
}

std::filesystem::path stakeq::working_path ()
{
	return std::filesystem::current_path ();
}
