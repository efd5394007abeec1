#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace stakeq
{
/** Key/value overrides applied on top of a toml config file */
using config_overrides_t = std::map<std::string, std::string>;

std::filesystem::path get_config_path (std::filesystem::path const & data_path);
std::filesystem::path get_log_toml_config_path (std::filesystem::path const & data_path);

/** Directory the process runs out of when no data path is supplied */
std::filesystem::path working_path ();
}
