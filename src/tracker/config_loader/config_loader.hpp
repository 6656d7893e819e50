#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

bool load_config_from_csv(FtseTracker::Config::SystemConfig& cfg, const std::string& csv_path);
int load_system_config(FtseTracker::Config::SystemConfig& config, const std::string& config_directory = "config");
bool apply_environment_overrides(FtseTracker::Config::SystemConfig& config, std::string& error_message);
bool validate_config(const FtseTracker::Config::SystemConfig& config, std::string& errorMessage);

#endif // CONFIG_LOADER_HPP
