#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

// Applies one key,value pair; false when the key is unknown. Throws on malformed values.
bool apply_config_setting(SwingScanner::Config::SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string);

bool load_config_from_csv(SwingScanner::Config::SystemConfig& cfg, const std::string& csv_path);
int load_system_config(SwingScanner::Config::SystemConfig& config, const std::string& config_directory);
bool validate_config(const SwingScanner::Config::SystemConfig& config, std::string& error_message);

#endif // CONFIG_LOADER_HPP
