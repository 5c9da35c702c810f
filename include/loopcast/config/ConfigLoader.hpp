// Repository: loopcast
// Component: Configuration Loader
// Purpose: JSON config file → BroadcastConfig, with validation.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_CONFIG_CONFIG_LOADER_HPP_
#define LOOPCAST_CONFIG_CONFIG_LOADER_HPP_

#include <string>

#include "loopcast/config/BroadcastConfig.hpp"

namespace loopcast::config {

// All three throw ConfigError on malformed or invalid input.
BroadcastConfig LoadConfigFile(const std::string& path);
BroadcastConfig ParseConfig(const std::string& json);
void ValidateConfig(const BroadcastConfig& config);

}  // namespace loopcast::config

#endif  // LOOPCAST_CONFIG_CONFIG_LOADER_HPP_
