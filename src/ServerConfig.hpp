#pragma once
#include <json/json.h>
#include <string>
#include <vector>
#include "Log.hpp"

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 41104;
    LogLevel logLevel = LogLevel::Info;
    // Default for tool calls that omit working_directory; empty means the
    // process working directory at the time of the call.
    std::string workingDirectory;
};

// Apply the "utilbox" section of a parsed config document. Invalid values are
// reported through warnings and leave the corresponding default untouched.
void apply_config_json(const Json::Value& root, ServerConfig& config, std::vector<std::string>& warnings);

// Apply UTILBOX_HOST, UTILBOX_PORT, UTILBOX_LOG_LEVEL and UTILBOX_WORKING_DIRECTORY.
void apply_config_env(ServerConfig& config, std::vector<std::string>& warnings);

// Defaults, then the config file (if it exists), then the environment.
// Problems are logged; loading never fails.
ServerConfig load_server_config(const std::string& path);
