#include "ServerConfig.hpp"
#include "PathResolver.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

namespace {

bool parse_port(const std::string& text, int& port) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || value < 1 || value > 65535) return false;
        port = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    if (!value || trim_copy(value).empty()) return nullptr;
    return value;
}

} // namespace

void apply_config_json(const Json::Value& root, ServerConfig& config, std::vector<std::string>& warnings) {
    if (!root.isObject() || !root.isMember("utilbox")) {
        return;
    }
    const Json::Value& section = root["utilbox"];
    if (!section.isObject()) {
        warnings.push_back("'utilbox' config section must be an object");
        return;
    }

    if (section.isMember("host")) {
        if (section["host"].isString() && !trim_copy(section["host"].asString()).empty()) {
            config.host = trim_copy(section["host"].asString());
        } else {
            warnings.push_back("Ignoring invalid 'host' in config");
        }
    }
    if (section.isMember("port")) {
        const Json::Value& port = section["port"];
        if (port.isInt() && port.asInt() >= 1 && port.asInt() <= 65535) {
            config.port = port.asInt();
        } else {
            warnings.push_back("Ignoring invalid 'port' in config");
        }
    }
    if (section.isMember("log_level")) {
        LogLevel level;
        if (section["log_level"].isString() && parse_log_level(section["log_level"].asString(), level)) {
            config.logLevel = level;
        } else {
            warnings.push_back("Ignoring invalid 'log_level' in config");
        }
    }
    if (section.isMember("working_directory")) {
        if (section["working_directory"].isString()) {
            config.workingDirectory = trim_copy(section["working_directory"].asString());
        } else {
            warnings.push_back("Ignoring invalid 'working_directory' in config");
        }
    }
}

void apply_config_env(ServerConfig& config, std::vector<std::string>& warnings) {
    if (const char* host = env_value("UTILBOX_HOST")) {
        config.host = trim_copy(host);
    }
    if (const char* port = env_value("UTILBOX_PORT")) {
        if (!parse_port(trim_copy(port), config.port)) {
            warnings.push_back(std::string("Ignoring invalid UTILBOX_PORT: ") + port);
        }
    }
    if (const char* level = env_value("UTILBOX_LOG_LEVEL")) {
        if (!parse_log_level(level, config.logLevel)) {
            warnings.push_back(std::string("Ignoring invalid UTILBOX_LOG_LEVEL: ") + level);
        }
    }
    if (const char* dir = env_value("UTILBOX_WORKING_DIRECTORY")) {
        config.workingDirectory = trim_copy(dir);
    }
}

ServerConfig load_server_config(const std::string& path) {
    ServerConfig config;
    std::vector<std::string> warnings;

    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        std::ifstream configFile(path);
        Json::Value root;
        Json::CharReaderBuilder builder;
        std::string errs;
        if (Json::parseFromStream(builder, configFile, &root, &errs)) {
            apply_config_json(root, config, warnings);
            log_info("Config file parsed successfully: " + path);
        } else {
            warnings.push_back("Failed to parse " + path + ": " + errs);
        }
    } else {
        log_debug("No config file at '" + path + "', using defaults");
    }

    apply_config_env(config, warnings);
    set_log_level(config.logLevel);
    for (const auto& warning : warnings) {
        log_warning(warning);
    }
    return config;
}
