#include "config_manager.hpp"
#include <crow/logging.h>
#include <cstdlib>

namespace clanlookup {

ConfigManager::ConfigManager(const std::filesystem::path& config_file, bool required)
    : configFile(config_file), configRequired(required) {}

void ConfigManager::loadConfig() {
    if (std::filesystem::exists(configFile)) {
        CROW_LOG_INFO << "Loading configuration from " << configFile.string();
        try {
            YAML::Node root = YAML::LoadFile(configFile.string());
            parseMainConfig(root);
        } catch (const YAML::Exception& e) {
            std::ostringstream error_msg;
            error_msg << "Error loading configuration file: " << configFile.string() << ", Error: " << e.what();
            CROW_LOG_ERROR << error_msg.str();
            throw ConfigurationError(error_msg.str());
        }
    } else if (configRequired) {
        throw ConfigurationError("Configuration file not found: " + configFile.string());
    } else {
        CROW_LOG_INFO << "No configuration file at " << configFile.string() << ", using defaults";
    }

    loadApiKeyFromEnvironment();
    CROW_LOG_INFO << "Configuration loaded successfully";
}

void ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        parseMainConfig(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Failed to parse YAML: ") + e.what());
    }
}

void ConfigManager::parseMainConfig(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ConfigurationError("Top level of the configuration must be a mapping");
    }

    config.server_name = safeGet<std::string>(root, "server-name", "server-name", config.server_name);
    config.http_port = validatePort(safeGet<int>(root, "http-port", "http-port", config.http_port), "http-port");

    CROW_LOG_DEBUG << "Server Name: " << config.server_name;
    CROW_LOG_DEBUG << "HTTP Port: " << config.http_port;

    parseUpstreamConfig(root);
}

void ConfigManager::parseUpstreamConfig(const YAML::Node& root) {
    if (!root["upstream"]) {
        return;
    }
    const YAML::Node upstream = root["upstream"];
    if (!upstream.IsMap()) {
        throw ConfigurationError("Expected a mapping", "upstream");
    }

    auto& up = config.upstream;
    up.base_url = safeGet<std::string>(upstream, "base-url", "upstream.base-url", up.base_url);
    up.timeout_seconds = safeGet<int>(upstream, "timeout", "upstream.timeout", up.timeout_seconds);
    up.verify_ssl = safeGet<bool>(upstream, "verify-ssl", "upstream.verify-ssl", up.verify_ssl);
    up.api_key_env = safeGet<std::string>(upstream, "api-key-env", "upstream.api-key-env", up.api_key_env);

    if (up.base_url.empty()) {
        throw ConfigurationError("Upstream base URL must not be empty", "upstream.base-url");
    }
    if (up.timeout_seconds <= 0) {
        throw ConfigurationError("Timeout must be positive, got " + std::to_string(up.timeout_seconds),
                                 "upstream.timeout");
    }
    if (up.api_key_env.empty()) {
        throw ConfigurationError("Environment variable name must not be empty", "upstream.api-key-env");
    }

    CROW_LOG_DEBUG << "Upstream Base URL: " << up.base_url;
    CROW_LOG_DEBUG << "Upstream Timeout: " << up.timeout_seconds << "s";
}

void ConfigManager::loadApiKeyFromEnvironment() {
    const auto& env_name = config.upstream.api_key_env;
    config.api_key = getEnv(env_name);
    if (config.api_key.empty()) {
        throw ConfigurationError("Environment variable " + env_name + " is not set or empty");
    }
    CROW_LOG_DEBUG << "API key loaded from environment variable " << env_name;
}

int ConfigManager::validatePort(int port, const std::string& path) {
    if (port < 1 || port > 65535) {
        throw ConfigurationError("Port must be between 1 and 65535, got " + std::to_string(port), path);
    }
    return port;
}

std::string ConfigManager::getEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : "";
}

template<typename T>
T ConfigManager::safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) const {
    if (!node[key]) {
        return defaultValue;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for key: " + key + ", Error: " + e.what(), path);
    }
}

int ConfigManager::getHttpPort() const { return config.http_port; }
void ConfigManager::setHttpPort(int port) { config.http_port = validatePort(port, "--port"); }
std::string ConfigManager::getServerName() const { return config.server_name; }
const std::string& ConfigManager::getApiKey() const { return config.api_key; }
void ConfigManager::setApiKey(const std::string& api_key) { config.api_key = api_key; }

template std::string ConfigManager::safeGet<std::string>(const YAML::Node& node, const std::string& key, const std::string& path, const std::string& defaultValue) const;
template int ConfigManager::safeGet<int>(const YAML::Node& node, const std::string& key, const std::string& path, const int& defaultValue) const;
template bool ConfigManager::safeGet<bool>(const YAML::Node& node, const std::string& key, const std::string& path, const bool& defaultValue) const;

} // namespace clanlookup
