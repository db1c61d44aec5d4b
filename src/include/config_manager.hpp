#pragma once

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace clanlookup {

struct UpstreamConfig {
    std::string base_url = "https://api.worldoftanks.eu";
    int timeout_seconds = 5;
    bool verify_ssl = true;
    std::string api_key_env = "API_KEY";
};

/**
 * Service configuration, loaded once at startup and passed explicitly to
 * the server and the lookup service.
 */
struct ServiceConfig {
    std::string server_name = "localhost";
    int http_port = 8080;
    UpstreamConfig upstream;
    std::string api_key;  // never logged
};

/**
 * Loads ServiceConfig from an optional YAML file and the environment.
 *
 * Example clanlookup.yaml:
 *
 *   server-name: localhost
 *   http-port: 8080
 *   upstream:
 *     base-url: https://api.worldoftanks.eu
 *     timeout: 5
 *     verify-ssl: true
 *     api-key-env: API_KEY
 */
class ConfigManager {
public:
    /**
     * @param config_file Path to the YAML file
     * @param required When false, a missing file means "use defaults"
     */
    explicit ConfigManager(const std::filesystem::path& config_file, bool required = true);

    /**
     * Read the YAML file (if present) and the API key from the environment.
     * @throws ConfigurationError on missing/invalid values or missing API key
     */
    void loadConfig();

    /**
     * Parse configuration from YAML text, without touching the environment.
     * @throws ConfigurationError on invalid values
     */
    void loadFromString(const std::string& yaml_content);

    const ServiceConfig& getConfig() const { return config; }

    int getHttpPort() const;
    // @throws ConfigurationError if port is outside 1..65535
    void setHttpPort(int port);
    std::string getServerName() const;
    const std::string& getApiKey() const;
    void setApiKey(const std::string& api_key);

private:
    void parseMainConfig(const YAML::Node& root);
    void parseUpstreamConfig(const YAML::Node& root);
    void loadApiKeyFromEnvironment();

    template<typename T>
    T safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) const;

    static std::string getEnv(const std::string& name);
    static int validatePort(int port, const std::string& path);

    std::filesystem::path configFile;
    bool configRequired;
    ServiceConfig config;
};

class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& message, const std::string& yamlPath = "")
        : std::runtime_error(formatMessage(message, yamlPath)) {}

private:
    static std::string formatMessage(const std::string& message, const std::string& yamlPath) {
        std::ostringstream oss;
        oss << "Configuration error";
        if (!yamlPath.empty()) {
            oss << " at " << yamlPath;
        }
        oss << ": " << message;
        return oss.str();
    }
};

} // namespace clanlookup
