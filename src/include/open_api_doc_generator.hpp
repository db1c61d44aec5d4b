#pragma once

#include <memory>
#include <string>
#include <yaml-cpp/yaml.h>

#include "config_manager.hpp"

namespace clanlookup {

/**
 * Builds the OpenAPI 3 description of the clan lookup routes, served as /doc.yaml
 */
class OpenAPIDocGenerator {
public:
    static constexpr const char* API_VERSION = "1.0.0";

    explicit OpenAPIDocGenerator(std::shared_ptr<ConfigManager> config_manager);

    YAML::Node generateDoc() const;

private:
    YAML::Node generateLookupOperation(const std::string& param_name,
                                       const std::string& param_type,
                                       const std::string& summary,
                                       const std::string& not_found_description,
                                       bool validates_param) const;
    YAML::Node generateSchemas() const;

    std::shared_ptr<ConfigManager> configManager;
};

} // namespace clanlookup
