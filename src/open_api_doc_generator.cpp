#include "open_api_doc_generator.hpp"

namespace clanlookup {

namespace {
    const char* CLAN_MODEL_REF = "#/components/schemas/ClanModel";
    const char* HTTP_ERROR_REF = "#/components/schemas/HTTPError";

    YAML::Node jsonContent(const std::string& schema_ref) {
        YAML::Node content;
        content["application/json"]["schema"]["$ref"] = schema_ref;
        return content;
    }
}

OpenAPIDocGenerator::OpenAPIDocGenerator(std::shared_ptr<ConfigManager> config_manager)
    : configManager(std::move(config_manager)) {}

YAML::Node OpenAPIDocGenerator::generateDoc() const
{
    YAML::Node doc;

    doc["openapi"] = "3.0.0";

    doc["info"]["title"] = configManager->getServerName();
    doc["info"]["version"] = API_VERSION;
    doc["info"]["description"] = "Translates between clan ids and clan tags using the Wargaming clan API.";

    doc["servers"].push_back(YAML::Node());
    doc["servers"][0]["url"] = "http://" + configManager->getServerName() + ":" + std::to_string(configManager->getHttpPort());

    doc["paths"]["/clan/tag/{clan_tag}"]["get"] = generateLookupOperation(
        "clan_tag", "string", "Get Clan Id",
        "Missing ressource: No clan was found for the requested tag.", false);
    doc["paths"]["/clan/id/{clan_id}"]["get"] = generateLookupOperation(
        "clan_id", "integer", "Get Clan Tag",
        "Missing ressource: No clan was found for the requested id.", true);

    doc["components"]["schemas"] = generateSchemas();

    return doc;
}

YAML::Node OpenAPIDocGenerator::generateLookupOperation(const std::string& param_name,
                                                        const std::string& param_type,
                                                        const std::string& summary,
                                                        const std::string& not_found_description,
                                                        bool validates_param) const
{
    YAML::Node operation;
    operation["summary"] = summary;
    operation["description"] = "Returns clan id and clan tag for the requested clan.";

    YAML::Node param;
    param["name"] = param_name;
    param["in"] = "path";
    param["required"] = true;
    param["schema"]["type"] = param_type;
    operation["parameters"].push_back(param);

    operation["responses"]["200"]["description"] = "Successful Response";
    operation["responses"]["200"]["content"] = jsonContent(CLAN_MODEL_REF);

    operation["responses"]["400"]["description"] = "Error in Request: Request could not be answered successful.";
    operation["responses"]["400"]["content"] = jsonContent(HTTP_ERROR_REF);

    operation["responses"]["404"]["description"] = not_found_description;
    operation["responses"]["404"]["content"] = jsonContent(HTTP_ERROR_REF);

    if (validates_param) {
        operation["responses"]["422"]["description"] = "Validation Error";
        operation["responses"]["422"]["content"] = jsonContent(HTTP_ERROR_REF);
    }

    return operation;
}

YAML::Node OpenAPIDocGenerator::generateSchemas() const
{
    YAML::Node schemas;

    YAML::Node clanModel;
    clanModel["title"] = "ClanModel";
    clanModel["type"] = "object";
    clanModel["required"].push_back("clan_id");
    clanModel["required"].push_back("clan_tag");
    clanModel["properties"]["clan_id"]["type"] = "integer";
    clanModel["properties"]["clan_id"]["format"] = "int64";
    clanModel["properties"]["clan_tag"]["type"] = "string";
    schemas["ClanModel"] = clanModel;

    YAML::Node httpError;
    httpError["title"] = "HTTPError";
    httpError["type"] = "object";
    httpError["required"].push_back("detail");
    httpError["properties"]["detail"]["type"] = "string";
    schemas["HTTPError"] = httpError;

    return schemas;
}

} // namespace clanlookup
