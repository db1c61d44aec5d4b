#include <catch2/catch_test_macros.hpp>

#include "open_api_doc_generator.hpp"
#include "test_utils.hpp"

using namespace clanlookup;
using namespace clanlookup::test;

TEST_CASE("OpenAPIDocGenerator: document structure", "[openapi]") {
    auto config_manager = createTestConfigManager("server-name: clans.example.org\nhttp-port: 9090\n");
    OpenAPIDocGenerator generator(config_manager);

    YAML::Node doc = generator.generateDoc();

    REQUIRE(doc["openapi"].as<std::string>() == "3.0.0");
    REQUIRE(doc["info"]["title"].as<std::string>() == "clans.example.org");
    REQUIRE(doc["info"]["version"].as<std::string>() == OpenAPIDocGenerator::API_VERSION);
    REQUIRE(doc["servers"][0]["url"].as<std::string>() == "http://clans.example.org:9090");

    SECTION("Tag lookup path") {
        auto op = doc["paths"]["/clan/tag/{clan_tag}"]["get"];
        REQUIRE(op);
        REQUIRE(op["parameters"][0]["name"].as<std::string>() == "clan_tag");
        REQUIRE(op["parameters"][0]["schema"]["type"].as<std::string>() == "string");
        REQUIRE(op["responses"]["200"]);
        REQUIRE(op["responses"]["400"]);
        REQUIRE(op["responses"]["404"]["description"].as<std::string>() ==
                "Missing ressource: No clan was found for the requested tag.");
        REQUIRE_FALSE(op["responses"]["422"]);
    }

    SECTION("Id lookup path") {
        auto op = doc["paths"]["/clan/id/{clan_id}"]["get"];
        REQUIRE(op);
        REQUIRE(op["parameters"][0]["schema"]["type"].as<std::string>() == "integer");
        REQUIRE(op["responses"]["422"]);
    }

    SECTION("Schemas") {
        auto schemas = doc["components"]["schemas"];
        REQUIRE(schemas["ClanModel"]["properties"]["clan_id"]["type"].as<std::string>() == "integer");
        REQUIRE(schemas["ClanModel"]["properties"]["clan_tag"]["type"].as<std::string>() == "string");
        REQUIRE(schemas["HTTPError"]["properties"]["detail"]["type"].as<std::string>() == "string");
    }
}

TEST_CASE("OpenAPIDocGenerator: server URL follows port override", "[openapi]") {
    auto config_manager = createTestConfigManager();
    OpenAPIDocGenerator generator(config_manager);

    config_manager->setHttpPort(18080);

    REQUIRE(generator.generateDoc()["servers"][0]["url"].as<std::string>() == "http://localhost:18080");
}
