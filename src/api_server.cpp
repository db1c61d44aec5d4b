#include <charconv>
#include <sstream>
#include <yaml-cpp/yaml.h>

#include "api_server.hpp"

namespace clanlookup {

APIServer::APIServer(std::shared_ptr<ConfigManager> cm, std::shared_ptr<ClanLookupService> lookup_service)
    : configManager(cm), lookupService(lookup_service), openAPIDocGenerator(cm)
{
    setupRoutes();
    CROW_LOG_INFO << "APIServer initialized";
}

void APIServer::setupRoutes() {
    CROW_LOG_INFO << "Setting up routes...";

    CROW_ROUTE(app, "/clan/tag/<string>")
        .methods("GET"_method)
        ([this](std::string clan_tag) {
            return getClanByTag(clan_tag);
        });

    CROW_ROUTE(app, "/clan/id/<string>")
        .methods("GET"_method)
        ([this](std::string clan_id) {
            return getClanById(clan_id);
        });

    CROW_ROUTE(app, "/doc.yaml")
        .methods("GET"_method)
        ([this]() {
            return generateOpenAPIDoc();
        });

    CROW_LOG_INFO << "Routes set up completed";
}

crow::response APIServer::toResponse(const Result<ClanRecord>& outcome) {
    if (!outcome) {
        const Error& error = outcome.error();
        int status = 400;
        if (error.message.find(NOT_FOUND_MARKER) != std::string::npos) {
            status = 404;
        } else if (error.category == ErrorCategory::Validation) {
            status = 422;
        }
        return crow::response(status, error.toJson());
    }
    return crow::response(200, outcome->toJson());
}

crow::response APIServer::getClanByTag(const std::string& clan_tag) {
    return toResponse(lookupService->lookupByTag(clan_tag, configManager->getApiKey()));
}

crow::response APIServer::getClanById(const std::string& raw_clan_id) {
    auto clan_id = parseClanId(raw_clan_id);
    if (!clan_id) {
        CROW_LOG_DEBUG << "Rejecting non-integer clan id: " << raw_clan_id;
        return Error::Validation("Path parameter clan_id must be an integer, got: " + raw_clan_id).toHttpResponse();
    }
    return toResponse(lookupService->lookupById(*clan_id, configManager->getApiKey()));
}

std::optional<int64_t> APIServer::parseClanId(const std::string& raw_clan_id) {
    if (raw_clan_id.empty()) {
        return std::nullopt;
    }
    int64_t value = 0;
    const char* first = raw_clan_id.data();
    const char* last = first + raw_clan_id.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

crow::response APIServer::generateOpenAPIDoc() {
    YAML::Node doc = openAPIDocGenerator.generateDoc();

    std::stringstream ss;
    ss << doc;

    crow::response res(200, ss.str());
    res.set_header("Content-Type", "application/yaml");
    return res;
}

void APIServer::run() {
    CROW_LOG_INFO << "Server starting on port " << configManager->getHttpPort() << "...";
    app.port(static_cast<uint16_t>(configManager->getHttpPort()))
       .server_name("clan-lookup")
       .multithreaded()
       .run();
}

void APIServer::stop() {
    CROW_LOG_INFO << "Stopping server";
    app.stop();
}

} // namespace clanlookup
