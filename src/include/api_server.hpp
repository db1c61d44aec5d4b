#pragma once

#include <crow.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "clan_lookup_service.hpp"
#include "config_manager.hpp"
#include "open_api_doc_generator.hpp"

namespace clanlookup {

using ClanLookupApp = crow::SimpleApp;

class APIServer
{
public:
    // Failures whose message contains this marker are answered with 404
    static constexpr const char* NOT_FOUND_MARKER = "No clan was found";

    APIServer(std::shared_ptr<ConfigManager> config_manager, std::shared_ptr<ClanLookupService> lookup_service);

    void run();
    void stop();

    // GET /clan/tag/<clan_tag>
    crow::response getClanByTag(const std::string& clan_tag);

    // GET /clan/id/<clan_id>
    crow::response getClanById(const std::string& raw_clan_id);

    crow::response generateOpenAPIDoc();

    /**
     * Parse a clan id path parameter. Only a complete signed 64-bit
     * decimal number is accepted.
     */
    static std::optional<int64_t> parseClanId(const std::string& raw_clan_id);

    ClanLookupApp& getApp() { return app; }

private:
    void setupRoutes();
    static crow::response toResponse(const Result<ClanRecord>& outcome);

    ClanLookupApp app;
    std::shared_ptr<ConfigManager> configManager;
    std::shared_ptr<ClanLookupService> lookupService;
    OpenAPIDocGenerator openAPIDocGenerator;
};

} // namespace clanlookup
