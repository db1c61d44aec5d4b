#pragma once

#include <cstdint>
#include <string>
#include <crow.h>

namespace clanlookup {

/**
 * Clan id and clan tag of a single clan. Both fields are always set;
 * a record lives for a single request.
 */
struct ClanRecord {
    int64_t clan_id;
    std::string clan_tag;

    crow::json::wvalue toJson() const {
        crow::json::wvalue json;
        json["clan_id"] = clan_id;
        json["clan_tag"] = clan_tag;
        return json;
    }
};

} // namespace clanlookup
