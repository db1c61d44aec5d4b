#include "clan_lookup_service.hpp"
#include <crow/logging.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>

namespace clanlookup {

namespace {
    constexpr const char* CLAN_LIST_PATH = "/wot/clans/list/";
    constexpr const char* CLAN_INFO_PATH = "/wot/clans/info/";

    /**
     * Raised while walking an upstream payload that does not have the
     * expected shape. kind is reported like an exception class name
     * (KeyError, TypeError, JSONDecodeError).
     */
    class PayloadShapeError : public std::runtime_error {
    public:
        PayloadShapeError(std::string kind, const std::string& detail)
            : std::runtime_error(detail), kind_(std::move(kind)) {}

        const std::string& kind() const { return kind_; }

    private:
        std::string kind_;
    };

    const crow::json::rvalue& member(const crow::json::rvalue& object, const std::string& key) {
        if (object.t() != crow::json::type::Object) {
            throw PayloadShapeError("TypeError", "expected an object when reading '" + key + "'");
        }
        if (!object.has(key)) {
            throw PayloadShapeError("KeyError", key);
        }
        return object[key];
    }

    crow::json::rvalue parseBody(const std::string& body) {
        auto json = crow::json::load(body);
        if (!json) {
            throw PayloadShapeError("JSONDecodeError", "upstream response is not valid JSON");
        }
        if (json.t() != crow::json::type::Object) {
            throw PayloadShapeError("TypeError", "upstream response is not a JSON object");
        }
        return json;
    }

    std::string displayValue(const crow::json::rvalue& value) {
        if (value.t() == crow::json::type::String) {
            return std::string(value.s());
        }
        return crow::json::wvalue(value).dump();
    }

    // Returns an UpstreamRejected error when status != "ok"
    std::optional<Error> checkStatus(const crow::json::rvalue& json) {
        const auto& status = member(json, "status");
        if (status.t() == crow::json::type::String && std::string(status.s()) == "ok") {
            return std::nullopt;
        }
        const auto& message = member(member(json, "error"), "message");
        return Error::UpstreamRejected("API Request responded with an error: " + displayValue(message));
    }

    // Only integral numbers that fit an int64 are clan ids
    int64_t clanIdOf(const crow::json::rvalue& value) {
        if (value.t() != crow::json::type::Number) {
            throw PayloadShapeError("TypeError", "'clan_id' is not a number");
        }
        if (value.nt() == crow::json::num_type::Floating_point) {
            throw PayloadShapeError("TypeError", "'clan_id' is not an integer");
        }
        if (value.nt() == crow::json::num_type::Unsigned_integer &&
            value.u() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw PayloadShapeError("TypeError", "'clan_id' is out of range");
        }
        return value.i();
    }

    Error shapeError(const PayloadShapeError& e) {
        return Error::MalformedPayload(HTTPClient::transportErrorMessage(e.kind(), e.what()));
    }

    std::string redact(std::string url, const std::string& credential) {
        if (credential.empty()) {
            return url;
        }
        size_t pos = url.find(credential);
        while (pos != std::string::npos) {
            url.replace(pos, credential.size(), "***");
            pos = url.find(credential, pos + 3);
        }
        return url;
    }
}

ClanLookupService::ClanLookupService(std::shared_ptr<IHttpClient> http_client,
                                     std::string base_url,
                                     int timeout_seconds)
    : httpClient(std::move(http_client)), baseUrl(std::move(base_url)), timeoutSeconds(timeout_seconds)
{
    while (!baseUrl.empty() && baseUrl.back() == '/') {
        baseUrl.pop_back();
    }
}

std::string ClanLookupService::normalizeTag(const std::string& clan_tag) {
    std::string normalized = clan_tag;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return normalized;
}

std::string ClanLookupService::buildTagSearchUrl(const std::string& normalized_tag,
                                                 const std::string& credential) const {
    return baseUrl + CLAN_LIST_PATH
        + "?application_id=" + HTTPClient::urlEncode(credential)
        + "&search=" + HTTPClient::urlEncode(normalized_tag)
        + "&fields=clan_id%2C+tag";
}

std::string ClanLookupService::buildIdInfoUrl(int64_t clan_id, const std::string& credential) const {
    return baseUrl + CLAN_INFO_PATH
        + "?application_id=" + HTTPClient::urlEncode(credential)
        + "&fields=tag"
        + "&clan_id=" + std::to_string(clan_id);
}

Result<ClanRecord> ClanLookupService::lookupByTag(const std::string& clan_tag,
                                                  const std::string& credential) const {
    const std::string tag = normalizeTag(clan_tag);
    const std::string url = buildTagSearchUrl(tag, credential);

    CROW_LOG_DEBUG << "Clan tag lookup: GET " << redact(url, credential);

    auto response = httpClient->get(url, timeoutSeconds);
    if (!response) {
        CROW_LOG_WARNING << "Clan tag lookup for " << tag << " failed: " << response.error().message;
        return std::move(response.error());
    }

    try {
        auto json = parseBody(response->body);
        if (auto rejected = checkStatus(json)) {
            CROW_LOG_WARNING << "Upstream rejected clan tag lookup for " << tag << ": " << rejected->message;
            return std::move(*rejected);
        }

        const auto& candidates = member(json, "data");
        if (candidates.t() != crow::json::type::List) {
            throw PayloadShapeError("TypeError", "'data' is not a list");
        }

        // Upstream search matches on prefixes, only an exact tag counts
        for (const auto& candidate : candidates) {
            const auto& candidate_tag = member(candidate, "tag");
            if (candidate_tag.t() != crow::json::type::String || std::string(candidate_tag.s()) != tag) {
                continue;
            }
            return ClanRecord{clanIdOf(member(candidate, "clan_id")), tag};
        }

        CROW_LOG_INFO << "No clan found for tag " << tag;
        return Error::NotFound(NOT_FOUND_PREFIX + tag);
    } catch (const PayloadShapeError& e) {
        CROW_LOG_WARNING << "Malformed upstream payload for clan tag " << tag << ": "
                         << e.kind() << ": " << e.what();
        return shapeError(e);
    } catch (const std::exception& e) {
        CROW_LOG_WARNING << "Malformed upstream payload for clan tag " << tag << ": " << e.what();
        return Error::MalformedPayload(HTTPClient::transportErrorMessage("ValueError", e.what()));
    }
}

Result<ClanRecord> ClanLookupService::lookupById(int64_t clan_id, const std::string& credential) const {
    const std::string id_key = std::to_string(clan_id);
    const std::string url = buildIdInfoUrl(clan_id, credential);

    CROW_LOG_DEBUG << "Clan id lookup: GET " << redact(url, credential);

    auto response = httpClient->get(url, timeoutSeconds);
    if (!response) {
        CROW_LOG_WARNING << "Clan id lookup for " << id_key << " failed: " << response.error().message;
        return std::move(response.error());
    }

    try {
        auto json = parseBody(response->body);
        if (auto rejected = checkStatus(json)) {
            CROW_LOG_WARNING << "Upstream rejected clan id lookup for " << id_key << ": " << rejected->message;
            return std::move(*rejected);
        }

        const auto& entry = member(member(json, "data"), id_key);

        if (entry.t() != crow::json::type::Object) {
            throw PayloadShapeError("TypeError", "clan entry for " + id_key + " is not an object");
        }
        // Unknown ids come back as entries without a tag
        if (!entry.has("tag") || entry["tag"].t() == crow::json::type::Null) {
            CROW_LOG_INFO << "No clan found for id " << id_key;
            return Error::NotFound(NOT_FOUND_PREFIX + id_key);
        }

        const auto& tag = entry["tag"];
        if (tag.t() != crow::json::type::String) {
            throw PayloadShapeError("TypeError", "'tag' is not a string");
        }
        std::string clan_tag = tag.s();
        if (clan_tag.empty()) {
            CROW_LOG_INFO << "No clan found for id " << id_key;
            return Error::NotFound(NOT_FOUND_PREFIX + id_key);
        }

        return ClanRecord{clan_id, clan_tag};
    } catch (const PayloadShapeError& e) {
        CROW_LOG_WARNING << "Malformed upstream payload for clan id " << id_key << ": "
                         << e.kind() << ": " << e.what();
        return shapeError(e);
    } catch (const std::exception& e) {
        CROW_LOG_WARNING << "Malformed upstream payload for clan id " << id_key << ": " << e.what();
        return Error::MalformedPayload(HTTPClient::transportErrorMessage("ValueError", e.what()));
    }
}

} // namespace clanlookup
