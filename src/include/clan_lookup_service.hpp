#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "clan_record.hpp"
#include "error.hpp"
#include "http_client.hpp"

namespace clanlookup {

/**
 * Translates clan tags to clan ids and back by querying the upstream
 * game-statistics API. One upstream GET per lookup, no retries, no state
 * shared between calls.
 *
 * Every lookup ends in exactly one of:
 * - a ClanRecord
 * - Error::NotFound ("No clan was found for this id: ...")
 * - Error::UpstreamRejected, Error::Transport or Error::MalformedPayload
 */
class ClanLookupService {
public:
    static constexpr const char* NOT_FOUND_PREFIX = "No clan was found for this id: ";

    ClanLookupService(std::shared_ptr<IHttpClient> http_client,
                      std::string base_url,
                      int timeout_seconds = 5);

    /**
     * Look up the clan id for a clan tag. The tag is upper-cased before the
     * search and only exact tag matches are accepted.
     *
     * @param clan_tag clan tag in any case
     * @param credential application_id for the upstream API
     */
    Result<ClanRecord> lookupByTag(const std::string& clan_tag, const std::string& credential) const;

    /**
     * Look up the clan tag for a clan id.
     *
     * @param clan_id upstream clan id
     * @param credential application_id for the upstream API
     */
    Result<ClanRecord> lookupById(int64_t clan_id, const std::string& credential) const;

    std::string buildTagSearchUrl(const std::string& normalized_tag, const std::string& credential) const;
    std::string buildIdInfoUrl(int64_t clan_id, const std::string& credential) const;

    static std::string normalizeTag(const std::string& clan_tag);

private:
    std::shared_ptr<IHttpClient> httpClient;
    std::string baseUrl;
    int timeoutSeconds;
};

} // namespace clanlookup
