#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "clan_lookup_service.hpp"
#include "test_utils.hpp"

using namespace clanlookup;
using namespace clanlookup::test;

namespace {

struct LookupFixture {
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    ClanLookupService service{http, TEST_BASE_URL, 5};
};

} // namespace

TEST_CASE_METHOD(LookupFixture, "lookupByTag: exact match is found", "[lookup][tag]") {
    http->respondWith(R"({"status":"ok","meta":{"count":1,"total":1},"data":[{"clan_id":5000000,"tag":"EXAMPLE"}]})");

    auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);

    REQUIRE(result.has_value());
    REQUIRE(result->clan_id == 5000000);
    REQUIRE(result->clan_tag == "EXAMPLE");
    REQUIRE(http->requested_urls.size() == 1);
    REQUIRE(http->requested_urls[0] == tagSearchUrl("EXAMPLE"));
    REQUIRE(http->last_timeout_seconds == 5);
}

TEST_CASE_METHOD(LookupFixture, "lookupByTag: input tag is upper-cased", "[lookup][tag]") {
    http->respondWith(R"({"status":"ok","data":[{"clan_id":42,"tag":"EXAMPLE"}]})");

    auto result = service.lookupByTag("exAmple", TEST_API_KEY);

    REQUIRE(result.has_value());
    REQUIRE(result->clan_tag == "EXAMPLE");
    REQUIRE(result->clan_id == 42);
    REQUIRE(http->requested_urls.size() == 1);
    REQUIRE(http->requested_urls[0] == tagSearchUrl("EXAMPLE"));
}

TEST_CASE_METHOD(LookupFixture, "lookupByTag: only exact tag matches count", "[lookup][tag]") {
    SECTION("Prefix matches are skipped") {
        http->respondWith(R"({"status":"ok","data":[
            {"clan_id":1,"tag":"EXAMPLE2"},
            {"clan_id":2,"tag":"EXAMPLE"},
            {"clan_id":3,"tag":"EXAMPLE"}]})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE(result.has_value());
        REQUIRE(result->clan_id == 2);
    }

    SECTION("Non-empty list without exact match is not found") {
        http->respondWith(R"({"status":"ok","data":[{"clan_id":1,"tag":"EXAMPLE2"},{"clan_id":2,"tag":"EXAMPL"}]})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::NotFound);
        REQUIRE(result.error().message == "No clan was found for this id: EXAMPLE");
    }

    SECTION("Null tags never match") {
        http->respondWith(R"({"status":"ok","data":[{"clan_id":1,"tag":null}]})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::NotFound);
    }
}

TEST_CASE_METHOD(LookupFixture, "lookupByTag: empty result is not found", "[lookup][tag]") {
    http->respondWith(R"({"status":"ok","data":[]})");

    auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().category == ErrorCategory::NotFound);
    REQUIRE(result.error().http_status_code == 404);
    REQUIRE(result.error().message == "No clan was found for this id: EXAMPLE");
}

TEST_CASE_METHOD(LookupFixture, "lookupByTag: upstream error status", "[lookup][tag]") {
    SECTION("Error message is embedded verbatim") {
        http->respondWith(R"({"status":"error","error":{"message":"TEST_API_ERROR"}})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::UpstreamRejected);
        REQUIRE(result.error().http_status_code == 400);
        REQUIRE(result.error().message == "API Request responded with an error: TEST_API_ERROR");
    }

    SECTION("Data content is ignored when status is not ok") {
        http->respondWith(R"({"status":"error","error":{"message":"INVALID_APPLICATION_ID"},"data":[{"clan_id":1,"tag":"EXAMPLE"}]})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "API Request responded with an error: INVALID_APPLICATION_ID");
    }

    SECTION("Error without message is a malformed payload") {
        http->respondWith(R"({"status":"error","error":{}})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::MalformedPayload);
        REQUIRE(result.error().message == "An Exception was raised during the api request. KeyError: message.");
    }
}

TEST_CASE_METHOD(LookupFixture, "lookupByTag: malformed payloads", "[lookup][tag]") {
    SECTION("Missing data key") {
        http->respondWith(R"({"status":"ok"})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::MalformedPayload);
        REQUIRE(result.error().http_status_code == 400);
        REQUIRE(result.error().message == "An Exception was raised during the api request. KeyError: data.");
    }

    SECTION("Missing status key") {
        http->respondWith(R"({"data":[]})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "An Exception was raised during the api request. KeyError: status.");
    }

    SECTION("Matching candidate without clan_id") {
        http->respondWith(R"({"status":"ok","data":[{"tag":"EXAMPLE"}]})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "An Exception was raised during the api request. KeyError: clan_id.");
    }

    SECTION("Fractional clan_id") {
        http->respondWith(R"({"status":"ok","data":[{"clan_id":5000000.7,"tag":"EXAMPLE"}]})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::MalformedPayload);
        REQUIRE_THAT(result.error().message,
                     Catch::Matchers::StartsWith("An Exception was raised during the api request. TypeError: "));
    }

    SECTION("Exponent clan_id") {
        http->respondWith(R"({"status":"ok","data":[{"clan_id":1e20,"tag":"EXAMPLE"}]})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::MalformedPayload);
    }

    SECTION("clan_id beyond int64") {
        http->respondWith(R"({"status":"ok","data":[{"clan_id":18446744073709551615,"tag":"EXAMPLE"}]})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::MalformedPayload);
    }

    SECTION("Data is not a list") {
        http->respondWith(R"({"status":"ok","data":{"EXAMPLE":5}})");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::MalformedPayload);
        REQUIRE_THAT(result.error().message,
                     Catch::Matchers::StartsWith("An Exception was raised during the api request. TypeError: "));
    }

    SECTION("Body is not JSON") {
        http->respondWith("<html>Service Unavailable</html>");

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::MalformedPayload);
        REQUIRE_THAT(result.error().message,
                     Catch::Matchers::StartsWith("An Exception was raised during the api request. JSONDecodeError: "));
    }
}

TEST_CASE_METHOD(LookupFixture, "lookupByTag: transport failures", "[lookup][tag]") {
    SECTION("Non-2xx status") {
        http->failWith(Error::Transport(
            HTTPClient::transportErrorMessage("HTTPError", "503 Error from upstream")));

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::Transport);
        REQUIRE(result.error().message ==
                "An Exception was raised during the api request. HTTPError: 503 Error from upstream.");
    }

    SECTION("Timeout") {
        http->failWith(Error::Transport(HTTPClient::transportErrorMessage("Timeout", "Timeout was reached")));

        auto result = service.lookupByTag("EXAMPLE", TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::Transport);
        REQUIRE(result.error().http_status_code == 400);
        REQUIRE(result.error().message ==
                "An Exception was raised during the api request. Timeout: Timeout was reached.");
        REQUIRE(http->requested_urls.size() == 1);
    }
}

TEST_CASE_METHOD(LookupFixture, "lookupById: tag is found", "[lookup][id]") {
    http->respondWith(R"({"status":"ok","meta":{"count":1},"data":{"5000000":{"tag":"EXAMPLE"}}})");

    auto result = service.lookupById(5000000, TEST_API_KEY);

    REQUIRE(result.has_value());
    REQUIRE(result->clan_id == 5000000);
    REQUIRE(result->clan_tag == "EXAMPLE");
    REQUIRE(http->requested_urls.size() == 1);
    REQUIRE(http->requested_urls[0] == idInfoUrl("5000000"));
}

TEST_CASE_METHOD(LookupFixture, "lookupById: falsy tag is not found", "[lookup][id]") {
    SECTION("Null tag") {
        http->respondWith(R"({"status":"ok","data":{"5000000":{"tag":null}}})");
    }

    SECTION("Empty tag") {
        http->respondWith(R"({"status":"ok","data":{"5000000":{"tag":""}}})");
    }

    SECTION("Absent tag") {
        http->respondWith(R"({"status":"ok","data":{"5000000":{}}})");
    }

    auto result = service.lookupById(5000000, TEST_API_KEY);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().category == ErrorCategory::NotFound);
    REQUIRE(result.error().http_status_code == 404);
    REQUIRE(result.error().message == "No clan was found for this id: 5000000");
}

TEST_CASE_METHOD(LookupFixture, "lookupById: upstream error status", "[lookup][id]") {
    http->respondWith(R"({"status":"error","error":{"message":"TEST_API_ERROR"}})");

    auto result = service.lookupById(5000000, TEST_API_KEY);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().category == ErrorCategory::UpstreamRejected);
    REQUIRE(result.error().message == "API Request responded with an error: TEST_API_ERROR");
}

TEST_CASE_METHOD(LookupFixture, "lookupById: malformed payloads", "[lookup][id]") {
    SECTION("Missing data key") {
        http->respondWith(R"({"status":"ok"})");

        auto result = service.lookupById(5000000, TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::MalformedPayload);
        REQUIRE(result.error().message == "An Exception was raised during the api request. KeyError: data.");
    }

    SECTION("Requested id missing from data") {
        http->respondWith(R"({"status":"ok","data":{"123":{"tag":"OTHER"}}})");

        auto result = service.lookupById(5000000, TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "An Exception was raised during the api request. KeyError: 5000000.");
    }

    SECTION("Tag of the wrong type") {
        http->respondWith(R"({"status":"ok","data":{"5000000":{"tag":17}}})");

        auto result = service.lookupById(5000000, TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::MalformedPayload);
    }

    SECTION("Null clan entry") {
        http->respondWith(R"({"status":"ok","data":{"5000000":null}})");

        auto result = service.lookupById(5000000, TEST_API_KEY);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::MalformedPayload);
        REQUIRE(result.error().http_status_code == 400);
        REQUIRE_THAT(result.error().message,
                     Catch::Matchers::StartsWith("An Exception was raised during the api request. TypeError: "));
    }
}

TEST_CASE("ClanLookupService: URL building", "[lookup]") {
    auto http = std::make_shared<FakeHttpClient>();

    SECTION("Trailing slash on base URL is ignored") {
        ClanLookupService service(http, "https://api.worldoftanks.eu/", 5);
        REQUIRE(service.buildIdInfoUrl(7, "key") ==
                "https://api.worldoftanks.eu/wot/clans/info/?application_id=key&fields=tag&clan_id=7");
    }

    SECTION("Search term is percent-encoded") {
        ClanLookupService service(http, TEST_BASE_URL, 5);
        REQUIRE(service.buildTagSearchUrl("A&B", "key") ==
                "https://api.worldoftanks.eu/wot/clans/list/?application_id=key&search=A%26B&fields=clan_id%2C+tag");
    }

    SECTION("Configured timeout is passed to the client") {
        ClanLookupService service(http, TEST_BASE_URL, 9);
        auto result = service.lookupById(1, "key");
        REQUIRE(http->last_timeout_seconds == 9);
    }
}

TEST_CASE("ClanLookupService::normalizeTag", "[lookup]") {
    REQUIRE(ClanLookupService::normalizeTag("abc") == "ABC");
    REQUIRE(ClanLookupService::normalizeTag("A-b_9") == "A-B_9");
    REQUIRE(ClanLookupService::normalizeTag("") == "");
}
