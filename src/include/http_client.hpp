#pragma once

#include <map>
#include <string>

#include "error.hpp"

namespace clanlookup {

/**
 * HTTP response data
 */
struct HTTPResponse {
    int status_code = 0;                        // HTTP status (200, 404, 500, etc.)
    std::string body;                           // Response body
    std::map<std::string, std::string> headers; // Response headers
};

/**
 * Abstract interface for outbound GET requests to the upstream API.
 *
 * Implementations:
 * - HTTPClient: libcurl, one easy handle per request
 * - FakeHttpClient (tests): canned responses
 *
 * Implementations never throw; every failure is returned as an Error in
 * category Transport whose message reads
 * "An Exception was raised during the api request. {Kind}: {detail}."
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * Perform a GET request.
     * @param url Full URL including the query string
     * @param timeout_seconds Bound for connecting and for the whole transfer
     * @return Response for any 2xx status, Transport error otherwise
     */
    virtual Result<HTTPResponse> get(const std::string& url, int timeout_seconds) = 0;
};

/**
 * libcurl backed HTTP client for the upstream game-statistics API
 */
class HTTPClient : public IHttpClient {
public:
    explicit HTTPClient(bool verify_ssl = true);

    Result<HTTPResponse> get(const std::string& url, int timeout_seconds) override;

    /**
     * Percent-encode a single query parameter value
     */
    static std::string urlEncode(const std::string& value);

    /**
     * Build the transport error message for a failure kind, e.g.
     * transportErrorMessage("Timeout", "Timeout was reached")
     */
    static std::string transportErrorMessage(const std::string& kind, const std::string& detail);

    /**
     * Process-wide libcurl setup/teardown. Call once from main before
     * the server starts its worker threads.
     */
    static void globalInit();
    static void globalCleanup();

private:
    bool verify_ssl_;
};

} // namespace clanlookup
