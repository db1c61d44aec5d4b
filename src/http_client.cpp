#include "http_client.hpp"
#include <crow/logging.h>
#include <curl/curl.h>
#include <memory>

namespace clanlookup {

namespace {
    constexpr const char* USER_AGENT = "clan-lookup/1.0";
    constexpr const char* EXCEPTION_PREFIX = "An Exception was raised during the api request. ";

    /**
     * Callback for libcurl to write response data
     */
    size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        userp->append(static_cast<char*>(contents), size * nmemb);
        return size * nmemb;
    }

    /**
     * Callback for libcurl to write response headers
     */
    size_t header_callback(char* buffer, size_t size, size_t nmemb, std::map<std::string, std::string>* userp) {
        std::string header_line(buffer, size * nmemb);

        size_t colon_pos = header_line.find(':');
        if (colon_pos != std::string::npos) {
            std::string header_name = header_line.substr(0, colon_pos);
            std::string header_value = header_line.substr(colon_pos + 1);

            header_value.erase(0, header_value.find_first_not_of(" \t"));
            header_value.erase(header_value.find_last_not_of(" \r\n") + 1);

            userp->insert({header_name, header_value});
        }

        return size * nmemb;
    }

    struct CurlDeleter {
        void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    };

    struct SlistDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };
}

HTTPClient::HTTPClient(bool verify_ssl) : verify_ssl_(verify_ssl) {
    if (!verify_ssl_) {
        CROW_LOG_WARNING << "SSL verification disabled - use only for development";
    }
}

void HTTPClient::globalInit() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HTTPClient::globalCleanup() {
    curl_global_cleanup();
}

std::string HTTPClient::transportErrorMessage(const std::string& kind, const std::string& detail) {
    return std::string(EXCEPTION_PREFIX) + kind + ": " + detail + ".";
}

std::string HTTPClient::urlEncode(const std::string& value) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return value;
    }
    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return value;
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

Result<HTTPResponse> HTTPClient::get(const std::string& url, int timeout_seconds) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        CROW_LOG_ERROR << "Failed to initialize CURL";
        return Error::Transport(transportErrorMessage("ConnectionError", "Failed to initialize HTTP client"));
    }

    HTTPResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));

    if (verify_ssl_) {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
    }

    std::unique_ptr<curl_slist, SlistDeleter> header_list(
        curl_slist_append(nullptr, "Accept: application/json"));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT);

    CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_OPERATION_TIMEDOUT) {
        CROW_LOG_WARNING << "Upstream request timed out after " << timeout_seconds << "s";
        return Error::Transport(transportErrorMessage("Timeout", curl_easy_strerror(res)));
    }
    if (res != CURLE_OK) {
        CROW_LOG_WARNING << "Upstream request failed: " << curl_easy_strerror(res);
        return Error::Transport(transportErrorMessage("ConnectionError", curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);

    CROW_LOG_DEBUG << "Upstream GET -> " << response.status_code;

    if (response.status_code < 200 || response.status_code >= 300) {
        // The URL carries the credential, so it is left out of the message
        return Error::Transport(
            transportErrorMessage("HTTPError", std::to_string(response.status_code) + " Error from upstream"));
    }

    return response;
}

} // namespace clanlookup
