/**
 * libcurl HTTP client implementation
 */

#include <string>
#include <curl/curl.h>

#include "pricewatch/common/config.h"
#include "pricewatch/data/http_client.h"

namespace pricewatch {
namespace data {

// Callback function for CURL
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Implementation class
class CurlHttpClient::Impl {
public:
    explicit Impl(const common::Config& config)
        : user_agent_(config.getHttpConfig().user_agent) {
        // Initialize CURL
        curl_global_init(CURL_GLOBAL_ALL);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    HttpResponse get(const HttpRequest& request) {
        // Set up CURL
        CURL* curl = curl_easy_init();
        if (!curl) {
            throw HttpError("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Accept: application/json, text/plain, */*");
        headers = curl_slist_append(headers, "Accept-Language: zh-CN,zh;q=0.9,en;q=0.8");
        for (const auto& header : request.headers) {
            headers = curl_slist_append(headers, header.c_str());
        }

        // Set up request
        HttpResponse response;
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        // Set timeout
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_s));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.timeout_s));

        // Perform request
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);
            throw HttpError("CURL request failed: " + std::string(curl_easy_strerror(res)));
        }

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        char* content_type = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
            response.content_type = content_type;
        }

        // Clean up
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (response.status < 200 || response.status >= 300) {
            throw HttpError("HTTP status " + std::to_string(response.status) + " from " + request.url);
        }

        return response;
    }

private:
    std::string user_agent_;
};

// CurlHttpClient implementation
CurlHttpClient::CurlHttpClient(const common::Config& config)
    : impl_(std::make_unique<Impl>(config)) {
}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::get(const HttpRequest& request) {
    return impl_->get(request);
}

} // namespace data
} // namespace pricewatch
