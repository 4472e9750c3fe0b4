/**
 * HTTP client used by the fetch adapters
 */

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "pricewatch/common/config.h"

namespace pricewatch {
namespace data {

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    int timeout_s = 5;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string content_type;
};

// Transport failure or non-2xx status
class HttpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Blocking GET bounded by request.timeout_s; throws HttpError
    virtual HttpResponse get(const HttpRequest& request) = 0;
};

/**
 * libcurl-backed client. One easy handle per call, so concurrent
 * calls from worker threads are safe.
 */
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const common::Config& config);
    ~CurlHttpClient() override;

    HttpResponse get(const HttpRequest& request) override;

private:
    // Implementation details
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace data
} // namespace pricewatch
