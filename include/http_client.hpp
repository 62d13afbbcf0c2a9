#pragma once

#include <string>
#include <vector>
#include <chrono>

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking HTTP GET
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Perform a GET with the given "Name: value" headers.
    // Throws std::runtime_error on transport errors and timeouts; HTTP error
    // statuses are returned, not thrown.
    virtual HttpResponse get(const std::string& url,
                             const std::vector<std::string>& headers,
                             std::chrono::seconds timeout) const = 0;
};

// libcurl implementation; one easy handle per request
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<std::string>& headers,
                     std::chrono::seconds timeout) const override;
};
