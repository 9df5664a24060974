#pragma once

#include <string>
#include "http/Request.hpp"

namespace toolkit {
namespace http {

/**
 * Fully read reply of an outbound request. Holds no connection: the client
 * has already drained and released it, so the caller owns a plain value.
 */
struct ClientResponse {
    long status = 0;
    Headers headers;
    std::string body;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Throws ToolkitError (Transport) when no HTTP response was obtained
    virtual ClientResponse post(const std::string& url, const std::string& body,
                                const Headers& headers) = 0;
};

/**
 * HttpClient over libcurl's easy interface
 */
class CurlHttpClient : public HttpClient {
public:
    // timeoutSeconds of 0 means no timeout
    explicit CurlHttpClient(long timeoutSeconds = 0);

    ClientResponse post(const std::string& url, const std::string& body,
                        const Headers& headers) override;

    void setTimeout(long timeoutSeconds) { timeoutSeconds_ = timeoutSeconds; }

private:
    long timeoutSeconds_;
};

} // namespace http
} // namespace toolkit
