#pragma once

#include <string>
#include <string_view>
#include <map>
#include <unordered_map>
#include <optional>
#include "const/rest_enums.hpp"

namespace toolkit {
namespace http {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

// Header names compare case-insensitively; one value per name
using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

/**
 * HTTP Request object containing all request data
 */
struct Request {
    HttpRequest method = HttpRequest::GET;                 // GET, HEAD, POST, ...
    std::string path;                                      // Clean path without query string
    std::unordered_map<std::string, std::string> query;    // Query parameters (?key=value)
    Headers headers;
    std::string body;                                      // Raw body (multipart or JSON)

    // Convenience methods
    std::string getQuery(const std::string& key, const std::string& defaultValue = "") const {
        auto it = query.find(key);
        return it != query.end() ? it->second : defaultValue;
    }

    bool hasQuery(const std::string& key) const {
        return query.find(key) != query.end();
    }

    std::optional<std::string> getHeader(const std::string& name) const {
        auto it = headers.find(name);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * Sink a handler writes its response into: headers first, then the status, then body bytes
 */
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual Headers& headers() = 0;

    virtual void writeHeader(int status) = 0;

    // Returns false when the bytes could not be delivered
    virtual bool write(std::string_view data) = 0;
};

/**
 * Buffered HTTP Response, serialized by the server once the handler returns
 */
class Response : public ResponseWriter {
public:
    int status = 200;
    Headers headerMap;
    std::string body;

    Headers& headers() override { return headerMap; }

    void writeHeader(int code) override {
        if (!statusWritten_) {
            status = code;
            statusWritten_ = true;
        }
    }

    bool write(std::string_view data) override {
        statusWritten_ = true;
        body.append(data.data(), data.size());
        return true;
    }

    std::string header(const std::string& name) const {
        auto it = headerMap.find(name);
        return it != headerMap.end() ? it->second : "";
    }

    static Response badRequest(const std::string& message);
    static Response notFound(const std::string& message = "Not found");
    static Response methodNotAllowed();
    static Response payloadTooLarge();
    static Response error(const std::string& message);

private:
    bool statusWritten_ = false;
};

} // namespace http
} // namespace toolkit
