#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "http/Request.hpp"

namespace toolkit {
namespace http {

/**
 * Streams a file from disk into a response
 */
class FileServer {
public:
    virtual ~FileServer() = default;

    virtual void serveFile(const Request& request, ResponseWriter& w, const std::string& path) = 0;
};

struct ByteRange {
    std::uintmax_t start = 0;
    std::uintmax_t length = 0;
};

/**
 * Default file server: 404 for missing files, sniffed Content-Type,
 * single-range requests, HEAD without body
 */
class StaticFileServer : public FileServer {
public:
    void serveFile(const Request& request, ResponseWriter& w, const std::string& path) override;

    /**
     * Parse a single "bytes=" range against a file size.
     * @return std::nullopt when the header should be ignored (absent, multi-range)
     * @throws ToolkitError (MalformedInput) for unparseable or unsatisfiable ranges
     */
    static std::optional<ByteRange> parseRange(const std::string& header, std::uintmax_t size);

private:
    static void writeText(ResponseWriter& w, int status, const std::string& text);
};

} // namespace http
} // namespace toolkit
