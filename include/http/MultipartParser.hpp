#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "http/Request.hpp"

namespace toolkit {
namespace http {

// One body part of a multipart/form-data request
struct MultipartPart {
    std::string name;           // "name" parameter of Content-Disposition
    std::string filename;       // "filename" parameter; empty for plain form values
    std::string content_type;   // as declared by the client, never trusted for type checks
    Headers headers;            // every part header, names case-insensitive
    std::vector<uint8_t> data;

    bool isFile() const { return !filename.empty(); }

    std::string dataAsString() const {
        return std::string(data.begin(), data.end());
    }
};

/**
 * Splits a buffered multipart/form-data body into parts.
 * Parts are returned in body order; framing errors are ToolkitError (MalformedInput).
 */
class MultipartParser {
public:
    // boundary is the Content-Type parameter value, without the leading "--"
    static std::vector<MultipartPart> parse(const std::string& body, const std::string& boundary);

    // "boundary" parameter of a Content-Type value, unquoted; empty when absent
    static std::string extractBoundary(const std::string& content_type);

    // True when the media type (parameters ignored) is multipart/form-data
    static bool isMultipartFormData(const std::string& content_type);

private:
    static void trim(std::string& s);
    static void toLower(std::string& s);
    static std::vector<std::pair<std::string, std::string>> parseParameters(const std::string& value);
    static void parseContentDisposition(const std::string& value, std::string& name, std::string& filename);
};

} // namespace http
} // namespace toolkit
