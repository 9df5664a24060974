#include "http/MultipartParser.hpp"
#include "core/ToolkitError.hpp"
#include <cctype>

namespace toolkit {
namespace http {

namespace {
    ToolkitError malformed(const std::string& what) {
        return ToolkitError(ErrorKind::MalformedInput, "multipart: " + what);
    }
}

void MultipartParser::trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void MultipartParser::toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

std::vector<std::pair<std::string, std::string>>
MultipartParser::parseParameters(const std::string& value) {
    std::vector<std::pair<std::string, std::string>> params;

    // Split on ';' outside quoted strings
    std::vector<std::string> tokens;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quoted && c == '\\' && i + 1 < value.size()) {
            current += c;
            current += value[++i];
            continue;
        }
        if (c == '"') quoted = !quoted;
        if (c == ';' && !quoted) {
            tokens.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    tokens.push_back(current);

    for (auto& token : tokens) {
        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        // Remove surrounding quotes; \" and \\ are escapes, other backslashes are kept (Windows paths)
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            std::string unquoted;
            for (size_t i = 1; i + 1 < val.size(); ++i) {
                if (val[i] == '\\' && i + 2 < val.size() && (val[i + 1] == '"' || val[i + 1] == '\\')) {
                    ++i;
                }
                unquoted += val[i];
            }
            val = unquoted;
        }

        params.emplace_back(key, val);
    }

    return params;
}

void MultipartParser::parseContentDisposition(const std::string& value,
                                               std::string& name,
                                               std::string& filename) {
    for (const auto& [key, val] : parseParameters(value)) {
        if (key == "name") {
            name = val;
        } else if (key == "filename") {
            filename = val;
        }
    }
}

std::string MultipartParser::extractBoundary(const std::string& content_type) {
    auto semicolon = content_type.find(';');
    if (semicolon == std::string::npos) {
        return "";
    }

    for (const auto& [key, val] : parseParameters(content_type.substr(semicolon + 1))) {
        if (key == "boundary") {
            return val;
        }
    }
    return "";
}

bool MultipartParser::isMultipartFormData(const std::string& content_type) {
    std::string media = content_type.substr(0, content_type.find(';'));
    trim(media);
    toLower(media);
    return media == "multipart/form-data";
}

std::vector<MultipartPart> MultipartParser::parse(const std::string& body,
                                                   const std::string& boundary) {
    if (boundary.empty()) {
        throw malformed("missing boundary");
    }

    std::vector<MultipartPart> parts;
    const std::string dash = "--" + boundary;
    const std::string marker = "\r\n" + dash;

    // Find first boundary
    size_t bline;
    if (body.rfind(dash, 0) == 0) {
        bline = 0;
    } else {
        size_t m = body.find(marker, 0);
        if (m == std::string::npos) throw malformed("opening boundary not found");
        bline = m + 2;
    }

    while (true) {
        // Check for final boundary (--)
        const size_t after = bline + dash.size();
        if (after + 2 <= body.size() && body.compare(after, 2, "--") == 0) break;

        // Boundary line ends with CRLF
        size_t line_end = body.find("\r\n", after);
        if (line_end == std::string::npos) throw malformed("unexpected end of body after boundary");

        MultipartPart part;

        size_t headers_start = line_end + 2;
        size_t content_start;
        if (body.compare(headers_start, 2, "\r\n") == 0) {
            // Part without headers
            content_start = headers_start + 2;
        } else {
            size_t headers_end = body.find("\r\n\r\n", headers_start);
            if (headers_end == std::string::npos) throw malformed("unterminated part headers");
            content_start = headers_end + 4;

            // Extract headers
            size_t hpos = headers_start;
            while (hpos <= headers_end) {
                size_t eol = body.find("\r\n", hpos);
                if (eol == std::string::npos || eol > headers_end) break;

                std::string hline = body.substr(hpos, eol - hpos);
                hpos = eol + 2;

                auto colon = hline.find(':');
                if (colon == std::string::npos) continue;

                std::string hname = hline.substr(0, colon);
                std::string hvalue = hline.substr(colon + 1);
                trim(hname);
                trim(hvalue);
                part.headers[hname] = hvalue;
            }

            auto disposition = part.headers.find("Content-Disposition");
            if (disposition != part.headers.end()) {
                parseContentDisposition(disposition->second, part.name, part.filename);
            }
            auto type = part.headers.find("Content-Type");
            if (type != part.headers.end()) {
                part.content_type = type->second;
            }
        }

        size_t next_marker = body.find(marker, content_start);
        if (next_marker == std::string::npos) throw malformed("closing boundary not found");

        const char* data_ptr = body.data() + content_start;
        part.data = std::vector<uint8_t>(data_ptr, data_ptr + (next_marker - content_start));

        parts.push_back(std::move(part));
        bline = next_marker + 2;
    }

    return parts;
}

} // namespace http
} // namespace toolkit
