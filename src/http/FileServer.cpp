#include "http/FileServer.hpp"
#include "http/ContentSniffer.hpp"
#include "core/ToolkitError.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace toolkit {
namespace http {

namespace {
    constexpr std::size_t CHUNK_SIZE = 32 * 1024;

    std::uintmax_t parseDigits(const std::string& s) {
        if (s.empty() || !std::all_of(s.begin(), s.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw ToolkitError(ErrorKind::MalformedInput, "invalid range");
        }
        try {
            return std::stoull(s);
        } catch (const std::out_of_range&) {
            throw ToolkitError(ErrorKind::MalformedInput, "invalid range");
        }
    }

    void trimSpaces(std::string& s) {
        size_t first = s.find_first_not_of(" \t");
        size_t last = s.find_last_not_of(" \t");
        s = (first == std::string::npos) ? "" : s.substr(first, last - first + 1);
    }
}

std::optional<ByteRange> StaticFileServer::parseRange(const std::string& header, std::uintmax_t size) {
    if (header.empty()) return std::nullopt;

    const std::string prefix = "bytes=";
    if (header.compare(0, prefix.size(), prefix) != 0) {
        throw ToolkitError(ErrorKind::MalformedInput, "invalid range");
    }

    std::string rangeSet = header.substr(prefix.size());
    // Multi-range requests are answered with the whole file
    if (rangeSet.find(',') != std::string::npos) return std::nullopt;

    trimSpaces(rangeSet);
    auto dash = rangeSet.find('-');
    if (dash == std::string::npos) {
        throw ToolkitError(ErrorKind::MalformedInput, "invalid range");
    }

    std::string first = rangeSet.substr(0, dash);
    std::string last = rangeSet.substr(dash + 1);
    trimSpaces(first);
    trimSpaces(last);

    ByteRange range;
    if (first.empty()) {
        // Suffix range: the final N bytes
        std::uintmax_t n = parseDigits(last);
        if (n == 0 || size == 0) {
            throw ToolkitError(ErrorKind::MalformedInput, "invalid range: failed to overlap");
        }
        n = std::min(n, size);
        range.start = size - n;
        range.length = n;
        return range;
    }

    range.start = parseDigits(first);
    if (range.start >= size) {
        throw ToolkitError(ErrorKind::MalformedInput, "invalid range: failed to overlap");
    }

    if (last.empty()) {
        range.length = size - range.start;
        return range;
    }

    std::uintmax_t end = parseDigits(last);
    if (end < range.start) {
        throw ToolkitError(ErrorKind::MalformedInput, "invalid range");
    }
    end = std::min(end, size - 1);
    range.length = end - range.start + 1;
    return range;
}

void StaticFileServer::writeText(ResponseWriter& w, int status, const std::string& text) {
    w.headers()["Content-Type"] = "text/plain; charset=utf-8";
    w.headers()["X-Content-Type-Options"] = "nosniff";
    w.writeHeader(status);
    if (!w.write(text)) {
        std::cerr << "Failed to write " << status << " response" << std::endl;
    }
}

void StaticFileServer::serveFile(const Request& request, ResponseWriter& w, const std::string& path) {
    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (ec || !fs::is_regular_file(st)) {
        writeText(w, 404, "404 page not found\n");
        return;
    }

    std::uintmax_t size = fs::file_size(path, ec);
    std::ifstream in(path, std::ios::binary);
    if (ec || !in) {
        std::cerr << "Cannot open " << path << " for serving" << std::endl;
        writeText(w, 500, "500 Internal Server Error\n");
        return;
    }

    std::optional<ByteRange> range;
    try {
        range = parseRange(request.getHeader("Range").value_or(""), size);
    } catch (const ToolkitError& e) {
        w.headers()["Content-Range"] = "bytes */" + std::to_string(size);
        writeText(w, 416, std::string(e.what()) + "\n");
        return;
    }

    if (w.headers().find("Content-Type") == w.headers().end()) {
        std::vector<char> head(SNIFF_LEN);
        in.read(head.data(), static_cast<std::streamsize>(head.size()));
        std::size_t got = static_cast<std::size_t>(in.gcount());
        w.headers()["Content-Type"] =
            detectContentType(reinterpret_cast<const uint8_t*>(head.data()), got);
        in.clear();
    }

    std::uintmax_t start = range ? range->start : 0;
    std::uintmax_t remaining = range ? range->length : size;

    w.headers()["Accept-Ranges"] = "bytes";
    w.headers()["Content-Length"] = std::to_string(remaining);
    if (range) {
        w.headers()["Content-Range"] = "bytes " + std::to_string(range->start) + "-" +
                                       std::to_string(range->start + range->length - 1) + "/" +
                                       std::to_string(size);
        w.writeHeader(206);
    } else {
        w.writeHeader(200);
    }

    if (request.method == HttpRequest::HEAD) return;

    in.seekg(static_cast<std::streamoff>(start));
    std::vector<char> buffer(CHUNK_SIZE);
    while (remaining > 0 && in) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uintmax_t>(remaining, buffer.size()));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        std::size_t got = static_cast<std::size_t>(in.gcount());
        if (got == 0) break;

        if (!w.write(std::string_view(buffer.data(), got))) {
            std::cerr << "Client write failed while serving " << path << std::endl;
            return;
        }
        remaining -= got;
    }
}

} // namespace http
} // namespace toolkit
