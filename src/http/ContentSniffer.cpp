#include "http/ContentSniffer.hpp"
#include <cstring>

namespace toolkit {
namespace http {

namespace {

    bool isWhitespace(uint8_t b) {
        return b == '\t' || b == '\n' || b == '\x0C' || b == '\r' || b == ' ';
    }

    bool isTagTerminator(uint8_t b) {
        return b == ' ' || b == '>';
    }

    // Bytes that never appear in text content
    bool isBinaryByte(uint8_t b) {
        return b <= 0x08 || b == 0x0B || (b >= 0x0E && b <= 0x1A) || (b >= 0x1C && b <= 0x1F);
    }

    size_t skipWhitespace(const uint8_t* data, size_t size) {
        size_t i = 0;
        while (i < size && isWhitespace(data[i])) ++i;
        return i;
    }

    bool hasPrefix(const uint8_t* data, size_t size, const char* prefix, size_t prefixLen) {
        return size >= prefixLen && std::memcmp(data, prefix, prefixLen) == 0;
    }

    // Compare under a mask; 0x00 in the mask ignores that byte
    bool maskedMatch(const uint8_t* data, size_t size,
                     const uint8_t* mask, const uint8_t* pattern, size_t len) {
        if (size < len) return false;
        for (size_t i = 0; i < len; ++i) {
            if ((data[i] & mask[i]) != pattern[i]) return false;
        }
        return true;
    }

    // "<TAG" followed by a space or '>', ASCII case-insensitive, after leading whitespace
    bool htmlMatch(const uint8_t* data, size_t size, const char* tag) {
        size_t start = skipWhitespace(data, size);
        const size_t len = std::strlen(tag);
        if (size - start < len + 1) return false;
        for (size_t i = 0; i < len; ++i) {
            uint8_t b = data[start + i];
            if (b >= 'a' && b <= 'z') b = static_cast<uint8_t>(b - 'a' + 'A');
            if (b != static_cast<uint8_t>(tag[i])) return false;
        }
        return isTagTerminator(data[start + len]);
    }

    struct ExactSig {
        const char* prefix;
        size_t len;
        const char* type;
    };

    const ExactSig EXACT_SIGNATURES[] = {
        {"%PDF-", 5, "application/pdf"},
        {"%!PS-Adobe-", 11, "application/postscript"},
        {"\x00\x00\x01\x00", 4, "image/x-icon"},
        {"\x00\x00\x02\x00", 4, "image/x-icon"},
        {"BM", 2, "image/bmp"},
        {"GIF87a", 6, "image/gif"},
        {"GIF89a", 6, "image/gif"},
        {"\x89PNG\x0D\x0A\x1A\x0A", 8, "image/png"},
        {"\xFF\xD8\xFF", 3, "image/jpeg"},
        {"ID3", 3, "audio/mpeg"},
        {"OggS\x00", 5, "application/ogg"},
        {"MThd\x00\x00\x00\x06", 8, "audio/midi"},
        {"\x1A\x45\xDF\xA3", 4, "video/webm"},
        {"\x00\x01\x00\x00", 4, "font/ttf"},
        {"OTTO", 4, "font/otf"},
        {"ttcf", 4, "font/collection"},
        {"wOFF", 4, "font/woff"},
        {"wOF2", 4, "font/woff2"},
        {"\x1F\x8B\x08", 3, "application/x-gzip"},
        {"PK\x03\x04", 4, "application/zip"},
        {"Rar!\x1A\x07\x00", 7, "application/x-rar-compressed"},
        {"Rar!\x1A\x07\x01\x00", 8, "application/x-rar-compressed"},
        {"\x00\x61\x73\x6D", 4, "application/wasm"},
    };

    // RIFF/FORM containers: 4-byte tag, 4 ignored size bytes, 4-byte form type
    struct ContainerSig {
        const char* outer;
        const char* form;
        const char* type;
    };

    const ContainerSig CONTAINER_SIGNATURES[] = {
        {"FORM", "AIFF", "audio/aiff"},
        {"RIFF", "AVI ", "video/avi"},
        {"RIFF", "WAVE", "audio/wave"},
    };

    const char* const HTML_TAGS[] = {
        "<!DOCTYPE HTML", "<HTML", "<HEAD", "<SCRIPT", "<IFRAME", "<H1", "<DIV",
        "<FONT", "<TABLE", "<A", "<STYLE", "<TITLE", "<B", "<BODY", "<BR", "<P", "<!--",
    };

    bool isWebP(const uint8_t* data, size_t size) {
        static const uint8_t mask[] = {0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x00,
                                       0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
        static const uint8_t pattern[] = {'R', 'I', 'F', 'F', 0, 0, 0, 0,
                                          'W', 'E', 'B', 'P', 'V', 'P'};
        return maskedMatch(data, size, mask, pattern, sizeof(pattern));
    }

    bool isMp4(const uint8_t* data, size_t size) {
        if (size < 12) return false;
        const size_t boxSize = (static_cast<size_t>(data[0]) << 24) |
                               (static_cast<size_t>(data[1]) << 16) |
                               (static_cast<size_t>(data[2]) << 8) |
                               static_cast<size_t>(data[3]);
        if (size < boxSize || boxSize % 4 != 0) return false;
        if (std::memcmp(data + 4, "ftyp", 4) != 0) return false;
        for (size_t st = 8; st < boxSize; st += 4) {
            if (st == 12) continue;  // minor version
            if (st + 3 <= size && std::memcmp(data + st, "mp4", 3) == 0) return true;
        }
        return false;
    }

}

std::string detectContentType(const uint8_t* data, std::size_t size) {
    if (size > SNIFF_LEN) size = SNIFF_LEN;

    for (const char* tag : HTML_TAGS) {
        if (htmlMatch(data, size, tag)) return "text/html; charset=utf-8";
    }

    {
        size_t start = skipWhitespace(data, size);
        if (hasPrefix(data + start, size - start, "<?xml", 5)) return "text/xml; charset=utf-8";
    }

    if (hasPrefix(data, size, "\xFE\xFF", 2)) return "text/plain; charset=utf-16be";
    if (hasPrefix(data, size, "\xFF\xFE", 2)) return "text/plain; charset=utf-16le";
    if (hasPrefix(data, size, "\xEF\xBB\xBF", 3)) return "text/plain; charset=utf-8";

    for (const auto& sig : EXACT_SIGNATURES) {
        if (hasPrefix(data, size, sig.prefix, sig.len)) return sig.type;
    }

    if (isWebP(data, size)) return "image/webp";

    for (const auto& sig : CONTAINER_SIGNATURES) {
        if (size >= 12 && std::memcmp(data, sig.outer, 4) == 0 &&
            std::memcmp(data + 8, sig.form, 4) == 0) {
            return sig.type;
        }
    }

    if (isMp4(data, size)) return "video/mp4";

    for (size_t i = 0; i < size; ++i) {
        if (isBinaryByte(data[i])) return "application/octet-stream";
    }
    return "text/plain; charset=utf-8";
}

} // namespace http
} // namespace toolkit
