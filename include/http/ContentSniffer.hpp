#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace toolkit {
namespace http {

// Number of leading bytes the sniffer looks at
constexpr std::size_t SNIFF_LEN = 512;

/**
 * Classify content by its leading bytes (WHATWG MIME sniffing).
 * Only the first SNIFF_LEN bytes are considered. Never fails: unknown binary
 * data is "application/octet-stream", unknown text "text/plain; charset=utf-8".
 */
std::string detectContentType(const uint8_t* data, std::size_t size);

inline std::string detectContentType(const std::vector<uint8_t>& data) {
    return detectContentType(data.data(), data.size());
}

inline std::string detectContentType(const std::string& data) {
    return detectContentType(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

} // namespace http
} // namespace toolkit
