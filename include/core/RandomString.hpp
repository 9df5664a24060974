#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace toolkit {

// 66 characters: a-z, A-Z, 0-9 and "_+-="
extern const char RANDOM_STRING_SOURCE[];

// Produces uniformly distributed 32-bit values; throws when the source is unavailable
using RandomDraw = std::function<std::uint32_t()>;

// Returns n characters drawn uniformly from RANDOM_STRING_SOURCE using std::random_device.
// Throws ToolkitError (Entropy) when the random source keeps failing.
std::string randomString(std::size_t n);

// Same, drawing from draw. A failed draw restarts the string; the third failure is Entropy.
std::string randomString(std::size_t n, const RandomDraw& draw);

} // namespace toolkit
