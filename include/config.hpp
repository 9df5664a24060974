#pragma once

#include <cstdint>
#include <string>
#include <vector>

#define TOOLKIT_DEFAULT_CONFIG_PATH "webtoolkit.json"
#define TOOLKIT_DEFAULT_UPLOAD_DIR "uploads"
#define TOOLKIT_DEFAULT_STATIC_DIR "static"

namespace toolkit {

constexpr std::uint64_t DEFAULT_MAX_UPLOAD_BYTES = 1024ULL * 1024 * 1024;
constexpr std::uint64_t DEFAULT_MAX_JSON_BYTES = 1024ULL * 1024;

struct ToolkitConfig {
    std::vector<std::string> allowedFileTypes;  // empty: every sniffed type is accepted
    std::uint64_t maxUploadBytes = 0;           // 0: DEFAULT_MAX_UPLOAD_BYTES
    std::uint64_t maxJsonBytes = 0;             // 0: DEFAULT_MAX_JSON_BYTES
    bool allowUnknownJsonFields = false;

    // Replaces zero limits with the defaults. Called once when a Toolkit is built.
    void resolveDefaults();
};

/**
 * Settings for the demo server binary
 */
struct ServerConfig {
    uint16_t port = 8080;
    std::string uploadDir = TOOLKIT_DEFAULT_UPLOAD_DIR;
    std::string staticDir = TOOLKIT_DEFAULT_STATIC_DIR;
    std::string pushTarget;                     // empty disables POST /push
    ToolkitConfig toolkit;
};

/**
 * Load server settings from a JSON file
 * @param path Config file path; a missing file yields the defaults
 * @return Parsed config with toolkit limits already resolved
 * @throws ToolkitError (MalformedInput) on unreadable or invalid JSON
 */
ServerConfig loadServerConfig(const std::string& path = TOOLKIT_DEFAULT_CONFIG_PATH);

} // namespace toolkit
