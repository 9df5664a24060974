#include "config.hpp"
#include "core/ToolkitError.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace toolkit {

void ToolkitConfig::resolveDefaults() {
    if (maxUploadBytes == 0) {
        maxUploadBytes = DEFAULT_MAX_UPLOAD_BYTES;
    }
    if (maxJsonBytes == 0) {
        maxJsonBytes = DEFAULT_MAX_JSON_BYTES;
    }
}

ServerConfig loadServerConfig(const std::string& path) {
    ServerConfig config;

    if (!std::filesystem::exists(path)) {
        std::cout << "Config file " << path << " not found, using defaults" << std::endl;
        config.toolkit.resolveDefaults();
        return config;
    }

    std::ifstream file(path);
    if (!file) {
        throw ToolkitError(ErrorKind::Io, "Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ToolkitError(ErrorKind::MalformedInput,
                           "Invalid config file " + path + ": " + e.what());
    }

    if (!j.is_object()) {
        throw ToolkitError(ErrorKind::MalformedInput,
                           "Invalid config file " + path + ": top level must be an object");
    }

    try {
        config.port = j.value("port", config.port);
        config.uploadDir = j.value("uploadDir", config.uploadDir);
        config.staticDir = j.value("staticDir", config.staticDir);
        config.pushTarget = j.value("pushTarget", config.pushTarget);

        if (j.contains("toolkit")) {
            const auto& t = j.at("toolkit");
            config.toolkit.allowedFileTypes =
                t.value("allowedFileTypes", config.toolkit.allowedFileTypes);
            config.toolkit.maxUploadBytes = t.value("maxUploadBytes", config.toolkit.maxUploadBytes);
            config.toolkit.maxJsonBytes = t.value("maxJsonBytes", config.toolkit.maxJsonBytes);
            config.toolkit.allowUnknownJsonFields =
                t.value("allowUnknownJsonFields", config.toolkit.allowUnknownJsonFields);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ToolkitError(ErrorKind::MalformedInput,
                           "Invalid config file " + path + ": " + e.what());
    }

    config.toolkit.resolveDefaults();
    return config;
}

} // namespace toolkit
