#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "core/ToolkitError.hpp"
#include "http/FileServer.hpp"
#include "http/HttpClient.hpp"
#include "http/Request.hpp"
#include "json/JsonCodec.hpp"
#include "server/UploadHandler.hpp"

namespace toolkit {

struct PushOptions {
    // Client used for the POST; a CurlHttpClient without timeout when empty
    std::shared_ptr<http::HttpClient> client;
};

/**
 * Entry point for the web-backend helpers. Limits are resolved to their
 * defaults once, at construction; calls only read the configuration.
 */
class Toolkit {
public:
    explicit Toolkit(ToolkitConfig config = {});

    const ToolkitConfig& config() const { return config_; }

    std::string randomString(std::size_t n) const;

    std::vector<UploadedFile> uploadFiles(const http::Request& request,
                                          const std::string& uploadDir,
                                          const UploadOptions& options = {}) const;

    // Same pipeline; every file part is stored, the first record is returned.
    // Throws ToolkitError (EmptyInput) when the request holds no file.
    UploadedFile uploadOneFile(const http::Request& request,
                               const std::string& uploadDir,
                               const UploadOptions& options = {}) const;

    void createDirIfNotExist(const std::string& path) const;

    std::string slugify(const std::string& text) const;

    // Sends pathName/fileName as an attachment named displayName
    void downloadStaticFile(const http::Request& request, http::ResponseWriter& w,
                            const std::string& pathName, const std::string& fileName,
                            const std::string& displayName) const;

    void setFileServer(std::shared_ptr<http::FileServer> server) { fileServer_ = std::move(server); }

    template <typename T>
    void readJSON(const http::Request& request, T& data) const {
        JsonCodec::decode(request.body, config_.maxJsonBytes, config_.allowUnknownJsonFields, data);
    }

    template <typename T>
    void writeJSON(http::ResponseWriter& w, int status, const T& data,
                   const JsonWriteOptions& options = {}) const {
        JsonCodec::encode(w, status, data, options);
    }

    void errorJSON(http::ResponseWriter& w, const std::exception& err,
                   const ErrorJsonOptions& options = {}) const;

    /**
     * POST data as JSON to uri.
     * The reply is read completely before returning; nothing is left open for the caller to close.
     * @throws ToolkitError Encoding when data cannot be marshalled, Transport on network failure
     */
    template <typename T>
    http::ClientResponse pushJSONToRemoteService(const std::string& uri, const T& data,
                                                 const PushOptions& options = {}) const {
        std::string body;
        try {
            body = nlohmann::json(data).dump();
        } catch (const nlohmann::json::exception& e) {
            throw ToolkitError(ErrorKind::Encoding, std::string("cannot encode JSON: ") + e.what());
        }
        return postJSON(uri, body, options);
    }

private:
    ToolkitConfig config_;
    std::shared_ptr<http::FileServer> fileServer_;

    http::ClientResponse postJSON(const std::string& uri, const std::string& body,
                                  const PushOptions& options) const;
};

} // namespace toolkit
