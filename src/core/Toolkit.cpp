#include "core/Toolkit.hpp"
#include "core/RandomString.hpp"
#include "core/Slug.hpp"
#include "server/FileStorage.hpp"
#include <filesystem>
#include <iostream>

namespace toolkit {

Toolkit::Toolkit(ToolkitConfig config)
    : config_(std::move(config)),
      fileServer_(std::make_shared<http::StaticFileServer>()) {
    config_.resolveDefaults();
}

std::string Toolkit::randomString(std::size_t n) const {
    return toolkit::randomString(n);
}

std::vector<UploadedFile> Toolkit::uploadFiles(const http::Request& request,
                                               const std::string& uploadDir,
                                               const UploadOptions& options) const {
    UploadHandler handler(config_);
    return handler.handleUpload(request, uploadDir, options);
}

UploadedFile Toolkit::uploadOneFile(const http::Request& request,
                                    const std::string& uploadDir,
                                    const UploadOptions& options) const {
    std::vector<UploadedFile> files = uploadFiles(request, uploadDir, options);
    if (files.empty()) {
        throw ToolkitError(ErrorKind::EmptyInput, "no file found in request");
    }
    return files.front();
}

void Toolkit::createDirIfNotExist(const std::string& path) const {
    FileStorage::createDirIfNotExist(path);
}

std::string Toolkit::slugify(const std::string& text) const {
    return toolkit::slugify(text);
}

void Toolkit::downloadStaticFile(const http::Request& request, http::ResponseWriter& w,
                                 const std::string& pathName, const std::string& fileName,
                                 const std::string& displayName) const {
    std::string filePath = (std::filesystem::path(pathName) / fileName).lexically_normal().string();
    std::string quoted;
    quoted.reserve(displayName.size());
    for (char c : displayName) {
        if (c == '"' || c == '\\') quoted += '\\';
        quoted += c;
    }
    w.headers()["Content-Disposition"] = "attachment; filename=\"" + quoted + "\"";
    fileServer_->serveFile(request, w, filePath);
}

void Toolkit::errorJSON(http::ResponseWriter& w, const std::exception& err,
                        const ErrorJsonOptions& options) const {
    JsonCodec::encodeError(w, err, options);
}

http::ClientResponse Toolkit::postJSON(const std::string& uri, const std::string& body,
                                       const PushOptions& options) const {
    std::shared_ptr<http::HttpClient> client = options.client;
    if (!client) {
        client = std::make_shared<http::CurlHttpClient>();
    }

    http::Headers headers;
    headers["Content-Type"] = "application/json";

    http::ClientResponse response = client->post(uri, body, headers);
    std::cout << "Pushed " << body.size() << " bytes to " << uri
              << ", status " << response.status << std::endl;
    return response;
}

} // namespace toolkit
