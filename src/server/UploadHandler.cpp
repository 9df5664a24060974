#include "server/UploadHandler.hpp"
#include "server/FileStorage.hpp"
#include "core/RandomString.hpp"
#include "core/Slug.hpp"
#include "http/ContentSniffer.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace toolkit {

namespace {
    constexpr std::size_t RANDOM_NAME_LENGTH = 32;

    bool equalsIgnoreCase(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    }
}

RenamePolicy parseRenamePolicy(const std::string& pattern) {
    if (pattern == "randomString") return RenamePolicy::RandomName;
    if (pattern == "noSpaces:retainCase") return RenamePolicy::NormalizeKeepCase;
    if (pattern == "noSpaces:allLowercase") return RenamePolicy::NormalizeLowercase;
    return RenamePolicy::KeepOriginal;
}

UploadHandler::UploadHandler(const ToolkitConfig& config) : config_(config) {}

std::vector<UploadedFile> UploadHandler::handleUpload(const http::Request& request,
                                                      const std::string& uploadDir,
                                                      const UploadOptions& options) const {
    std::vector<UploadedFile> uploadedFiles;

    FileStorage storage(uploadDir);
    try {
        storage.ensureStorageDirectory();
    } catch (const ToolkitError& e) {
        throw UploadError(e.kind(), e.what());
    }

    if (request.body.size() > config_.maxUploadBytes) {
        std::cerr << "Upload rejected: body of " << request.body.size() << " bytes exceeds "
                  << config_.maxUploadBytes << std::endl;
        throw UploadError(ErrorKind::SizeExceeded, "uploaded file exceeds allowed maximum file size");
    }

    std::string contentType = request.getHeader("Content-Type").value_or("");
    if (!http::MultipartParser::isMultipartFormData(contentType)) {
        throw UploadError(ErrorKind::MalformedInput, "request Content-Type isn't multipart/form-data");
    }

    std::vector<http::MultipartPart> parts;
    try {
        parts = http::MultipartParser::parse(request.body,
                                             http::MultipartParser::extractBoundary(contentType));
    } catch (const ToolkitError& e) {
        throw UploadError(e.kind(), e.what());
    }

    for (const http::MultipartPart* part : fileParts(parts)) {
        UploadedFile uploadedFile;
        uploadedFile.originalName = baseName(part->filename);
        if (uploadedFile.originalName.empty() || uploadedFile.originalName == "." ||
            uploadedFile.originalName == "..") {
            throw UploadError(ErrorKind::MalformedInput,
                              "invalid file name: " + part->filename, std::move(uploadedFiles));
        }

        // Sniff the leading bytes; the full data, prefix included, is written below
        std::string fileType = http::detectContentType(part->data);
        if (!isAllowedType(fileType)) {
            std::cerr << "Upload rejected: " << uploadedFile.originalName << " sniffed as " << fileType << std::endl;
            throw UploadError(ErrorKind::TypeNotPermitted, "the uploaded file type is not permitted",
                              std::move(uploadedFiles));
        }

        try {
            uploadedFile.storedName = storedNameFor(uploadedFile.originalName, options.rename);
            uploadedFile.sizeBytes = storage.saveFile(uploadedFile.storedName, part->data);
        } catch (const ToolkitError& e) {
            throw UploadError(e.kind(), e.what(), std::move(uploadedFiles));
        }

        uploadedFiles.push_back(std::move(uploadedFile));
    }

    return uploadedFiles;
}

std::string UploadHandler::storedNameFor(const std::string& originalName, RenamePolicy policy) {
    // Extension runs from the last dot and is kept verbatim
    std::string extension;
    std::string name = originalName;
    size_t dotPos = originalName.find_last_of('.');
    if (dotPos != std::string::npos) {
        extension = originalName.substr(dotPos);
        name = originalName.substr(0, dotPos);
    }

    switch (policy) {
        case RenamePolicy::NormalizeKeepCase:
            return normalizeFileName(name, false) + extension;
        case RenamePolicy::NormalizeLowercase:
            return normalizeFileName(name, true) + extension;
        case RenamePolicy::RandomName:
            return randomString(RANDOM_NAME_LENGTH) + extension;
        case RenamePolicy::KeepOriginal:
        default:
            return originalName;
    }
}

bool UploadHandler::isAllowedType(const std::string& sniffedType) const {
    if (config_.allowedFileTypes.empty()) return true;

    return std::any_of(config_.allowedFileTypes.begin(), config_.allowedFileTypes.end(),
                       [&](const std::string& allowed) { return equalsIgnoreCase(allowed, sniffedType); });
}

std::vector<const http::MultipartPart*>
UploadHandler::fileParts(const std::vector<http::MultipartPart>& parts) {
    std::vector<std::string> fieldOrder;
    for (const auto& part : parts) {
        if (part.isFile() &&
            std::find(fieldOrder.begin(), fieldOrder.end(), part.name) == fieldOrder.end()) {
            fieldOrder.push_back(part.name);
        }
    }

    std::vector<const http::MultipartPart*> ordered;
    for (const auto& field : fieldOrder) {
        for (const auto& part : parts) {
            if (part.isFile() && part.name == field) ordered.push_back(&part);
        }
    }
    return ordered;
}

std::string UploadHandler::baseName(const std::string& clientName) {
    // Sanitize filename - remove any path components
    size_t lastSlash = clientName.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        return clientName.substr(lastSlash + 1);
    }
    return clientName;
}

} // namespace toolkit
