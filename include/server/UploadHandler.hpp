#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"
#include "core/ToolkitError.hpp"
#include "http/MultipartParser.hpp"
#include "http/Request.hpp"

namespace toolkit {

enum class RenamePolicy {
    KeepOriginal,
    RandomName,             // 32 random characters + original extension
    NormalizeKeepCase,      // runs outside [A-Za-z0-9-] become '_'
    NormalizeLowercase,     // same, lowercased first
};

// Maps "", "randomString", "noSpaces:retainCase", "noSpaces:allLowercase";
// anything else is KeepOriginal
RenamePolicy parseRenamePolicy(const std::string& pattern);

struct UploadOptions {
    RenamePolicy rename = RenamePolicy::KeepOriginal;
};

struct UploadedFile {
    std::string storedName;
    std::string originalName;
    std::uintmax_t sizeBytes = 0;
};

/**
 * Upload failure carrying the files already written by the same call
 */
class UploadError : public ToolkitError {
public:
    UploadError(ErrorKind kind, const std::string& message, std::vector<UploadedFile> uploaded = {})
        : ToolkitError(kind, message), uploaded_(std::move(uploaded)) {}

    const std::vector<UploadedFile>& uploaded() const noexcept { return uploaded_; }

private:
    std::vector<UploadedFile> uploaded_;
};

class UploadHandler {
public:
    explicit UploadHandler(const ToolkitConfig& config);

    /**
     * Store every file part of a multipart request into uploadDir
     * @param request Request with a multipart/form-data Content-Type and raw body
     * @param uploadDir Destination directory, created when missing
     * @param options Renaming policy
     * @return One record per stored file, in processing order
     * @throws UploadError on the first failure, with the records written before it
     */
    std::vector<UploadedFile> handleUpload(const http::Request& request,
                                           const std::string& uploadDir,
                                           const UploadOptions& options) const;

    static std::string storedNameFor(const std::string& originalName, RenamePolicy policy);

private:
    const ToolkitConfig& config_;

    bool isAllowedType(const std::string& sniffedType) const;

    // File parts grouped by field name (first appearance order), body order within a field
    static std::vector<const http::MultipartPart*> fileParts(const std::vector<http::MultipartPart>& parts);

    static std::string baseName(const std::string& clientName);
};

} // namespace toolkit
