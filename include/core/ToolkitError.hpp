#pragma once

#include <string>
#include <stdexcept>

namespace toolkit {

/**
 * Failure categories reported by every toolkit operation
 */
enum class ErrorKind {
    SizeExceeded,       // body or upload above the configured ceiling
    TypeNotPermitted,   // sniffed upload type not in the allow list
    MalformedInput,     // bad JSON, bad multipart framing, bad config file
    Io,                 // create/read/write/stat failure
    EmptyInput,
    EmptyResult,
    Encoding,           // value could not be serialized
    Transport,          // outbound HTTP failure
    Entropy,            // random source unavailable
};

const char* to_string(ErrorKind kind);

class ToolkitError : public std::runtime_error {
public:
    ToolkitError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace toolkit
