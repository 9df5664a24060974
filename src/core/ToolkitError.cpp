#include "core/ToolkitError.hpp"

namespace toolkit {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SizeExceeded: return "size-exceeded";
        case ErrorKind::TypeNotPermitted: return "type-not-permitted";
        case ErrorKind::MalformedInput: return "malformed-input";
        case ErrorKind::Io: return "io";
        case ErrorKind::EmptyInput: return "empty-input";
        case ErrorKind::EmptyResult: return "empty-result";
        case ErrorKind::Encoding: return "encoding";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Entropy: return "entropy";
        default: return "unknown";
    }
}

} // namespace toolkit
