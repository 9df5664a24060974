#include "core/Slug.hpp"
#include "core/ToolkitError.hpp"

namespace toolkit {

namespace {

    bool isAsciiAlnum(unsigned char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    }

    char asciiLower(char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    // Collapse each run of rejected characters into one separator, then trim separators
    template <typename Keep>
    std::string collapseRuns(const std::string& input, char separator, Keep keep) {
        std::string result;
        result.reserve(input.size());

        bool lastWasSeparator = false;
        for (char c : input) {
            if (keep(static_cast<unsigned char>(c))) {
                result += c;
                lastWasSeparator = false;
            } else if (!lastWasSeparator) {
                result += separator;
                lastWasSeparator = true;
            }
        }

        size_t start = result.find_first_not_of(separator);
        if (start == std::string::npos) return "";
        size_t end = result.find_last_not_of(separator);
        return result.substr(start, end - start + 1);
    }

}

std::string slugify(const std::string& text) {
    if (text.empty()) {
        throw ToolkitError(ErrorKind::EmptyInput, "empty string not permitted");
    }

    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) lowered += asciiLower(c);

    std::string slug = collapseRuns(lowered, '-', [](unsigned char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    });

    if (slug.empty()) {
        throw ToolkitError(ErrorKind::EmptyResult,
                           "after replacing characters, slug length is zero");
    }
    return slug;
}

std::string normalizeFileName(const std::string& name, bool lowercase) {
    std::string input = name;
    if (lowercase) {
        for (char& c : input) c = asciiLower(c);
    }

    return collapseRuns(input, '_', [](unsigned char c) {
        return isAsciiAlnum(c) || c == '-';
    });
}

} // namespace toolkit
