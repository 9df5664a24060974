#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ToolkitError.hpp"
#include "http/Request.hpp"

namespace toolkit {

/**
 * Envelope used for every JSON reply: {"error": bool, "message": str, "data": any}.
 * "data" is omitted when null.
 */
struct JsonResponse {
    bool error = false;
    std::string message;
    nlohmann::json data;
};

void to_json(nlohmann::json& j, const JsonResponse& r);
void from_json(const nlohmann::json& j, JsonResponse& r);

/**
 * Request body rejected by JsonCodec::decode
 */
class JsonDecodeError : public ToolkitError {
public:
    enum class Reason {
        Syntax,          // badly formed JSON, offset() set
        Truncated,       // body ends inside a value
        TypeMismatch,    // field() set when known, else offset()
        EmptyBody,
        UnknownField,    // field() set
        TooLarge,
        MultipleValues,  // more than one top-level value
        Other,
    };

    JsonDecodeError(Reason reason, const std::string& message,
                    std::string field = "", std::size_t offset = 0);

    Reason reason() const noexcept { return reason_; }
    const std::string& field() const noexcept { return field_; }
    std::size_t offset() const noexcept { return offset_; }

private:
    Reason reason_;
    std::string field_;
    std::size_t offset_;
};

struct JsonWriteOptions {
    // Extra response headers. Only the first set is applied; later sets are ignored.
    std::vector<http::Headers> headers;
};

struct ErrorJsonOptions {
    int status = 400;
};

class JsonCodec {
public:
    /**
     * Decode exactly one JSON value from body into target.
     *
     * T needs nlohmann to_json and from_json. The value target holds on entry
     * is the shape the body is checked against: field types must match and,
     * unless allowUnknownFields, every key must exist in it. Keys missing
     * from the body and keys set to null keep target's values.
     * After conversion target is rendered back to JSON; a value that did not
     * survive (an integer out of range for its field, an element key the
     * element type drops) is rejected as well.
     *
     * @param maxBytes Body size ceiling; 0 means DEFAULT_MAX_JSON_BYTES
     * @throws JsonDecodeError
     */
    template <typename T>
    static void decode(const std::string& body, std::uint64_t maxBytes,
                       bool allowUnknownFields, T& target) {
        const nlohmann::json prototype(target);
        std::size_t valueEnd = 0;
        nlohmann::json merged = decodeValue(body, maxBytes, allowUnknownFields, prototype, valueEnd);

        T decoded = target;
        try {
            decoded = merged.template get<T>();
        } catch (const nlohmann::json::type_error&) {
            std::string field = locateFailure(prototype, merged, [](const nlohmann::json& candidate) {
                try {
                    (void)candidate.template get<T>();
                    return true;
                } catch (const nlohmann::json::exception&) {
                    return false;
                }
            });
            throw typeMismatchAt(body, field, valueEnd);
        } catch (const nlohmann::json::exception& e) {
            throw JsonDecodeError(JsonDecodeError::Reason::Other,
                                  std::string("error unmarshalling JSON request body: ") + e.what());
        }

        std::string field;
        JsonDecodeError::Reason reason = JsonDecodeError::Reason::TypeMismatch;
        if (findLoss(merged, nlohmann::json(decoded), allowUnknownFields, "", field, reason)) {
            if (reason == JsonDecodeError::Reason::UnknownField) {
                throw JsonDecodeError(reason, "request body contains unknown key: \"" + field + "\"",
                                      field, valueEnd);
            }
            throw typeMismatchAt(body, field, valueEnd);
        }

        target = std::move(decoded);
    }

    // Validates body against prototype and returns prototype overlaid with the decoded value.
    // valueEnd receives the offset just past the first value.
    static nlohmann::json decodeValue(const std::string& body, std::uint64_t maxBytes,
                                      bool allowUnknownFields, const nlohmann::json& prototype,
                                      std::size_t& valueEnd);

    /**
     * Serialize data, apply the first header set, set Content-Type: application/json,
     * then write status and body.
     * @throws ToolkitError Encoding when data cannot be serialized, Io when the write fails
     */
    static void encode(http::ResponseWriter& w, int status, const nlohmann::json& data,
                       const JsonWriteOptions& options = {});

    template <typename T>
    static void encode(http::ResponseWriter& w, int status, const T& data,
                       const JsonWriteOptions& options = {}) {
        nlohmann::json j;
        try {
            j = data;
        } catch (const nlohmann::json::exception& e) {
            throw ToolkitError(ErrorKind::Encoding, std::string("cannot encode JSON: ") + e.what());
        }
        encode(w, status, j, options);
    }

    // Writes {"error": true, "message": err.what()} with options.status (400 by default)
    static void encodeError(http::ResponseWriter& w, const std::exception& err,
                            const ErrorJsonOptions& options = {});

private:
    static std::size_t firstValueEnd(const std::string& body, std::size_t start);

    // End offset of the value at a dotted field path, or fallback when the text has no such member
    static std::size_t fieldValueEnd(const std::string& body, const std::string& field, std::size_t fallback);

    // TypeMismatch for field (empty when unknown), positioned after the offending value
    static JsonDecodeError typeMismatchAt(const std::string& body, const std::string& field, std::size_t fallback);

    // Dotted path of the first member of input that makes converts() fail when placed into good
    static std::string locateFailure(const nlohmann::json& good, const nlohmann::json& input,
                                     const std::function<bool(const nlohmann::json&)>& converts);

    // Compares the decoded input with the converted target rendered back to JSON.
    // Sets field and reason for the first value that was dropped or altered.
    static bool findLoss(const nlohmann::json& input, const nlohmann::json& stored,
                         bool allowUnknownFields, const std::string& path,
                         std::string& field, JsonDecodeError::Reason& reason);
    static void checkShape(const nlohmann::json& input, const nlohmann::json& prototype,
                           bool allowUnknownFields, const std::string& path, std::size_t offset);
    static nlohmann::json overlay(nlohmann::json base, const nlohmann::json& input);
};

} // namespace toolkit
