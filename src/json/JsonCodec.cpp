#include "json/JsonCodec.hpp"
#include "config.hpp"
#include <cstring>
#include <vector>

namespace toolkit {

using Reason = JsonDecodeError::Reason;

namespace {

    bool isJsonWhitespace(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    std::size_t skipWhitespace(const std::string& s, std::size_t pos) {
        while (pos < s.size() && isJsonWhitespace(s[pos])) ++pos;
        return pos;
    }

    JsonDecodeError typeMismatch(const std::string& path, std::size_t offset) {
        if (path.empty()) {
            return JsonDecodeError(Reason::TypeMismatch,
                                   "request body contains incorrect JSON type: at character " +
                                       std::to_string(offset),
                                   "", offset);
        }
        return JsonDecodeError(Reason::TypeMismatch,
                               "request body contains incorrect JSON type for field \"" + path + "\"",
                               path, offset);
    }

}

void to_json(nlohmann::json& j, const JsonResponse& r) {
    j = nlohmann::json{{"error", r.error}, {"message", r.message}};
    if (!r.data.is_null()) {
        j["data"] = r.data;
    }
}

void from_json(const nlohmann::json& j, JsonResponse& r) {
    r.error = j.value("error", false);
    r.message = j.value("message", std::string());
    r.data = j.contains("data") ? j.at("data") : nlohmann::json();
}

JsonDecodeError::JsonDecodeError(Reason reason, const std::string& message,
                                 std::string field, std::size_t offset)
    : ToolkitError(reason == Reason::EmptyBody  ? ErrorKind::EmptyInput
                   : reason == Reason::TooLarge ? ErrorKind::SizeExceeded
                                                : ErrorKind::MalformedInput,
                   message),
      reason_(reason), field_(std::move(field)), offset_(offset) {}

nlohmann::json JsonCodec::decodeValue(const std::string& body, std::uint64_t maxBytes,
                                      bool allowUnknownFields, const nlohmann::json& prototype,
                                      std::size_t& valueEnd) {
    if (maxBytes == 0) maxBytes = DEFAULT_MAX_JSON_BYTES;

    if (body.size() > maxBytes) {
        throw JsonDecodeError(Reason::TooLarge,
                              "maximum allowed request body size is " + std::to_string(maxBytes) + " bytes");
    }

    const std::size_t start = skipWhitespace(body, 0);
    if (start == body.size()) {
        throw JsonDecodeError(Reason::EmptyBody, "request body cannot be empty");
    }

    // Parse only the first value; offsets stay relative to the start of the body
    const std::size_t end = firstValueEnd(body, start);
    nlohmann::json value;
    try {
        value = nlohmann::json::parse(body.begin(), body.begin() + static_cast<std::ptrdiff_t>(end));
    } catch (const nlohmann::json::parse_error& e) {
        if (end == body.size() && e.byte > end) {
            throw JsonDecodeError(Reason::Truncated,
                                  "request body contains badly formed JSON at some point within");
        }
        throw JsonDecodeError(Reason::Syntax,
                              "request body contains badly formed JSON: at character " + std::to_string(e.byte),
                              "", e.byte);
    }

    valueEnd = end;
    try {
        checkShape(value, prototype, allowUnknownFields, "", end);
    } catch (const JsonDecodeError& e) {
        if (e.reason() == Reason::TypeMismatch && !e.field().empty()) {
            throw typeMismatchAt(body, e.field(), end);
        }
        throw;
    }

    if (skipWhitespace(body, end) != body.size()) {
        throw JsonDecodeError(Reason::MultipleValues, "request body must only contain one JSON value");
    }

    return overlay(prototype, value);
}

std::size_t JsonCodec::firstValueEnd(const std::string& body, std::size_t start) {
    const std::size_t n = body.size();
    const char first = body[start];

    if (first == '{' || first == '[') {
        int depth = 0;
        bool inString = false;
        for (std::size_t i = start; i < n; ++i) {
            const char c = body[i];
            if (inString) {
                if (c == '\\') ++i;
                else if (c == '"') inString = false;
                continue;
            }
            if (c == '"') {
                inString = true;
            } else if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                if (--depth == 0) return i + 1;
            }
        }
        return n;
    }

    if (first == '"') {
        for (std::size_t i = start + 1; i < n; ++i) {
            if (body[i] == '\\') ++i;
            else if (body[i] == '"') return i + 1;
        }
        return n;
    }

    // Literal or number: runs until whitespace or a structural character
    std::size_t i = start;
    while (i < n && !isJsonWhitespace(body[i]) && std::strchr(",:[]{}\"", body[i]) == nullptr) ++i;
    return i == start ? start + 1 : i;
}

std::size_t JsonCodec::fieldValueEnd(const std::string& body, const std::string& field,
                                     std::size_t fallback) {
    std::vector<std::string> segments;
    std::size_t from = 0;
    while (true) {
        std::size_t dot = field.find('.', from);
        segments.push_back(field.substr(from, dot == std::string::npos ? std::string::npos : dot - from));
        if (dot == std::string::npos) break;
        from = dot + 1;
    }

    std::size_t pos = skipWhitespace(body, 0);
    for (std::size_t depth = 0; depth < segments.size(); ++depth) {
        if (pos >= body.size() || body[pos] != '{') return fallback;
        pos = skipWhitespace(body, pos + 1);

        bool matched = false;
        while (pos < body.size() && body[pos] == '"') {
            const std::size_t keyEnd = firstValueEnd(body, pos);
            std::string key;
            try {
                key = nlohmann::json::parse(body.begin() + static_cast<std::ptrdiff_t>(pos),
                                            body.begin() + static_cast<std::ptrdiff_t>(keyEnd))
                          .get<std::string>();
            } catch (const nlohmann::json::exception&) {
                return fallback;
            }

            pos = skipWhitespace(body, keyEnd);
            if (pos >= body.size() || body[pos] != ':') return fallback;
            pos = skipWhitespace(body, pos + 1);
            if (pos >= body.size()) return fallback;

            if (key == segments[depth]) {
                matched = true;
                break;
            }
            pos = skipWhitespace(body, firstValueEnd(body, pos));
            if (pos < body.size() && body[pos] == ',') pos = skipWhitespace(body, pos + 1);
        }
        if (!matched) return fallback;
    }
    return firstValueEnd(body, pos);
}

JsonDecodeError JsonCodec::typeMismatchAt(const std::string& body, const std::string& field,
                                          std::size_t fallback) {
    if (field.empty()) return typeMismatch(field, fallback);
    return typeMismatch(field, fieldValueEnd(body, field, fallback));
}

std::string JsonCodec::locateFailure(const nlohmann::json& good, const nlohmann::json& input,
                                     const std::function<bool(const nlohmann::json&)>& converts) {
    // Substitute members one at a time into a document known to convert and
    // descend into the first one that breaks it. Array elements are not
    // descended; the array's own field is reported.
    nlohmann::json doc = good;
    nlohmann::json::json_pointer at;
    std::string path;
    const nlohmann::json* current = &input;

    while (current->is_object() && doc.is_object()) {
        const nlohmann::json* failing = nullptr;
        std::string failingKey;
        for (const auto& item : current->items()) {
            nlohmann::json candidate = doc;
            candidate[at / item.key()] = item.value();
            if (!converts(candidate)) {
                failing = &item.value();
                failingKey = item.key();
                break;
            }
            doc = std::move(candidate);
        }
        if (failing == nullptr) break;

        at /= failingKey;
        path = path.empty() ? failingKey : path + "." + failingKey;
        if (!doc[at].is_object()) break;
        current = failing;
    }
    return path;
}

bool JsonCodec::findLoss(const nlohmann::json& input, const nlohmann::json& stored,
                         bool allowUnknownFields, const std::string& path,
                         std::string& field, Reason& reason) {
    auto mismatch = [&]() {
        field = path;
        reason = Reason::TypeMismatch;
        return true;
    };

    if (input.is_null()) return false;

    if (input.is_object()) {
        if (!stored.is_object()) return mismatch();
        for (const auto& item : input.items()) {
            const std::string childPath = path.empty() ? item.key() : path + "." + item.key();
            auto kept = stored.find(item.key());
            if (kept == stored.end()) {
                if (item.value().is_null() || allowUnknownFields) continue;
                field = childPath;
                reason = Reason::UnknownField;
                return true;
            }
            if (findLoss(item.value(), *kept, allowUnknownFields, childPath, field, reason)) return true;
        }
        return false;
    }

    if (input.is_array()) {
        if (!stored.is_array() || stored.size() != input.size()) return mismatch();
        for (std::size_t i = 0; i < input.size(); ++i) {
            if (findLoss(input[i], stored[i], allowUnknownFields, path, field, reason)) return true;
        }
        return false;
    }

    if (input.is_number()) {
        if (!stored.is_number()) return mismatch();
        // Floating point fields round; only integer fields must hold the exact value
        if (stored.is_number_float()) return false;
        return input != stored ? mismatch() : false;
    }

    return input != stored ? mismatch() : false;
}

void JsonCodec::checkShape(const nlohmann::json& input, const nlohmann::json& prototype,
                           bool allowUnknownFields, const std::string& path, std::size_t offset) {
    // null on either side places no constraint
    if (prototype.is_null() || input.is_null()) return;

    switch (prototype.type()) {
        case nlohmann::json::value_t::object: {
            if (!input.is_object()) throw typeMismatch(path, offset);
            // An empty prototype object is an open map
            if (prototype.empty()) return;
            for (const auto& item : input.items()) {
                const std::string childPath = path.empty() ? item.key() : path + "." + item.key();
                auto known = prototype.find(item.key());
                if (known == prototype.end()) {
                    if (!allowUnknownFields) {
                        throw JsonDecodeError(Reason::UnknownField,
                                              "request body contains unknown key: \"" + childPath + "\"",
                                              childPath, offset);
                    }
                    continue;
                }
                checkShape(item.value(), *known, allowUnknownFields, childPath, offset);
            }
            return;
        }
        case nlohmann::json::value_t::array:
            if (!input.is_array()) throw typeMismatch(path, offset);
            if (prototype.empty()) return;
            for (const auto& element : input) {
                checkShape(element, prototype.front(), allowUnknownFields, path, offset);
            }
            return;
        case nlohmann::json::value_t::string:
            if (!input.is_string()) throw typeMismatch(path, offset);
            return;
        case nlohmann::json::value_t::boolean:
            if (!input.is_boolean()) throw typeMismatch(path, offset);
            return;
        case nlohmann::json::value_t::number_integer:
            if (!input.is_number_integer()) throw typeMismatch(path, offset);
            return;
        case nlohmann::json::value_t::number_unsigned:
            if (!input.is_number_unsigned()) throw typeMismatch(path, offset);
            return;
        case nlohmann::json::value_t::number_float:
            if (!input.is_number()) throw typeMismatch(path, offset);
            return;
        default:
            return;
    }
}

nlohmann::json JsonCodec::overlay(nlohmann::json base, const nlohmann::json& input) {
    if (input.is_null()) return base;
    if (!base.is_object() || !input.is_object()) return input;

    for (const auto& item : input.items()) {
        auto existing = base.find(item.key());
        base[item.key()] = existing != base.end() ? overlay(*existing, item.value()) : item.value();
    }
    return base;
}

void JsonCodec::encode(http::ResponseWriter& w, int status, const nlohmann::json& data,
                       const JsonWriteOptions& options) {
    std::string out;
    try {
        out = data.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw ToolkitError(ErrorKind::Encoding, std::string("cannot encode JSON: ") + e.what());
    }

    if (!options.headers.empty()) {
        for (const auto& [name, value] : options.headers.front()) {
            w.headers()[name] = value;
        }
    }

    w.headers()["Content-Type"] = "application/json";
    w.writeHeader(status);
    if (!w.write(out)) {
        throw ToolkitError(ErrorKind::Io, "failed to write JSON response");
    }
}

void JsonCodec::encodeError(http::ResponseWriter& w, const std::exception& err,
                            const ErrorJsonOptions& options) {
    JsonResponse payload;
    payload.error = true;
    payload.message = err.what();

    encode(w, options.status, payload);
}

} // namespace toolkit
