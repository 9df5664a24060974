#include "http/Request.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace toolkit {
namespace http {

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) <
                   std::tolower(static_cast<unsigned char>(y));
        });
}

namespace {
    Response errorResponse(int status, const std::string& message) {
        Response res;
        res.headers()["Content-Type"] = "application/json";
        res.writeHeader(status);
        nlohmann::json body = {{"error", true}, {"message", message}};
        res.write(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        return res;
    }
}

Response Response::badRequest(const std::string& message) {
    return errorResponse(400, message);
}

Response Response::notFound(const std::string& message) {
    return errorResponse(404, message);
}

Response Response::methodNotAllowed() {
    return errorResponse(405, "Method not allowed");
}

Response Response::payloadTooLarge() {
    return errorResponse(413, "Request body too large");
}

Response Response::error(const std::string& message) {
    return errorResponse(500, message);
}

} // namespace http
} // namespace toolkit
