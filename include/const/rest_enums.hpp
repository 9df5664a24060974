#pragma once

#include <string>
#include <stdexcept>

namespace toolkit {

enum class HttpRequest {
    GET,
    HEAD,
    POST,
    PATCH,
    PUT,
    DELETE,
};


inline const char* to_string(HttpRequest method) {
    switch(method) {
        case HttpRequest::GET: return "GET";
        case HttpRequest::HEAD: return "HEAD";
        case HttpRequest::POST: return "POST";
        case HttpRequest::PATCH: return "PATCH";
        case HttpRequest::PUT: return "PUT";
        case HttpRequest::DELETE: return "DELETE";
        default: return "UNKNOWN";
    }
}


inline HttpRequest from_string(const std::string& method) {
    if (method == "GET") return HttpRequest::GET;
    else if (method == "HEAD") return HttpRequest::HEAD;
    else if (method == "POST") return HttpRequest::POST;
    else if (method == "PATCH") return HttpRequest::PATCH;
    else if (method == "PUT") return HttpRequest::PUT;
    else if (method == "DELETE") return HttpRequest::DELETE;
    else throw std::invalid_argument("Invalid HTTP method string: " + method);
}

inline const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 416: return "Range Not Satisfiable";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        default:  return "Unknown";
    }
}

} // namespace toolkit
