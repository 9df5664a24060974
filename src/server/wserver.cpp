#include "server/wserver.hpp"
#include <cctype>
#include <iostream>
#include <sstream>

namespace asio = boost::asio;
using boost::asio::ip::tcp;

namespace toolkit {

namespace {

    void trim(std::string& s) {
        size_t a = 0, b = s.size();
        while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
        while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) --b;
        s = s.substr(a, b - a);
    }

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    }

    std::string url_decode(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
                out += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
                i += 2;
            } else if (s[i] == '+') {
                out += ' ';
            } else {
                out += s[i];
            }
        }
        return out;
    }

    bool iequals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        }
        return true;
    }

    // Field names are tokens; anything that could end the line or the name is refused
    bool valid_header_name(const std::string& name) {
        if (name.empty()) return false;
        for (char c : name) {
            if (c == '\r' || c == '\n' || c == ':' || c == ' ' || c == '\t' || c == '\0') return false;
        }
        return true;
    }

    // CR and LF in a value would start a new header line
    std::string header_value(const std::string& value) {
        std::string out = value;
        for (char& c : out) {
            if (c == '\r' || c == '\n') c = ' ';
        }
        return out;
    }

    void parse_query(const std::string& qs, std::unordered_map<std::string, std::string>& query) {
        size_t pos = 0;
        while (pos <= qs.size()) {
            size_t amp = qs.find('&', pos);
            std::string pair = qs.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
            if (!pair.empty()) {
                auto eq = pair.find('=');
                if (eq == std::string::npos) {
                    query[url_decode(pair)] = "";
                } else {
                    query[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
                }
            }
            if (amp == std::string::npos) break;
            pos = amp + 1;
        }
    }

}

wServer::wServer(std::uint64_t max_body_bytes)
    : acceptor_(io_context_), max_body_bytes_(max_body_bytes) {}

void wServer::add_endpoint(const endpoint& ep)
{
    handlers_.push_back(ep);
}

void wServer::parse_head(const std::string& head, http::Request& request)
{
    std::istringstream request_stream(head);

    std::string method, target, version;
    request_stream >> method >> target >> version;
    if (method.empty() || target.empty()) {
        throw std::invalid_argument("Malformed request line");
    }
    request.method = from_string(method);

    std::string dummy;
    std::getline(request_stream, dummy);

    auto qm = target.find('?');
    request.path = url_decode(target.substr(0, qm));
    if (qm != std::string::npos) {
        parse_query(target.substr(qm + 1), request.query);
    }

    std::string header_line;
    while (std::getline(request_stream, header_line))
    {
        if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
        if (header_line.empty()) break;

        auto colon = header_line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = header_line.substr(0, colon);
        std::string value = header_line.substr(colon + 1);
        trim(name); trim(value);
        request.headers[name] = value;
    }
}

http::Response wServer::dispatch(const http::Request& request) const
{
    bool path_known = false;
    for (const auto& ep : handlers_) {
        if (ep.get_path() != request.path) continue;
        path_known = true;
        if (ep.get_rest_type() != request.method) continue;

        http::Response response;
        try {
            ep.get_handler()(request, response);
        } catch (const std::exception& e) {
            std::cerr << "Handler for " << request.path << " failed: " << e.what() << std::endl;
            return http::Response::error(e.what());
        }
        return response;
    }

    return path_known ? http::Response::methodNotAllowed() : http::Response::notFound();
}

std::string wServer::serialize(const http::Response& response)
{
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";

    bool has_length = false;
    for (const auto& [name, value] : response.headerMap) {
        if (!valid_header_name(name)) {
            std::cerr << "Dropping response header with invalid name" << std::endl;
            continue;
        }
        if (iequals(name, "Content-Length")) has_length = true;
        out << name << ": " << header_value(value) << "\r\n";
    }
    if (!has_length) {
        out << "Content-Length: " << response.body.size() << "\r\n";
    }
    out << "Connection: close\r\n\r\n";
    out << response.body;
    return out.str();
}

void wServer::handle_connection(tcp::socket& socket)
{
    asio::streambuf buf;
    size_t head_size = asio::read_until(socket, buf, "\r\n\r\n");

    std::string head(asio::buffers_begin(buf.data()), asio::buffers_begin(buf.data()) + head_size);
    buf.consume(head_size);

    http::Request request;
    try {
        parse_head(head, request);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Bad request: " << e.what() << std::endl;
        asio::write(socket, asio::buffer(serialize(http::Response::badRequest(e.what()))));
        return;
    }

    size_t content_length = 0;
    if (auto length = request.getHeader("Content-Length")) {
        try {
            content_length = static_cast<size_t>(std::stoull(*length));
        } catch (const std::exception&) {
            content_length = 0;
        }
    }

    if (content_length > max_body_bytes_) {
        std::cerr << "Request body of " << content_length << " bytes rejected" << std::endl;
        asio::write(socket, asio::buffer(serialize(http::Response::payloadTooLarge())));
        return;
    }

    std::string body(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));
    if (body.size() < content_length) {
        std::string rest;
        rest.resize(content_length - body.size());
        asio::read(socket, asio::buffer(&rest[0], rest.size()));
        body += rest;
    } else if (body.size() > content_length) {
        body.resize(content_length);
    }
    request.body.swap(body);

    http::Response response = dispatch(request);
    std::cout << to_string(request.method) << " " << request.path << " -> " << response.status << std::endl;
    asio::write(socket, asio::buffer(serialize(response)));
}

void wServer::run(uint16_t port)
{
    tcp::endpoint endpoint(tcp::v4(), port);
    acceptor_ = tcp::acceptor(io_context_, endpoint);
    std::cout << "Server listening on port " << port << std::endl;

    while (true)
    {
        tcp::socket socket(io_context_);
        acceptor_.accept(socket);

        try {
            handle_connection(socket);
        } catch (const std::exception& e) {
            std::cerr << "Connection error: " << e.what() << std::endl;
        }

        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
}

} // namespace toolkit
