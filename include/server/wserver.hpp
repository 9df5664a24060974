#pragma once
#include <boost/asio.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include "const/rest_enums.hpp"
#include "http/Request.hpp"
#include "server/endpoint.hpp"

namespace toolkit {

class wServer
{
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::vector<endpoint> handlers_;
  std::uint64_t max_body_bytes_;
public:
    explicit wServer(std::uint64_t max_body_bytes);
    void add_endpoint(const endpoint& ep);

    void run(uint16_t port);

    // Runs the matching endpoint; 404 for an unknown path, 405 for a known path with another method
    http::Response dispatch(const http::Request& request) const;

    // Fills method, path, query and headers from the request line and header block
    static void parse_head(const std::string& head, http::Request& request);

    static std::string serialize(const http::Response& response);

private:
    void handle_connection(boost::asio::ip::tcp::socket& socket);
};

} // namespace toolkit
