#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace rainsight {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * Path and decoded query parameters of a request target
 */
struct RequestTarget {
    std::string path;
    std::map<std::string, std::string> params;

    static RequestTarget parse(const std::string& target);
};

/**
 * Session HTTP - gère une connexion client
 *
 * Keep-alive connections serve at most kMaxRequestsPerConnection requests.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    static constexpr size_t kMaxBodyBytes = 1024 * 1024;
    static constexpr size_t kMaxRequestsPerConnection = 100;
    static constexpr std::chrono::seconds kIdleTimeout{30};

    explicit HttpSession(tcp::socket socket);

    void run();

    /**
     * Route one request to RequestHandler. Never throws: handler errors
     * become 400 (validation) or 500 responses.
     */
    static http::response<http::string_body> handleRequest(
        http::request<http::string_body>&& req);

private:
    void readNext();
    void onRead(beast::error_code ec);
    void write(http::response<http::string_body> response);
    void close();

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    size_t m_served = 0;
};

} // namespace server
} // namespace rainsight
