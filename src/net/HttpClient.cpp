#include "net/HttpClient.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <cctype>
#include <functional>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace rainsight {
namespace net {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

using Clock = std::chrono::steady_clock;

/**
 * Private io_context driving one exchange against a single deadline
 */
class Exchange {
public:
    explicit Exchange(std::chrono::milliseconds timeout)
        : m_deadline(Clock::now() + timeout)
    {}

    asio::io_context& context() { return m_ioc; }

    /**
     * Run until the pending operation reports `done`. Past the deadline the
     * operation is cancelled and TransportError is thrown.
     */
    void wait(const bool& done, const std::function<void()>& cancel, const std::string& step) {
        m_ioc.restart();
        m_ioc.run_until(m_deadline);
        if (!done) {
            cancel();
            m_ioc.restart();
            m_ioc.run();
            throw TransportError(step + " timed out");
        }
    }

private:
    asio::io_context m_ioc;
    Clock::time_point m_deadline;
};

http::verb toVerb(const std::string& method) {
    http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown) {
        throw ValidationError("Unsupported HTTP method: " + method);
    }
    return verb;
}

template <class Stream>
HttpResponse transact(Exchange& exchange, Stream& stream, const Url& url,
                      const tcp::resolver::results_type& endpoints,
                      http::request<http::string_body>& req) {
    auto& socket = beast::get_lowest_layer(stream);
    bool done = false;
    beast::error_code ec;

    socket.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint&) {
        ec = e;
        done = true;
    });
    exchange.wait(done, [&] { socket.cancel(); }, "Connect to " + url.host);
    if (ec) {
        throw TransportError("Connect to " + url.host + ":" + url.port + ": " + ec.message());
    }

    if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
        done = false;
        stream.async_handshake(ssl::stream_base::client, [&](beast::error_code e) {
            ec = e;
            done = true;
        });
        exchange.wait(done, [&] { socket.cancel(); }, "TLS handshake with " + url.host);
        if (ec) {
            throw TransportError("TLS handshake with " + url.host + ": " + ec.message());
        }
    }

    done = false;
    http::async_write(stream, req, [&](beast::error_code e, std::size_t) {
        ec = e;
        done = true;
    });
    exchange.wait(done, [&] { socket.cancel(); }, "Write to " + url.host);
    if (ec) {
        throw TransportError("Write to " + url.host + ": " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    done = false;
    http::async_read(stream, buffer, res, [&](beast::error_code e, std::size_t) {
        ec = e;
        done = true;
    });
    exchange.wait(done, [&] { socket.cancel(); }, "Read from " + url.host);
    if (ec) {
        throw TransportError("Read from " + url.host + ": " + ec.message());
    }

    // Connection is not reused
    beast::error_code ignored;
    socket.socket().shutdown(tcp::socket::shutdown_both, ignored);

    HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    response.body = std::move(res.body());
    return response;
}

} // anonymous namespace

// =============================================================================
// Url
// =============================================================================

Url Url::parse(const std::string& text) {
    Url url;

    size_t schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos) {
        throw ValidationError("URL without scheme: " + text);
    }
    url.scheme = text.substr(0, schemeEnd);
    if (url.scheme != "http" && url.scheme != "https") {
        throw ValidationError("Unsupported URL scheme: " + url.scheme);
    }

    size_t hostStart = schemeEnd + 3;
    size_t pathStart = text.find_first_of("/?", hostStart);
    std::string authority = text.substr(hostStart, pathStart == std::string::npos
                                                     ? std::string::npos
                                                     : pathStart - hostStart);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
    } else {
        url.host = authority;
        url.port = url.secure() ? "443" : "80";
    }
    if (url.host.empty()) {
        throw ValidationError("URL without host: " + text);
    }

    url.target = pathStart == std::string::npos ? "/" : text.substr(pathStart);
    if (url.target.front() == '?') {
        url.target = "/" + url.target;
    }
    return url;
}

// =============================================================================
// BeastHttpTransport
// =============================================================================

HttpResponse BeastHttpTransport::send(const HttpRequest& request) {
    Url url = Url::parse(request.url);

    http::request<http::string_body> req{toVerb(request.method), url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, "RainSight/1.0");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty()) {
        req.body() = request.body;
    }
    req.prepare_payload();

    Exchange exchange(request.timeout);

    tcp::resolver resolver(exchange.context());
    tcp::resolver::results_type endpoints;
    bool done = false;
    beast::error_code ec;
    resolver.async_resolve(url.host, url.port,
        [&](beast::error_code e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
            done = true;
        });
    exchange.wait(done, [&] { resolver.cancel(); }, "Resolve " + url.host);
    if (ec) {
        throw TransportError("Resolve " + url.host + ": " + ec.message());
    }

    LOG_DEBUG(request.method + " " + request.url);

    if (url.secure()) {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(exchange.context(), ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            throw TransportError("Cannot set SNI host name " + url.host);
        }
        stream.set_verify_callback(ssl::host_name_verification(url.host));
        return transact(exchange, stream, url, endpoints, req);
    }

    beast::tcp_stream stream(exchange.context());
    return transact(exchange, stream, url, endpoints, req);
}

// =============================================================================
// Query helpers
// =============================================================================

std::string urlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == ',') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string buildQuery(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += '&';
        query += urlEncode(key) + "=" + urlEncode(value);
    }
    return query;
}

} // namespace net
} // namespace rainsight
