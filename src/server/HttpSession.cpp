#include "server/HttpSession.hpp"
#include "core/Errors.hpp"
#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"
#include <cctype>

namespace rainsight {
namespace server {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * Percent-decoding, '+' is a space. Malformed escapes are kept as is.
 */
std::string urlDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size()
                   && hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
            out += static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

void setCommonHeaders(http::response<http::string_body>& res) {
    res.set(http::field::server, "RainSight/1.0");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
}

// Création d'une réponse JSON
http::response<http::string_body> jsonResponse(http::status status, const json& body,
                                               unsigned version, bool keepAlive) {
    http::response<http::string_body> res{status, version};
    setCommonHeaders(res);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(keepAlive);
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

} // anonymous namespace

RequestTarget RequestTarget::parse(const std::string& target) {
    RequestTarget result;
    size_t q = target.find('?');
    result.path = target.substr(0, q);
    if (q == std::string::npos) {
        return result;
    }

    std::string query = target.substr(q + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = urlDecode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1));
            if (!key.empty()) {
                result.params[key] = value;
            }
        }
        pos = amp + 1;
    }
    return result;
}

HttpSession::HttpSession(tcp::socket socket)
    : m_stream(std::move(socket))
{
}

void HttpSession::run() {
    // Tout le travail de la session passe par le strand du socket
    net::dispatch(m_stream.get_executor(),
                  [self = shared_from_this()] { self->readNext(); });
}

void HttpSession::readNext() {
    m_parser.emplace();
    m_parser->body_limit(kMaxBodyBytes);
    m_stream.expires_after(kIdleTimeout);

    http::async_read(m_stream, m_buffer, *m_parser,
                     [self = shared_from_this()](beast::error_code ec, std::size_t) {
                         self->onRead(ec);
                     });
}

void HttpSession::onRead(beast::error_code ec) {
    if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
        return close();
    }
    if (ec == http::error::body_limit) {
        LOG_WARN("Request body over " + std::to_string(kMaxBodyBytes) + " bytes rejected");
        auto res = jsonResponse(http::status::payload_too_large,
                                json{{"status", "error"}, {"message", "Request body too large"}},
                                11, false);
        return write(std::move(res));
    }
    if (ec) {
        LOG_ERROR("Read error: " + ec.message());
        return;
    }

    auto res = handleRequest(m_parser->release());
    if (++m_served >= kMaxRequestsPerConnection) {
        res.keep_alive(false);
    }
    write(std::move(res));
}

void HttpSession::write(http::response<http::string_body> response) {
    auto res = std::make_shared<http::response<http::string_body>>(std::move(response));
    bool keepAlive = res->keep_alive();

    http::async_write(m_stream, *res,
                      [self = shared_from_this(), res, keepAlive](beast::error_code ec, std::size_t) {
                          if (ec) {
                              LOG_ERROR("Write error: " + ec.message());
                              return;
                          }
                          if (keepAlive) {
                              self->readNext();
                          } else {
                              self->close();
                          }
                      });
}

void HttpSession::close() {
    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

http::response<http::string_body> HttpSession::handleRequest(
    http::request<http::string_body>&& req)
{
    auto& handler = RequestHandler::instance();
    auto& logger = Logger::instance();
    std::string method(req.method_string());
    RequestTarget target = RequestTarget::parse(std::string(req.target()));

    RequestLog requestLog = logger.beginRequest(method, std::string(req.target()), req.body());

    auto reply = [&](const RouteResult& result) {
        auto res = jsonResponse(static_cast<http::status>(result.first), result.second,
                                req.version(), req.keep_alive());
        logger.endRequest(requestLog, result.first, res.body());
        return res;
    };

    // CORS preflight
    if (req.method() == http::verb::options) {
        http::response<http::string_body> res{http::status::no_content, req.version()};
        setCommonHeaders(res);
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        logger.endRequest(requestLog, 204, "");
        return res;
    }

    try {
        // GET /api/health
        if (req.method() == http::verb::get && target.path == "/api/health") {
            return reply(handler.handleHealth());
        }

        // POST /api/user_input
        if (req.method() == http::verb::post && target.path == "/api/user_input") {
            json requestBody;
            try {
                requestBody = json::parse(req.body());
            } catch (const json::parse_error& e) {
                return reply({400, json{{"status", "error"}, {"message", "Invalid JSON: " + std::string(e.what())}}});
            }
            return reply(handler.handleUserInput(requestBody));
        }

        // GET /api/chatbot_response?user_id=N
        if (req.method() == http::verb::get && target.path == "/api/chatbot_response") {
            return reply(handler.handleChatbotResponse(target.params));
        }

        // GET /api/forecast/latest?type=daily|monthly
        if (req.method() == http::verb::get && target.path == "/api/forecast/latest") {
            return reply(handler.handleLatestForecast(target.params));
        }

        // ============================================================
        // Chart refresh
        // ============================================================

        if (req.method() == http::verb::post && target.path == "/admin/update-weekly-chart") {
            return reply(handler.handleUpdateChart(forecast::Mode::Daily));
        }

        if (req.method() == http::verb::post && target.path == "/admin/update-monthly-chart") {
            return reply(handler.handleUpdateChart(forecast::Mode::Monthly));
        }

        // 404 Not Found
        return reply({404, json{{"status", "error"}, {"message", "Not found: " + target.path}}});

    } catch (const Error& e) {
        LOG_ERROR("Request failed (" + errorKindToString(e.kind()) + "): " + e.what());
        unsigned code = e.kind() == ErrorKind::Validation ? 400 : 500;
        return reply({code, json{{"status", "error"}, {"message", e.what()}}});
    } catch (const std::exception& e) {
        LOG_ERROR("Request failed: " + std::string(e.what()));
        return reply({500, json{{"status", "error"}, {"message", e.what()}}});
    }
}

} // namespace server
} // namespace rainsight
