#include "server/HttpServer.hpp"
#include "server/HttpSession.hpp"
#include "server/Logger.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <csignal>
#include <thread>
#include <vector>

namespace rainsight {
namespace server {

HttpServer::HttpServer(const std::string& address, unsigned short port, size_t threads)
    : m_threads(std::max<size_t>(threads, 1))
    , m_ioc(static_cast<int>(m_threads))
    , m_acceptor(net::make_strand(m_ioc))
    , m_signals(m_ioc, SIGINT, SIGTERM)
{
    beast::error_code ec;
    auto ip = net::ip::make_address(address, ec);
    if (ec) {
        throw ValidationError("Invalid listen address '" + address + "': " + ec.message());
    }
    tcp::endpoint endpoint(ip, port);
    std::string where = address + ":" + std::to_string(port);

    m_acceptor.open(endpoint.protocol(), ec);
    if (!ec) m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) m_acceptor.bind(endpoint, ec);
    if (!ec) m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw TransportError("Cannot listen on " + where + ": " + ec.message());
    }

    m_port = m_acceptor.local_endpoint().port();
    LOG_INFO("Server listening on http://" + address + ":" + std::to_string(m_port));
}

void HttpServer::run() {
    m_signals.async_wait([this](beast::error_code ec, int signal) {
        if (!ec) {
            LOG_INFO("Signal " + std::to_string(signal) + " received, shutting down");
            stop();
        }
    });

    doAccept();

    // Le thread appelant sert aussi la boucle d'événements
    std::vector<std::thread> extra;
    extra.reserve(m_threads - 1);
    for (size_t i = 1; i < m_threads; ++i) {
        extra.emplace_back([this] { m_ioc.run(); });
    }
    m_ioc.run();
    for (auto& t : extra) {
        t.join();
    }
    LOG_INFO("Server stopped after " + std::to_string(m_accepted.load()) + " connection(s)");
}

void HttpServer::stop() {
    if (m_stopping.exchange(true)) return;

    net::post(m_acceptor.get_executor(), [this] {
        beast::error_code ec;
        m_acceptor.close(ec);
        m_signals.cancel(ec);
        m_ioc.stop();
    });
}

void HttpServer::doAccept() {
    m_acceptor.async_accept(
        net::make_strand(m_ioc),
        beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec != net::error::operation_aborted) {
            LOG_WARN("Accept error: " + ec.message());
        }
    } else {
        ++m_accepted;
        std::make_shared<HttpSession>(std::move(socket))->run();
    }

    if (!m_stopping.load() && m_acceptor.is_open()) {
        doAccept();
    }
}

} // namespace server
} // namespace rainsight
