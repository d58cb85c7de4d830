#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <cstddef>
#include <string>

namespace rainsight {
namespace server {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * Serveur HTTP basé sur Boost.Beast
 *
 * Owns its io_context. run() blocks until stop() is called or the process
 * receives SIGINT/SIGTERM.
 */
class HttpServer {
public:
    /**
     * Bind and listen. Port 0 picks a free port, see port().
     * Throws ValidationError for a bad address, TransportError if the
     * endpoint cannot be bound.
     */
    HttpServer(const std::string& address, unsigned short port, size_t threads = 1);

    void run();

    /// Safe to call from any thread
    void stop();

    unsigned short port() const { return m_port; }
    uint64_t acceptedConnections() const { return m_accepted.load(); }

private:
    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);

    size_t m_threads;
    net::io_context m_ioc;
    tcp::acceptor m_acceptor;
    net::signal_set m_signals;
    unsigned short m_port = 0;
    std::atomic<bool> m_stopping{false};
    std::atomic<uint64_t> m_accepted{0};
};

} // namespace server
} // namespace rainsight
