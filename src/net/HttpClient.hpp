#pragma once

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace rainsight {
namespace net {

/**
 * Decomposed absolute URL (http or https)
 */
struct Url {
    std::string scheme;     // "http" | "https"
    std::string host;
    std::string port;       // defaults to 80 / 443
    std::string target;     // path + query, at least "/"

    bool secure() const { return scheme == "https"; }

    /**
     * Throws ValidationError on unsupported scheme or missing host
     */
    static Url parse(const std::string& url);
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * Blocking HTTP exchange
 *
 * Network failures (resolve, connect, TLS, timeout, read/write) throw
 * TransportError. Any HTTP status is returned as a response.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * Boost.Beast client, one connection per request
 *
 * Operations run asynchronously on a private io_context so the request
 * timeout bounds the whole exchange. HTTPS uses OpenSSL with SNI and
 * peer verification against the system trust store.
 */
class BeastHttpTransport : public IHttpTransport {
public:
    BeastHttpTransport() = default;

    HttpResponse send(const HttpRequest& request) override;
};

/**
 * Percent-encoding of a query component
 */
std::string urlEncode(const std::string& value);

/**
 * "a=1&b=2" from ordered key/value pairs
 */
std::string buildQuery(const std::vector<std::pair<std::string, std::string>>& params);

} // namespace net
} // namespace rainsight
