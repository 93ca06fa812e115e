#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace crimrag {
namespace net {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    unsigned status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

struct Url {
    std::string scheme;     // http | https
    std::string host;
    std::string port;
    std::string path;       // always begins with '/'

    // Throws std::invalid_argument on anything but http(s)://host[:port][/path]
    static Url parse(const std::string& url);
};

// Network failure before an HTTP status was received.
class HttpTransportError : public std::runtime_error {
public:
    HttpTransportError(const std::string& message, bool timed_out)
        : std::runtime_error(message), timed_out_(timed_out) {}

    bool timed_out() const noexcept { return timed_out_; }

private:
    bool timed_out_;
};

/**
 * Synchronous HTTP/1.1 client over Boost.Beast. One connection per request;
 * the whole exchange (resolve, connect, TLS handshake, write, read) must
 * finish within `timeout`. Safe to share between threads.
 */
class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient() = default;

    // Throws HttpTransportError on network failure or timeout. Non-2xx
    // statuses are returned, not thrown.
    virtual HttpResponse send_request(const std::string& method,
                                      const std::string& url,
                                      const std::string& body,
                                      const HttpHeaders& headers,
                                      std::chrono::milliseconds timeout);

    HttpResponse send_json(const std::string& method,
                           const std::string& url,
                           const boost::json::value& body,
                           const HttpHeaders& headers,
                           std::chrono::milliseconds timeout);

private:
    struct TlsContext;
    std::shared_ptr<TlsContext> tls_;
};

// base + "/" + path, without doubled slashes.
std::string join_url(const std::string& base, const std::string& path);

} // namespace net
} // namespace crimrag
