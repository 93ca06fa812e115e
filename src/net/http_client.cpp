#include "crimrag/net/http_client.hpp"
#include "crimrag/logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <optional>

namespace crimrag {
namespace net {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

// One request/response exchange driven by an io_context owned by the caller.
class Exchange : public std::enable_shared_from_this<Exchange> {
public:
    Exchange(asio::io_context& ioc,
             ssl::context& tls,
             Url url,
             http::request<http::string_body> request,
             std::chrono::steady_clock::time_point deadline)
        : resolver_(ioc),
          url_(std::move(url)),
          request_(std::move(request)),
          deadline_(deadline) {
        if (url_.scheme == "https") {
            secure_.emplace(ioc, tls);
        } else {
            plain_.emplace(ioc);
        }
    }

    void start() {
        if (secure_) {
            if (!SSL_set_tlsext_host_name(secure_->native_handle(), url_.host.c_str())) {
                finish(beast::error_code(static_cast<int>(::ERR_get_error()),
                                         asio::error::get_ssl_category()));
                return;
            }
            secure_->set_verify_callback(ssl::host_name_verification(url_.host));
        }
        resolver_.async_resolve(url_.host, url_.port,
                                beast::bind_front_handler(&Exchange::on_resolve, shared_from_this()));
    }

    void cancel() {
        resolver_.cancel();
        beast::error_code ignored;
        lowest().socket().close(ignored);
    }

    bool finished() const { return finished_; }
    const beast::error_code& error() const { return error_; }
    http::response<http::string_body>& response() { return response_; }

private:
    beast::tcp_stream& lowest() {
        return secure_ ? beast::get_lowest_layer(*secure_) : *plain_;
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return finish(ec);
        }
        lowest().expires_at(deadline_);
        lowest().async_connect(results,
                               beast::bind_front_handler(&Exchange::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            return finish(ec);
        }
        if (secure_) {
            lowest().expires_at(deadline_);
            secure_->async_handshake(ssl::stream_base::client,
                                     beast::bind_front_handler(&Exchange::on_handshake, shared_from_this()));
        } else {
            write();
        }
    }

    void on_handshake(beast::error_code ec) {
        if (ec) {
            return finish(ec);
        }
        write();
    }

    void write() {
        lowest().expires_at(deadline_);
        auto handler = beast::bind_front_handler(&Exchange::on_write, shared_from_this());
        if (secure_) {
            http::async_write(*secure_, request_, std::move(handler));
        } else {
            http::async_write(*plain_, request_, std::move(handler));
        }
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            return finish(ec);
        }
        auto handler = beast::bind_front_handler(&Exchange::on_read, shared_from_this());
        if (secure_) {
            http::async_read(*secure_, buffer_, response_, std::move(handler));
        } else {
            http::async_read(*plain_, buffer_, response_, std::move(handler));
        }
    }

    void on_read(beast::error_code ec, std::size_t) {
        finish(ec);
        // not_connected can happen here; the response is already complete
        beast::error_code ignored;
        lowest().socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    void finish(beast::error_code ec) {
        error_ = ec;
        finished_ = true;
    }

    tcp::resolver resolver_;
    std::optional<beast::tcp_stream> plain_;
    std::optional<beast::ssl_stream<beast::tcp_stream>> secure_;
    Url url_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    beast::flat_buffer buffer_;
    std::chrono::steady_clock::time_point deadline_;
    beast::error_code error_;
    bool finished_ = false;
};

} // namespace

Url Url::parse(const std::string& url) {
    Url result;
    std::string rest;
    if (url.rfind("http://", 0) == 0) {
        result.scheme = "http";
        result.port = "80";
        rest = url.substr(7);
    } else if (url.rfind("https://", 0) == 0) {
        result.scheme = "https";
        result.port = "443";
        rest = url.substr(8);
    } else {
        throw std::invalid_argument("unsupported URL scheme: " + url);
    }

    const auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    result.path = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        result.port = authority.substr(colon + 1);
        authority.resize(colon);
        if (result.port.empty() ||
            result.port.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("invalid port in URL: " + url);
        }
    }
    if (authority.empty()) {
        throw std::invalid_argument("missing host in URL: " + url);
    }
    result.host = authority;
    return result;
}

std::string join_url(const std::string& base, const std::string& path) {
    std::string left = base;
    while (!left.empty() && left.back() == '/') {
        left.pop_back();
    }
    std::size_t skip = 0;
    while (skip < path.size() && path[skip] == '/') {
        ++skip;
    }
    return left + "/" + path.substr(skip);
}

struct HttpClient::TlsContext {
    ssl::context context{ssl::context::tls_client};
};

HttpClient::HttpClient()
    : tls_(std::make_shared<TlsContext>()) {
    tls_->context.set_default_verify_paths();
    tls_->context.set_verify_mode(ssl::verify_peer);
}

HttpResponse HttpClient::send_request(const std::string& method,
                                      const std::string& url,
                                      const std::string& body,
                                      const HttpHeaders& headers,
                                      std::chrono::milliseconds timeout) {
    Url target;
    try {
        target = Url::parse(url);
    } catch (const std::invalid_argument& e) {
        throw HttpTransportError(e.what(), false);
    }

    const http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown) {
        throw HttpTransportError("unsupported HTTP method: " + method, false);
    }

    http::request<http::string_body> request{verb, target.path, 11};
    request.set(http::field::host, target.host);
    request.set(http::field::user_agent, "crimrag/" BOOST_BEAST_VERSION_STRING);
    if (!body.empty()) {
        request.set(http::field::content_type, "application/json");
    }
    for (const auto& [name, value] : headers) {
        request.set(name, value);
    }
    request.body() = body;
    request.prepare_payload();

    LOG_DEBUG("Sending HTTP " + method + " request to " + url);

    asio::io_context ioc;
    auto exchange = std::make_shared<Exchange>(ioc, tls_->context, target, std::move(request),
                                               std::chrono::steady_clock::now() + timeout);
    exchange->start();
    ioc.run_for(timeout);

    if (!exchange->finished()) {
        exchange->cancel();
        ioc.restart();
        ioc.run();
        throw HttpTransportError("request to " + url + " timed out after " +
                                 std::to_string(timeout.count()) + " ms", true);
    }
    if (exchange->error()) {
        const bool timed_out = exchange->error() == beast::error::timeout;
        throw HttpTransportError("request to " + url + " failed: " + exchange->error().message(),
                                 timed_out);
    }

    HttpResponse response;
    response.status = exchange->response().result_int();
    response.body = std::move(exchange->response().body());
    LOG_DEBUG("HTTP " + std::to_string(response.status) + " from " + url);
    return response;
}

HttpResponse HttpClient::send_json(const std::string& method,
                                   const std::string& url,
                                   const boost::json::value& body,
                                   const HttpHeaders& headers,
                                   std::chrono::milliseconds timeout) {
    return send_request(method, url, boost::json::serialize(body), headers, timeout);
}

} // namespace net
} // namespace crimrag
