#include "adapters/secondary/HttpsClient.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <iostream>
#include <memory>
#include <optional>

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace pricefetcher::adapters::secondary {

namespace {

/**
 * @brief Один GET/POST обмен: resolve -> connect -> handshake -> write -> read
 *
 * Живёт, пока на него ссылаются незавершённые handlers.
 */
class HttpsExchange : public std::enable_shared_from_this<HttpsExchange> {
public:
    HttpsExchange(net::io_context& ioc, ssl::context& ctx, std::chrono::milliseconds timeout)
        : resolver_(ioc)
        , stream_(ioc, ctx)
        , timeout_(timeout)
    {}

    void start(const std::string& host, int port, bhttp::request<bhttp::string_body> request) {
        host_ = host;
        request_ = std::move(request);

        if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            fail("sni", ec);
            return;
        }
        stream_.set_verify_callback(ssl::host_name_verification(host_));

        resolver_.async_resolve(host_, std::to_string(port),
            beast::bind_front_handler(&HttpsExchange::onResolve, shared_from_this()));
    }

    void cancel() {
        resolver_.cancel();
        beast::get_lowest_layer(stream_).cancel();
    }

    bool finished() const { return finished_; }
    const std::optional<std::string>& error() const { return error_; }
    const bhttp::response<bhttp::string_body>& response() const { return response_; }

private:
    tcp::resolver resolver_;
    beast::ssl_stream<beast::tcp_stream> stream_;
    std::chrono::milliseconds timeout_;
    std::string host_;
    beast::flat_buffer buffer_;
    bhttp::request<bhttp::string_body> request_;
    bhttp::response<bhttp::string_body> response_;
    bool finished_ = false;
    std::optional<std::string> error_;

    void fail(const char* stage, const beast::error_code& ec) {
        finished_ = true;
        error_ = std::string(stage) + " " + host_ + ": " + ec.message();
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail("resolve", ec);

        beast::get_lowest_layer(stream_).expires_after(timeout_);
        beast::get_lowest_layer(stream_).async_connect(results,
            beast::bind_front_handler(&HttpsExchange::onConnect, shared_from_this()));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail("connect", ec);

        beast::get_lowest_layer(stream_).expires_after(timeout_);
        stream_.async_handshake(ssl::stream_base::client,
            beast::bind_front_handler(&HttpsExchange::onHandshake, shared_from_this()));
    }

    void onHandshake(beast::error_code ec) {
        if (ec) return fail("handshake", ec);

        beast::get_lowest_layer(stream_).expires_after(timeout_);
        bhttp::async_write(stream_, request_,
            beast::bind_front_handler(&HttpsExchange::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) return fail("write", ec);

        bhttp::async_read(stream_, buffer_, response_,
            beast::bind_front_handler(&HttpsExchange::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) return fail("read", ec);

        // TLS shutdown не ждём: тело уже прочитано
        finished_ = true;
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
    }
};

} // namespace

HttpsClient::HttpsClient(std::chrono::milliseconds timeout)
    : timeout_(timeout)
    , sslContext_(ssl::context::tls_client)
{
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(ssl::verify_peer);
}

bool HttpsClient::send(const IRequest& req, IResponse& res)
{
    const std::string host = req.getIp();
    const int port = req.getPort();

    bhttp::request<bhttp::string_body> request;
    request.method_string(req.getMethod());
    request.target(req.getPath());
    request.version(11);
    request.set(bhttp::field::host, host);
    request.set(bhttp::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto& [name, value] : req.getHeaders()) {
        request.set(name, value);
    }
    const std::string body = req.getBody();
    if (!body.empty()) {
        request.body() = body;
        request.prepare_payload();
    }

    net::io_context ioc;
    auto exchange = std::make_shared<HttpsExchange>(ioc, sslContext_, timeout_);
    exchange->start(host, port, std::move(request));

    ioc.run_for(timeout_);

    if (!exchange->finished()) {
        // Дожидаемся отмены, чтобы handlers не пережили io_context
        exchange->cancel();
        ioc.restart();
        ioc.run();
        throw HttpsClientError("Request to " + host + ":" + std::to_string(port) +
                               " timed out after " + std::to_string(timeout_.count()) + " ms");
    }

    if (exchange->error()) {
        throw HttpsClientError(*exchange->error());
    }

    const auto& response = exchange->response();
    res.setStatus(static_cast<int>(response.result_int()));
    for (const auto& field : response) {
        res.setHeader(std::string(field.name_string()), std::string(field.value()));
    }
    res.setBody(response.body());
    return true;
}

} // namespace pricefetcher::adapters::secondary
