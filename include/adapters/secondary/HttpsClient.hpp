#pragma once

#include <IHttpClient.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

namespace pricefetcher::adapters::secondary {

/**
 * @brief Ошибка транспорта: DNS, TCP, TLS, таймаут
 */
class HttpsClientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief IHttpClient поверх Boost.Beast + OpenSSL
 *
 * req.getIp() — имя хоста (SNI и проверка сертификата),
 * req.getPort() — порт, req.getPath() — request target.
 *
 * Каждый запрос ограничен timeout целиком: resolve, connect,
 * handshake, write и read. По истечении бросается HttpsClientError.
 * Любой HTTP статус считается успешным обменом (send возвращает true).
 */
class HttpsClient : public IHttpClient {
public:
    explicit HttpsClient(std::chrono::milliseconds timeout);

    bool send(const IRequest& req, IResponse& res) override;

private:
    std::chrono::milliseconds timeout_;
    boost::asio::ssl::context sslContext_;
};

} // namespace pricefetcher::adapters::secondary
