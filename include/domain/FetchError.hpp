#pragma once

#include <stdexcept>
#include <string>

namespace pricefetcher::domain {

/**
 * @brief Ошибка получения котировки от провайдера
 *
 * Терминальна для запроса: повторов нет.
 * what() содержит человекочитаемую причину, которая попадает в ответ клиенту.
 */
class FetchError : public std::runtime_error {
public:
    enum class Kind {
        UpstreamUnreachable,    ///< Сеть, DNS, TLS, таймаут
        UpstreamHttpError,      ///< Ответ не 2xx
        MalformedPayload,       ///< Тело не JSON или нет chart.result[0].meta
        MissingField            ///< Нет regularMarketPrice
    };

    FetchError(Kind kind, const std::string& message, int httpStatus = 0)
        : std::runtime_error(message), kind_(kind), httpStatus_(httpStatus) {}

    static FetchError unreachable(const std::string& reason) {
        return FetchError(Kind::UpstreamUnreachable, reason);
    }

    static FetchError httpError(int status) {
        return FetchError(Kind::UpstreamHttpError, "HTTP error: " + std::to_string(status), status);
    }

    static FetchError malformed(const std::string& reason) {
        return FetchError(Kind::MalformedPayload, reason);
    }

    static FetchError missingField(const std::string& reason) {
        return FetchError(Kind::MissingField, reason);
    }

    Kind kind() const { return kind_; }

    /// Статус upstream-ответа, 0 если ошибка не HTTP
    int httpStatus() const { return httpStatus_; }

private:
    Kind kind_;
    int httpStatus_;
};

inline std::string toString(FetchError::Kind kind) {
    switch (kind) {
        case FetchError::Kind::UpstreamUnreachable: return "UPSTREAM_UNREACHABLE";
        case FetchError::Kind::UpstreamHttpError: return "UPSTREAM_HTTP_ERROR";
        case FetchError::Kind::MalformedPayload: return "MALFORMED_PAYLOAD";
        case FetchError::Kind::MissingField: return "MISSING_FIELD";
    }
    return "UNKNOWN";
}

} // namespace pricefetcher::domain
