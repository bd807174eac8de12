#pragma once

#include "settings/EnvReader.hpp"
#include "settings/IYahooClientSettings.hpp"
#include <string>

namespace pricefetcher::settings {

/**
 * @brief Настройки подключения к Yahoo Finance chart API
 *
 * Читает из ENV:
 * - YAHOO_HOST (default: "query1.finance.yahoo.com")
 * - YAHOO_PORT (default: 443)
 * - YAHOO_USER_AGENT (default: "WSB-Price-Fetcher/1.0")
 * - YAHOO_TIMEOUT_MS (default: 5000)
 */
class YahooClientSettings : public IYahooClientSettings {
public:
    YahooClientSettings() {
        if (auto host = readEnv("YAHOO_HOST")) {
            host_ = *host;
        }
        int port = readEnvInt("YAHOO_PORT", port_);
        if (port > 0 && port <= 65535) {
            port_ = port;
        }
        if (auto agent = readEnv("YAHOO_USER_AGENT")) {
            userAgent_ = *agent;
        }
        int timeout = readEnvInt("YAHOO_TIMEOUT_MS", static_cast<int>(timeout_.count()));
        if (timeout > 0) {
            timeout_ = std::chrono::milliseconds(timeout);
        }
    }

    std::string getHost() const override { return host_; }
    int getPort() const override { return port_; }
    std::string getUserAgent() const override { return userAgent_; }
    std::chrono::milliseconds getTimeout() const override { return timeout_; }

private:
    std::string host_ = "query1.finance.yahoo.com";
    int port_ = 443;
    std::string userAgent_ = "WSB-Price-Fetcher/1.0";
    std::chrono::milliseconds timeout_{5000};
};

} // namespace pricefetcher::settings
