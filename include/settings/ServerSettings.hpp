#pragma once

#include "settings/EnvReader.hpp"
#include <settings/IServerSettings.hpp>
#include <cstdint>
#include <string>

namespace pricefetcher::settings {

/**
 * @brief Настройки HTTP сервера
 *
 * Читает из ENV:
 * - SERVER_HOST (default: "0.0.0.0")
 * - SERVER_PORT или PORT (default: 3000)
 */
class ServerSettings : public IServerSettings {
public:
    ServerSettings() {
        if (auto host = readEnv("SERVER_HOST")) {
            host_ = *host;
        }

        int port = readEnvInt("PORT", port_);
        port = readEnvInt("SERVER_PORT", port);
        if (port > 0 && port <= 65535) {
            port_ = static_cast<uint16_t>(port);
        }
    }

    std::string getHost() const override { return host_; }
    uint16_t getPort() const override { return port_; }

private:
    std::string host_ = "0.0.0.0";
    uint16_t port_ = 3000;
};

} // namespace pricefetcher::settings
