#pragma once

#include <chrono>
#include <string>

namespace pricefetcher::settings {

class IYahooClientSettings {
public:
    virtual ~IYahooClientSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual std::string getUserAgent() const = 0;
    virtual std::chrono::milliseconds getTimeout() const = 0;
};

} // namespace pricefetcher::settings
