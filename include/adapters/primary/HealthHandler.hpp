#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IClock.hpp"

#include <nlohmann/json.hpp>
#include <memory>

namespace pricefetcher::adapters::primary {

/**
 * @brief GET /health
 *
 * Не обращается к провайдерам: 200 при любой доступности upstream.
 */
class HealthHandler : public IHttpHandler {
public:
    static constexpr const char* SERVICE_NAME = "WSB Price Fetcher";

    explicit HealthHandler(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = SERVICE_NAME;
        response["timestamp"] = clock_->nowSeconds();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace pricefetcher::adapters::primary
