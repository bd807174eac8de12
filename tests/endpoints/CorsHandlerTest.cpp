#include <gtest/gtest.h>

#include "adapters/primary/CorsHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "mocks/FixedClock.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace pricefetcher;
using namespace pricefetcher::adapters::primary;

namespace {

class ThrowingHandler : public IHttpHandler {
public:
    void handle(IRequest&, IResponse&) override {
        throw std::runtime_error("boom");
    }
};

void expectCorsHeaders(const SimpleResponse& res) {
    EXPECT_EQ(res.getHeader("Access-Control-Allow-Origin").value_or(""), "*");
    EXPECT_EQ(res.getHeader("Access-Control-Allow-Methods").value_or(""), "*");
    EXPECT_EQ(res.getHeader("Access-Control-Allow-Headers").value_or(""), "*");
}

SimpleRequest createRequest(const std::string& method, const std::string& path) {
    SimpleRequest req;
    req.setMethod(method);
    req.setPath(path);
    return req;
}

} // namespace

// ============================================================================
// CorsHandler
// ============================================================================

TEST(CorsHandlerTest, SuccessfulResponse_HasCorsHeaders) {
    CorsHandler handler(std::make_shared<HealthHandler>(std::make_shared<tests::FixedClock>()));

    auto req = createRequest("GET", "/health");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    expectCorsHeaders(res);
}

TEST(CorsHandlerTest, InnerException_Returns500WithCorsHeaders) {
    CorsHandler handler(std::make_shared<ThrowingHandler>());

    auto req = createRequest("GET", "/prices");
    SimpleResponse res;
    EXPECT_NO_THROW(handler.handle(req, res));

    EXPECT_EQ(res.getStatus(), 500);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "INTERNAL_ERROR");
    EXPECT_EQ(json["message"], "Internal server error");
    EXPECT_EQ(res.getBody().find("boom"), std::string::npos);
    expectCorsHeaders(res);
}

// ============================================================================
// PreflightHandler
// ============================================================================

TEST(CorsHandlerTest, Preflight_Returns204WithMaxAge) {
    CorsHandler handler(std::make_shared<PreflightHandler>());

    auto req = createRequest("OPTIONS", "/price/AAPL");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 204);
    EXPECT_TRUE(res.getBody().empty());
    EXPECT_EQ(res.getHeader("Access-Control-Max-Age").value_or(""), "86400");
    expectCorsHeaders(res);
}
