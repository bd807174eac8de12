#pragma once

#include "adapters/primary/ResponseUtils.hpp"

#include <IHttpHandler.hpp>
#include <iostream>
#include <memory>

namespace pricefetcher::adapters::primary
{

    /**
     * @brief Декоратор: CORS заголовки и граница ошибок
     *
     * Разрешены все origins, methods и headers.
     * Исключение из inner handler превращается в 500 INTERNAL_ERROR.
     * Заголовки ставятся после inner handler, чтобы их нельзя было потерять.
     */
    class CorsHandler : public IHttpHandler
    {
    public:
        explicit CorsHandler(std::shared_ptr<IHttpHandler> inner)
            : inner_(std::move(inner))
        {}

        void handle(IRequest &req, IResponse &res) override
        {
            try
            {
                inner_->handle(req, res);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CorsHandler] Unhandled error on " << req.getMethod() << " "
                          << req.getPath() << ": " << e.what() << std::endl;
                sendError(res, 500, "INTERNAL_ERROR", "Internal server error");
            }
            applyHeaders(res);
        }

        static void applyHeaders(IResponse &res)
        {
            res.setHeader("Access-Control-Allow-Origin", "*");
            res.setHeader("Access-Control-Allow-Methods", "*");
            res.setHeader("Access-Control-Allow-Headers", "*");
        }

    private:
        std::shared_ptr<IHttpHandler> inner_;
    };

    /**
     * @brief OPTIONS на маршрут — CORS preflight, 204 без тела
     */
    class PreflightHandler : public IHttpHandler
    {
    public:
        void handle(IRequest &req, IResponse &res) override
        {
            res.setStatus(204);
            res.setHeader("Access-Control-Max-Age", "86400");
            res.setBody("");
        }
    };

} // namespace pricefetcher::adapters::primary
