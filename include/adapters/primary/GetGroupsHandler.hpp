#pragma once

#include "ports/input/IStockGroupService.hpp"

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <memory>

namespace pricefetcher::adapters::primary {

/**
 * @brief GET /groups — популярные группы тикеров для UI
 *
 * {"tech": {"name": "Tech Giants", "symbols": [...], "description": "..."}, ...}
 */
class GetGroupsHandler : public IHttpHandler {
public:
    explicit GetGroupsHandler(std::shared_ptr<ports::input::IStockGroupService> groups)
        : groups_(std::move(groups)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response = nlohmann::json::object();
        for (const auto& group : groups_->getGroups()) {
            response[group.id] = {
                {"name", group.name},
                {"symbols", group.symbols},
                {"description", group.description}
            };
        }

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::IStockGroupService> groups_;
};

} // namespace pricefetcher::adapters::primary
