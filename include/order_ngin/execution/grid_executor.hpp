// include/order_ngin/execution/grid_executor.hpp
#pragma once

#include <map>
#include <string>
#include "order_ngin/execution/grid_planner.hpp"
#include "order_ngin/execution/plan_handler.hpp"

namespace order_ngin {

/**
 * @brief Places one resting limit leg per grid level and tracks them to completion
 *
 * All levels rest at once. The plan completes when every level leg is
 * terminal, including levels the venue closed without a fill. A level that
 * cannot be placed fails the plan after the placed levels are cancelled.
 */
class GridExecutor : public PlanHandler {
public:
    using PlanHandler::PlanHandler;

    std::string component_name() const override {
        return "GridExecutor";
    }

    void run(PlanContext& ctx) override;

private:
    // Open level legs, sequence number -> exchange order id
    using OpenLegs = std::map<int, std::string>;

    void cancel_open(PlanContext& ctx, OpenLegs& open);
};

}  // namespace order_ngin
