// include/order_ngin/execution/oco_coordinator.hpp
#pragma once

#include <string>
#include <vector>
#include "order_ngin/execution/plan_handler.hpp"

namespace order_ngin {

/**
 * @brief One-cancels-other pair of a stop leg and a limit leg
 *
 * For a SELL the stop sits below the market and the limit above it, for a
 * BUY the other way round. The first leg to fill cancels its sibling.
 */
class OcoCoordinator : public PlanHandler {
public:
    using PlanHandler::PlanHandler;

    std::string component_name() const override {
        return "OcoCoordinator";
    }

    void run(PlanContext& ctx) override;

    /**
     * @brief True if the stop and limit prices sit on the correct sides for `side`
     */
    static bool prices_ordered(Side side, Price stop_price, Price limit_price);

private:
    struct Sibling {
        int sequence_number{0};
        std::string exchange_order_id;
        LegState state{LegState::SUBMITTED};
    };

    void refresh(PlanContext& ctx, Sibling& sibling);
};

}  // namespace order_ngin
