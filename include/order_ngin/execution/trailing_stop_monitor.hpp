// include/order_ngin/execution/trailing_stop_monitor.hpp
#pragma once

#include <string>
#include "order_ngin/execution/plan_handler.hpp"

namespace order_ngin {

/**
 * @brief Keeps one stop order trailing the best price seen
 *
 * A SELL stop trails below the highest price, a BUY stop above the lowest.
 * Re-arming cancels the live stop first and places the replacement only once
 * the cancel is confirmed, so at most one stop is ever live.
 */
class TrailingStopMonitor : public PlanHandler {
public:
    using PlanHandler::PlanHandler;

    std::string component_name() const override {
        return "TrailingStopMonitor";
    }

    void run(PlanContext& ctx) override;

    /**
     * @brief Stop price implied by the best price seen
     */
    static Price stop_price_for(Side side, Price best_price, const TrailingStopParams& params);

    /**
     * @brief True if `price` is a better extreme than `best` for the side
     */
    static bool improves_best(Side side, Price price, Price best);

private:
    struct LiveStop {
        int sequence_number{0};
        std::string exchange_order_id;
        Price stop_price{0.0};
    };

    enum class ArmResult { ARMED, FILLED, FAILED };

    ArmResult arm(PlanContext& ctx, Price stop_price, Quantity quantity, LiveStop& live,
                  std::string& failure);
};

}  // namespace order_ngin
