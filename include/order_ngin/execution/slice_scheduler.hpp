// include/order_ngin/execution/slice_scheduler.hpp
#pragma once

#include <string>
#include <vector>
#include "order_ngin/execution/plan_handler.hpp"

namespace order_ngin {

/**
 * @brief TWAP execution: one market leg per interval
 *
 * Slice i fires at start + i * duration / intervals. The scheduler sleeps on
 * the plan's cancellation token between slices, so a cancel stops it at the
 * next wake-up without another leg being sent.
 */
class SliceScheduler : public PlanHandler {
public:
    using PlanHandler::PlanHandler;

    std::string component_name() const override {
        return "TwapScheduler";
    }

    void run(PlanContext& ctx) override;

    /**
     * @brief Slice quantities for a TWAP order
     *
     * All slices but the last are floor(total / intervals) in lot units; the
     * last takes the remainder so the slices sum to the total.
     * @return INVALID_PLAN if intervals < 1, total <= 0 or a slice would fall
     *         below one lot
     */
    static Result<std::vector<Quantity>> plan_slices(Quantity total_quantity, int intervals,
                                                     Quantity lot_size = 0.0);

private:
    enum class SliceOutcome { FILLED, FAILED, CANCELLED };

    SliceOutcome execute_slice(PlanContext& ctx, int index, Quantity quantity,
                               std::string& failure);
};

}  // namespace order_ngin
