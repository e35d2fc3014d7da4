// src/execution/grid_executor.cpp

#include "order_ngin/execution/grid_executor.hpp"
#include "order_ngin/core/logger.hpp"

namespace order_ngin {

void GridExecutor::cancel_open(PlanContext& ctx, OpenLegs& open) {
    for (const auto& [sequence_number, order_id] : open) {
        cancel_leg(ctx, sequence_number, order_id);
    }
    open.clear();
}

void GridExecutor::run(PlanContext& ctx) {
    if (!ctx.mark_running()) {
        return;
    }

    const auto& params = std::get<GridParams>(ctx.params());
    auto levels = GridPlanner::compute_levels(params);
    if (levels.is_error()) {
        ctx.finish(PlanStatus::FAILED, levels.error()->what());
        return;
    }

    INFO("Grid " << ctx.plan_id() << ": " << levels.value().size() << " levels from "
                 << params.start_price << " to " << params.end_price);

    OpenLegs open;
    size_t filled = 0;
    for (const auto& level : levels.value()) {
        if (ctx.is_cancelled()) {
            cancel_open(ctx, open);
            ctx.finish(PlanStatus::CANCELLED,
                       "Cancelled after placing " + std::to_string(level.index) + " levels");
            return;
        }

        PlacedLeg placed = place_leg_with_retry(ctx, OrderType::LIMIT, level.price, level.quantity);
        if (placed.state == LegState::FILLED) {
            ++filled;
            continue;
        }
        if (!placed.accepted() || placed.state != LegState::SUBMITTED) {
            if (ctx.is_cancelled()) {
                cancel_open(ctx, open);
                ctx.finish(PlanStatus::CANCELLED, "Cancelled while placing levels");
                return;
            }
            cancel_open(ctx, open);
            ctx.finish(PlanStatus::FAILED, "Level " + std::to_string(level.index) + " at " +
                                               std::to_string(level.price) +
                                               " failed: " + placed.error_message);
            return;
        }
        open.emplace(placed.sequence_number, placed.exchange_order_id);
    }

    const size_t total = levels.value().size();
    size_t closed = 0;
    while (!open.empty()) {
        if (ctx.wait_for(config_.status_poll_interval)) {
            cancel_open(ctx, open);
            ctx.finish(PlanStatus::CANCELLED, std::to_string(filled) + " of " +
                                                  std::to_string(total) + " levels filled");
            return;
        }

        for (auto it = open.begin(); it != open.end();) {
            const int sequence_number = it->first;
            auto status = query_status(ctx, it->second);
            if (status.is_error()) {
                if (is_transient_error(status.error()->code())) {
                    WARN("Grid " << ctx.plan_id() << " status check failed: "
                                 << status.error()->what());
                    ++it;
                    continue;
                }
                // Unknown to the venue, the level is over
                ctx.set_leg_state(sequence_number, LegState::REJECTED, status.error()->what());
                WARN("Grid " << ctx.plan_id() << " level leg " << sequence_number
                             << " lost at venue: " << status.error()->what());
                ++closed;
                it = open.erase(it);
                continue;
            }

            if (!apply_exchange_status(ctx, sequence_number, status.value())) {
                ++it;
                continue;
            }

            it = open.erase(it);
            if (status.value() == ExchangeOrderStatus::FILLED) {
                ++filled;
                INFO("Grid " << ctx.plan_id() << " level leg " << sequence_number << " FILLED ("
                             << filled << "/" << total << ")");
            } else {
                ++closed;
                WARN("Grid " << ctx.plan_id() << " level leg " << sequence_number
                             << " closed at venue: " << exchange_status_to_string(status.value()));
            }
        }
    }

    if (closed == 0) {
        ctx.finish(PlanStatus::COMPLETED, "All " + std::to_string(total) + " levels filled");
    } else {
        ctx.finish(PlanStatus::COMPLETED, std::to_string(filled) + " of " +
                                              std::to_string(total) + " levels filled, " +
                                              std::to_string(closed) + " closed at venue");
    }
}

}  // namespace order_ngin
