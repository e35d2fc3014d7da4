// src/execution/trailing_stop_monitor.cpp

#include "order_ngin/execution/trailing_stop_monitor.hpp"
#include "order_ngin/core/logger.hpp"

namespace order_ngin {

Price TrailingStopMonitor::stop_price_for(Side side, Price best_price,
                                          const TrailingStopParams& params) {
    const double offset = params.trail_mode == TrailMode::RATE
                              ? best_price * params.trail_value / 100.0
                              : params.trail_value;
    return side == Side::SELL ? best_price - offset : best_price + offset;
}

bool TrailingStopMonitor::improves_best(Side side, Price price, Price best) {
    return side == Side::SELL ? price > best : price < best;
}

TrailingStopMonitor::ArmResult TrailingStopMonitor::arm(PlanContext& ctx, Price stop_price,
                                                        Quantity quantity, LiveStop& live,
                                                        std::string& failure) {
    PlacedLeg placed = place_leg_with_retry(ctx, OrderType::STOP, stop_price, quantity);
    if (placed.state == LegState::FILLED) {
        ctx.arm_stop(placed.sequence_number, stop_price);
        return ArmResult::FILLED;
    }
    if (!placed.accepted() || placed.state != LegState::SUBMITTED) {
        failure = "Stop at " + std::to_string(stop_price) + " not placed: " +
                  placed.error_message;
        return ArmResult::FAILED;
    }

    live.sequence_number = placed.sequence_number;
    live.exchange_order_id = placed.exchange_order_id;
    live.stop_price = stop_price;
    ctx.arm_stop(placed.sequence_number, stop_price);
    return ArmResult::ARMED;
}

void TrailingStopMonitor::run(PlanContext& ctx) {
    if (!ctx.mark_running()) {
        return;
    }

    const auto& params = std::get<TrailingStopParams>(ctx.params());
    const Side side = ctx.side();

    auto initial_price = query_price(ctx);
    if (initial_price.is_error()) {
        ctx.finish(PlanStatus::FAILED,
                   std::string("Could not read price: ") + initial_price.error()->what());
        return;
    }

    Price best = initial_price.value();
    ctx.set_best_price(best);

    LiveStop live;
    std::string failure;
    switch (arm(ctx, stop_price_for(side, best, params), params.quantity, live, failure)) {
        case ArmResult::FILLED:
            ctx.finish(PlanStatus::COMPLETED, "Stop filled on placement");
            return;
        case ArmResult::FAILED:
            ctx.finish(ctx.is_cancelled() ? PlanStatus::CANCELLED : PlanStatus::FAILED, failure);
            return;
        case ArmResult::ARMED:
            break;
    }
    INFO("Trailing stop " << ctx.plan_id() << " armed at " << live.stop_price << " (best "
                          << best << ")");

    while (true) {
        if (ctx.wait_for(config_.trailing_poll_interval)) {
            CancelOutcome outcome = cancel_leg(ctx, live.sequence_number, live.exchange_order_id);
            if (outcome == CancelOutcome::ALREADY_FILLED) {
                ctx.finish(PlanStatus::COMPLETED, "Stop filled at " +
                                                      std::to_string(live.stop_price));
            } else {
                ctx.finish(PlanStatus::CANCELLED,
                           outcome == CancelOutcome::UNCONFIRMED
                               ? "Cancel of stop " + live.exchange_order_id + " unconfirmed"
                               : "");
            }
            return;
        }

        auto status = query_status(ctx, live.exchange_order_id);
        if (status.is_ok()) {
            if (apply_exchange_status(ctx, live.sequence_number, status.value())) {
                if (status.value() == ExchangeOrderStatus::FILLED) {
                    INFO("Trailing stop " << ctx.plan_id() << " triggered at "
                                          << live.stop_price);
                    ctx.finish(PlanStatus::COMPLETED,
                               "Stop filled at " + std::to_string(live.stop_price));
                } else {
                    ctx.finish(PlanStatus::FAILED,
                               "Stop order " + live.exchange_order_id + " closed at venue: " +
                                   exchange_status_to_string(status.value()));
                }
                return;
            }
        } else if (!is_transient_error(status.error()->code())) {
            ctx.set_leg_state(live.sequence_number, LegState::REJECTED, status.error()->what());
            ctx.finish(PlanStatus::FAILED, std::string("Stop order lost: ") +
                                               status.error()->what());
            return;
        }

        auto price = query_price(ctx);
        if (price.is_error()) {
            WARN("Trailing stop " << ctx.plan_id() << " price check failed: "
                                  << price.error()->what());
            continue;
        }

        if (improves_best(side, price.value(), best)) {
            best = price.value();
            ctx.set_best_price(best);
        }

        const Price candidate = stop_price_for(side, best, params);
        const double improvement =
            side == Side::SELL ? candidate - live.stop_price : live.stop_price - candidate;
        if (improvement <= params.rearm_threshold) {
            continue;
        }

        CancelOutcome outcome = cancel_leg(ctx, live.sequence_number, live.exchange_order_id);
        if (outcome == CancelOutcome::ALREADY_FILLED) {
            ctx.finish(PlanStatus::COMPLETED,
                       "Stop filled at " + std::to_string(live.stop_price) + " before re-arm");
            return;
        }
        if (outcome == CancelOutcome::UNCONFIRMED) {
            // Old stop stays armed, try again next tick
            continue;
        }

        const Price previous = live.stop_price;
        switch (arm(ctx, candidate, params.quantity, live, failure)) {
            case ArmResult::FILLED:
                ctx.finish(PlanStatus::COMPLETED, "Replacement stop filled on placement");
                return;
            case ArmResult::FAILED:
                // The old stop is already gone, no stop is live
                ctx.finish(ctx.is_cancelled() ? PlanStatus::CANCELLED : PlanStatus::FAILED,
                           failure);
                return;
            case ArmResult::ARMED:
                INFO("Trailing stop " << ctx.plan_id() << " re-armed " << previous << " -> "
                                      << live.stop_price << " (best " << best << ")");
                break;
        }
    }
}

}  // namespace order_ngin
