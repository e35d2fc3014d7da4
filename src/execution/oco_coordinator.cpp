// src/execution/oco_coordinator.cpp

#include "order_ngin/execution/oco_coordinator.hpp"
#include <algorithm>
#include "order_ngin/core/logger.hpp"

namespace order_ngin {

namespace {

// Resting or filled; an ack the venue closed on the spot does not count
bool placed_live(const PlacedLeg& leg) {
    return leg.accepted() && (leg.state == LegState::SUBMITTED || leg.state == LegState::FILLED);
}

std::string placement_failure(const PlacedLeg& leg) {
    if (leg.accepted()) {
        return leg.exchange_order_id + " closed on placement (" +
               leg_state_to_string(leg.state) + ")";
    }
    return leg.error_message;
}

}  // namespace

bool OcoCoordinator::prices_ordered(Side side, Price stop_price, Price limit_price) {
    if (side == Side::SELL) {
        return stop_price < limit_price;
    }
    if (side == Side::BUY) {
        return limit_price < stop_price;
    }
    return false;
}

void OcoCoordinator::refresh(PlanContext& ctx, Sibling& sibling) {
    auto status = query_status(ctx, sibling.exchange_order_id);
    if (status.is_error()) {
        if (is_transient_error(status.error()->code())) {
            WARN("OCO " << ctx.plan_id() << " status check failed: " << status.error()->what());
            return;
        }
        ctx.set_leg_state(sibling.sequence_number, LegState::REJECTED, status.error()->what());
        sibling.state = LegState::REJECTED;
        return;
    }

    if (!apply_exchange_status(ctx, sibling.sequence_number, status.value())) {
        return;
    }
    switch (status.value()) {
        case ExchangeOrderStatus::FILLED:
            sibling.state = LegState::FILLED;
            INFO("OCO " << ctx.plan_id() << " leg " << sibling.sequence_number << " ("
                        << sibling.exchange_order_id << ") FILLED");
            break;
        case ExchangeOrderStatus::REJECTED:
            sibling.state = LegState::REJECTED;
            break;
        default:
            sibling.state = LegState::CANCELLED;
            break;
    }
}

void OcoCoordinator::run(PlanContext& ctx) {
    if (!ctx.mark_running()) {
        return;
    }

    const auto& params = std::get<OcoParams>(ctx.params());

    PlacedLeg stop = place_leg_with_retry(ctx, OrderType::STOP, params.stop_price, params.quantity);
    if (!placed_live(stop)) {
        ctx.finish(ctx.is_cancelled() ? PlanStatus::CANCELLED : PlanStatus::FAILED,
                   "Stop leg not placed: " + placement_failure(stop));
        return;
    }
    if (stop.state == LegState::FILLED) {
        ctx.finish(PlanStatus::COMPLETED, "Stop leg filled on placement");
        return;
    }

    PlacedLeg limit =
        place_leg_with_retry(ctx, OrderType::LIMIT, params.limit_price, params.quantity);
    if (!placed_live(limit)) {
        CancelOutcome outcome = CancelOutcome::CANCELLED;
        if (stop.state == LegState::SUBMITTED) {
            outcome = cancel_leg(ctx, stop.sequence_number, stop.exchange_order_id);
        }
        if (stop.state == LegState::FILLED || outcome == CancelOutcome::ALREADY_FILLED) {
            ctx.finish(PlanStatus::COMPLETED, "Stop leg filled, limit leg not placed");
        } else {
            ctx.finish(ctx.is_cancelled() ? PlanStatus::CANCELLED : PlanStatus::FAILED,
                       "Limit leg not placed: " + placement_failure(limit));
        }
        return;
    }

    std::vector<Sibling> siblings{
        Sibling{stop.sequence_number, stop.exchange_order_id, stop.state},
        Sibling{limit.sequence_number, limit.exchange_order_id, limit.state}};

    auto count_in = [&siblings](LegState state) {
        return std::count_if(siblings.begin(), siblings.end(),
                             [state](const Sibling& s) { return s.state == state; });
    };

    while (true) {
        if (count_in(LegState::FILLED) > 0) {
            bool unconfirmed = false;
            for (auto& sibling : siblings) {
                if (sibling.state != LegState::SUBMITTED) {
                    continue;
                }
                switch (cancel_leg(ctx, sibling.sequence_number, sibling.exchange_order_id)) {
                    case CancelOutcome::CANCELLED:
                        sibling.state = LegState::CANCELLED;
                        break;
                    case CancelOutcome::ALREADY_FILLED:
                        sibling.state = LegState::FILLED;
                        break;
                    case CancelOutcome::UNCONFIRMED:
                        unconfirmed = true;
                        break;
                }
            }

            if (!unconfirmed) {
                if (count_in(LegState::FILLED) > 1) {
                    ctx.mark_double_fill();
                    WARN("OCO " << ctx.plan_id() << " both legs filled ("
                                << stop.exchange_order_id << ", " << limit.exchange_order_id
                                << ")");
                    ctx.finish(PlanStatus::COMPLETED, "Both legs filled");
                } else {
                    const bool stop_won = siblings[0].state == LegState::FILLED;
                    ctx.finish(PlanStatus::COMPLETED, std::string(stop_won ? "Stop" : "Limit") +
                                                          " leg filled, sibling cancelled");
                }
                return;
            }
        } else if (count_in(LegState::SUBMITTED) == 0) {
            ctx.finish(PlanStatus::FAILED, "Both legs closed without a fill");
            return;
        }

        if (ctx.wait_for(config_.oco_poll_interval)) {
            for (auto& sibling : siblings) {
                if (sibling.state == LegState::SUBMITTED) {
                    cancel_leg(ctx, sibling.sequence_number, sibling.exchange_order_id);
                }
            }
            ctx.finish(PlanStatus::CANCELLED);
            return;
        }

        for (auto& sibling : siblings) {
            if (sibling.state == LegState::SUBMITTED) {
                refresh(ctx, sibling);
            }
        }
    }
}

}  // namespace order_ngin
