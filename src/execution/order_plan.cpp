// src/execution/order_plan.cpp

#include "order_ngin/execution/order_plan.hpp"
#include <type_traits>
#include "order_ngin/core/time_utils.hpp"

namespace order_ngin {

PlanKind plan_kind_of(const PlanParams& params) {
    switch (params.index()) {
        case 0:
            return PlanKind::TWAP;
        case 1:
            return PlanKind::GRID;
        case 2:
            return PlanKind::TRAILING_STOP;
        default:
            return PlanKind::OCO;
    }
}

std::string plan_kind_to_string(PlanKind kind) {
    switch (kind) {
        case PlanKind::TWAP:
            return "TWAP";
        case PlanKind::GRID:
            return "GRID";
        case PlanKind::TRAILING_STOP:
            return "TRAILING_STOP";
        case PlanKind::OCO:
            return "OCO";
        default:
            return "UNKNOWN";
    }
}

std::string plan_status_to_string(PlanStatus status) {
    switch (status) {
        case PlanStatus::PENDING:
            return "PENDING";
        case PlanStatus::RUNNING:
            return "RUNNING";
        case PlanStatus::COMPLETED:
            return "COMPLETED";
        case PlanStatus::FAILED:
            return "FAILED";
        case PlanStatus::CANCELLED:
            return "CANCELLED";
        default:
            return "UNKNOWN";
    }
}

std::string leg_state_to_string(LegState state) {
    switch (state) {
        case LegState::SUBMITTED:
            return "SUBMITTED";
        case LegState::FILLED:
            return "FILLED";
        case LegState::REJECTED:
            return "REJECTED";
        case LegState::CANCELLED:
            return "CANCELLED";
        case LegState::TIMED_OUT:
            return "TIMED_OUT";
        default:
            return "UNKNOWN";
    }
}

bool is_valid_status_transition(PlanStatus from, PlanStatus to) {
    switch (from) {
        case PlanStatus::PENDING:
            return to == PlanStatus::RUNNING || to == PlanStatus::CANCELLED;
        case PlanStatus::RUNNING:
            return is_terminal(to);
        default:
            return false;
    }
}

const OrderLeg* OrderPlan::find_leg(int sequence_number) const {
    // Sequence numbers start at 1 and are dense
    if (sequence_number < 1 || static_cast<size_t>(sequence_number) > legs.size()) {
        return nullptr;
    }
    return &legs[static_cast<size_t>(sequence_number - 1)];
}

OrderLeg* OrderPlan::find_leg(int sequence_number) {
    return const_cast<OrderLeg*>(static_cast<const OrderPlan*>(this)->find_leg(sequence_number));
}

namespace {

Quantity target_quantity_of(const PlanParams& params) {
    return std::visit(
        [](const auto& p) -> Quantity {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, TwapParams> || std::is_same_v<T, GridParams>) {
                return p.total_quantity;
            } else {
                return p.quantity;
            }
        },
        params);
}

}  // namespace

PlanMetrics compute_metrics(const OrderPlan& plan) {
    PlanMetrics metrics;
    metrics.target_quantity = target_quantity_of(plan.params);
    metrics.retries = plan.retry_count;

    double notional = 0.0;
    for (const auto& leg : plan.legs) {
        ++metrics.legs_submitted;
        switch (leg.result_state) {
            case LegState::FILLED:
                ++metrics.legs_filled;
                metrics.filled_quantity += leg.quantity;
                notional += leg.fill_price.value_or(leg.price) * leg.quantity;
                break;
            case LegState::REJECTED:
            case LegState::TIMED_OUT:
                ++metrics.legs_failed;
                break;
            case LegState::CANCELLED:
                ++metrics.legs_cancelled;
                break;
            case LegState::SUBMITTED:
                ++metrics.legs_open;
                break;
        }
    }

    if (metrics.filled_quantity > 0.0) {
        metrics.average_fill_price = notional / metrics.filled_quantity;
    }
    if (metrics.target_quantity > 0.0) {
        metrics.completion_rate = metrics.filled_quantity / metrics.target_quantity;
    }

    if (plan.started_at.time_since_epoch().count() != 0) {
        Timestamp end = plan.finished_at.time_since_epoch().count() != 0
                            ? plan.finished_at
                            : std::chrono::system_clock::now();
        metrics.elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(end - plan.started_at);
    }
    return metrics;
}

nlohmann::json to_json(const OrderLeg& leg) {
    nlohmann::json j;
    j["sequence_number"] = leg.sequence_number;
    j["exchange_order_id"] =
        leg.exchange_order_id ? nlohmann::json(*leg.exchange_order_id) : nlohmann::json();
    j["type"] = order_type_to_string(leg.type);
    j["price"] = leg.price;
    j["quantity"] = leg.quantity;
    j["submitted_at"] = core::format_timestamp(leg.submitted_at);
    j["result_state"] = leg_state_to_string(leg.result_state);
    if (leg.fill_price) {
        j["fill_price"] = *leg.fill_price;
    }
    if (!leg.error_message.empty()) {
        j["error"] = leg.error_message;
    }
    return j;
}

nlohmann::json to_json(const PlanParams& params) {
    nlohmann::json j;
    std::visit(
        [&j](const auto& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, TwapParams>) {
                j["total_quantity"] = p.total_quantity;
                j["duration_ms"] = p.duration.count();
                j["intervals"] = p.intervals;
                j["lot_size"] = p.lot_size;
            } else if constexpr (std::is_same_v<T, GridParams>) {
                j["start_price"] = p.start_price;
                j["end_price"] = p.end_price;
                j["grid_count"] = p.grid_count;
                j["total_quantity"] = p.total_quantity;
                j["spacing"] = p.spacing == GridSpacing::ARITHMETIC ? "ARITHMETIC" : "GEOMETRIC";
                j["lot_size"] = p.lot_size;
            } else if constexpr (std::is_same_v<T, TrailingStopParams>) {
                j["quantity"] = p.quantity;
                j["trail_mode"] = p.trail_mode == TrailMode::DISTANCE ? "DISTANCE" : "RATE";
                j["trail_value"] = p.trail_value;
                j["rearm_threshold"] = p.rearm_threshold;
            } else {
                j["quantity"] = p.quantity;
                j["stop_price"] = p.stop_price;
                j["limit_price"] = p.limit_price;
            }
        },
        params);
    return j;
}

nlohmann::json to_json(const PlanMetrics& metrics) {
    nlohmann::json j;
    j["legs_submitted"] = metrics.legs_submitted;
    j["legs_filled"] = metrics.legs_filled;
    j["legs_failed"] = metrics.legs_failed;
    j["legs_cancelled"] = metrics.legs_cancelled;
    j["legs_open"] = metrics.legs_open;
    j["filled_quantity"] = metrics.filled_quantity;
    j["target_quantity"] = metrics.target_quantity;
    j["average_fill_price"] = metrics.average_fill_price;
    j["completion_rate"] = metrics.completion_rate;
    j["elapsed_ms"] = metrics.elapsed.count();
    j["retries"] = metrics.retries;
    return j;
}

nlohmann::json to_json(const OrderPlan& plan) {
    nlohmann::json j;
    j["id"] = plan.id;
    j["kind"] = plan_kind_to_string(plan.kind);
    j["symbol"] = plan.symbol;
    j["side"] = side_to_string(plan.side);
    j["params"] = to_json(plan.params);
    j["status"] = plan_status_to_string(plan.status);
    j["status_message"] = plan.status_message;
    j["created_at"] = core::format_timestamp(plan.created_at);
    j["started_at"] = core::format_timestamp(plan.started_at);
    j["finished_at"] = core::format_timestamp(plan.finished_at);
    j["retry_count"] = plan.retry_count;
    if (plan.kind == PlanKind::OCO) {
        j["double_fill"] = plan.double_fill;
    }
    if (plan.trailing) {
        j["best_price_seen"] = plan.trailing->best_price_seen;
        j["armed_stop_price"] = plan.trailing->armed_stop_price;
        j["rearm_count"] = plan.trailing->rearm_count;
    }

    nlohmann::json legs = nlohmann::json::array();
    for (const auto& leg : plan.legs) {
        legs.push_back(to_json(leg));
    }
    j["legs"] = legs;
    return j;
}

nlohmann::json to_json(const PlanSnapshot& snapshot) {
    nlohmann::json j = to_json(snapshot.plan);
    j["metrics"] = to_json(snapshot.metrics);
    return j;
}

}  // namespace order_ngin
