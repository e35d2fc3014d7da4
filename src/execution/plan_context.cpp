// src/execution/plan_context.cpp

#include "order_ngin/execution/plan_context.hpp"
#include "order_ngin/core/logger.hpp"

namespace order_ngin {

PlanContext::PlanContext(PlanRegistry& registry, const OrderPlan& plan,
                         std::shared_ptr<CancellationToken> token)
    : registry_(registry),
      plan_id_(plan.id),
      symbol_(plan.symbol),
      side_(plan.side),
      params_(plan.params),
      token_(std::move(token)) {}

void PlanContext::apply(const std::function<void(OrderPlan&)>& fn) {
    auto result = registry_.mutate(plan_id_, fn);
    if (result.is_error()) {
        ERROR("Plan " << plan_id_ << " update lost: " << result.error()->what());
    }
}

bool PlanContext::mark_running() {
    if (token_->is_cancelled()) {
        finish(PlanStatus::CANCELLED, "Cancelled before start");
        return false;
    }

    auto result = registry_.transition(plan_id_, PlanStatus::RUNNING);
    if (result.is_error()) {
        ERROR("Plan " << plan_id_ << " could not start: " << result.error()->what());
        return false;
    }
    INFO("Plan " << plan_id_ << " running on " << symbol_);
    return true;
}

void PlanContext::finish(PlanStatus status, const std::string& message) {
    auto result = registry_.transition(plan_id_, status, message);
    if (result.is_error()) {
        ERROR("Plan " << plan_id_ << " could not finish: " << result.error()->what());
        return;
    }

    switch (status) {
        case PlanStatus::FAILED:
            ERROR("Plan " << plan_id_ << " FAILED: " << message);
            break;
        case PlanStatus::CANCELLED:
            INFO("Plan " << plan_id_ << " CANCELLED" << (message.empty() ? "" : ": ")
                         << message);
            break;
        default:
            INFO("Plan " << plan_id_ << " " << plan_status_to_string(status)
                         << (message.empty() ? "" : ": ") << message);
            break;
    }
}

int PlanContext::append_leg(OrderType type, Price price, Quantity quantity) {
    int sequence_number = 0;
    apply([&](OrderPlan& plan) {
        OrderLeg leg;
        leg.sequence_number = static_cast<int>(plan.legs.size()) + 1;
        leg.type = type;
        leg.price = price;
        leg.quantity = quantity;
        leg.submitted_at = std::chrono::system_clock::now();
        leg.result_state = LegState::SUBMITTED;
        plan.legs.push_back(leg);
        sequence_number = leg.sequence_number;
    });
    return sequence_number;
}

void PlanContext::record_ack(int sequence_number, const ExchangeOrderAck& ack) {
    apply([&](OrderPlan& plan) {
        OrderLeg* leg = plan.find_leg(sequence_number);
        if (!leg) {
            return;
        }
        leg->exchange_order_id = ack.exchange_order_id;
        if (ack.status == ExchangeOrderStatus::FILLED) {
            leg->result_state = LegState::FILLED;
            leg->fill_price = ack.fill_price;
            // Market legs carry the price they executed at
            if (leg->type == OrderType::MARKET && ack.fill_price) {
                leg->price = *ack.fill_price;
            }
        }
    });
}

void PlanContext::set_leg_state(int sequence_number, LegState state, const std::string& error,
                                std::optional<Price> fill_price) {
    apply([&](OrderPlan& plan) {
        OrderLeg* leg = plan.find_leg(sequence_number);
        if (!leg || is_terminal(leg->result_state)) {
            return;
        }
        leg->result_state = state;
        if (!error.empty()) {
            leg->error_message = error;
        }
        if (fill_price) {
            leg->fill_price = fill_price;
        }
    });
}

void PlanContext::record_retry() {
    apply([](OrderPlan& plan) { ++plan.retry_count; });
}

void PlanContext::set_best_price(Price best_price) {
    apply([&](OrderPlan& plan) {
        if (!plan.trailing) {
            plan.trailing = TrailingState{};
        }
        plan.trailing->best_price_seen = best_price;
    });
}

void PlanContext::arm_stop(int sequence_number, Price stop_price) {
    apply([&](OrderPlan& plan) {
        if (!plan.trailing) {
            plan.trailing = TrailingState{};
        }
        if (plan.trailing->active_leg) {
            ++plan.trailing->rearm_count;
        }
        plan.trailing->armed_stop_price = stop_price;
        plan.trailing->active_leg = sequence_number;
    });
}

void PlanContext::mark_double_fill() {
    apply([](OrderPlan& plan) { plan.double_fill = true; });
}

std::optional<OrderLeg> PlanContext::leg(int sequence_number) const {
    auto snapshot = registry_.snapshot(plan_id_);
    if (snapshot.is_error()) {
        return std::nullopt;
    }
    const OrderLeg* leg = snapshot.value().plan.find_leg(sequence_number);
    return leg ? std::optional<OrderLeg>(*leg) : std::nullopt;
}

std::optional<PlanStatus> PlanContext::status() const {
    auto snapshot = registry_.snapshot(plan_id_);
    if (snapshot.is_error()) {
        return std::nullopt;
    }
    return snapshot.value().plan.status;
}

}  // namespace order_ngin
