// src/execution/plan_handler.cpp

#include "order_ngin/execution/plan_handler.hpp"
#include <algorithm>
#include <thread>
#include "order_ngin/core/logger.hpp"

namespace order_ngin {

namespace {

// Retries transient failures of a read or cancel call. Sleeps are not
// interruptible so cleanup after a cancellation still gets its retries.
template <typename Fn>
auto call_with_retry(const RetryPolicy& policy, Fn&& fn) -> decltype(fn()) {
    auto result = fn();
    int retries = 0;
    while (result.is_error() && is_transient_error(result.error()->code()) &&
           policy.can_retry(retries)) {
        ++retries;
        std::this_thread::sleep_for(policy.backoff_for(retries));
        result = fn();
    }
    return result;
}

}  // namespace

PlanHandler::PlanHandler(std::shared_ptr<ExchangeClient> exchange, const EngineConfig& config)
    : exchange_(std::move(exchange)), config_(config) {}

PlacedLeg PlanHandler::place_leg(PlanContext& ctx, OrderType type, std::optional<Price> price,
                                 Quantity quantity) {
    PlacedLeg placed;
    placed.sequence_number = ctx.append_leg(type, price.value_or(0.0), quantity);

    auto result = exchange_->place_order(ctx.symbol(), ctx.side(), type, quantity, price);
    if (result.is_error()) {
        placed.error = result.error()->code();
        placed.error_message = result.error()->what();
        placed.state = is_transient_error(placed.error) ? LegState::TIMED_OUT : LegState::REJECTED;
        ctx.set_leg_state(placed.sequence_number, placed.state, placed.error_message);

        if (placed.state == LegState::TIMED_OUT) {
            WARN("Plan " << ctx.plan_id() << " leg " << placed.sequence_number
                         << " not placed: " << placed.error_message);
        } else if (is_permanent_exchange_error(placed.error)) {
            INFO("Plan " << ctx.plan_id() << " leg " << placed.sequence_number
                         << " REJECTED: " << placed.error_message);
        } else {
            ERROR("Plan " << ctx.plan_id() << " leg " << placed.sequence_number
                          << " failed with unexpected error: " << placed.error_message);
        }
        return placed;
    }

    const ExchangeOrderAck& ack = result.value();
    placed.exchange_order_id = ack.exchange_order_id;
    ctx.record_ack(placed.sequence_number, ack);
    if (ack.status == ExchangeOrderStatus::FILLED) {
        placed.state = LegState::FILLED;
    } else if (apply_exchange_status(ctx, placed.sequence_number, ack.status)) {
        auto leg = ctx.leg(placed.sequence_number);
        placed.state = leg ? leg->result_state : LegState::REJECTED;
    }

    INFO("Plan " << ctx.plan_id() << " leg " << placed.sequence_number << " "
                 << order_type_to_string(type) << " " << side_to_string(ctx.side()) << " "
                 << quantity << " " << ctx.symbol()
                 << (price ? " @ " + std::to_string(*price) : std::string())
                 << " -> " << ack.exchange_order_id << " " << leg_state_to_string(placed.state));
    return placed;
}

PlacedLeg PlanHandler::place_leg_with_retry(PlanContext& ctx, OrderType type,
                                            std::optional<Price> price, Quantity quantity) {
    const RetryPolicy& policy = config_.retry_policy;
    int retries = 0;

    while (true) {
        PlacedLeg placed = place_leg(ctx, type, price, quantity);
        if (placed.accepted() || !is_transient_error(placed.error) ||
            !policy.can_retry(retries)) {
            return placed;
        }

        ++retries;
        ctx.record_retry();
        auto backoff = policy.backoff_for(retries);
        WARN("Plan " << ctx.plan_id() << " retrying placement (" << retries << "/"
                     << policy.max_retries << ") in " << backoff.count() << "ms");
        if (ctx.wait_for(backoff)) {
            return placed;
        }
    }
}

Result<ExchangeOrderStatus> PlanHandler::query_status(PlanContext& ctx,
                                                      const std::string& exchange_order_id) {
    return call_with_retry(config_.retry_policy, [&] {
        return exchange_->get_order_status(ctx.symbol(), exchange_order_id);
    });
}

Result<Price> PlanHandler::query_price(PlanContext& ctx) {
    return call_with_retry(config_.retry_policy,
                           [&] { return exchange_->get_current_price(ctx.symbol()); });
}

bool PlanHandler::apply_exchange_status(PlanContext& ctx, int sequence_number,
                                        ExchangeOrderStatus status) {
    switch (status) {
        case ExchangeOrderStatus::FILLED:
            ctx.set_leg_state(sequence_number, LegState::FILLED);
            return true;
        case ExchangeOrderStatus::CANCELLED:
        case ExchangeOrderStatus::EXPIRED:
            ctx.set_leg_state(sequence_number, LegState::CANCELLED,
                              "Closed at venue: " + exchange_status_to_string(status));
            return true;
        case ExchangeOrderStatus::REJECTED:
            ctx.set_leg_state(sequence_number, LegState::REJECTED, "Rejected at venue");
            return true;
        default:
            return false;
    }
}

CancelOutcome PlanHandler::cancel_leg(PlanContext& ctx, int sequence_number,
                                      const std::string& exchange_order_id,
                                      LegState cancelled_state) {
    auto result = call_with_retry(config_.retry_policy, [&] {
        return exchange_->cancel_order(ctx.symbol(), exchange_order_id);
    });

    if (result.is_ok()) {
        ctx.set_leg_state(sequence_number, cancelled_state);
        INFO("Plan " << ctx.plan_id() << " leg " << sequence_number << " ("
                     << exchange_order_id << ") " << leg_state_to_string(cancelled_state));
        return CancelOutcome::CANCELLED;
    }

    const ErrorCode code = result.error()->code();
    if (code == ErrorCode::ORDER_ALREADY_FILLED) {
        ctx.set_leg_state(sequence_number, LegState::FILLED);
        INFO("Plan " << ctx.plan_id() << " leg " << sequence_number << " ("
                     << exchange_order_id << ") filled before cancel");
        return CancelOutcome::ALREADY_FILLED;
    }

    if (code == ErrorCode::ORDER_NOT_FOUND) {
        // Not cancellable: find out whether it filled or was closed
        auto status = query_status(ctx, exchange_order_id);
        if (status.is_ok() && apply_exchange_status(ctx, sequence_number, status.value())) {
            if (status.value() == ExchangeOrderStatus::FILLED) {
                INFO("Plan " << ctx.plan_id() << " leg " << sequence_number
                             << " filled before cancel");
                return CancelOutcome::ALREADY_FILLED;
            }
            return CancelOutcome::CANCELLED;
        }
        if (status.is_error() && status.error()->code() == ErrorCode::ORDER_NOT_FOUND) {
            ctx.set_leg_state(sequence_number, cancelled_state, "Unknown at venue");
            return CancelOutcome::CANCELLED;
        }
    }

    WARN("Plan " << ctx.plan_id() << " could not confirm cancel of leg " << sequence_number
                 << " (" << exchange_order_id << "): " << result.error()->what());
    return CancelOutcome::UNCONFIRMED;
}

FillWait PlanHandler::wait_for_fill(PlanContext& ctx, int sequence_number,
                                    const std::string& exchange_order_id,
                                    std::chrono::steady_clock::time_point deadline) {
    while (true) {
        auto next_poll =
            std::min(std::chrono::steady_clock::now() + config_.status_poll_interval, deadline);
        if (ctx.wait_until(next_poll)) {
            return FillWait::PLAN_CANCELLED;
        }

        auto status = query_status(ctx, exchange_order_id);
        if (status.is_ok()) {
            if (apply_exchange_status(ctx, sequence_number, status.value())) {
                return status.value() == ExchangeOrderStatus::FILLED ? FillWait::FILLED
                                                                     : FillWait::CLOSED;
            }
        } else if (status.error()->code() == ErrorCode::ORDER_NOT_FOUND) {
            ctx.set_leg_state(sequence_number, LegState::REJECTED, status.error()->what());
            return FillWait::CLOSED;
        } else {
            WARN("Plan " << ctx.plan_id() << " status check failed: " << status.error()->what());
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return FillWait::TIMED_OUT;
        }
    }
}

}  // namespace order_ngin
