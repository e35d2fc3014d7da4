// src/execution/slice_scheduler.cpp

#include "order_ngin/execution/slice_scheduler.hpp"
#include <cmath>
#include "order_ngin/core/logger.hpp"

namespace order_ngin {

namespace {

constexpr double LOT_EPSILON = 1e-9;

}  // namespace

Result<std::vector<Quantity>> SliceScheduler::plan_slices(Quantity total_quantity, int intervals,
                                                          Quantity lot_size) {
    if (intervals < 1) {
        return make_error<std::vector<Quantity>>(ErrorCode::INVALID_PLAN,
                                                 "TWAP needs at least one interval",
                                                 "TwapScheduler");
    }
    if (!is_positive_finite(total_quantity) || !is_non_negative_finite(lot_size)) {
        return make_error<std::vector<Quantity>>(ErrorCode::INVALID_PLAN,
                                                 "TWAP quantity must be positive",
                                                 "TwapScheduler");
    }

    Quantity slice = total_quantity / intervals;
    if (lot_size > 0.0) {
        slice = std::floor(slice / lot_size + LOT_EPSILON) * lot_size;
        if (slice < lot_size) {
            return make_error<std::vector<Quantity>>(
                ErrorCode::INVALID_PLAN,
                "Slice size " + std::to_string(total_quantity / intervals) +
                    " is below the lot size " + std::to_string(lot_size),
                "TwapScheduler");
        }
    }

    std::vector<Quantity> slices(static_cast<size_t>(intervals), slice);
    slices.back() = total_quantity - slice * (intervals - 1);
    return Result<std::vector<Quantity>>(slices);
}

SliceScheduler::SliceOutcome SliceScheduler::execute_slice(PlanContext& ctx, int index,
                                                           Quantity quantity,
                                                           std::string& failure) {
    const RetryPolicy& policy = config_.retry_policy;
    int retries = 0;

    while (true) {
        PlacedLeg placed = place_leg(ctx, OrderType::MARKET, std::nullopt, quantity);
        if (placed.state == LegState::FILLED) {
            return SliceOutcome::FILLED;
        }

        if (placed.accepted() && placed.state == LegState::SUBMITTED) {
            auto deadline = std::chrono::steady_clock::now() + config_.order_fill_timeout;
            FillWait wait =
                wait_for_fill(ctx, placed.sequence_number, placed.exchange_order_id, deadline);

            if (wait == FillWait::FILLED) {
                return SliceOutcome::FILLED;
            }
            if (wait == FillWait::PLAN_CANCELLED) {
                cancel_leg(ctx, placed.sequence_number, placed.exchange_order_id);
                return SliceOutcome::CANCELLED;
            }
            if (wait == FillWait::TIMED_OUT) {
                CancelOutcome cancel = cancel_leg(ctx, placed.sequence_number,
                                                  placed.exchange_order_id, LegState::TIMED_OUT);
                if (cancel == CancelOutcome::ALREADY_FILLED) {
                    return SliceOutcome::FILLED;
                }
                if (cancel == CancelOutcome::UNCONFIRMED) {
                    // Resending while the old slice may still fill could overfill
                    failure = "Slice " + std::to_string(index + 1) +
                              " timed out and could not be cancelled";
                    return SliceOutcome::FAILED;
                }
                WARN("TWAP " << ctx.plan_id() << " slice " << index + 1 << " timed out after "
                             << config_.order_fill_timeout.count() << "ms");
            }
        } else if (!is_transient_error(placed.error)) {
            failure = "Slice " + std::to_string(index + 1) + " rejected: " + placed.error_message;
            return SliceOutcome::FAILED;
        }

        if (!policy.can_retry(retries)) {
            failure = "Slice " + std::to_string(index + 1) + " failed after " +
                      std::to_string(retries) + " retries";
            return SliceOutcome::FAILED;
        }

        ++retries;
        ctx.record_retry();
        auto backoff = policy.backoff_for(retries);
        WARN("TWAP " << ctx.plan_id() << " retrying slice " << index + 1 << " (" << retries << "/"
                     << policy.max_retries << ") in " << backoff.count() << "ms");
        if (ctx.wait_for(backoff)) {
            return SliceOutcome::CANCELLED;
        }
    }
}

void SliceScheduler::run(PlanContext& ctx) {
    if (!ctx.mark_running()) {
        return;
    }

    const auto& params = std::get<TwapParams>(ctx.params());
    auto slices = plan_slices(params.total_quantity, params.intervals, params.lot_size);
    if (slices.is_error()) {
        ctx.finish(PlanStatus::FAILED, slices.error()->what());
        return;
    }

    const auto& quantities = slices.value();
    const auto interval = params.duration / params.intervals;
    INFO("TWAP " << ctx.plan_id() << ": " << params.total_quantity << " " << ctx.symbol()
                 << " in " << quantities.size() << " slices every " << interval.count() << "ms");

    const auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < quantities.size(); ++i) {
        auto fire_at = start + interval * static_cast<int64_t>(i);
        if (ctx.wait_until(fire_at)) {
            ctx.finish(PlanStatus::CANCELLED,
                       "Cancelled after " + std::to_string(i) + " of " +
                           std::to_string(quantities.size()) + " slices");
            return;
        }

        std::string failure;
        switch (execute_slice(ctx, static_cast<int>(i), quantities[i], failure)) {
            case SliceOutcome::FILLED:
                INFO("TWAP " << ctx.plan_id() << " slice " << i + 1 << "/" << quantities.size()
                             << " filled " << quantities[i]);
                break;
            case SliceOutcome::CANCELLED:
                ctx.finish(PlanStatus::CANCELLED, "Cancelled during slice " + std::to_string(i + 1));
                return;
            case SliceOutcome::FAILED:
                ctx.finish(PlanStatus::FAILED, failure);
                return;
        }
    }

    ctx.finish(PlanStatus::COMPLETED,
               "All " + std::to_string(quantities.size()) + " slices filled");
}

}  // namespace order_ngin
