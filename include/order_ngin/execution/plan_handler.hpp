// include/order_ngin/execution/plan_handler.hpp
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "order_ngin/exchange/exchange_client.hpp"
#include "order_ngin/execution/engine_config.hpp"
#include "order_ngin/execution/plan_context.hpp"

namespace order_ngin {

/**
 * @brief Result of submitting one leg
 */
struct PlacedLeg {
    int sequence_number{0};
    std::string exchange_order_id;  // Empty when the venue refused the order
    LegState state{LegState::SUBMITTED};
    ErrorCode error{ErrorCode::NONE};
    std::string error_message;

    bool accepted() const {
        return !exchange_order_id.empty();
    }
};

/**
 * @brief What a cancel request established about a leg
 */
enum class CancelOutcome {
    CANCELLED,       // The leg is no longer live and did not fill
    ALREADY_FILLED,  // The leg filled before the cancel landed
    UNCONFIRMED      // The venue could not be reached, the leg may still be live
};

/**
 * @brief What a bounded wait on a live leg observed
 */
enum class FillWait {
    FILLED,
    CLOSED,          // Cancelled, rejected or expired at the venue
    TIMED_OUT,
    PLAN_CANCELLED
};

/**
 * @brief Strategy that drives one kind of plan to a terminal state
 *
 * run() executes on the plan's worker thread and must leave the plan terminal
 * before returning. Exchange errors are absorbed into leg states and the
 * plan's status; they are never thrown.
 */
class PlanHandler {
public:
    PlanHandler(std::shared_ptr<ExchangeClient> exchange, const EngineConfig& config);
    virtual ~PlanHandler() = default;

    /**
     * @brief Thread-local logger component used while running
     */
    virtual std::string component_name() const = 0;

    virtual void run(PlanContext& ctx) = 0;

protected:
    /**
     * @brief Append a leg and send it once
     */
    PlacedLeg place_leg(PlanContext& ctx, OrderType type, std::optional<Price> price,
                        Quantity quantity);

    /**
     * @brief Send a leg, retrying transient failures per the retry policy
     *
     * Every attempt is its own leg. Backoff waits are interruptible, a
     * cancelled plan returns the last failed attempt.
     */
    PlacedLeg place_leg_with_retry(PlanContext& ctx, OrderType type, std::optional<Price> price,
                                   Quantity quantity);

    Result<ExchangeOrderStatus> query_status(PlanContext& ctx, const std::string& exchange_order_id);

    Result<Price> query_price(PlanContext& ctx);

    /**
     * @brief Cancel a live leg and record what happened to it
     * @param cancelled_state State recorded when the cancel succeeds
     */
    CancelOutcome cancel_leg(PlanContext& ctx, int sequence_number,
                             const std::string& exchange_order_id,
                             LegState cancelled_state = LegState::CANCELLED);

    /**
     * @brief Poll a live leg until it is terminal, the deadline passes or the plan is cancelled
     */
    FillWait wait_for_fill(PlanContext& ctx, int sequence_number,
                           const std::string& exchange_order_id,
                           std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Record a terminal venue status on the leg
     * @return false if the status is still live
     */
    bool apply_exchange_status(PlanContext& ctx, int sequence_number, ExchangeOrderStatus status);

    std::shared_ptr<ExchangeClient> exchange_;
    EngineConfig config_;
};

}  // namespace order_ngin
