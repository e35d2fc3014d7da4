// include/order_ngin/execution/plan_context.hpp
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "order_ngin/exchange/exchange_client.hpp"
#include "order_ngin/execution/cancellation_token.hpp"
#include "order_ngin/execution/plan_registry.hpp"

namespace order_ngin {

/**
 * @brief Write handle for one plan, owned by the worker running it
 *
 * Exactly one context exists per running plan, so the handler holding it is
 * the plan's only writer. Every method is a short critical section on the
 * registry; none of them touch the exchange.
 */
class PlanContext {
public:
    PlanContext(PlanRegistry& registry, const OrderPlan& plan,
                std::shared_ptr<CancellationToken> token);

    PlanContext(const PlanContext&) = delete;
    PlanContext& operator=(const PlanContext&) = delete;

    const std::string& plan_id() const {
        return plan_id_;
    }
    const std::string& symbol() const {
        return symbol_;
    }
    Side side() const {
        return side_;
    }
    const PlanParams& params() const {
        return params_;
    }

    bool is_cancelled() const {
        return token_->is_cancelled();
    }

    /**
     * @brief Interruptible sleep
     * @return true if the plan was cancelled while waiting
     */
    bool wait_for(std::chrono::milliseconds timeout) {
        return token_->wait_for(timeout);
    }

    bool wait_until(std::chrono::steady_clock::time_point deadline) {
        return token_->wait_until(deadline);
    }

    /**
     * @brief PENDING -> RUNNING
     *
     * A plan cancelled before its worker started is finished CANCELLED here.
     * @return false if the handler must not run
     */
    bool mark_running();

    /**
     * @brief Move the plan to a terminal status
     */
    void finish(PlanStatus status, const std::string& message = "");

    /**
     * @brief Append a SUBMITTED leg before it is sent
     * @return Sequence number of the new leg
     */
    int append_leg(OrderType type, Price price, Quantity quantity);

    /**
     * @brief Record the venue's answer to a placement
     */
    void record_ack(int sequence_number, const ExchangeOrderAck& ack);

    void set_leg_state(int sequence_number, LegState state, const std::string& error = "",
                       std::optional<Price> fill_price = std::nullopt);

    void record_retry();

    void set_best_price(Price best_price);

    /**
     * @brief Point the trailing state at a newly armed stop leg
     */
    void arm_stop(int sequence_number, Price stop_price);

    void mark_double_fill();

    std::optional<OrderLeg> leg(int sequence_number) const;
    std::optional<PlanStatus> status() const;

private:
    void apply(const std::function<void(OrderPlan&)>& fn);

    PlanRegistry& registry_;
    std::string plan_id_;
    std::string symbol_;
    Side side_;
    PlanParams params_;
    std::shared_ptr<CancellationToken> token_;
};

}  // namespace order_ngin
