// include/order_ngin/execution/plan_registry.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "order_ngin/core/error.hpp"
#include "order_ngin/execution/cancellation_token.hpp"
#include "order_ngin/execution/order_plan.hpp"

namespace order_ngin {

/**
 * @brief Thread-safe store of active plans and a bounded log of retired ones
 *
 * The registry is the only structure shared between the supervisor, callers
 * and plan workers. Every read hands out a copy; every write goes through
 * mutate() or transition() under the registry lock. Callbacks passed to
 * mutate() must not call back into the registry or block.
 */
class PlanRegistry {
public:
    explicit PlanRegistry(size_t completed_capacity = 1000);

    PlanRegistry(const PlanRegistry&) = delete;
    PlanRegistry& operator=(const PlanRegistry&) = delete;

    /**
     * @brief Register a new PENDING plan
     * @return Generated plan id
     */
    std::string create(const PlanRequest& request);

    /**
     * @brief Copy of an active or retired plan with its metrics
     * @return PLAN_NOT_FOUND if the id was never issued or has aged out of the log
     */
    Result<PlanSnapshot> snapshot(const std::string& plan_id) const;

    bool is_active(const std::string& plan_id) const;

    /**
     * @brief Apply a change to an active plan under the registry lock
     */
    Result<void> mutate(const std::string& plan_id, const std::function<void(OrderPlan&)>& fn);

    /**
     * @brief Move an active plan to a new status
     *
     * Sets started_at on RUNNING and finished_at on a terminal status.
     * @return INVALID_STATE_TRANSITION if the lifecycle forbids the move
     */
    Result<void> transition(const std::string& plan_id, PlanStatus status,
                            const std::string& message = "");

    /**
     * @brief Cancellation token of an active plan, nullptr if not active
     */
    std::shared_ptr<CancellationToken> token(const std::string& plan_id) const;

    /**
     * @brief Move a terminal plan from the active set into the completed log
     */
    Result<void> retire(const std::string& plan_id);

    /**
     * @brief Block until the plan has been retired
     * @return Final status, PLAN_NOT_FOUND for unknown ids, TIMEOUT_ERROR on timeout
     */
    Result<PlanStatus> wait_for_retirement(const std::string& plan_id,
                                           std::chrono::milliseconds timeout) const;

    std::vector<PlanSnapshot> list_active() const;
    std::vector<PlanSnapshot> list_completed() const;
    size_t active_count() const;

    /**
     * @brief Completed log as a JSON array, oldest first
     */
    nlohmann::json completed_json() const;

private:
    struct Entry {
        OrderPlan plan;
        std::shared_ptr<CancellationToken> token;
    };

    std::string generate_id_locked();
    const OrderPlan* find_completed_locked(const std::string& plan_id) const;

    size_t completed_capacity_;
    uint64_t id_counter_{0};
    std::unordered_map<std::string, Entry> active_;
    std::deque<OrderPlan> completed_;
    mutable std::mutex mutex_;
    mutable std::condition_variable retired_cv_;
};

}  // namespace order_ngin
