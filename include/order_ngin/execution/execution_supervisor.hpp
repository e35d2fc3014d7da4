// include/order_ngin/execution/execution_supervisor.hpp
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "order_ngin/core/error.hpp"
#include "order_ngin/exchange/exchange_client.hpp"
#include "order_ngin/execution/engine_config.hpp"
#include "order_ngin/execution/plan_handler.hpp"
#include "order_ngin/execution/plan_registry.hpp"

namespace order_ngin {

/**
 * @brief Engine-wide counters
 */
struct EngineMetrics {
    int plans_submitted{0};
    int plans_completed{0};
    int plans_failed{0};
    int plans_cancelled{0};
    int active_plans{0};
    int queued_plans{0};
    int legs_submitted{0};
    int legs_filled{0};
    double success_rate{0.0};  // Completed share of retired plans

    nlohmann::json to_json() const;
    std::unordered_map<std::string, double> to_map() const;
};

/**
 * @brief Entry point of the engine
 *
 * Validates submitted plans, runs each on its own worker thread through the
 * handler registered for its kind, and retires finished plans. At most
 * max_concurrent_plans workers run at once; later submissions wait in FIFO
 * order. Lock order is supervisor mutex, then registry.
 */
class ExecutionSupervisor {
public:
    ExecutionSupervisor(std::shared_ptr<ExchangeClient> exchange,
                        EngineConfig config = EngineConfig());
    ~ExecutionSupervisor();

    ExecutionSupervisor(const ExecutionSupervisor&) = delete;
    ExecutionSupervisor& operator=(const ExecutionSupervisor&) = delete;

    /**
     * @brief Mark the supervisor RUNNING, required before submit_plan
     */
    Result<void> initialize();

    /**
     * @brief Validate and register a plan, then start or queue it
     * @return Plan id, or INVALID_PLAN without creating anything
     */
    Result<std::string> submit_plan(const PlanRequest& request);

    /**
     * @brief Snapshot of an active or retired plan
     */
    Result<PlanSnapshot> get_plan_status(const std::string& plan_id) const;

    /**
     * @brief Request cooperative cancellation
     * @return PLAN_NOT_FOUND for unknown or already retired plans
     */
    Result<void> cancel_plan(const std::string& plan_id);

    std::vector<PlanSnapshot> list_active_plans() const;

    /**
     * @brief Block until the plan is retired
     * @return Final status, or TIMEOUT_ERROR / PLAN_NOT_FOUND
     */
    Result<PlanStatus> wait_for_plan(const std::string& plan_id,
                                     std::chrono::milliseconds timeout) const;

    EngineMetrics get_engine_metrics() const;

    /**
     * @brief Write the completed log to a JSON file
     */
    Result<void> save_completed_plans(const std::string& path) const;

    /**
     * @brief Cancel every plan, join all workers and mark the supervisor STOPPED
     */
    Result<void> shutdown();

    /**
     * @brief Check a request without submitting it
     */
    static Result<void> validate_request(const PlanRequest& request);

    const std::string& component_id() const {
        return component_id_;
    }

    const EngineConfig& config() const {
        return config_;
    }

private:
    void launch_locked(const std::string& plan_id);
    void run_plan(const std::string& plan_id);
    void on_plan_finished(const std::string& plan_id);
    void retire_plan(const std::string& plan_id);
    void reap_finished();
    void publish_metrics() const;

    std::shared_ptr<ExchangeClient> exchange_;
    EngineConfig config_;
    std::string component_id_;
    PlanRegistry registry_;
    std::unordered_map<PlanKind, std::shared_ptr<PlanHandler>> handlers_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::thread> workers_;
    std::vector<std::thread> finished_;
    std::deque<std::string> queue_;
    bool running_{false};
    bool stopping_{false};

    std::atomic<int> plans_submitted_{0};
    std::atomic<int> plans_completed_{0};
    std::atomic<int> plans_failed_{0};
    std::atomic<int> plans_cancelled_{0};
    std::atomic<int> legs_submitted_{0};
    std::atomic<int> legs_filled_{0};

    static std::atomic<int> instance_counter_;
};

}  // namespace order_ngin
