// src/execution/execution_supervisor.cpp

#include "order_ngin/execution/execution_supervisor.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include "order_ngin/core/logger.hpp"
#include "order_ngin/core/state_manager.hpp"
#include "order_ngin/execution/grid_executor.hpp"
#include "order_ngin/execution/grid_planner.hpp"
#include "order_ngin/execution/oco_coordinator.hpp"
#include "order_ngin/execution/slice_scheduler.hpp"
#include "order_ngin/execution/trailing_stop_monitor.hpp"

namespace order_ngin {

std::atomic<int> ExecutionSupervisor::instance_counter_{0};

nlohmann::json EngineMetrics::to_json() const {
    nlohmann::json j;
    j["plans_submitted"] = plans_submitted;
    j["plans_completed"] = plans_completed;
    j["plans_failed"] = plans_failed;
    j["plans_cancelled"] = plans_cancelled;
    j["active_plans"] = active_plans;
    j["queued_plans"] = queued_plans;
    j["legs_submitted"] = legs_submitted;
    j["legs_filled"] = legs_filled;
    j["success_rate"] = success_rate;
    return j;
}

std::unordered_map<std::string, double> EngineMetrics::to_map() const {
    return {{"plans_submitted", plans_submitted},
            {"plans_completed", plans_completed},
            {"plans_failed", plans_failed},
            {"plans_cancelled", plans_cancelled},
            {"active_plans", active_plans},
            {"queued_plans", queued_plans},
            {"legs_submitted", legs_submitted},
            {"legs_filled", legs_filled},
            {"success_rate", success_rate}};
}

ExecutionSupervisor::ExecutionSupervisor(std::shared_ptr<ExchangeClient> exchange,
                                         EngineConfig config)
    : exchange_(std::move(exchange)),
      config_(std::move(config)),
      component_id_("EXECUTION_SUPERVISOR_" + std::to_string(++instance_counter_)),
      registry_(config_.completed_log_capacity) {
    if (!exchange_) {
        throw std::invalid_argument("ExecutionSupervisor requires an exchange client");
    }
    if (config_.max_concurrent_plans == 0) {
        WARN("max_concurrent_plans is 0, using 1");
        config_.max_concurrent_plans = 1;
    }

    handlers_[PlanKind::TWAP] = std::make_shared<SliceScheduler>(exchange_, config_);
    handlers_[PlanKind::GRID] = std::make_shared<GridExecutor>(exchange_, config_);
    handlers_[PlanKind::TRAILING_STOP] = std::make_shared<TrailingStopMonitor>(exchange_, config_);
    handlers_[PlanKind::OCO] = std::make_shared<OcoCoordinator>(exchange_, config_);

    ComponentInfo info{ComponentType::EXECUTION_SUPERVISOR,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};

    auto register_result = StateManager::instance().register_component(info);
    if (register_result.is_error()) {
        throw std::runtime_error(register_result.error()->what());
    }
}

ExecutionSupervisor::~ExecutionSupervisor() {
    try {
        auto shutdown_result = shutdown();
        if (shutdown_result.is_error()) {
            std::cerr << "Error shutting down " << component_id_ << ": "
                      << shutdown_result.error()->what() << std::endl;
        }

        auto unreg_result = StateManager::instance().unregister_component(component_id_);
        if (unreg_result.is_error()) {
            std::cerr << "Error unregistering from StateManager: "
                      << unreg_result.error()->what() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Exception during destruction: " << e.what() << std::endl;
    }
}

Result<void> ExecutionSupervisor::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Supervisor has been shut down",
                                "ExecutionSupervisor");
    }
    if (running_) {
        return Result<void>();
    }

    auto state_result =
        StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
    if (state_result.is_error()) {
        return state_result;
    }

    running_ = true;
    INFO("Execution supervisor " << component_id_ << " initialized, max "
                                 << config_.max_concurrent_plans << " concurrent plans");
    return Result<void>();
}

Result<void> ExecutionSupervisor::validate_request(const PlanRequest& request) {
    auto invalid = [](const std::string& message) {
        return make_error<void>(ErrorCode::INVALID_PLAN, message, "ExecutionSupervisor");
    };

    if (request.symbol.empty()) {
        return invalid("Symbol is required");
    }
    if (request.side != Side::BUY && request.side != Side::SELL) {
        return invalid("Side must be BUY or SELL");
    }
    if (request.kind != plan_kind_of(request.params)) {
        return invalid("Plan kind " + plan_kind_to_string(request.kind) +
                       " does not match parameters for " +
                       plan_kind_to_string(plan_kind_of(request.params)));
    }

    switch (request.kind) {
        case PlanKind::TWAP: {
            const auto& p = std::get<TwapParams>(request.params);
            if (p.duration.count() <= 0) {
                return invalid("TWAP duration must be positive");
            }
            auto slices = SliceScheduler::plan_slices(p.total_quantity, p.intervals, p.lot_size);
            if (slices.is_error()) {
                return invalid(slices.error()->what());
            }
            break;
        }
        case PlanKind::GRID: {
            auto levels = GridPlanner::compute_levels(std::get<GridParams>(request.params));
            if (levels.is_error()) {
                return invalid(levels.error()->what());
            }
            break;
        }
        case PlanKind::TRAILING_STOP: {
            const auto& p = std::get<TrailingStopParams>(request.params);
            if (!is_positive_finite(p.quantity)) {
                return invalid("Quantity must be positive");
            }
            if (!is_positive_finite(p.trail_value)) {
                return invalid("Trail value must be positive");
            }
            if (p.trail_mode == TrailMode::RATE && p.trail_value >= 100.0) {
                return invalid("Trail rate must be below 100 percent");
            }
            if (!is_non_negative_finite(p.rearm_threshold)) {
                return invalid("Re-arm threshold cannot be negative");
            }
            break;
        }
        case PlanKind::OCO: {
            const auto& p = std::get<OcoParams>(request.params);
            if (!is_positive_finite(p.quantity)) {
                return invalid("Quantity must be positive");
            }
            if (!is_positive_finite(p.stop_price) || !is_positive_finite(p.limit_price)) {
                return invalid("OCO prices must be positive");
            }
            if (!OcoCoordinator::prices_ordered(request.side, p.stop_price, p.limit_price)) {
                return invalid(request.side == Side::SELL
                                   ? "SELL OCO needs stop below limit"
                                   : "BUY OCO needs limit below stop");
            }
            break;
        }
    }
    return Result<void>();
}

Result<std::string> ExecutionSupervisor::submit_plan(const PlanRequest& request) {
    auto valid = validate_request(request);
    if (valid.is_error()) {
        WARN("Rejected " << plan_kind_to_string(request.kind) << " plan: "
                         << valid.error()->what());
        return make_error<std::string>(valid.error()->code(), valid.error()->what(),
                                       "ExecutionSupervisor");
    }

    reap_finished();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stopping_) {
        return make_error<std::string>(ErrorCode::NOT_INITIALIZED,
                                       "Supervisor is not running", "ExecutionSupervisor");
    }

    std::string plan_id = registry_.create(request);
    ++plans_submitted_;
    INFO("Submitted " << plan_kind_to_string(request.kind) << " plan " << plan_id << " "
                      << side_to_string(request.side) << " " << request.symbol);

    if (workers_.size() < config_.max_concurrent_plans) {
        launch_locked(plan_id);
    } else {
        queue_.push_back(plan_id);
        INFO("Plan " << plan_id << " queued, " << queue_.size() << " waiting");
    }
    return Result<std::string>(plan_id);
}

void ExecutionSupervisor::launch_locked(const std::string& plan_id) {
    workers_.emplace(plan_id, std::thread(&ExecutionSupervisor::run_plan, this, plan_id));
}

void ExecutionSupervisor::run_plan(const std::string& plan_id) {
    auto snapshot = registry_.snapshot(plan_id);
    auto token = registry_.token(plan_id);
    if (snapshot.is_error() || !token) {
        Logger::register_component("ExecutionSupervisor");
        ERROR("Plan " << plan_id << " vanished before its worker started");
        on_plan_finished(plan_id);
        return;
    }

    const OrderPlan& plan = snapshot.value().plan;
    const auto handler = handlers_.at(plan.kind);
    Logger::register_component(handler->component_name());

    PlanContext ctx(registry_, plan, token);
    std::string failure = "Handler stopped without a terminal status";
    try {
        handler->run(ctx);
    } catch (const std::exception& e) {
        failure = std::string("Unhandled exception: ") + e.what();
        ERROR("Plan " << plan_id << " handler threw: " << e.what());
    }

    auto status = ctx.status();
    if (status && !is_terminal(*status)) {
        if (*status == PlanStatus::PENDING) {
            auto started = registry_.transition(plan_id, PlanStatus::RUNNING);
            if (started.is_error()) {
                ERROR("Plan " << plan_id << ": " << started.error()->what());
            }
        }
        ctx.finish(PlanStatus::FAILED, failure);
    }

    on_plan_finished(plan_id);
}

void ExecutionSupervisor::retire_plan(const std::string& plan_id) {
    auto snapshot = registry_.snapshot(plan_id);
    if (snapshot.is_ok()) {
        const auto& finished = snapshot.value();
        switch (finished.plan.status) {
            case PlanStatus::COMPLETED:
                ++plans_completed_;
                break;
            case PlanStatus::FAILED:
                ++plans_failed_;
                break;
            case PlanStatus::CANCELLED:
                ++plans_cancelled_;
                break;
            default:
                break;
        }
        legs_submitted_ += finished.metrics.legs_submitted;
        legs_filled_ += finished.metrics.legs_filled;
    }

    auto retired = registry_.retire(plan_id);
    if (retired.is_error()) {
        ERROR("Could not retire plan " << plan_id << ": " << retired.error()->what());
    }
}

void ExecutionSupervisor::on_plan_finished(const std::string& plan_id) {
    retire_plan(plan_id);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workers_.find(plan_id);
        if (it != workers_.end()) {
            finished_.push_back(std::move(it->second));
            workers_.erase(it);
        }

        while (!stopping_ && !queue_.empty() && workers_.size() < config_.max_concurrent_plans) {
            std::string next = queue_.front();
            queue_.pop_front();
            launch_locked(next);
        }
    }

    publish_metrics();
}

void ExecutionSupervisor::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done.swap(finished_);
    }
    for (auto& worker : done) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

Result<PlanSnapshot> ExecutionSupervisor::get_plan_status(const std::string& plan_id) const {
    return registry_.snapshot(plan_id);
}

Result<void> ExecutionSupervisor::cancel_plan(const std::string& plan_id) {
    bool was_queued = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto queued = std::find(queue_.begin(), queue_.end(), plan_id);
        if (queued != queue_.end()) {
            queue_.erase(queued);
            auto cancelled =
                registry_.transition(plan_id, PlanStatus::CANCELLED, "Cancelled while queued");
            if (cancelled.is_error()) {
                return cancelled;
            }
            retire_plan(plan_id);
            was_queued = true;
        }
    }

    if (was_queued) {
        INFO("Plan " << plan_id << " cancelled while queued");
        publish_metrics();
        return Result<void>();
    }

    auto token = registry_.token(plan_id);
    if (!token) {
        return make_error<void>(ErrorCode::PLAN_NOT_FOUND, "No active plan " + plan_id,
                                "ExecutionSupervisor");
    }

    token->cancel();
    INFO("Cancellation requested for plan " << plan_id);
    return Result<void>();
}

std::vector<PlanSnapshot> ExecutionSupervisor::list_active_plans() const {
    return registry_.list_active();
}

Result<PlanStatus> ExecutionSupervisor::wait_for_plan(const std::string& plan_id,
                                                      std::chrono::milliseconds timeout) const {
    return registry_.wait_for_retirement(plan_id, timeout);
}

EngineMetrics ExecutionSupervisor::get_engine_metrics() const {
    EngineMetrics metrics;
    metrics.plans_submitted = plans_submitted_.load();
    metrics.plans_completed = plans_completed_.load();
    metrics.plans_failed = plans_failed_.load();
    metrics.plans_cancelled = plans_cancelled_.load();
    metrics.legs_submitted = legs_submitted_.load();
    metrics.legs_filled = legs_filled_.load();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics.active_plans = static_cast<int>(workers_.size());
        metrics.queued_plans = static_cast<int>(queue_.size());
    }

    const int retired = metrics.plans_completed + metrics.plans_failed + metrics.plans_cancelled;
    if (retired > 0) {
        metrics.success_rate = static_cast<double>(metrics.plans_completed) / retired;
    }
    return metrics;
}

void ExecutionSupervisor::publish_metrics() const {
    auto result =
        StateManager::instance().update_metrics(component_id_, get_engine_metrics().to_map());
    if (result.is_error()) {
        WARN("Failed to publish engine metrics: " << result.error()->what());
    }
}

Result<void> ExecutionSupervisor::save_completed_plans(const std::string& path) const {
    try {
        nlohmann::json j = registry_.completed_json();
        std::ofstream file(path);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + path,
                                    "ExecutionSupervisor");
        }
        file << std::setw(4) << j << std::endl;
        INFO("Saved " << j.size() << " completed plans to " << path);
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error saving completed plans: ") + e.what(),
                                "ExecutionSupervisor");
    }
}

Result<void> ExecutionSupervisor::shutdown() {
    std::deque<std::string> queued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return Result<void>();
        }
        stopping_ = true;
        queued.swap(queue_);
    }

    for (const auto& plan_id : queued) {
        auto cancelled = registry_.transition(plan_id, PlanStatus::CANCELLED, "Engine shutdown");
        if (cancelled.is_error()) {
            ERROR("Plan " << plan_id << ": " << cancelled.error()->what());
        }
        retire_plan(plan_id);
    }

    for (const auto& snapshot : registry_.list_active()) {
        auto token = registry_.token(snapshot.plan.id);
        if (token) {
            token->cancel();
        }
    }

    while (true) {
        std::vector<std::thread> running;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& [_, worker] : workers_) {
                running.push_back(std::move(worker));
            }
            workers_.clear();
        }
        if (running.empty()) {
            break;
        }
        for (auto& worker : running) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }
    reap_finished();

    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_running = running_;
        running_ = false;
    }

    publish_metrics();
    auto state_result =
        StateManager::instance().update_state(component_id_, ComponentState::STOPPED);
    if (state_result.is_error()) {
        return state_result;
    }

    if (was_running) {
        INFO("Execution supervisor " << component_id_ << " stopped");
    }
    return Result<void>();
}

}  // namespace order_ngin
