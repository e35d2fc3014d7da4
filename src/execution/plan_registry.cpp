// src/execution/plan_registry.cpp

#include "order_ngin/execution/plan_registry.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace order_ngin {

namespace {

// Trailing counter of a PLAN_<millis>_<n> id
uint64_t id_sequence(const std::string& plan_id) {
    auto pos = plan_id.rfind('_');
    if (pos == std::string::npos || pos + 1 >= plan_id.size()) {
        return 0;
    }
    return std::stoull(plan_id.substr(pos + 1));
}

}  // namespace

PlanRegistry::PlanRegistry(size_t completed_capacity) : completed_capacity_(completed_capacity) {}

std::string PlanRegistry::generate_id_locked() {
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();

    std::stringstream ss;
    ss << "PLAN_" << std::hex << std::uppercase << std::setfill('0') << std::setw(12) << now_ms
       << "_" << std::dec << ++id_counter_;
    return ss.str();
}

std::string PlanRegistry::create(const PlanRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    Entry entry;
    entry.plan.id = generate_id_locked();
    entry.plan.kind = request.kind;
    entry.plan.symbol = request.symbol;
    entry.plan.side = request.side;
    entry.plan.params = request.params;
    entry.plan.status = PlanStatus::PENDING;
    entry.plan.created_at = std::chrono::system_clock::now();
    entry.token = std::make_shared<CancellationToken>();

    std::string id = entry.plan.id;
    active_.emplace(id, std::move(entry));
    return id;
}

const OrderPlan* PlanRegistry::find_completed_locked(const std::string& plan_id) const {
    // Newest first, recent plans are the ones callers ask about
    for (auto it = completed_.rbegin(); it != completed_.rend(); ++it) {
        if (it->id == plan_id) {
            return &(*it);
        }
    }
    return nullptr;
}

Result<PlanSnapshot> PlanRegistry::snapshot(const std::string& plan_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const OrderPlan* plan = nullptr;
    auto it = active_.find(plan_id);
    if (it != active_.end()) {
        plan = &it->second.plan;
    } else {
        plan = find_completed_locked(plan_id);
    }

    if (!plan) {
        return make_error<PlanSnapshot>(ErrorCode::PLAN_NOT_FOUND, "Plan not found: " + plan_id,
                                        "PlanRegistry");
    }
    return Result<PlanSnapshot>(PlanSnapshot{*plan, compute_metrics(*plan)});
}

bool PlanRegistry::is_active(const std::string& plan_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(plan_id) > 0;
}

Result<void> PlanRegistry::mutate(const std::string& plan_id,
                                  const std::function<void(OrderPlan&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(plan_id);
    if (it == active_.end()) {
        return make_error<void>(ErrorCode::PLAN_NOT_FOUND, "Plan not active: " + plan_id,
                                "PlanRegistry");
    }
    fn(it->second.plan);
    return Result<void>();
}

Result<void> PlanRegistry::transition(const std::string& plan_id, PlanStatus status,
                                      const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(plan_id);
    if (it == active_.end()) {
        return make_error<void>(ErrorCode::PLAN_NOT_FOUND, "Plan not active: " + plan_id,
                                "PlanRegistry");
    }

    OrderPlan& plan = it->second.plan;
    if (!is_valid_status_transition(plan.status, status)) {
        return make_error<void>(ErrorCode::INVALID_STATE_TRANSITION,
                                "Invalid plan transition from " +
                                    plan_status_to_string(plan.status) + " to " +
                                    plan_status_to_string(status),
                                "PlanRegistry");
    }

    auto now = std::chrono::system_clock::now();
    plan.status = status;
    if (status == PlanStatus::RUNNING) {
        plan.started_at = now;
    } else if (is_terminal(status)) {
        plan.finished_at = now;
        plan.status_message = message;
    }
    return Result<void>();
}

std::shared_ptr<CancellationToken> PlanRegistry::token(const std::string& plan_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(plan_id);
    return it == active_.end() ? nullptr : it->second.token;
}

Result<void> PlanRegistry::retire(const std::string& plan_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(plan_id);
        if (it == active_.end()) {
            return make_error<void>(ErrorCode::PLAN_NOT_FOUND, "Plan not active: " + plan_id,
                                    "PlanRegistry");
        }
        if (!is_terminal(it->second.plan.status)) {
            return make_error<void>(ErrorCode::INVALID_STATE_TRANSITION,
                                    "Cannot retire plan in status " +
                                        plan_status_to_string(it->second.plan.status),
                                    "PlanRegistry");
        }

        completed_.push_back(std::move(it->second.plan));
        active_.erase(it);
        while (completed_.size() > completed_capacity_) {
            completed_.pop_front();
        }
    }
    retired_cv_.notify_all();
    return Result<void>();
}

Result<PlanStatus> PlanRegistry::wait_for_retirement(const std::string& plan_id,
                                                     std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (active_.count(plan_id) == 0 && !find_completed_locked(plan_id)) {
        return make_error<PlanStatus>(ErrorCode::PLAN_NOT_FOUND, "Plan not found: " + plan_id,
                                      "PlanRegistry");
    }

    bool retired = retired_cv_.wait_for(lock, timeout,
                                        [&] { return active_.count(plan_id) == 0; });
    if (!retired) {
        return make_error<PlanStatus>(ErrorCode::TIMEOUT_ERROR,
                                      "Timed out waiting for plan " + plan_id, "PlanRegistry");
    }

    const OrderPlan* plan = find_completed_locked(plan_id);
    if (!plan) {
        return make_error<PlanStatus>(ErrorCode::PLAN_NOT_FOUND,
                                      "Plan aged out of the completed log: " + plan_id,
                                      "PlanRegistry");
    }
    return Result<PlanStatus>(plan->status);
}

std::vector<PlanSnapshot> PlanRegistry::list_active() const {
    std::vector<PlanSnapshot> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(active_.size());
        for (const auto& [_, entry] : active_) {
            result.push_back(PlanSnapshot{entry.plan, compute_metrics(entry.plan)});
        }
    }

    std::sort(result.begin(), result.end(), [](const PlanSnapshot& a, const PlanSnapshot& b) {
        if (a.plan.created_at != b.plan.created_at) {
            return a.plan.created_at < b.plan.created_at;
        }
        return id_sequence(a.plan.id) < id_sequence(b.plan.id);
    });
    return result;
}

std::vector<PlanSnapshot> PlanRegistry::list_completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PlanSnapshot> result;
    result.reserve(completed_.size());
    for (const auto& plan : completed_) {
        result.push_back(PlanSnapshot{plan, compute_metrics(plan)});
    }
    return result;
}

size_t PlanRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

nlohmann::json PlanRegistry::completed_json() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& snapshot : list_completed()) {
        j.push_back(to_json(snapshot));
    }
    return j;
}

}  // namespace order_ngin
