// include/order_ngin/execution/order_plan.hpp
#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "order_ngin/core/types.hpp"

namespace order_ngin {

/**
 * @brief Kinds of derived order plans
 */
enum class PlanKind { TWAP, GRID, TRAILING_STOP, OCO };

/**
 * @brief Plan lifecycle
 *
 * PENDING -> RUNNING -> {COMPLETED | FAILED | CANCELLED}, plus PENDING -> CANCELLED
 * for a plan cancelled while queued. Terminal states are final.
 */
enum class PlanStatus { PENDING, RUNNING, COMPLETED, FAILED, CANCELLED };

/**
 * @brief Outcome of one primitive order
 */
enum class LegState { SUBMITTED, FILLED, REJECTED, CANCELLED, TIMED_OUT };

enum class GridSpacing {
    ARITHMETIC,  // Constant price step
    GEOMETRIC    // Constant price ratio
};

enum class TrailMode {
    DISTANCE,  // Absolute price offset
    RATE       // Percent of the best price seen
};

struct TwapParams {
    Quantity total_quantity{0.0};
    std::chrono::milliseconds duration{0};
    int intervals{0};
    Quantity lot_size{0.0};  // Slices are floored to this step, 0 disables rounding
};

struct GridParams {
    Price start_price{0.0};
    Price end_price{0.0};
    int grid_count{0};
    Quantity total_quantity{0.0};
    GridSpacing spacing{GridSpacing::ARITHMETIC};
    Quantity lot_size{0.0};
};

struct TrailingStopParams {
    Quantity quantity{0.0};
    TrailMode trail_mode{TrailMode::DISTANCE};
    double trail_value{0.0};      // Price offset, or percent in (0, 100) for RATE
    Price rearm_threshold{0.0};  // Minimum stop improvement before re-arming
};

struct OcoParams {
    Quantity quantity{0.0};
    Price stop_price{0.0};
    Price limit_price{0.0};
};

using PlanParams = std::variant<TwapParams, GridParams, TrailingStopParams, OcoParams>;

/**
 * @brief Kind implied by the parameter alternative held
 */
PlanKind plan_kind_of(const PlanParams& params);

std::string plan_kind_to_string(PlanKind kind);
std::string plan_status_to_string(PlanStatus status);
std::string leg_state_to_string(LegState state);

inline bool is_terminal(PlanStatus status) {
    return status == PlanStatus::COMPLETED || status == PlanStatus::FAILED ||
           status == PlanStatus::CANCELLED;
}

inline bool is_terminal(LegState state) {
    return state != LegState::SUBMITTED;
}

/**
 * @brief True if the lifecycle allows moving from `from` to `to`
 */
bool is_valid_status_transition(PlanStatus from, PlanStatus to);

/**
 * @brief One primitive order submitted on behalf of a plan
 */
struct OrderLeg {
    int sequence_number{0};
    std::optional<std::string> exchange_order_id;
    OrderType type{OrderType::NONE};
    Price price{0.0};  // Limit or stop price, last price for market legs
    Quantity quantity{0.0};
    Timestamp submitted_at;
    LegState result_state{LegState::SUBMITTED};
    std::optional<Price> fill_price;
    std::string error_message;
};

/**
 * @brief Live state of a trailing stop, owned by its monitor
 */
struct TrailingState {
    Price best_price_seen{0.0};
    Price armed_stop_price{0.0};
    std::optional<int> active_leg;  // Sequence number of the live stop order
    int rearm_count{0};
};

/**
 * @brief Unit of work submitted by a caller
 */
struct OrderPlan {
    std::string id;
    PlanKind kind{PlanKind::TWAP};
    std::string symbol;
    Side side{Side::NONE};
    PlanParams params;
    PlanStatus status{PlanStatus::PENDING};
    std::vector<OrderLeg> legs;

    Timestamp created_at;
    Timestamp started_at;
    Timestamp finished_at;
    std::string status_message;
    int retry_count{0};
    bool double_fill{false};
    std::optional<TrailingState> trailing;

    const OrderLeg* find_leg(int sequence_number) const;
    OrderLeg* find_leg(int sequence_number);
};

/**
 * @brief Caller-side description of a plan to submit
 */
struct PlanRequest {
    PlanKind kind{PlanKind::TWAP};
    std::string symbol;
    Side side{Side::NONE};
    PlanParams params;
};

/**
 * @brief Aggregates derived from a plan's legs
 */
struct PlanMetrics {
    int legs_submitted{0};
    int legs_filled{0};
    int legs_failed{0};     // REJECTED or TIMED_OUT
    int legs_cancelled{0};
    int legs_open{0};
    Quantity filled_quantity{0.0};
    Quantity target_quantity{0.0};
    double average_fill_price{0.0};
    double completion_rate{0.0};  // filled_quantity / target_quantity
    std::chrono::milliseconds elapsed{0};
    int retries{0};
};

PlanMetrics compute_metrics(const OrderPlan& plan);

/**
 * @brief Point-in-time copy of a plan returned to callers
 */
struct PlanSnapshot {
    OrderPlan plan;
    PlanMetrics metrics;
};

nlohmann::json to_json(const OrderLeg& leg);
nlohmann::json to_json(const PlanParams& params);
nlohmann::json to_json(const PlanMetrics& metrics);
nlohmann::json to_json(const OrderPlan& plan);
nlohmann::json to_json(const PlanSnapshot& snapshot);

}  // namespace order_ngin
