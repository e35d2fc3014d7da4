// src/execution/grid_planner.cpp

#include "order_ngin/execution/grid_planner.hpp"
#include <cmath>

namespace order_ngin {

namespace {

constexpr double LOT_EPSILON = 1e-9;

}  // namespace

Result<std::vector<GridLevel>> GridPlanner::compute_levels(Price start, Price end, int count,
                                                           Quantity total_quantity,
                                                           GridSpacing spacing,
                                                           Quantity lot_size) {
    if (!is_positive_finite(start) || !std::isfinite(end) || !(start < end)) {
        return make_error<std::vector<GridLevel>>(
            ErrorCode::INVALID_RANGE,
            "Grid range must satisfy 0 < start < end, got " + std::to_string(start) + " to " +
                std::to_string(end),
            "GridPlanner");
    }
    if (count < 2) {
        return make_error<std::vector<GridLevel>>(
            ErrorCode::INVALID_RANGE, "Grid needs at least 2 levels, got " + std::to_string(count),
            "GridPlanner");
    }
    if (!is_positive_finite(total_quantity) || !is_non_negative_finite(lot_size)) {
        return make_error<std::vector<GridLevel>>(ErrorCode::INVALID_ARGUMENT,
                                                  "Grid quantity must be positive",
                                                  "GridPlanner");
    }

    Quantity per_level = total_quantity / count;
    if (lot_size > 0.0) {
        per_level = std::floor(per_level / lot_size + LOT_EPSILON) * lot_size;
    }
    if (per_level <= 0.0) {
        return make_error<std::vector<GridLevel>>(
            ErrorCode::INVALID_ARGUMENT,
            "Quantity per level is below the lot size of " + std::to_string(lot_size),
            "GridPlanner");
    }
    const Quantity remainder = total_quantity - per_level * count;

    std::vector<GridLevel> levels;
    levels.reserve(static_cast<size_t>(count));

    const double step = (end - start) / (count - 1);
    const double ratio = std::pow(end / start, 1.0 / (count - 1));
    for (int i = 0; i < count; ++i) {
        GridLevel level;
        level.index = i;
        if (i == count - 1) {
            level.price = end;
        } else if (spacing == GridSpacing::GEOMETRIC) {
            level.price = start * std::pow(ratio, i);
        } else {
            level.price = start + step * i;
        }
        level.quantity = i == 0 ? per_level + remainder : per_level;
        levels.push_back(level);
    }
    return Result<std::vector<GridLevel>>(levels);
}

}  // namespace order_ngin
