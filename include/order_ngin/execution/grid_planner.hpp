// include/order_ngin/execution/grid_planner.hpp
#pragma once

#include <vector>
#include "order_ngin/core/error.hpp"
#include "order_ngin/execution/order_plan.hpp"

namespace order_ngin {

struct GridLevel {
    int index{0};
    Price price{0.0};
    Quantity quantity{0.0};
};

/**
 * @brief Pure computation of grid price levels
 */
class GridPlanner {
public:
    /**
     * @brief Split a price range into `count` levels with equal quantity
     *
     * Prices run from start to end inclusive, strictly increasing. With a
     * lot size, per-level quantity is floored to the lot and the remainder
     * goes to the first level.
     *
     * @return INVALID_RANGE unless 0 < start < end (both finite) and count >= 2;
     *         INVALID_ARGUMENT if the per-level quantity is not positive
     */
    static Result<std::vector<GridLevel>> compute_levels(Price start, Price end, int count,
                                                         Quantity total_quantity,
                                                         GridSpacing spacing = GridSpacing::ARITHMETIC,
                                                         Quantity lot_size = 0.0);

    static Result<std::vector<GridLevel>> compute_levels(const GridParams& params) {
        return compute_levels(params.start_price, params.end_price, params.grid_count,
                              params.total_quantity, params.spacing, params.lot_size);
    }
};

}  // namespace order_ngin
