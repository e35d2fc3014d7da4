#include <gtest/gtest.h>
#include <limits>
#include <numeric>
#include "order_ngin/execution/grid_planner.hpp"

using namespace order_ngin;

class GridPlannerTest : public ::testing::Test {
protected:
    static Quantity total_of(const std::vector<GridLevel>& levels) {
        return std::accumulate(levels.begin(), levels.end(), 0.0,
                               [](Quantity sum, const GridLevel& l) { return sum + l.quantity; });
    }
};

TEST_F(GridPlannerTest, ArithmeticLevelsSpanRange) {
    auto result = GridPlanner::compute_levels(40000.0, 45000.0, 10, 0.1);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& levels = result.value();
    ASSERT_EQ(levels.size(), 10u);
    EXPECT_NEAR(levels.front().price, 40000.0, 0.01);
    EXPECT_DOUBLE_EQ(levels.back().price, 45000.0);
    EXPECT_NEAR(levels[1].price, 40555.56, 0.01);

    for (size_t i = 1; i < levels.size(); ++i) {
        EXPECT_GT(levels[i].price, levels[i - 1].price);
        EXPECT_NEAR(levels[i].price - levels[i - 1].price, 5000.0 / 9.0, 0.01);
        EXPECT_EQ(levels[i].index, static_cast<int>(i));
    }
    EXPECT_NEAR(total_of(levels), 0.1, 1e-12);
}

TEST_F(GridPlannerTest, GeometricLevelsKeepConstantRatio) {
    auto result = GridPlanner::compute_levels(100.0, 1600.0, 5, 5.0, GridSpacing::GEOMETRIC);
    ASSERT_TRUE(result.is_ok());

    const auto& levels = result.value();
    ASSERT_EQ(levels.size(), 5u);
    EXPECT_NEAR(levels[0].price, 100.0, 1e-9);
    EXPECT_NEAR(levels[1].price, 200.0, 1e-9);
    EXPECT_NEAR(levels[2].price, 400.0, 1e-9);
    EXPECT_NEAR(levels[3].price, 800.0, 1e-9);
    EXPECT_DOUBLE_EQ(levels[4].price, 1600.0);
    for (const auto& level : levels) {
        EXPECT_DOUBLE_EQ(level.quantity, 1.0);
    }
}

TEST_F(GridPlannerTest, LotRoundingPutsRemainderOnFirstLevel) {
    auto result = GridPlanner::compute_levels(100.0, 200.0, 3, 1.0, GridSpacing::ARITHMETIC, 0.1);
    ASSERT_TRUE(result.is_ok());

    const auto& levels = result.value();
    EXPECT_NEAR(levels[0].quantity, 0.4, 1e-9);
    EXPECT_NEAR(levels[1].quantity, 0.3, 1e-9);
    EXPECT_NEAR(levels[2].quantity, 0.3, 1e-9);
    EXPECT_NEAR(total_of(levels), 1.0, 1e-9);
}

TEST_F(GridPlannerTest, TwoLevelsAreTheEndpoints) {
    auto result = GridPlanner::compute_levels(42000.0, 44000.0, 2, 0.02);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_DOUBLE_EQ(result.value()[0].price, 42000.0);
    EXPECT_DOUBLE_EQ(result.value()[1].price, 44000.0);
}

TEST_F(GridPlannerTest, InvalidRanges) {
    EXPECT_EQ(GridPlanner::compute_levels(45000.0, 40000.0, 10, 0.1).error()->code(),
              ErrorCode::INVALID_RANGE);
    EXPECT_EQ(GridPlanner::compute_levels(40000.0, 40000.0, 10, 0.1).error()->code(),
              ErrorCode::INVALID_RANGE);
    EXPECT_EQ(GridPlanner::compute_levels(0.0, 40000.0, 10, 0.1).error()->code(),
              ErrorCode::INVALID_RANGE);
    EXPECT_EQ(GridPlanner::compute_levels(40000.0, 45000.0, 1, 0.1).error()->code(),
              ErrorCode::INVALID_RANGE);
}

TEST_F(GridPlannerTest, NonFiniteRangeIsInvalid) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_EQ(GridPlanner::compute_levels(nan, 45000.0, 10, 0.1).error()->code(),
              ErrorCode::INVALID_RANGE);
    EXPECT_EQ(GridPlanner::compute_levels(40000.0, nan, 10, 0.1).error()->code(),
              ErrorCode::INVALID_RANGE);
    EXPECT_EQ(GridPlanner::compute_levels(40000.0, inf, 10, 0.1).error()->code(),
              ErrorCode::INVALID_RANGE);
    EXPECT_EQ(GridPlanner::compute_levels(40000.0, 45000.0, 10, nan).error()->code(),
              ErrorCode::INVALID_ARGUMENT);
}

TEST_F(GridPlannerTest, InvalidQuantities) {
    EXPECT_EQ(GridPlanner::compute_levels(40000.0, 45000.0, 10, 0.0).error()->code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(GridPlanner::compute_levels(40000.0, 45000.0, 10, 0.005, GridSpacing::ARITHMETIC,
                                          0.001)
                  .error()
                  ->code(),
              ErrorCode::INVALID_ARGUMENT);
}

TEST_F(GridPlannerTest, ParamsOverloadMatches) {
    GridParams params;
    params.start_price = 40000.0;
    params.end_price = 45000.0;
    params.grid_count = 6;
    params.total_quantity = 0.06;

    auto from_params = GridPlanner::compute_levels(params);
    auto direct = GridPlanner::compute_levels(40000.0, 45000.0, 6, 0.06);
    ASSERT_TRUE(from_params.is_ok());
    ASSERT_TRUE(direct.is_ok());
    ASSERT_EQ(from_params.value().size(), direct.value().size());
    for (size_t i = 0; i < direct.value().size(); ++i) {
        EXPECT_DOUBLE_EQ(from_params.value()[i].price, direct.value()[i].price);
    }
}
