#include <gtest/gtest.h>
#include <numeric>
#include "test_utils.hpp"
#include "order_ngin/execution/slice_scheduler.hpp"

using namespace order_ngin;
using namespace order_ngin::testing;

class SliceSchedulerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        exchange_ = create_test_exchange();
        config_ = create_fast_config();
    }

    std::shared_ptr<SliceScheduler> scheduler() {
        return std::make_shared<SliceScheduler>(exchange_, config_);
    }

    std::shared_ptr<HookedExchange> exchange_;
    EngineConfig config_;
};

TEST_F(SliceSchedulerTest, PlanSlicesEvenSplit) {
    auto slices = SliceScheduler::plan_slices(0.01, 10, 0.001);
    ASSERT_TRUE(slices.is_ok());
    ASSERT_EQ(slices.value().size(), 10u);
    for (auto q : slices.value()) {
        EXPECT_NEAR(q, 0.001, 1e-12);
    }
    EXPECT_NEAR(std::accumulate(slices.value().begin(), slices.value().end(), 0.0), 0.01, 1e-12);
}

TEST_F(SliceSchedulerTest, PlanSlicesLastTakesRemainder) {
    auto slices = SliceScheduler::plan_slices(0.0105, 4, 0.001);
    ASSERT_TRUE(slices.is_ok());
    const auto& q = slices.value();
    ASSERT_EQ(q.size(), 4u);
    EXPECT_NEAR(q[0], 0.002, 1e-12);
    EXPECT_NEAR(q[1], 0.002, 1e-12);
    EXPECT_NEAR(q[2], 0.002, 1e-12);
    EXPECT_NEAR(q[3], 0.0045, 1e-12);
}

TEST_F(SliceSchedulerTest, PlanSlicesRejectsInvalidInput) {
    EXPECT_EQ(SliceScheduler::plan_slices(0.01, 0).error()->code(), ErrorCode::INVALID_PLAN);
    EXPECT_EQ(SliceScheduler::plan_slices(0.0, 5).error()->code(), ErrorCode::INVALID_PLAN);
    EXPECT_EQ(SliceScheduler::plan_slices(0.005, 10, 0.001).error()->code(),
              ErrorCode::INVALID_PLAN);
}

TEST_F(SliceSchedulerTest, ExecutesEverySlice) {
    HandlerRun run(scheduler(), create_twap_request(0.01, 10, std::chrono::milliseconds(50)));
    auto snapshot = run.run_to_end();

    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::COMPLETED));
    ASSERT_EQ(snapshot.plan.legs.size(), 10u);
    for (const auto& leg : snapshot.plan.legs) {
        EXPECT_THAT(leg, HasLegState(LegState::FILLED));
        EXPECT_EQ(leg.type, OrderType::MARKET);
        EXPECT_DOUBLE_EQ(leg.price, 43000.0);
    }
    EXPECT_THAT(snapshot, HasFilledQuantity(0.01, 1e-9));
    EXPECT_NEAR(snapshot.metrics.completion_rate, 1.0, 1e-9);
    EXPECT_GE(snapshot.metrics.elapsed.count(), 40);
}

TEST_F(SliceSchedulerTest, TransientFailureIsRetried) {
    exchange_->inject_failure(SimulatedOperation::PLACE, ErrorCode::NETWORK_ERROR, 1);

    HandlerRun run(scheduler(), create_twap_request(0.003, 3, std::chrono::milliseconds(15)));
    auto snapshot = run.run_to_end();

    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::COMPLETED));
    ASSERT_EQ(snapshot.plan.legs.size(), 4u);
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::TIMED_OUT));
    EXPECT_EQ(snapshot.plan.retry_count, 1);
    EXPECT_THAT(snapshot, HasFilledQuantity(0.003, 1e-9));
}

TEST_F(SliceSchedulerTest, RetriesExhaustedFailsPlan) {
    config_.retry_policy.max_retries = 1;
    exchange_->inject_failure(SimulatedOperation::PLACE, ErrorCode::NETWORK_ERROR, 2);

    HandlerRun run(scheduler(), create_twap_request(0.003, 3, std::chrono::milliseconds(15)));
    auto snapshot = run.run_to_end();

    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::FAILED));
    ASSERT_EQ(snapshot.plan.legs.size(), 2u);
    EXPECT_EQ(legs_in_state(snapshot.plan, LegState::TIMED_OUT).size(), 2u);
    EXPECT_NE(snapshot.plan.status_message.find("Slice 1"), std::string::npos);
}

TEST_F(SliceSchedulerTest, PermanentRejectionFailsImmediately) {
    exchange_->inject_failure(SimulatedOperation::PLACE, ErrorCode::ORDER_REJECTED, 1);

    HandlerRun run(scheduler(), create_twap_request(0.003, 3, std::chrono::milliseconds(15)));
    auto snapshot = run.run_to_end();

    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::FAILED));
    ASSERT_EQ(snapshot.plan.legs.size(), 1u);
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::REJECTED));
    EXPECT_EQ(snapshot.plan.retry_count, 0);
}

TEST_F(SliceSchedulerTest, CancelStopsBeforeNextSlice) {
    HandlerRun run(scheduler(), create_twap_request(0.01, 10, std::chrono::milliseconds(10000)));
    run.start();

    ASSERT_TRUE(eventually([&] { return run.snapshot().plan.legs.size() == 1; }));
    run.cancel();
    run.join();

    auto snapshot = run.snapshot();
    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::CANCELLED));
    EXPECT_EQ(snapshot.plan.legs.size(), 1u);
    EXPECT_THAT(snapshot, HasFilledQuantity(0.001, 1e-9));
}

TEST_F(SliceSchedulerTest, UnfilledSliceTimesOutAndIsResent) {
    exchange_->rest_market_orders = 1;

    HandlerRun run(scheduler(), create_twap_request(0.002, 2, std::chrono::milliseconds(10)));
    auto snapshot = run.run_to_end();

    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::COMPLETED));
    ASSERT_EQ(snapshot.plan.legs.size(), 3u);
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::TIMED_OUT));
    EXPECT_THAT(snapshot.plan.legs[1], HasLegState(LegState::FILLED));
    EXPECT_THAT(snapshot.plan.legs[2], HasLegState(LegState::FILLED));
    EXPECT_EQ(snapshot.plan.retry_count, 1);
    EXPECT_THAT(snapshot, HasFilledQuantity(0.002, 1e-9));
    EXPECT_EQ(exchange_->live_order_count(), 0u);
}

TEST_F(SliceSchedulerTest, CancelDuringFillWaitCancelsLiveSlice) {
    exchange_->rest_market_orders = 1;
    config_.order_fill_timeout = std::chrono::milliseconds(10000);

    HandlerRun run(scheduler(), create_twap_request(0.002, 2, std::chrono::milliseconds(10)));
    run.start();

    ASSERT_TRUE(eventually([&] { return exchange_->live_order_count() == 1; }));
    run.cancel();
    run.join();

    auto snapshot = run.snapshot();
    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::CANCELLED));
    ASSERT_EQ(snapshot.plan.legs.size(), 1u);
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::CANCELLED));
    EXPECT_EQ(exchange_->live_order_count(), 0u);
}
