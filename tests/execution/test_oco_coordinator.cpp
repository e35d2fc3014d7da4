#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "order_ngin/execution/oco_coordinator.hpp"

using namespace order_ngin;
using namespace order_ngin::testing;

class OcoCoordinatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        exchange_ = create_test_exchange();
        config_ = create_fast_config();
    }

    std::shared_ptr<OcoCoordinator> coordinator() {
        return std::make_shared<OcoCoordinator>(exchange_, config_);
    }

    bool both_legs_live() const {
        return exchange_->live_order_count("BTCUSDT") == 2;
    }

    std::shared_ptr<HookedExchange> exchange_;
    EngineConfig config_;
};

TEST_F(OcoCoordinatorTest, PriceOrderingBySide) {
    EXPECT_TRUE(OcoCoordinator::prices_ordered(Side::SELL, 41000.0, 45000.0));
    EXPECT_FALSE(OcoCoordinator::prices_ordered(Side::SELL, 45000.0, 41000.0));
    EXPECT_TRUE(OcoCoordinator::prices_ordered(Side::BUY, 45000.0, 41000.0));
    EXPECT_FALSE(OcoCoordinator::prices_ordered(Side::BUY, 41000.0, 45000.0));
    EXPECT_FALSE(OcoCoordinator::prices_ordered(Side::NONE, 41000.0, 45000.0));
}

TEST_F(OcoCoordinatorTest, LimitFillCancelsStop) {
    HandlerRun run(coordinator(), create_oco_request());
    run.start();
    ASSERT_TRUE(eventually([&] { return both_legs_live(); }));

    exchange_->set_price("BTCUSDT", 45500.0);
    run.join();

    auto snapshot = run.snapshot();
    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::COMPLETED));
    ASSERT_EQ(snapshot.plan.legs.size(), 2u);
    EXPECT_EQ(snapshot.plan.legs[0].type, OrderType::STOP);
    EXPECT_EQ(snapshot.plan.legs[1].type, OrderType::LIMIT);
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::CANCELLED));
    EXPECT_THAT(snapshot.plan.legs[1], HasLegState(LegState::FILLED));
    EXPECT_FALSE(snapshot.plan.double_fill);
    EXPECT_EQ(snapshot.plan.status_message, "Limit leg filled, sibling cancelled");
    EXPECT_EQ(exchange_->live_order_count(), 0u);
}

TEST_F(OcoCoordinatorTest, StopFillCancelsLimit) {
    HandlerRun run(coordinator(), create_oco_request());
    run.start();
    ASSERT_TRUE(eventually([&] { return both_legs_live(); }));

    exchange_->set_price("BTCUSDT", 40000.0);
    run.join();

    auto snapshot = run.snapshot();
    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::COMPLETED));
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::FILLED));
    EXPECT_THAT(snapshot.plan.legs[1], HasLegState(LegState::CANCELLED));
    EXPECT_EQ(snapshot.plan.status_message, "Stop leg filled, sibling cancelled");
}

TEST_F(OcoCoordinatorTest, BuySideLimitBelowStopAbove) {
    HandlerRun run(coordinator(), create_oco_request(Side::BUY, 45000.0, 41000.0));
    run.start();
    ASSERT_TRUE(eventually([&] { return both_legs_live(); }));

    exchange_->set_price("BTCUSDT", 40500.0);
    run.join();

    auto snapshot = run.snapshot();
    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::COMPLETED));
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::CANCELLED));
    EXPECT_THAT(snapshot.plan.legs[1], HasLegState(LegState::FILLED));
    EXPECT_DOUBLE_EQ(*snapshot.plan.legs[1].fill_price, 41000.0);
}

TEST_F(OcoCoordinatorTest, SiblingFillingFirstIsDoubleFill) {
    exchange_->before_cancel = [this](const std::string& id) {
        EXPECT_TRUE(exchange_->fill_order(id).is_ok());
    };

    HandlerRun run(coordinator(), create_oco_request());
    run.start();
    ASSERT_TRUE(eventually([&] { return both_legs_live(); }));

    auto orders = exchange_->all_orders();
    ASSERT_EQ(orders.size(), 2u);
    ASSERT_EQ(orders[1].type, OrderType::LIMIT);
    ASSERT_TRUE(exchange_->fill_order(orders[1].exchange_order_id).is_ok());
    run.join();

    auto snapshot = run.snapshot();
    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::COMPLETED));
    EXPECT_TRUE(snapshot.plan.double_fill);
    EXPECT_EQ(snapshot.plan.status_message, "Both legs filled");
    EXPECT_EQ(legs_in_state(snapshot.plan, LegState::FILLED).size(), 2u);
}

TEST_F(OcoCoordinatorTest, CancelRemovesBothLegs) {
    HandlerRun run(coordinator(), create_oco_request());
    run.start();
    ASSERT_TRUE(eventually([&] { return both_legs_live(); }));

    run.cancel();
    run.join();

    auto snapshot = run.snapshot();
    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::CANCELLED));
    EXPECT_EQ(legs_in_state(snapshot.plan, LegState::CANCELLED).size(), 2u);
    EXPECT_EQ(exchange_->live_order_count(), 0u);
}

TEST_F(OcoCoordinatorTest, RejectedLimitCancelsStop) {
    exchange_->before_place = [this](OrderType type, std::optional<Price>) {
        if (type == OrderType::LIMIT) {
            exchange_->inject_failure(SimulatedOperation::PLACE, ErrorCode::ORDER_REJECTED);
        }
    };

    HandlerRun run(coordinator(), create_oco_request());
    auto snapshot = run.run_to_end();

    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::FAILED));
    ASSERT_EQ(snapshot.plan.legs.size(), 2u);
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::CANCELLED));
    EXPECT_THAT(snapshot.plan.legs[1], HasLegState(LegState::REJECTED));
    EXPECT_EQ(exchange_->live_order_count(), 0u);
}

TEST_F(OcoCoordinatorTest, RejectedStopPlacesNothingElse) {
    exchange_->inject_failure(SimulatedOperation::PLACE, ErrorCode::ORDER_REJECTED);

    HandlerRun run(coordinator(), create_oco_request());
    auto snapshot = run.run_to_end();

    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::FAILED));
    ASSERT_EQ(snapshot.plan.legs.size(), 1u);
    EXPECT_TRUE(exchange_->all_orders().empty());
}

TEST_F(OcoCoordinatorTest, BothLegsClosedExternallyFails) {
    HandlerRun run(coordinator(), create_oco_request());
    run.start();
    ASSERT_TRUE(eventually([&] { return both_legs_live(); }));

    for (const auto& order : exchange_->all_orders()) {
        ASSERT_TRUE(exchange_->cancel_externally(order.exchange_order_id).is_ok());
    }
    run.join();

    auto snapshot = run.snapshot();
    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::FAILED));
    EXPECT_EQ(snapshot.plan.status_message, "Both legs closed without a fill");
}

TEST_F(OcoCoordinatorTest, StopClosedOnAckPlacesNoLimit) {
    exchange_->close_on_ack = OrderType::STOP;
    exchange_->close_status = ExchangeOrderStatus::REJECTED;

    HandlerRun run(coordinator(), create_oco_request());
    auto snapshot = run.run_to_end();

    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::FAILED));
    ASSERT_EQ(snapshot.plan.legs.size(), 1u);
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::REJECTED));
    EXPECT_NE(snapshot.plan.status_message.find("Stop leg not placed"), std::string::npos);
    EXPECT_EQ(exchange_->live_order_count(), 0u);
}

TEST_F(OcoCoordinatorTest, LimitClosedOnAckCancelsStop) {
    exchange_->close_on_ack = OrderType::LIMIT;
    exchange_->close_status = ExchangeOrderStatus::EXPIRED;

    HandlerRun run(coordinator(), create_oco_request());
    auto snapshot = run.run_to_end();

    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::FAILED));
    ASSERT_EQ(snapshot.plan.legs.size(), 2u);
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::CANCELLED));
    EXPECT_THAT(snapshot.plan.legs[1], HasLegState(LegState::CANCELLED));
    EXPECT_NE(snapshot.plan.status_message.find("Limit leg not placed"), std::string::npos);
    EXPECT_EQ(exchange_->live_order_count(), 0u);
}

TEST_F(OcoCoordinatorTest, CancelDuringLimitRetryBackoff) {
    config_.retry_policy.initial_backoff = std::chrono::milliseconds(2000);
    config_.retry_policy.max_backoff = std::chrono::milliseconds(2000);
    bool failed_once = false;
    exchange_->before_place = [&](OrderType type, std::optional<Price>) {
        if (type == OrderType::LIMIT && !failed_once) {
            failed_once = true;
            exchange_->inject_failure(SimulatedOperation::PLACE, ErrorCode::NETWORK_ERROR, 1);
        }
    };

    HandlerRun run(coordinator(), create_oco_request());
    run.start();
    ASSERT_TRUE(eventually([&] { return run.snapshot().plan.retry_count == 1; }));

    run.cancel();
    run.join();

    auto snapshot = run.snapshot();
    EXPECT_THAT(snapshot, HasPlanStatus(PlanStatus::CANCELLED));
    ASSERT_EQ(snapshot.plan.legs.size(), 2u);
    EXPECT_THAT(snapshot.plan.legs[0], HasLegState(LegState::CANCELLED));
    EXPECT_THAT(snapshot.plan.legs[1], HasLegState(LegState::TIMED_OUT));
    EXPECT_EQ(exchange_->live_order_count(), 0u);
}
