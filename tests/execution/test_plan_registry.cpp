#include <gtest/gtest.h>
#include <regex>
#include <set>
#include <thread>
#include "test_utils.hpp"
#include "order_ngin/execution/plan_registry.hpp"

using namespace order_ngin;
using namespace order_ngin::testing;

class PlanRegistryTest : public TestBase {
protected:
    void finish(PlanRegistry& registry, const std::string& id, PlanStatus status) {
        ASSERT_TRUE(registry.transition(id, PlanStatus::RUNNING).is_ok());
        ASSERT_TRUE(registry.transition(id, status, "done").is_ok());
        ASSERT_TRUE(registry.retire(id).is_ok());
    }
};

TEST_F(PlanRegistryTest, CreateAssignsUniquePendingIds) {
    PlanRegistry registry;
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        ids.insert(registry.create(create_oco_request()));
    }
    EXPECT_EQ(ids.size(), 50u);

    const std::regex pattern("PLAN_[0-9A-F]{12}_[0-9]+");
    for (const auto& id : ids) {
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
        auto snapshot = registry.snapshot(id);
        ASSERT_TRUE(snapshot.is_ok());
        EXPECT_THAT(snapshot.value(), HasPlanStatus(PlanStatus::PENDING));
        EXPECT_EQ(snapshot.value().plan.kind, PlanKind::OCO);
        EXPECT_TRUE(snapshot.value().plan.legs.empty());
    }
}

TEST_F(PlanRegistryTest, UnknownIdIsNotFound) {
    PlanRegistry registry;
    auto snapshot = registry.snapshot("PLAN_000000000000_1");
    ASSERT_TRUE(snapshot.is_error());
    EXPECT_EQ(snapshot.error()->code(), ErrorCode::PLAN_NOT_FOUND);
    EXPECT_EQ(registry.token("PLAN_000000000000_1"), nullptr);
}

TEST_F(PlanRegistryTest, TransitionsFollowLifecycle) {
    PlanRegistry registry;
    const std::string id = registry.create(create_twap_request());

    EXPECT_EQ(registry.transition(id, PlanStatus::COMPLETED).error()->code(),
              ErrorCode::INVALID_STATE_TRANSITION);

    ASSERT_TRUE(registry.transition(id, PlanStatus::RUNNING).is_ok());
    ASSERT_TRUE(registry.transition(id, PlanStatus::FAILED, "Slice 1 rejected").is_ok());
    EXPECT_EQ(registry.transition(id, PlanStatus::COMPLETED).error()->code(),
              ErrorCode::INVALID_STATE_TRANSITION);

    auto snapshot = registry.snapshot(id).value();
    EXPECT_EQ(snapshot.plan.status, PlanStatus::FAILED);
    EXPECT_EQ(snapshot.plan.status_message, "Slice 1 rejected");
    EXPECT_GE(snapshot.plan.finished_at, snapshot.plan.started_at);
}

TEST_F(PlanRegistryTest, PendingPlanCanBeCancelled) {
    PlanRegistry registry;
    const std::string id = registry.create(create_grid_request());
    EXPECT_TRUE(registry.transition(id, PlanStatus::CANCELLED, "Cancelled while queued").is_ok());
    EXPECT_TRUE(registry.retire(id).is_ok());
    EXPECT_EQ(registry.snapshot(id).value().plan.status, PlanStatus::CANCELLED);
}

TEST_F(PlanRegistryTest, RetireRequiresTerminalStatus) {
    PlanRegistry registry;
    const std::string id = registry.create(create_twap_request());
    ASSERT_TRUE(registry.transition(id, PlanStatus::RUNNING).is_ok());

    EXPECT_EQ(registry.retire(id).error()->code(), ErrorCode::INVALID_STATE_TRANSITION);
    EXPECT_TRUE(registry.is_active(id));
}

TEST_F(PlanRegistryTest, RetiredPlansStayQueryable) {
    PlanRegistry registry;
    const std::string id = registry.create(create_twap_request());
    finish(registry, id, PlanStatus::COMPLETED);

    EXPECT_FALSE(registry.is_active(id));
    EXPECT_EQ(registry.active_count(), 0u);
    auto snapshot = registry.snapshot(id);
    ASSERT_TRUE(snapshot.is_ok());
    EXPECT_THAT(snapshot.value(), HasPlanStatus(PlanStatus::COMPLETED));

    EXPECT_EQ(registry.mutate(id, [](OrderPlan&) {}).error()->code(), ErrorCode::PLAN_NOT_FOUND);
    EXPECT_EQ(registry.token(id), nullptr);
}

TEST_F(PlanRegistryTest, CompletedLogIsBounded) {
    PlanRegistry registry(3);
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(registry.create(create_twap_request()));
        finish(registry, ids.back(), PlanStatus::COMPLETED);
    }

    auto completed = registry.list_completed();
    ASSERT_EQ(completed.size(), 3u);
    EXPECT_EQ(completed.front().plan.id, ids[2]);
    EXPECT_EQ(completed.back().plan.id, ids[4]);
    EXPECT_EQ(registry.snapshot(ids[0]).error()->code(), ErrorCode::PLAN_NOT_FOUND);

    auto j = registry.completed_json();
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j.size(), 3u);
}

TEST_F(PlanRegistryTest, ListActiveInSubmissionOrder) {
    PlanRegistry registry;
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(registry.create(create_twap_request()));
    }

    auto active = registry.list_active();
    ASSERT_EQ(active.size(), 5u);
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(active[i].plan.id, ids[i]);
    }
}

TEST_F(PlanRegistryTest, MutateUpdatesMetrics) {
    PlanRegistry registry;
    const std::string id = registry.create(create_twap_request(0.02, 2));

    ASSERT_TRUE(registry
                    .mutate(id,
                            [](OrderPlan& plan) {
                                OrderLeg leg;
                                leg.sequence_number = 1;
                                leg.type = OrderType::MARKET;
                                leg.price = 43000.0;
                                leg.quantity = 0.01;
                                leg.result_state = LegState::FILLED;
                                leg.fill_price = 43000.0;
                                plan.legs.push_back(leg);
                            })
                    .is_ok());

    auto snapshot = registry.snapshot(id).value();
    EXPECT_EQ(snapshot.metrics.legs_submitted, 1);
    EXPECT_EQ(snapshot.metrics.legs_filled, 1);
    EXPECT_THAT(snapshot, HasFilledQuantity(0.01, 1e-12));
    EXPECT_NEAR(snapshot.metrics.completion_rate, 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(snapshot.metrics.average_fill_price, 43000.0);
}

TEST_F(PlanRegistryTest, WaitForRetirement) {
    PlanRegistry registry;
    const std::string id = registry.create(create_twap_request());

    auto timed_out = registry.wait_for_retirement(id, std::chrono::milliseconds(10));
    ASSERT_TRUE(timed_out.is_error());
    EXPECT_EQ(timed_out.error()->code(), ErrorCode::TIMEOUT_ERROR);

    std::thread finisher([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_TRUE(registry.transition(id, PlanStatus::RUNNING).is_ok());
        EXPECT_TRUE(registry.transition(id, PlanStatus::CANCELLED).is_ok());
        EXPECT_TRUE(registry.retire(id).is_ok());
    });

    auto status = registry.wait_for_retirement(id, std::chrono::milliseconds(2000));
    finisher.join();
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value(), PlanStatus::CANCELLED);

    EXPECT_EQ(registry.wait_for_retirement("PLAN_X_1", std::chrono::milliseconds(1))
                  .error()
                  ->code(),
              ErrorCode::PLAN_NOT_FOUND);
}
