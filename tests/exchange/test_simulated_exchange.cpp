#include <gtest/gtest.h>
#include "order_ngin/exchange/simulated_exchange.hpp"
#include "../core/test_base.hpp"

using namespace order_ngin;
using namespace order_ngin::testing;

class SimulatedExchangeTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        SimulatedExchangeConfig config;
        config.initial_prices = {{"BTCUSDT", 43000.0}, {"ETHUSDT", 2300.0}};
        exchange = std::make_unique<SimulatedExchange>(config);
    }

    std::unique_ptr<SimulatedExchange> exchange;
};

TEST_F(SimulatedExchangeTest, MarketOrderFillsAtLastPrice) {
    auto ack = exchange->place_order("BTCUSDT", Side::BUY, OrderType::MARKET, 0.01, std::nullopt);
    ASSERT_TRUE(ack.is_ok());
    EXPECT_EQ(ack.value().status, ExchangeOrderStatus::FILLED);
    ASSERT_TRUE(ack.value().fill_price.has_value());
    EXPECT_DOUBLE_EQ(*ack.value().fill_price, 43000.0);
    EXPECT_EQ(ack.value().exchange_order_id.rfind("SIM", 0), 0u);
}

TEST_F(SimulatedExchangeTest, LimitOrderRestsUntilCrossed) {
    auto ack = exchange->place_order("BTCUSDT", Side::BUY, OrderType::LIMIT, 0.01, 42000.0);
    ASSERT_TRUE(ack.is_ok());
    EXPECT_EQ(ack.value().status, ExchangeOrderStatus::NEW);
    const std::string id = ack.value().exchange_order_id;

    EXPECT_EQ(exchange->set_price("BTCUSDT", 42500.0), 0u);
    EXPECT_EQ(exchange->get_order_status("BTCUSDT", id).value(), ExchangeOrderStatus::NEW);

    EXPECT_EQ(exchange->set_price("BTCUSDT", 41900.0), 1u);
    EXPECT_EQ(exchange->get_order_status("BTCUSDT", id).value(), ExchangeOrderStatus::FILLED);
    EXPECT_EQ(exchange->live_order_count(), 0u);
}

TEST_F(SimulatedExchangeTest, MarketableLimitFillsOnPlacement) {
    auto ack = exchange->place_order("BTCUSDT", Side::SELL, OrderType::LIMIT, 0.01, 42000.0);
    ASSERT_TRUE(ack.is_ok());
    EXPECT_EQ(ack.value().status, ExchangeOrderStatus::FILLED);
    EXPECT_DOUBLE_EQ(*ack.value().fill_price, 42000.0);
}

TEST_F(SimulatedExchangeTest, StopTriggersWhenMarketMovesThrough) {
    auto ack = exchange->place_order("BTCUSDT", Side::SELL, OrderType::STOP, 0.01, 41000.0);
    ASSERT_TRUE(ack.is_ok());
    EXPECT_EQ(ack.value().status, ExchangeOrderStatus::NEW);

    exchange->set_price("BTCUSDT", 40900.0);
    EXPECT_EQ(exchange->get_order_status("BTCUSDT", ack.value().exchange_order_id).value(),
              ExchangeOrderStatus::FILLED);
}

TEST_F(SimulatedExchangeTest, StopThroughTheMarketIsRejected) {
    auto ack = exchange->place_order("BTCUSDT", Side::SELL, OrderType::STOP, 0.01, 44000.0);
    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error()->code(), ErrorCode::ORDER_REJECTED);
    EXPECT_TRUE(exchange->all_orders().empty());
}

TEST_F(SimulatedExchangeTest, RejectsInvalidOrders) {
    auto unknown = exchange->place_order("DOGEUSDT", Side::BUY, OrderType::MARKET, 1.0,
                                         std::nullopt);
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::INVALID_SYMBOL);

    auto no_price = exchange->place_order("BTCUSDT", Side::BUY, OrderType::LIMIT, 0.01,
                                          std::nullopt);
    ASSERT_TRUE(no_price.is_error());
    EXPECT_EQ(no_price.error()->code(), ErrorCode::ORDER_REJECTED);

    auto zero_qty = exchange->place_order("BTCUSDT", Side::BUY, OrderType::MARKET, 0.0,
                                          std::nullopt);
    ASSERT_TRUE(zero_qty.is_error());
    EXPECT_EQ(zero_qty.error()->code(), ErrorCode::ORDER_REJECTED);

    auto price = exchange->get_current_price("DOGEUSDT");
    ASSERT_TRUE(price.is_error());
    EXPECT_EQ(price.error()->code(), ErrorCode::INVALID_SYMBOL);
}

TEST_F(SimulatedExchangeTest, CancelOutcomes) {
    auto resting = exchange->place_order("BTCUSDT", Side::BUY, OrderType::LIMIT, 0.01, 42000.0);
    ASSERT_TRUE(resting.is_ok());
    const std::string id = resting.value().exchange_order_id;

    EXPECT_TRUE(exchange->cancel_order("BTCUSDT", id).is_ok());
    EXPECT_EQ(exchange->get_order_status("BTCUSDT", id).value(), ExchangeOrderStatus::CANCELLED);

    auto again = exchange->cancel_order("BTCUSDT", id);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error()->code(), ErrorCode::ORDER_NOT_FOUND);

    auto filled = exchange->place_order("BTCUSDT", Side::BUY, OrderType::MARKET, 0.01,
                                        std::nullopt);
    auto late = exchange->cancel_order("BTCUSDT", filled.value().exchange_order_id);
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error()->code(), ErrorCode::ORDER_ALREADY_FILLED);

    auto unknown = exchange->cancel_order("BTCUSDT", "SIM999");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::ORDER_NOT_FOUND);
}

TEST_F(SimulatedExchangeTest, InjectedFailuresAreConsumedInOrder) {
    exchange->inject_failure(SimulatedOperation::PLACE, ErrorCode::NETWORK_ERROR, 2);

    for (int i = 0; i < 2; ++i) {
        auto ack = exchange->place_order("BTCUSDT", Side::BUY, OrderType::MARKET, 0.01,
                                         std::nullopt);
        ASSERT_TRUE(ack.is_error());
        EXPECT_EQ(ack.error()->code(), ErrorCode::NETWORK_ERROR);
    }

    auto ack = exchange->place_order("BTCUSDT", Side::BUY, OrderType::MARKET, 0.01, std::nullopt);
    EXPECT_TRUE(ack.is_ok());

    exchange->inject_failure(SimulatedOperation::PRICE, ErrorCode::RATE_LIMITED);
    EXPECT_EQ(exchange->get_current_price("BTCUSDT").error()->code(), ErrorCode::RATE_LIMITED);
    EXPECT_DOUBLE_EQ(exchange->get_current_price("BTCUSDT").value(), 43000.0);
}

TEST_F(SimulatedExchangeTest, OpenOrdersFilterBySymbol) {
    ASSERT_TRUE(
        exchange->place_order("BTCUSDT", Side::BUY, OrderType::LIMIT, 0.01, 42000.0).is_ok());
    ASSERT_TRUE(
        exchange->place_order("BTCUSDT", Side::BUY, OrderType::LIMIT, 0.01, 41000.0).is_ok());
    ASSERT_TRUE(
        exchange->place_order("ETHUSDT", Side::SELL, OrderType::LIMIT, 1.0, 2400.0).is_ok());

    auto btc = exchange->get_open_orders("BTCUSDT");
    ASSERT_TRUE(btc.is_ok());
    ASSERT_EQ(btc.value().size(), 2u);
    EXPECT_DOUBLE_EQ(btc.value()[0].price, 42000.0);
    EXPECT_DOUBLE_EQ(btc.value()[1].price, 41000.0);

    auto all = exchange->get_open_orders("");
    ASSERT_TRUE(all.is_ok());
    EXPECT_EQ(all.value().size(), 3u);
    EXPECT_EQ(exchange->live_order_count("ETHUSDT"), 1u);
}

TEST_F(SimulatedExchangeTest, ExternalFillAndCancel) {
    auto first = exchange->place_order("BTCUSDT", Side::BUY, OrderType::LIMIT, 0.01, 42000.0);
    auto second = exchange->place_order("BTCUSDT", Side::BUY, OrderType::LIMIT, 0.01, 41000.0);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_TRUE(exchange->fill_order(first.value().exchange_order_id).is_ok());
    EXPECT_TRUE(exchange->cancel_externally(second.value().exchange_order_id).is_ok());

    EXPECT_EQ(exchange->get_order_status("BTCUSDT", first.value().exchange_order_id).value(),
              ExchangeOrderStatus::FILLED);
    EXPECT_EQ(exchange->get_order_status("BTCUSDT", second.value().exchange_order_id).value(),
              ExchangeOrderStatus::CANCELLED);
    EXPECT_TRUE(exchange->fill_order(second.value().exchange_order_id).is_error());
}
