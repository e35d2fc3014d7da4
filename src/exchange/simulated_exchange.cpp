// src/exchange/simulated_exchange.cpp

#include "order_ngin/exchange/simulated_exchange.hpp"
#include <algorithm>
#include <thread>
#include "order_ngin/core/logger.hpp"

namespace order_ngin {

SimulatedExchange::SimulatedExchange(SimulatedExchangeConfig config)
    : config_(std::move(config)), prices_(config_.initial_prices) {}

Result<void> SimulatedExchange::take_failure_locked(SimulatedOperation operation) {
    auto it = failures_.find(operation);
    if (it == failures_.end() || it->second.empty()) {
        return Result<void>();
    }
    ErrorCode code = it->second.front();
    it->second.pop_front();
    return make_error<void>(code, "Injected failure: " + error_code_to_string(code),
                            "SimulatedExchange");
}

void SimulatedExchange::simulate_latency() const {
    if (config_.latency.count() > 0) {
        std::this_thread::sleep_for(config_.latency);
    }
}

bool SimulatedExchange::is_crossed(const OpenOrder& order, Price market_price) {
    switch (order.type) {
        case OrderType::LIMIT:
            return order.side == Side::BUY ? market_price <= order.price
                                           : market_price >= order.price;
        case OrderType::STOP:
            return order.side == Side::BUY ? market_price >= order.price
                                           : market_price <= order.price;
        case OrderType::MARKET:
            return true;
        default:
            return false;
    }
}

Result<ExchangeOrderAck> SimulatedExchange::place_order(const std::string& symbol, Side side,
                                                        OrderType type, Quantity quantity,
                                                        std::optional<Price> price) {
    simulate_latency();
    std::lock_guard<std::mutex> lock(mutex_);

    auto failure = take_failure_locked(SimulatedOperation::PLACE);
    if (failure.is_error()) {
        return make_error<ExchangeOrderAck>(failure.error()->code(), failure.error()->what(),
                                            "SimulatedExchange");
    }

    auto price_it = prices_.find(symbol);
    if (price_it == prices_.end()) {
        return make_error<ExchangeOrderAck>(ErrorCode::INVALID_SYMBOL,
                                            "Unknown symbol: " + symbol, "SimulatedExchange");
    }
    if (side == Side::NONE || !is_positive_finite(quantity)) {
        return make_error<ExchangeOrderAck>(ErrorCode::ORDER_REJECTED,
                                            "Invalid side or quantity", "SimulatedExchange");
    }
    if (type != OrderType::MARKET && (!price.has_value() || !is_positive_finite(*price))) {
        return make_error<ExchangeOrderAck>(ErrorCode::ORDER_REJECTED,
                                            "Price required for " + order_type_to_string(type),
                                            "SimulatedExchange");
    }

    const Price market_price = price_it->second;

    SimulatedOrder sim;
    sim.sequence = next_order_id_;
    sim.order.exchange_order_id = "SIM" + std::to_string(next_order_id_++);
    sim.order.symbol = symbol;
    sim.order.side = side;
    sim.order.type = type;
    sim.order.quantity = quantity;
    sim.order.price = type == OrderType::MARKET ? market_price : *price;

    if (type == OrderType::STOP && config_.reject_immediate_stops &&
        is_crossed(sim.order, market_price)) {
        return make_error<ExchangeOrderAck>(ErrorCode::ORDER_REJECTED,
                                            "Order would immediately trigger",
                                            "SimulatedExchange");
    }

    if (is_crossed(sim.order, market_price)) {
        sim.order.status = ExchangeOrderStatus::FILLED;
        sim.fill_price = type == OrderType::LIMIT ? sim.order.price : market_price;
    }

    ExchangeOrderAck ack{sim.order.exchange_order_id, sim.order.status, sim.fill_price};
    DEBUG("Simulated " << order_type_to_string(type) << " " << side_to_string(side) << " "
                       << quantity << " " << symbol << " -> " << ack.exchange_order_id << " "
                       << exchange_status_to_string(ack.status));
    orders_.emplace(sim.order.exchange_order_id, std::move(sim));
    return Result<ExchangeOrderAck>(ack);
}

Result<void> SimulatedExchange::cancel_order(const std::string& symbol,
                                             const std::string& exchange_order_id) {
    simulate_latency();
    std::lock_guard<std::mutex> lock(mutex_);

    auto failure = take_failure_locked(SimulatedOperation::CANCEL);
    if (failure.is_error()) {
        return failure;
    }

    auto it = orders_.find(exchange_order_id);
    if (it == orders_.end() || it->second.order.symbol != symbol) {
        return make_error<void>(ErrorCode::ORDER_NOT_FOUND,
                                "Unknown order: " + exchange_order_id, "SimulatedExchange");
    }

    auto& order = it->second.order;
    if (order.status == ExchangeOrderStatus::FILLED) {
        return make_error<void>(ErrorCode::ORDER_ALREADY_FILLED,
                                "Order already filled: " + exchange_order_id,
                                "SimulatedExchange");
    }
    if (is_terminal(order.status)) {
        return make_error<void>(ErrorCode::ORDER_NOT_FOUND,
                                "Order no longer open: " + exchange_order_id,
                                "SimulatedExchange");
    }

    order.status = ExchangeOrderStatus::CANCELLED;
    return Result<void>();
}

Result<ExchangeOrderStatus> SimulatedExchange::get_order_status(
    const std::string& symbol, const std::string& exchange_order_id) {
    simulate_latency();
    std::lock_guard<std::mutex> lock(mutex_);

    auto failure = take_failure_locked(SimulatedOperation::STATUS);
    if (failure.is_error()) {
        return make_error<ExchangeOrderStatus>(failure.error()->code(), failure.error()->what(),
                                               "SimulatedExchange");
    }

    auto it = orders_.find(exchange_order_id);
    if (it == orders_.end() || it->second.order.symbol != symbol) {
        return make_error<ExchangeOrderStatus>(ErrorCode::ORDER_NOT_FOUND,
                                               "Unknown order: " + exchange_order_id,
                                               "SimulatedExchange");
    }
    return Result<ExchangeOrderStatus>(it->second.order.status);
}

Result<Price> SimulatedExchange::get_current_price(const std::string& symbol) {
    simulate_latency();
    std::lock_guard<std::mutex> lock(mutex_);

    auto failure = take_failure_locked(SimulatedOperation::PRICE);
    if (failure.is_error()) {
        return make_error<Price>(failure.error()->code(), failure.error()->what(),
                                 "SimulatedExchange");
    }

    auto it = prices_.find(symbol);
    if (it == prices_.end()) {
        return make_error<Price>(ErrorCode::INVALID_SYMBOL, "Unknown symbol: " + symbol,
                                 "SimulatedExchange");
    }
    return Result<Price>(it->second);
}

Result<std::vector<OpenOrder>> SimulatedExchange::get_open_orders(const std::string& symbol) {
    simulate_latency();
    std::lock_guard<std::mutex> lock(mutex_);

    auto failure = take_failure_locked(SimulatedOperation::OPEN_ORDERS);
    if (failure.is_error()) {
        return make_error<std::vector<OpenOrder>>(failure.error()->code(),
                                                  failure.error()->what(), "SimulatedExchange");
    }

    std::vector<const SimulatedOrder*> open;
    for (const auto& [_, sim] : orders_) {
        if (!is_terminal(sim.order.status) && (symbol.empty() || sim.order.symbol == symbol)) {
            open.push_back(&sim);
        }
    }
    std::sort(open.begin(), open.end(), [](const SimulatedOrder* a, const SimulatedOrder* b) {
        return a->sequence < b->sequence;
    });

    std::vector<OpenOrder> result;
    result.reserve(open.size());
    for (const auto* sim : open) {
        result.push_back(sim->order);
    }
    return Result<std::vector<OpenOrder>>(result);
}

size_t SimulatedExchange::set_price(const std::string& symbol, Price price) {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_[symbol] = price;

    size_t filled = 0;
    for (auto& [id, sim] : orders_) {
        if (sim.order.symbol != symbol || is_terminal(sim.order.status)) {
            continue;
        }
        if (is_crossed(sim.order, price)) {
            sim.order.status = ExchangeOrderStatus::FILLED;
            sim.fill_price = sim.order.type == OrderType::LIMIT ? sim.order.price : price;
            ++filled;
            DEBUG("Simulated fill of " << id << " at " << *sim.fill_price);
        }
    }
    return filled;
}

void SimulatedExchange::inject_failure(SimulatedOperation operation, ErrorCode code, int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int i = 0; i < count; ++i) {
        failures_[operation].push_back(code);
    }
}

Result<void> SimulatedExchange::fill_order(const std::string& exchange_order_id,
                                           std::optional<Price> fill_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(exchange_order_id);
    if (it == orders_.end()) {
        return make_error<void>(ErrorCode::ORDER_NOT_FOUND,
                                "Unknown order: " + exchange_order_id, "SimulatedExchange");
    }
    if (is_terminal(it->second.order.status)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Order is not open: " + exchange_order_id, "SimulatedExchange");
    }
    it->second.order.status = ExchangeOrderStatus::FILLED;
    it->second.fill_price = fill_price.value_or(it->second.order.price);
    return Result<void>();
}

Result<void> SimulatedExchange::cancel_externally(const std::string& exchange_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(exchange_order_id);
    if (it == orders_.end()) {
        return make_error<void>(ErrorCode::ORDER_NOT_FOUND,
                                "Unknown order: " + exchange_order_id, "SimulatedExchange");
    }
    if (is_terminal(it->second.order.status)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Order is not open: " + exchange_order_id, "SimulatedExchange");
    }
    it->second.order.status = ExchangeOrderStatus::CANCELLED;
    return Result<void>();
}

std::vector<OpenOrder> SimulatedExchange::all_orders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const SimulatedOrder*> sorted;
    sorted.reserve(orders_.size());
    for (const auto& [_, sim] : orders_) {
        sorted.push_back(&sim);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const SimulatedOrder* a, const SimulatedOrder* b) {
                  return a->sequence < b->sequence;
              });

    std::vector<OpenOrder> result;
    result.reserve(sorted.size());
    for (const auto* sim : sorted) {
        result.push_back(sim->order);
    }
    return result;
}

size_t SimulatedExchange::live_order_count(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(orders_.begin(), orders_.end(), [&](const auto& kv) {
        return !is_terminal(kv.second.order.status) &&
               (symbol.empty() || kv.second.order.symbol == symbol);
    }));
}

}  // namespace order_ngin
