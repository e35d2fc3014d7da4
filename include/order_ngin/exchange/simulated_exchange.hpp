// include/order_ngin/exchange/simulated_exchange.hpp
#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <unordered_map>
#include "order_ngin/core/config_base.hpp"
#include "order_ngin/exchange/exchange_client.hpp"

namespace order_ngin {

/**
 * @brief Exchange calls that can be made to fail on purpose
 */
enum class SimulatedOperation { PLACE, CANCEL, STATUS, PRICE, OPEN_ORDERS };

/**
 * @brief Configuration for the paper venue
 */
struct SimulatedExchangeConfig : public ConfigBase {
    std::chrono::milliseconds latency{0};  // Added to every call
    bool reject_immediate_stops{true};     // Stops already through the market are rejected
    std::unordered_map<std::string, Price> initial_prices;

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["latency_ms"] = latency.count();
        j["reject_immediate_stops"] = reject_immediate_stops;
        j["initial_prices"] = initial_prices;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("latency_ms"))
            latency = std::chrono::milliseconds(j.at("latency_ms").get<int64_t>());
        if (j.contains("reject_immediate_stops"))
            reject_immediate_stops = j.at("reject_immediate_stops").get<bool>();
        if (j.contains("initial_prices"))
            initial_prices =
                j.at("initial_prices").get<std::unordered_map<std::string, Price>>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief In-memory paper venue
 *
 * Market orders fill at the last price. Limit and stop orders rest until
 * set_price() moves the market through them. Failures can be queued per
 * operation with inject_failure() to exercise retry and reconciliation paths.
 */
class SimulatedExchange : public ExchangeClient {
public:
    explicit SimulatedExchange(SimulatedExchangeConfig config = SimulatedExchangeConfig());

    SimulatedExchange(const SimulatedExchange&) = delete;
    SimulatedExchange& operator=(const SimulatedExchange&) = delete;

    Result<ExchangeOrderAck> place_order(const std::string& symbol, Side side, OrderType type,
                                         Quantity quantity, std::optional<Price> price) override;
    Result<void> cancel_order(const std::string& symbol,
                              const std::string& exchange_order_id) override;
    Result<ExchangeOrderStatus> get_order_status(const std::string& symbol,
                                                 const std::string& exchange_order_id) override;
    Result<Price> get_current_price(const std::string& symbol) override;
    Result<std::vector<OpenOrder>> get_open_orders(const std::string& symbol) override;

    /**
     * @brief Move the market and fill every resting order it crosses
     * @return Number of orders filled by the move
     */
    size_t set_price(const std::string& symbol, Price price);

    /**
     * @brief Make the next `count` calls of an operation fail with `code`
     */
    void inject_failure(SimulatedOperation operation, ErrorCode code, int count = 1);

    /**
     * @brief Fill a resting order regardless of price
     */
    Result<void> fill_order(const std::string& exchange_order_id,
                            std::optional<Price> fill_price = std::nullopt);

    /**
     * @brief Cancel a resting order from outside the engine (e.g. manual cancel)
     */
    Result<void> cancel_externally(const std::string& exchange_order_id);

    /**
     * @brief Every order ever accepted, in placement order
     */
    std::vector<OpenOrder> all_orders() const;

    size_t live_order_count(const std::string& symbol = "") const;

private:
    struct SimulatedOrder {
        OpenOrder order;
        std::optional<Price> fill_price;
        uint64_t sequence{0};
    };

    Result<void> take_failure_locked(SimulatedOperation operation);
    static bool is_crossed(const OpenOrder& order, Price market_price);
    void simulate_latency() const;

    SimulatedExchangeConfig config_;
    std::unordered_map<std::string, SimulatedOrder> orders_;
    std::unordered_map<std::string, Price> prices_;
    std::unordered_map<SimulatedOperation, std::deque<ErrorCode>> failures_;
    uint64_t next_order_id_{1};
    mutable std::mutex mutex_;
};

}  // namespace order_ngin
