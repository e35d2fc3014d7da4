// include/order_ngin/exchange/exchange_client.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "order_ngin/core/error.hpp"
#include "order_ngin/core/types.hpp"

namespace order_ngin {

/**
 * @brief Order status as reported by the venue
 */
enum class ExchangeOrderStatus {
    NEW,
    PARTIALLY_FILLED,
    FILLED,
    CANCELLED,
    REJECTED,
    EXPIRED
};

std::string exchange_status_to_string(ExchangeOrderStatus status);

inline bool is_terminal(ExchangeOrderStatus status) {
    return status == ExchangeOrderStatus::FILLED || status == ExchangeOrderStatus::CANCELLED ||
           status == ExchangeOrderStatus::REJECTED || status == ExchangeOrderStatus::EXPIRED;
}

/**
 * @brief Acknowledgement returned by place_order
 */
struct ExchangeOrderAck {
    std::string exchange_order_id;
    ExchangeOrderStatus status{ExchangeOrderStatus::NEW};
    std::optional<Price> fill_price;  // Set when the order filled on placement
};

/**
 * @brief Resting order as listed by get_open_orders
 */
struct OpenOrder {
    std::string exchange_order_id;
    std::string symbol;
    Side side{Side::NONE};
    OrderType type{OrderType::NONE};
    Quantity quantity{0.0};
    Price price{0.0};
    ExchangeOrderStatus status{ExchangeOrderStatus::NEW};
};

/**
 * @brief Synchronous capability over the remote venue
 *
 * Implementations own transport, authentication and pacing. Every call blocks
 * until the venue answers or the implementation gives up, and reports failures
 * as error results:
 *   - NETWORK_ERROR, TIMEOUT_ERROR, RATE_LIMITED (transient)
 *   - AUTH_ERROR, ORDER_REJECTED, INVALID_SYMBOL (permanent)
 *   - ORDER_ALREADY_FILLED, ORDER_NOT_FOUND (cancel and status lookups)
 */
class ExchangeClient {
public:
    virtual ~ExchangeClient() = default;

    /**
     * @brief Submit a primitive order
     * @param price Limit price for LIMIT, trigger price for STOP, ignored for MARKET
     */
    virtual Result<ExchangeOrderAck> place_order(const std::string& symbol, Side side,
                                                 OrderType type, Quantity quantity,
                                                 std::optional<Price> price) = 0;

    virtual Result<void> cancel_order(const std::string& symbol,
                                      const std::string& exchange_order_id) = 0;

    virtual Result<ExchangeOrderStatus> get_order_status(
        const std::string& symbol, const std::string& exchange_order_id) = 0;

    virtual Result<Price> get_current_price(const std::string& symbol) = 0;

    /**
     * @brief Resting orders, all symbols when symbol is empty
     */
    virtual Result<std::vector<OpenOrder>> get_open_orders(const std::string& symbol) = 0;
};

}  // namespace order_ngin
