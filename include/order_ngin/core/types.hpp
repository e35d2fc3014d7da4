// include/order_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cmath>
#include <string>

namespace order_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 * Used for all price-related calculations
 */
using Price = double;

/**
 * @brief Quantity type for order sizes
 * Double to support fractional (crypto lot) quantities
 */
using Quantity = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE  // Used for invalid/undefined states
};

/**
 * @brief Primitive order types the exchange supports natively
 */
enum class OrderType {
    MARKET,
    LIMIT,
    STOP,  // Stop-market, price is the trigger price
    NONE
};

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "BUY";
        case Side::SELL:
            return "SELL";
        default:
            return "NONE";
    }
}

inline Side side_from_string(const std::string& str) {
    if (str == "BUY" || str == "buy")
        return Side::BUY;
    if (str == "SELL" || str == "sell")
        return Side::SELL;
    return Side::NONE;
}

inline std::string order_type_to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET:
            return "MARKET";
        case OrderType::LIMIT:
            return "LIMIT";
        case OrderType::STOP:
            return "STOP";
        default:
            return "NONE";
    }
}

/**
 * @brief Finite and strictly above zero, NaN fails
 */
inline bool is_positive_finite(double value) {
    return std::isfinite(value) && value > 0.0;
}

inline bool is_non_negative_finite(double value) {
    return std::isfinite(value) && value >= 0.0;
}

}  // namespace order_ngin
