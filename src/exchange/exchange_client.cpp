// src/exchange/exchange_client.cpp

#include "order_ngin/exchange/exchange_client.hpp"

namespace order_ngin {

std::string exchange_status_to_string(ExchangeOrderStatus status) {
    switch (status) {
        case ExchangeOrderStatus::NEW:
            return "NEW";
        case ExchangeOrderStatus::PARTIALLY_FILLED:
            return "PARTIALLY_FILLED";
        case ExchangeOrderStatus::FILLED:
            return "FILLED";
        case ExchangeOrderStatus::CANCELLED:
            return "CANCELLED";
        case ExchangeOrderStatus::REJECTED:
            return "REJECTED";
        case ExchangeOrderStatus::EXPIRED:
            return "EXPIRED";
        default:
            return "UNKNOWN";
    }
}

}  // namespace order_ngin
