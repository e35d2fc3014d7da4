// include/order_ngin/execution/engine_config.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include "order_ngin/core/config_base.hpp"

namespace order_ngin {

/**
 * @brief Bounded exponential backoff for transient exchange errors
 *
 * Attempt n (1-based) waits initial_backoff * multiplier^(n-1), capped at
 * max_backoff. max_retries counts retries after the first attempt.
 */
struct RetryPolicy : public ConfigBase {
    int max_retries{1};
    std::chrono::milliseconds initial_backoff{200};
    double backoff_multiplier{2.0};
    std::chrono::milliseconds max_backoff{5000};

    std::chrono::milliseconds backoff_for(int attempt) const {
        if (attempt <= 0) {
            return std::chrono::milliseconds(0);
        }
        double scaled = static_cast<double>(initial_backoff.count()) *
                        std::pow(backoff_multiplier, attempt - 1);
        auto capped = std::min(scaled, static_cast<double>(max_backoff.count()));
        return std::chrono::milliseconds(static_cast<int64_t>(capped));
    }

    bool can_retry(int retries_done) const {
        return retries_done < max_retries;
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["max_retries"] = max_retries;
        j["initial_backoff_ms"] = initial_backoff.count();
        j["backoff_multiplier"] = backoff_multiplier;
        j["max_backoff_ms"] = max_backoff.count();
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("max_retries"))
            max_retries = j.at("max_retries").get<int>();
        if (j.contains("initial_backoff_ms"))
            initial_backoff = std::chrono::milliseconds(j.at("initial_backoff_ms").get<int64_t>());
        if (j.contains("backoff_multiplier"))
            backoff_multiplier = j.at("backoff_multiplier").get<double>();
        if (j.contains("max_backoff_ms"))
            max_backoff = std::chrono::milliseconds(j.at("max_backoff_ms").get<int64_t>());
    }
};

/**
 * @brief Configuration for the execution supervisor and its handlers
 */
struct EngineConfig : public ConfigBase {
    size_t max_concurrent_plans{8};                      // Excess submissions queue
    std::chrono::milliseconds status_poll_interval{500};   // Fill checks for TWAP and grid legs
    std::chrono::milliseconds trailing_poll_interval{1000};
    std::chrono::milliseconds oco_poll_interval{500};
    std::chrono::milliseconds order_fill_timeout{10000};  // Unfilled TWAP slice is abandoned
    size_t completed_log_capacity{1000};                  // Retired plans kept for status queries
    RetryPolicy retry_policy;

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["max_concurrent_plans"] = max_concurrent_plans;
        j["status_poll_interval_ms"] = status_poll_interval.count();
        j["trailing_poll_interval_ms"] = trailing_poll_interval.count();
        j["oco_poll_interval_ms"] = oco_poll_interval.count();
        j["order_fill_timeout_ms"] = order_fill_timeout.count();
        j["completed_log_capacity"] = completed_log_capacity;
        j["retry_policy"] = retry_policy.to_json();
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("max_concurrent_plans"))
            max_concurrent_plans = j.at("max_concurrent_plans").get<size_t>();
        if (j.contains("status_poll_interval_ms"))
            status_poll_interval =
                std::chrono::milliseconds(j.at("status_poll_interval_ms").get<int64_t>());
        if (j.contains("trailing_poll_interval_ms"))
            trailing_poll_interval =
                std::chrono::milliseconds(j.at("trailing_poll_interval_ms").get<int64_t>());
        if (j.contains("oco_poll_interval_ms"))
            oco_poll_interval =
                std::chrono::milliseconds(j.at("oco_poll_interval_ms").get<int64_t>());
        if (j.contains("order_fill_timeout_ms"))
            order_fill_timeout =
                std::chrono::milliseconds(j.at("order_fill_timeout_ms").get<int64_t>());
        if (j.contains("completed_log_capacity"))
            completed_log_capacity = j.at("completed_log_capacity").get<size_t>();
        if (j.contains("retry_policy"))
            retry_policy.from_json(j.at("retry_policy"));
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

}  // namespace order_ngin
