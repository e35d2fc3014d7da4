#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "order_ngin/core/config_base.hpp"
#include "order_ngin/core/logger.hpp"
#include "order_ngin/core/state_manager.hpp"
#include "order_ngin/exchange/simulated_exchange.hpp"
#include "order_ngin/execution/execution_supervisor.hpp"

using namespace order_ngin;

namespace {

/**
 * @brief Settings file accepted as the optional first argument
 */
struct CliConfig : public ConfigBase {
    EngineConfig engine;
    SimulatedExchangeConfig exchange;
    LoggerConfig logger;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["engine"] = engine.to_json();
        j["exchange"] = exchange.to_json();
        j["logger"] = logger.to_json();
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("engine"))
            engine.from_json(j.at("engine"));
        if (j.contains("exchange"))
            exchange.from_json(j.at("exchange"));
        if (j.contains("logger"))
            logger.from_json(j.at("logger"));
    }
};

std::vector<std::string> split(const std::string& line) {
    std::istringstream ss(line);
    std::vector<std::string> parts;
    std::string part;
    while (ss >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

void print_help() {
    std::cout << "\nAVAILABLE COMMANDS:\n"
              << "  help                                              Show this help message\n"
              << "  price <symbol>                                    Current price\n"
              << "  setprice <symbol> <price>                         Move the simulated market\n"
              << "  twap <symbol> <side> <qty> <seconds> <slices> [lot]\n"
              << "                                                    Time-sliced market order\n"
              << "  grid <symbol> <side> <start> <end> <levels> <qty> [geometric]\n"
              << "                                                    Limit order ladder\n"
              << "  trail <symbol> <side> <qty> <distance|rate%> [threshold]\n"
              << "                                                    Trailing stop\n"
              << "  oco <symbol> <side> <qty> <stop> <limit>          Stop / limit pair\n"
              << "  status <plan_id>                                  Plan details\n"
              << "  cancel <plan_id>                                  Cancel a plan\n"
              << "  list                                              Active plans\n"
              << "  orders [symbol]                                   Open exchange orders\n"
              << "  metrics                                           Engine counters and health\n"
              << "  save <path>                                       Write completed plans as JSON\n"
              << "  quit/exit                                         Exit the application\n"
              << std::endl;
}

void print_snapshot_line(const PlanSnapshot& snapshot) {
    const auto& plan = snapshot.plan;
    std::cout << std::left << std::setw(28) << plan.id << std::setw(15)
              << plan_kind_to_string(plan.kind) << std::setw(10) << plan.symbol << std::setw(6)
              << side_to_string(plan.side) << std::setw(11) << plan_status_to_string(plan.status)
              << snapshot.metrics.legs_filled << "/" << snapshot.metrics.legs_submitted
              << " legs filled" << std::endl;
}

void report_submit(const Result<std::string>& result) {
    if (result.is_error()) {
        std::cout << "Rejected: " << result.error()->what() << std::endl;
        return;
    }
    std::cout << "Submitted plan " << result.value() << std::endl;
}

class OrderCli {
public:
    OrderCli(std::shared_ptr<SimulatedExchange> exchange,
             std::shared_ptr<ExecutionSupervisor> supervisor)
        : exchange_(std::move(exchange)), supervisor_(std::move(supervisor)) {}

    void run() {
        std::cout << std::string(60, '=') << "\n"
                  << "ORDER ENGINE (simulated exchange)\n"
                  << "Type 'help' to see available commands or 'quit' to exit.\n"
                  << std::string(60, '=') << std::endl;

        std::string line;
        while (true) {
            std::cout << "order_ngin> " << std::flush;
            if (!std::getline(std::cin, line)) {
                break;
            }
            auto args = split(line);
            if (args.empty()) {
                continue;
            }

            const std::string command = args[0];
            args.erase(args.begin());
            if (command == "quit" || command == "exit") {
                break;
            }

            try {
                dispatch(command, args);
            } catch (const std::invalid_argument&) {
                std::cout << "Invalid number. Type 'help' for usage." << std::endl;
            } catch (const std::out_of_range&) {
                std::cout << "Number out of range." << std::endl;
            }
        }
    }

private:
    void dispatch(const std::string& command, const std::vector<std::string>& args) {
        if (command == "help") {
            print_help();
        } else if (command == "price") {
            handle_price(args);
        } else if (command == "setprice") {
            handle_set_price(args);
        } else if (command == "twap") {
            handle_twap(args);
        } else if (command == "grid") {
            handle_grid(args);
        } else if (command == "trail") {
            handle_trail(args);
        } else if (command == "oco") {
            handle_oco(args);
        } else if (command == "status") {
            handle_status(args);
        } else if (command == "cancel") {
            handle_cancel(args);
        } else if (command == "list") {
            handle_list();
        } else if (command == "orders") {
            handle_orders(args);
        } else if (command == "metrics") {
            handle_metrics();
        } else if (command == "save") {
            handle_save(args);
        } else {
            std::cout << "Unknown command '" << command << "'. Type 'help'." << std::endl;
        }
    }

    void handle_price(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cout << "Usage: price <symbol>" << std::endl;
            return;
        }
        auto price = exchange_->get_current_price(upper(args[0]));
        if (price.is_error()) {
            std::cout << "Error: " << price.error()->what() << std::endl;
            return;
        }
        std::cout << upper(args[0]) << ": " << price.value() << std::endl;
    }

    void handle_set_price(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: setprice <symbol> <price>" << std::endl;
            return;
        }
        size_t filled = exchange_->set_price(upper(args[0]), std::stod(args[1]));
        std::cout << upper(args[0]) << " set to " << args[1] << ", " << filled
                  << " resting orders filled" << std::endl;
    }

    void handle_twap(const std::vector<std::string>& args) {
        if (args.size() < 5) {
            std::cout << "Usage: twap <symbol> <side> <qty> <seconds> <slices> [lot]" << std::endl;
            return;
        }
        TwapParams params;
        params.total_quantity = std::stod(args[2]);
        params.duration =
            std::chrono::milliseconds(static_cast<int64_t>(std::stod(args[3]) * 1000.0));
        params.intervals = std::stoi(args[4]);
        params.lot_size = args.size() > 5 ? std::stod(args[5]) : 0.0;
        report_submit(supervisor_->submit_plan(
            {PlanKind::TWAP, upper(args[0]), side_from_string(upper(args[1])), params}));
    }

    void handle_grid(const std::vector<std::string>& args) {
        if (args.size() < 6) {
            std::cout << "Usage: grid <symbol> <side> <start> <end> <levels> <qty> [geometric]"
                      << std::endl;
            return;
        }
        GridParams params;
        params.start_price = std::stod(args[2]);
        params.end_price = std::stod(args[3]);
        params.grid_count = std::stoi(args[4]);
        params.total_quantity = std::stod(args[5]);
        if (args.size() > 6 && upper(args[6]) == "GEOMETRIC") {
            params.spacing = GridSpacing::GEOMETRIC;
        }
        report_submit(supervisor_->submit_plan(
            {PlanKind::GRID, upper(args[0]), side_from_string(upper(args[1])), params}));
    }

    void handle_trail(const std::vector<std::string>& args) {
        if (args.size() < 4) {
            std::cout << "Usage: trail <symbol> <side> <qty> <distance|rate%> [threshold]"
                      << std::endl;
            return;
        }
        TrailingStopParams params;
        params.quantity = std::stod(args[2]);
        std::string trail = args[3];
        if (!trail.empty() && trail.back() == '%') {
            params.trail_mode = TrailMode::RATE;
            trail.pop_back();
        }
        params.trail_value = std::stod(trail);
        params.rearm_threshold = args.size() > 4 ? std::stod(args[4]) : 0.0;
        report_submit(supervisor_->submit_plan(
            {PlanKind::TRAILING_STOP, upper(args[0]), side_from_string(upper(args[1])), params}));
    }

    void handle_oco(const std::vector<std::string>& args) {
        if (args.size() < 5) {
            std::cout << "Usage: oco <symbol> <side> <qty> <stop> <limit>" << std::endl;
            return;
        }
        OcoParams params;
        params.quantity = std::stod(args[2]);
        params.stop_price = std::stod(args[3]);
        params.limit_price = std::stod(args[4]);
        report_submit(supervisor_->submit_plan(
            {PlanKind::OCO, upper(args[0]), side_from_string(upper(args[1])), params}));
    }

    void handle_status(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cout << "Usage: status <plan_id>" << std::endl;
            return;
        }
        auto snapshot = supervisor_->get_plan_status(args[0]);
        if (snapshot.is_error()) {
            std::cout << "Error: " << snapshot.error()->what() << std::endl;
            return;
        }
        std::cout << std::setw(2) << to_json(snapshot.value()) << std::endl;
    }

    void handle_cancel(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cout << "Usage: cancel <plan_id>" << std::endl;
            return;
        }
        auto result = supervisor_->cancel_plan(args[0]);
        if (result.is_error()) {
            std::cout << "Error: " << result.error()->what() << std::endl;
            return;
        }
        std::cout << "Cancellation requested for " << args[0] << std::endl;
    }

    void handle_list() {
        auto plans = supervisor_->list_active_plans();
        if (plans.empty()) {
            std::cout << "No active plans" << std::endl;
            return;
        }
        for (const auto& snapshot : plans) {
            print_snapshot_line(snapshot);
        }
    }

    void handle_orders(const std::vector<std::string>& args) {
        auto orders = exchange_->get_open_orders(args.empty() ? "" : upper(args[0]));
        if (orders.is_error()) {
            std::cout << "Error: " << orders.error()->what() << std::endl;
            return;
        }
        if (orders.value().empty()) {
            std::cout << "No open orders" << std::endl;
            return;
        }
        for (const auto& order : orders.value()) {
            std::cout << std::left << std::setw(10) << order.exchange_order_id << std::setw(10)
                      << order.symbol << std::setw(6) << side_to_string(order.side)
                      << std::setw(8) << order_type_to_string(order.type) << order.quantity
                      << " @ " << order.price << std::endl;
        }
    }

    void handle_metrics() {
        std::cout << std::setw(2) << supervisor_->get_engine_metrics().to_json() << "\n"
                  << "Engine healthy: " << (StateManager::instance().is_healthy() ? "yes" : "no")
                  << std::endl;
    }

    void handle_save(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cout << "Usage: save <path>" << std::endl;
            return;
        }
        auto result = supervisor_->save_completed_plans(args[0]);
        if (result.is_error()) {
            std::cout << "Error: " << result.error()->what() << std::endl;
            return;
        }
        std::cout << "Completed plans written to " << args[0] << std::endl;
    }

    std::shared_ptr<SimulatedExchange> exchange_;
    std::shared_ptr<ExecutionSupervisor> supervisor_;
};

}  // namespace

int main(int argc, char* argv[]) {
    try {
        CliConfig config;
        config.logger.min_level = LogLevel::INFO;
        config.logger.destination = LogDestination::FILE;
        config.logger.log_directory = "logs";
        config.logger.filename_prefix = "order_cli";
        config.exchange.initial_prices = {{"BTCUSDT", 43000.0}, {"ETHUSDT", 2300.0}};

        if (argc > 2) {
            std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
            return 1;
        }
        if (argc == 2) {
            auto load_result = config.load_from_file(argv[1]);
            if (load_result.is_error()) {
                std::cerr << "Failed to load config: " << load_result.error()->what()
                          << std::endl;
                return 1;
            }
        }

        Logger::instance().initialize(config.logger);
        Logger::register_component("OrderCli");
        INFO("Order CLI starting");

        auto exchange = std::make_shared<SimulatedExchange>(config.exchange);
        auto supervisor = std::make_shared<ExecutionSupervisor>(exchange, config.engine);
        auto init_result = supervisor->initialize();
        if (init_result.is_error()) {
            std::cerr << "Failed to start engine: " << init_result.error()->what() << std::endl;
            return 1;
        }

        OrderCli cli(exchange, supervisor);
        cli.run();

        auto shutdown_result = supervisor->shutdown();
        if (shutdown_result.is_error()) {
            ERROR("Shutdown failed: " << shutdown_result.error()->what());
        }

        auto metrics = supervisor->get_engine_metrics();
        std::cout << "Plans completed: " << metrics.plans_completed << " of "
                  << metrics.plans_submitted << ", failed: " << metrics.plans_failed
                  << ", cancelled: " << metrics.plans_cancelled << std::endl;
        INFO("Order CLI exiting");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
