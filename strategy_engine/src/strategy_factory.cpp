#include "strategy_factory.hpp"
#include "buy_second_bar_strategy.hpp"
#include "moving_average_cross_strategy.hpp"
#include "logging.hpp"
#include "exceptions.hpp"

#include <string>
#include <memory>

namespace strategy_engine {

    namespace {

        template <typename T>
        T param(const json& config, const char* key, T fallback) {
            auto it = config.find(key);
            if (it == config.end() || it->is_null()) {
                return fallback;
            }
            return it->get<T>();
        }

    } // end anonymous namespace

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const json& config, double default_alloc_pct) {
        auto logger = core::logging::getLogger();

        if (!config.is_object()) {
            throw core::StrategyException("Strategy config must be a JSON object.");
        }
        if (!config.contains("type") || !config["type"].is_string()) {
            throw core::StrategyException("Strategy config missing 'type' (string).");
        }
        const std::string type = config["type"].get<std::string>();
        logger->debug("Creating strategy from config: {}", config.dump());

        try {
            const double alloc_pct = param<double>(config, "alloc_pct", default_alloc_pct);

            if (type == "buy_second_bar") {
                auto strategy = std::make_unique<BuySecondBarStrategy>(alloc_pct);
                logger->info("Created strategy '{}' (alloc_pct={})", strategy->getName(), alloc_pct);
                return strategy;
            }
            if (type == "ma_cross") {
                const int short_window = param<int>(config, "short_window", 10);
                const int long_window = param<int>(config, "long_window", 50);
                const bool close_on_finish = param<bool>(config, "close_on_finish", true);
                auto strategy = std::make_unique<MovingAverageCrossStrategy>(short_window, long_window,
                                                                             alloc_pct, close_on_finish);
                logger->info("Created strategy '{}' (short={}, long={}, alloc_pct={}, close_on_finish={})",
                             strategy->getName(), short_window, long_window, alloc_pct, close_on_finish);
                return strategy;
            }
        } catch (const json::exception& e) {
            throw core::StrategyException(fmt::format("Invalid parameters for strategy '{}': {}", type, e.what()));
        } catch (const core::IndicatorCalculationException& e) {
            throw core::StrategyException(fmt::format("Invalid indicator setup for strategy '{}': {}", type, e.what()));
        }

        throw core::StrategyException(fmt::format("Unknown strategy type '{}' (expected buy_second_bar or ma_cross).", type));
    }

} // namespace strategy_engine
