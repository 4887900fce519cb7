#pragma once

#include <string>
#include <memory> // For std::unique_ptr
#include <nlohmann/json.hpp>

#include "interfaces.hpp"

namespace strategy_engine {

    using json = nlohmann::json;

    class StrategyFactory {
    public:
        // {"type": "buy_second_bar", "alloc_pct": 0.1}
        // {"type": "ma_cross", "short_window": 10, "long_window": 50, "alloc_pct": 0.1, "close_on_finish": true}
        // alloc_pct falls back to default_alloc_pct. Throws core::StrategyException on unknown type or bad parameters.
        static std::unique_ptr<IStrategy> createStrategy(const json& config, double default_alloc_pct = 0.10);
    };

} // namespace strategy_engine
