#pragma once

#include "interfaces.hpp"
#include <optional>

namespace strategy_engine {

    // Buys alloc_pct of cash on the second bar; the finish hook sells the whole position at the last close
    class BuySecondBarStrategy : public IStrategy {
    public:
        explicit BuySecondBarStrategy(double alloc_pct = 0.10);

        std::string getName() const override { return "BuySecondBar"; }
        void onBar(const core::Bar& bar, backtester::Portfolio& portfolio) override;
        std::optional<FinishHook> finishHook() override;

        int getBarCount() const { return counter_; }

    private:
        double alloc_pct_;
        int counter_ = 0;
        std::optional<core::Bar> last_bar_;
    };

} // namespace strategy_engine
