// backtester/include/portfolio.hpp
#pragma once

#include <string>
#include <vector>
#include <optional>

#include "datatypes.hpp"        // core::Timestamp, core::Trade
#include "config.hpp"           // core::BacktestConfig
#include "decimal.hpp"
#include "symbol_rules.hpp"
#include "execution_model.hpp"

namespace backtester {

    // Version of the trade export layout (see ReportWriter)
    constexpr int kSchemaVersion = 1;

    // --- Equity curve point ---
    struct EquitySample {
        core::Timestamp timestamp;
        double equity = 0.0;
    };

    // --- Ledger entry: the trade plus the audit trail of how it was executed ---
    struct TradeRecord {
        core::Trade trade;
        ExecutionPreview execution;
        double fee_bps = 0.0;       // Realised: 1e4 * fee / notional_after_round
        int schema_version = kSchemaVersion;
        std::string run_id;
        // Rules in force when the trade executed (absent when trading without rules)
        std::optional<core::Decimal> tick_size_used;
        std::optional<core::Decimal> step_size_used;
        std::optional<core::Decimal> min_notional_used;
    };

    struct PortfolioSummary {
        double starting_cash = 0.0;
        double cash = 0.0;
        double quantity = 0.0;
        std::optional<double> last_price;
        double equity = 0.0;
        double realized_pnl = 0.0;
        double total_pnl = 0.0;      // equity - starting_cash
        double avg_price = 0.0;
    };

    // Single-symbol, long-only ledger with average-cost accounting.
    // The only component that mutates cash, position and realised PnL.
    class Portfolio {
    public:
        // Numerical tolerance for position comparisons
        static constexpr double kQuantityEpsilon = 1e-12;

        explicit Portfolio(const core::BacktestConfig& config, std::string run_id = "");

        // --- Execution settings ---
        void setExecutionRules(const rules::SymbolRules& rules, double slippage_bps);
        void clearExecutionRules();
        const std::optional<rules::SymbolRules>& getExecutionRules() const { return rules_; }

        // --- Market data ---
        void markToMarket(double price);

        // --- Orders ---
        // Runs the execution model; on rejection logs at info and returns false.
        bool buy(core::Timestamp timestamp, double quantity, double reference_price, const std::string& note = "");

        // Throws core::InsufficientPositionException if quantity exceeds the position beyond tolerance.
        // Market rejections log at info and return false.
        bool sell(core::Timestamp timestamp, double quantity, double reference_price, const std::string& note = "");

        // (cash * alloc) / (price * (1 + fee_bps/1e4)); 0 when price <= 0 or alloc <= 0. Ignores step size.
        double affordableQuantity(double price, double alloc_fraction = 1.0) const;

        // Uses `price`, else the last marked price, else cash alone
        double equity(std::optional<double> price = std::nullopt) const;
        double pnlTotal() const;

        // Appends (timestamp, equity()) to the equity curve
        void recordEquitySample(core::Timestamp timestamp);

        // --- Getters ---
        double getCash() const { return cash_; }
        double getPositionQuantity() const { return quantity_; }
        double getAveragePrice() const { return avg_price_; }
        double getRealizedPnl() const { return realized_pnl_; }
        double getStartingCash() const { return starting_cash_; }
        std::optional<double> getLastPrice() const { return last_price_; }
        double getFeeBps() const { return fee_bps_; }
        double getSlippageBps() const { return slippage_bps_; }
        const std::string& getSymbol() const { return symbol_; }
        const std::string& getRunId() const { return run_id_; }

        PortfolioSummary summary() const;
        const std::vector<TradeRecord>& getTradeLedger() const { return trades_; }
        const std::vector<EquitySample>& getEquityCurve() const { return equity_curve_; }

        // "[run:<id>] " or empty
        std::string logPrefix() const;

    private:
        std::string symbol_;
        std::string run_id_;
        double starting_cash_;
        double cash_;
        double quantity_ = 0.0;
        double avg_price_ = 0.0;
        double realized_pnl_ = 0.0;
        std::optional<double> last_price_;
        double fee_bps_;
        double slippage_bps_;
        bool realized_pnl_net_fees_;
        std::optional<rules::SymbolRules> rules_;

        std::vector<TradeRecord> trades_;
        std::vector<EquitySample> equity_curve_;

        ExecutionPreview preview(core::Side side, double quantity, double reference_price) const;
        void ensureChronological(core::Timestamp timestamp) const;
        void record(const core::Trade& trade, const ExecutionPreview& execution);
    };

} // namespace backtester
