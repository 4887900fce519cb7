#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "portfolio.hpp"   // EquitySample, TradeRecord, PortfolioSummary

namespace backtester {

    // --- Performance summary of one run (NaN where undefined) ---
    struct BacktestMetrics {
        double total_return = 0.0;          // end / start - 1
        double annualized_return = 0.0;     // (1 + total_return)^(days / period_days) - 1
        double annualized_volatility = 0.0; // sample std of returns * sqrt(days)
        double sharpe = 0.0;                // mean / std * sqrt(days), no risk-free rate
        double max_drawdown = 0.0;          // min(equity / running peak - 1), <= 0
        int trade_count = 0;
        int winning_trades = 0;             // Sells with positive realised PnL
        double win_rate = 0.0;              // winning_trades / sells
        double total_realized_pnl = 0.0;
        int period_days = 1;
        int annualization_days = 252;
        double start_equity = 0.0;
        double end_equity = 0.0;
        core::Timestamp start_ts;
        core::Timestamp end_ts;
        std::string returns_basis;          // "daily" or "per-bar"

        void logMetrics() const;
        nlohmann::json toJson() const;
    };

    // Throws core::BacktestException for an empty curve.
    BacktestMetrics computeMetrics(const std::vector<EquitySample>& equity_curve,
                                   const std::vector<TradeRecord>& trades,
                                   bool use_daily = true,
                                   int annualization_days = 252);

    // Writes metrics, final portfolio state, the run configuration and run id as pretty JSON.
    // Throws core::BacktestException when the file cannot be written.
    void writeSummaryJson(const std::string& path,
                          const BacktestMetrics& metrics,
                          const PortfolioSummary& summary,
                          const nlohmann::json& config,
                          const std::string& run_id);

} // namespace backtester
