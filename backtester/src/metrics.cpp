#include "metrics.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <cmath>
#include <limits>
#include <numeric>
#include <algorithm>
#include <fstream>

namespace backtester {

    namespace {

        constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
        constexpr std::int64_t kMillisPerDay = 86400000;

        std::vector<double> pctChange(const std::vector<double>& values) {
            std::vector<double> returns;
            if (values.size() < 2) {
                return returns;
            }
            returns.reserve(values.size() - 1);
            for (size_t i = 1; i < values.size(); ++i) {
                returns.push_back(values[i] / values[i - 1] - 1.0);
            }
            return returns;
        }

        // Last equity of each UTC calendar day present in the curve
        std::vector<double> dailyCloses(const std::vector<EquitySample>& curve) {
            std::vector<double> closes;
            std::optional<std::int64_t> current_day;
            for (const auto& sample : curve) {
                std::int64_t ms = core::utils::timestampToMillis(sample.timestamp);
                std::int64_t day = ms >= 0 ? ms / kMillisPerDay : -((-ms + kMillisPerDay - 1) / kMillisPerDay);
                if (current_day && *current_day == day) {
                    closes.back() = sample.equity;
                } else {
                    closes.push_back(sample.equity);
                    current_day = day;
                }
            }
            return closes;
        }

        nlohmann::json finiteOrNull(double value) {
            if (!std::isfinite(value)) {
                return nullptr;
            }
            return value;
        }

    } // namespace

    BacktestMetrics computeMetrics(const std::vector<EquitySample>& equity_curve,
                                   const std::vector<TradeRecord>& trades,
                                   bool use_daily,
                                   int annualization_days) {
        if (equity_curve.empty()) {
            throw core::BacktestException("Cannot compute metrics: equity curve is empty.");
        }
        if (annualization_days < 1) {
            annualization_days = 1;
        }

        // Curve is appended in bar order, but a sorted copy keeps this usable on any input
        std::vector<EquitySample> curve = equity_curve;
        std::stable_sort(curve.begin(), curve.end(),
                         [](const EquitySample& a, const EquitySample& b) { return a.timestamp < b.timestamp; });

        BacktestMetrics m;
        m.annualization_days = annualization_days;
        m.start_ts = curve.front().timestamp;
        m.end_ts = curve.back().timestamp;
        m.start_equity = curve.front().equity;
        m.end_equity = curve.back().equity;

        // --- Returns basis ---
        std::vector<double> returns;
        m.returns_basis = "per-bar";
        if (use_daily) {
            returns = pctChange(dailyCloses(curve));
            if (!returns.empty()) {
                m.returns_basis = "daily";
            }
        }
        if (m.returns_basis == "per-bar") {
            std::vector<double> equities;
            equities.reserve(curve.size());
            for (const auto& s : curve) {
                equities.push_back(s.equity);
            }
            returns = pctChange(equities);
        }

        // --- Period ---
        auto elapsed = std::chrono::duration_cast<std::chrono::hours>(m.end_ts - m.start_ts).count();
        m.period_days = std::max<int>(static_cast<int>(elapsed / 24), 1);

        // --- Return ---
        m.total_return = m.start_equity > 0 ? m.end_equity / m.start_equity - 1.0 : kNaN;
        m.annualized_return = std::isfinite(m.total_return)
            ? std::pow(1.0 + m.total_return, static_cast<double>(annualization_days) / m.period_days) - 1.0
            : kNaN;

        // --- Volatility and Sharpe (sample standard deviation) ---
        double mean = kNaN;
        double stddev = kNaN;
        if (!returns.empty()) {
            mean = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
        }
        if (returns.size() > 1) {
            double sq_sum = 0.0;
            for (double r : returns) {
                sq_sum += (r - mean) * (r - mean);
            }
            stddev = std::sqrt(sq_sum / (returns.size() - 1));
        }
        const double sqrt_days = std::sqrt(static_cast<double>(annualization_days));
        m.annualized_volatility = std::isfinite(stddev) ? stddev * sqrt_days : kNaN;
        m.sharpe = (std::isfinite(mean) && std::isfinite(stddev) && stddev > 0) ? mean / stddev * sqrt_days : kNaN;

        // --- Max Drawdown ---
        double peak = curve.front().equity;
        double max_dd = 0.0;
        for (const auto& s : curve) {
            peak = std::max(peak, s.equity);
            if (peak > 0) {
                max_dd = std::min(max_dd, s.equity / peak - 1.0);
            }
        }
        m.max_drawdown = max_dd;

        // --- Trade-Based Metrics ---
        m.trade_count = static_cast<int>(trades.size());
        int sells = 0;
        for (const auto& record : trades) {
            m.total_realized_pnl += record.trade.realized_pnl;
            if (record.trade.side == core::Side::Sell) {
                ++sells;
                if (record.trade.realized_pnl > 0) {
                    ++m.winning_trades;
                }
            }
        }
        m.win_rate = sells > 0 ? static_cast<double>(m.winning_trades) / sells : 0.0;

        return m;
    }

    void BacktestMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ({} returns) ---", returns_basis);
        logger->info("Period: {} -> {} ({} days)",
                     core::utils::timestampToString(start_ts), core::utils::timestampToString(end_ts), period_days);
        logger->info("Equity: {:.2f} -> {:.2f}", start_equity, end_equity);
        logger->info("Total Return: {:.2f}%", total_return * 100.0);
        logger->info("Annualized Return: {:.2f}%", annualized_return * 100.0);
        logger->info("Annualized Volatility: {:.2f}%", annualized_volatility * 100.0);
        logger->info("Sharpe Ratio: {:.4f}", sharpe);
        logger->info("Max Drawdown: {:.2f}%", max_drawdown * 100.0);
        logger->info("Trades: {} (winning sells: {}, win rate {:.2f}%)", trade_count, winning_trades, win_rate * 100.0);
        logger->info("Total Realized PnL: {:.2f}", total_realized_pnl);
        logger->info("------------------------");
    }

    nlohmann::json BacktestMetrics::toJson() const {
        nlohmann::json j;
        j["total_return"] = finiteOrNull(total_return);
        j["annualized_return"] = finiteOrNull(annualized_return);
        j["annualized_volatility"] = finiteOrNull(annualized_volatility);
        j["sharpe_ratio"] = finiteOrNull(sharpe);
        j["max_drawdown"] = finiteOrNull(max_drawdown);
        j["n_trades"] = trade_count;
        j["winning_trades"] = winning_trades;
        j["win_rate"] = finiteOrNull(win_rate);
        j["total_pnl"] = finiteOrNull(total_realized_pnl);
        j["period_days"] = period_days;
        j["equity_start"] = finiteOrNull(start_equity);
        j["equity_end"] = finiteOrNull(end_equity);
        j["start_timestamp"] = core::utils::timestampToString(start_ts);
        j["end_timestamp"] = core::utils::timestampToString(end_ts);
        j["returns_basis"] = returns_basis;
        j["annualization_days"] = annualization_days;
        return j;
    }

    void writeSummaryJson(const std::string& path,
                          const BacktestMetrics& metrics,
                          const PortfolioSummary& summary,
                          const nlohmann::json& config,
                          const std::string& run_id) {
        nlohmann::json j;
        j["run_id"] = run_id;
        j["metrics"] = metrics.toJson();

        nlohmann::json portfolio;
        portfolio["starting_cash"] = finiteOrNull(summary.starting_cash);
        portfolio["cash"] = finiteOrNull(summary.cash);
        portfolio["quantity"] = finiteOrNull(summary.quantity);
        portfolio["last_price"] = summary.last_price ? finiteOrNull(*summary.last_price) : nlohmann::json(nullptr);
        portfolio["equity"] = finiteOrNull(summary.equity);
        portfolio["realized_pnl"] = finiteOrNull(summary.realized_pnl);
        portfolio["total_pnl"] = finiteOrNull(summary.total_pnl);
        portfolio["avg_price"] = finiteOrNull(summary.avg_price);
        j["portfolio"] = portfolio;
        j["config"] = config;

        std::ofstream out(path);
        if (!out) {
            throw core::BacktestException("Cannot open summary file for writing: " + path);
        }
        out << j.dump(4) << '\n';
        if (!out) {
            throw core::BacktestException("Failed writing summary file: " + path);
        }
        core::logging::getLogger()->info("Summary exported to {}", path);
    }

} // namespace backtester
