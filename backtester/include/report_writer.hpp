#pragma once

#include <string>
#include <vector>

#include "portfolio.hpp"   // TradeRecord, EquitySample

namespace backtester {

    // Column order of trades.csv (schema version kSchemaVersion)
    extern const std::vector<std::string> kTradeCsvColumns;

    // Writes the per-run CSV exports into one report directory.
    // All write failures throw core::BacktestException.
    class ReportWriter {
    public:
        explicit ReportWriter(std::string report_dir);

        // Header is always written, even with no trades. Returns the file path.
        std::string writeTrades(const std::vector<TradeRecord>& trades) const;

        // "ts,equity". Returns the file path.
        std::string writeEquityCurve(const std::vector<EquitySample>& curve) const;

        const std::string& getReportDir() const { return report_dir_; }
        std::string tradesPath() const;
        std::string equityCurvePath() const;
        std::string summaryPath() const;

        // Creates <reports_root>/<SYMBOL>_<STRATEGY>_<YYYY-MM-DD>_runNN with the next free NN
        // (UTC date, strategy reduced to [A-Za-z0-9_-]) and returns its path.
        static std::string generateReportDir(const std::string& reports_root,
                                             const std::string& symbol,
                                             const std::string& strategy_name);

        // Quotes a CSV field when it contains a comma, quote or line break
        static std::string escapeCsv(const std::string& field);

    private:
        std::string report_dir_;
    };

} // namespace backtester
