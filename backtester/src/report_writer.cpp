#include "report_writer.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <fstream>
#include <filesystem>
#include <optional>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <spdlog/fmt/fmt.h>

namespace fs = std::filesystem;

namespace backtester {

    const std::vector<std::string> kTradeCsvColumns = {
        "ts", "symbol", "side", "qty", "price", "fee", "cash_after", "qty_after", "equity_after",
        "realized_pnl", "cum_realized_pnl", "note", "intended_price", "exec_price_raw", "price_round_diff",
        "qty_raw", "qty_rounded", "qty_round_diff", "slippage_bps", "notional_before_round",
        "notional_after_round", "rule_check", "run_id", "fee_bps", "schema_version",
        "tickSize_used", "stepSize_used", "minNotional_used"
    };

    namespace {

        std::string decimalField(const std::optional<core::Decimal>& value) {
            return value ? value->toString() : std::string();
        }

        std::ofstream openForWrite(const std::string& path) {
            std::ofstream out(path, std::ios::out | std::ios::trunc);
            if (!out) {
                throw core::BacktestException("Cannot open report file for writing: " + path);
            }
            return out;
        }

        void finish(std::ofstream& out, const std::string& path) {
            out.flush();
            if (!out) {
                throw core::BacktestException("Failed writing report file: " + path);
            }
        }

    } // namespace

    ReportWriter::ReportWriter(std::string report_dir) : report_dir_(std::move(report_dir)) {
        std::error_code ec;
        fs::create_directories(report_dir_, ec);
        if (ec) {
            throw core::BacktestException(fmt::format("Cannot create report directory {}: {}", report_dir_, ec.message()));
        }
    }

    std::string ReportWriter::tradesPath() const {
        return (fs::path(report_dir_) / "trades.csv").string();
    }

    std::string ReportWriter::equityCurvePath() const {
        return (fs::path(report_dir_) / "equity_curve.csv").string();
    }

    std::string ReportWriter::summaryPath() const {
        return (fs::path(report_dir_) / "summary.json").string();
    }

    std::string ReportWriter::escapeCsv(const std::string& field) {
        if (field.find_first_of(",\"\r\n") == std::string::npos) {
            return field;
        }
        std::string quoted = "\"";
        for (char c : field) {
            if (c == '"') {
                quoted += '"';
            }
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    std::string ReportWriter::writeTrades(const std::vector<TradeRecord>& trades) const {
        const std::string path = tradesPath();
        std::ofstream out = openForWrite(path);

        for (size_t i = 0; i < kTradeCsvColumns.size(); ++i) {
            out << (i ? "," : "") << kTradeCsvColumns[i];
        }
        out << '\n';

        for (const auto& r : trades) {
            const core::Trade& t = r.trade;
            const ExecutionPreview& e = r.execution;
            out << fmt::format("{},{},{},{},{},{},{},{},{},{},{},{},",
                               core::utils::timestampToString(t.timestamp), escapeCsv(t.symbol),
                               core::sideToString(t.side), t.quantity, t.price, t.fee,
                               t.cash_after, t.quantity_after, t.equity_after,
                               t.realized_pnl, t.cum_realized_pnl, escapeCsv(t.note))
                << fmt::format("{},{},{},{},{},{},{},{},{},",
                               e.intended_price, e.exec_price_raw, e.price_round_diff,
                               e.qty_raw, e.qty_rounded, e.qty_round_diff, e.slippage_bps,
                               e.notional_before_round, e.notional_after_round)
                << fmt::format("OK,{},{},{},{},{},{}\n",
                               escapeCsv(r.run_id), r.fee_bps, r.schema_version,
                               decimalField(r.tick_size_used), decimalField(r.step_size_used),
                               decimalField(r.min_notional_used));
        }
        finish(out, path);
        core::logging::getLogger()->info("Trades written ({} rows) to {}", trades.size(), path);
        return path;
    }

    std::string ReportWriter::writeEquityCurve(const std::vector<EquitySample>& curve) const {
        const std::string path = equityCurvePath();
        std::ofstream out = openForWrite(path);
        out << "ts,equity\n";
        for (const auto& s : curve) {
            out << fmt::format("{},{}\n", core::utils::timestampToString(s.timestamp), s.equity);
        }
        finish(out, path);
        core::logging::getLogger()->info("Equity curve written ({} points) to {}", curve.size(), path);
        return path;
    }

    std::string ReportWriter::generateReportDir(const std::string& reports_root,
                                                const std::string& symbol,
                                                const std::string& strategy_name) {
        std::string safe_strategy;
        for (char c : strategy_name) {
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
                safe_strategy += c;
            }
        }
        const std::string date = core::utils::utcDateString(std::chrono::system_clock::now());
        const std::string prefix = fmt::format("{}_{}_{}_run", symbol, safe_strategy, date);

        std::error_code ec;
        fs::create_directories(reports_root, ec);
        if (ec) {
            throw core::BacktestException(fmt::format("Cannot create reports directory {}: {}", reports_root, ec.message()));
        }

        // Next number after the highest existing one, so deleted runs leave gaps
        int max_run = 0;
        for (const auto& entry : fs::directory_iterator(reports_root, ec)) {
            if (!entry.is_directory()) {
                continue;
            }
            const std::string name = entry.path().filename().string();
            if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }
            const std::string suffix = name.substr(prefix.size());
            if (suffix.find_first_not_of("0123456789") != std::string::npos || suffix.size() > 6) {
                continue;
            }
            max_run = std::max(max_run, std::stoi(suffix));
        }
        if (ec) {
            throw core::BacktestException(fmt::format("Cannot list reports directory {}: {}", reports_root, ec.message()));
        }

        const fs::path dir = fs::path(reports_root) / fmt::format("{}{:02d}", prefix, max_run + 1);
        fs::create_directories(dir, ec);
        if (ec) {
            throw core::BacktestException(fmt::format("Cannot create report directory {}: {}", dir.string(), ec.message()));
        }
        core::logging::getLogger()->info("Report directory: {}", dir.string());
        return dir.string();
    }

} // namespace backtester
