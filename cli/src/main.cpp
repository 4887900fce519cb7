// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <memory>      // For std::unique_ptr
#include <optional>
#include <cstdint>
#include <exception>

// Project includes
#include "logging.hpp"            // For logging functionality
#include "exceptions.hpp"         // For custom exception types
#include "datatypes.hpp"
#include "utils.hpp"
#include "config.hpp"
#include "bar_source.hpp"
#include "database_manager.hpp"   // SQLite bar store
#include "binance_api_client.hpp" // Binance REST client
#include "rules_loader.hpp"
#include "strategy_factory.hpp"
#include "backtester.hpp"
#include "metrics.hpp"
#include "report_writer.hpp"

#include <spdlog/spdlog.h>

namespace {

    std::optional<std::int64_t> optionalMillis(const std::string& value) {
        if (value.empty()) {
            return std::nullopt;
        }
        return data::BinanceApiClient::toMillis(value);
    }

    std::optional<core::Timestamp> optionalTimestamp(const std::string& value) {
        auto ms = optionalMillis(value);
        if (!ms) {
            return std::nullopt;
        }
        return core::utils::millisToTimestamp(*ms);
    }

    // Binance: REST download (optionally persisted to SQLite). csv: lazy file reader. sqlite: stored bars.
    std::unique_ptr<data::IBarSource> openBarSource(const core::BacktestConfig& config,
                                                    data::BinanceApiClient& client) {
        auto logger = core::logging::getLogger();

        if (config.data_source == "csv") {
            logger->info("Reading bars from CSV: {}", config.csv_path);
            return std::make_unique<data::CsvBarSource>(config.csv_path, config.symbol);
        }

        if (config.data_source == "sqlite") {
            data::DatabaseManager db(config.db_path);
            if (!db.connect() || !db.initializeSchema()) {
                throw core::DataLoadException("Cannot open SQLite bar store: " + config.db_path);
            }
            auto bars = db.queryBars(config.symbol, config.interval,
                                     optionalTimestamp(config.start), optionalTimestamp(config.end));
            logger->info("Loaded {} bars for {} ({}) from {}", bars.size(), config.symbol, config.interval, config.db_path);
            return std::make_unique<data::SeriesBarSource>(std::move(bars), config.db_path);
        }

        logger->info("Downloading {} {} klines from {}", config.symbol, config.interval, client.baseUrl());
        auto bars = client.getKlines(config.symbol, config.interval, config.limit,
                                     optionalMillis(config.start), optionalMillis(config.end));
        logger->info("Downloaded {} bars.", bars.size());

        if (!config.db_path.empty()) {
            data::DatabaseManager db(config.db_path);
            if (db.connect() && db.initializeSchema() && db.saveBars(bars, config.symbol, config.interval)) {
                logger->info("Bars stored in {}", config.db_path);
            } else {
                logger->warn("Could not store downloaded bars in {}", config.db_path);
            }
        }
        return std::make_unique<data::SeriesBarSource>(std::move(bars), "binance");
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Initialize Logging ---
        core::logging::initialize("spot_backtester.log", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Spot backtester starting...");

        // --- Configuration ---
        const std::string config_path = argc > 1 ? argv[1] : "";
        core::BacktestConfig config = core::loadConfig(config_path);
        const std::string run_id = core::utils::generateRunId();
        logger->info("[run:{}] Config: symbol={}, interval={}, source={}, cash={:.2f}, fee_bps={}, slippage_bps={}",
                     run_id, config.symbol, config.interval, config.data_source,
                     config.starting_cash, config.fee_bps, config.slippage_bps);

        data::BinanceApiClient client(config.testnet);

        // --- Strategy and engine ---
        auto strategy = strategy_engine::StrategyFactory::createStrategy(config.strategy, config.alloc_pct);
        const std::string strategy_name = strategy->getName();
        backtester::Backtester engine(config, std::move(strategy), run_id);

        // --- Exchange rules ---
        if (config.rules_enabled) {
            rules::SymbolRules symbol_rules = rules::loadSymbolRules(
                config.symbol, config.rules_dir, config.rules_use_cache, config.rules_refresh,
                [&client](const std::string& symbol) { return client.getExchangeInfo(symbol); });
            engine.getPortfolio().setExecutionRules(symbol_rules, config.slippage_bps);
        } else {
            logger->info("[run:{}] Exchange rules disabled; fills are not rounded.", run_id);
        }

        // --- Run ---
        auto source = openBarSource(config, client);
        const std::size_t bars = engine.run(*source);
        if (bars == 0) {
            throw core::DataLoadException("No bars available for " + config.symbol + "; nothing to backtest.");
        }

        const backtester::Portfolio& portfolio = engine.getPortfolio();
        const backtester::PortfolioSummary summary = portfolio.summary();
        logger->info("[run:{}] Final: cash={:.2f}, qty={:.8f}, equity={:.2f}, realized={:.2f}, total_pnl={:.2f}",
                     run_id, summary.cash, summary.quantity, summary.equity, summary.realized_pnl, summary.total_pnl);

        backtester::BacktestMetrics metrics = backtester::computeMetrics(
            portfolio.getEquityCurve(), portfolio.getTradeLedger(),
            config.metrics_use_daily, config.metrics_annualization_days);
        metrics.logMetrics();

        // --- Reports ---
        backtester::ReportWriter writer(
            backtester::ReportWriter::generateReportDir(config.reports_dir, config.symbol, strategy_name));
        writer.writeTrades(portfolio.getTradeLedger());
        writer.writeEquityCurve(portfolio.getEquityCurve());
        backtester::writeSummaryJson(writer.summaryPath(), metrics, summary, core::configToJson(config), run_id);

        logger->info("Spot backtester finished. Reports in {}", writer.getReportDir());

    // --- Exception Handling ---
    } catch (const core::SpotBacktesterException& ex) {
        std::cerr << "Backtester Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Backtester Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
