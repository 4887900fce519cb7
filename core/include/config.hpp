#pragma once

#include <string>
#include <nlohmann/json.hpp> // For strategy parameters

namespace core {

    // Explicit run configuration handed to the Portfolio and the Backtester
    struct BacktestConfig {
        // --- Market data ---
        std::string symbol = "BTCUSDT";
        std::string interval = "1h";
        int limit = 200;
        bool testnet = true;
        std::string data_source = "binance"; // binance | csv | sqlite
        std::string csv_path;
        std::string db_path;
        std::string start;                   // Optional range bounds (date, ISO-8601 or epoch)
        std::string end;

        // --- Costs and sizing ---
        double starting_cash = 10000.0;
        double fee_bps = 1.0;
        double slippage_bps = 5.0;
        double alloc_pct = 0.10;
        bool realized_pnl_net_fees = false;

        // --- Engine ---
        int log_every = 10;

        // --- Exchange rules ---
        bool rules_enabled = true;
        bool rules_use_cache = true;
        bool rules_refresh = false;
        std::string rules_dir = "rules";

        // --- Reports / metrics ---
        std::string reports_dir = "reports";
        bool metrics_use_daily = true;
        int metrics_annualization_days = 252;

        nlohmann::json strategy = {{"type", "buy_second_bar"}};
    };

    bool isValidInterval(const std::string& interval);

    // Reads a JSON object into a config (missing keys keep defaults),
    // then applies environment overrides and sanitisation.
    // Throws ConfigException on unreadable file, invalid JSON or wrong value types.
    BacktestConfig loadConfig(const std::string& path);

    // Reads fields only; no environment overrides, no sanitisation
    BacktestConfig configFromJson(const nlohmann::json& j);

    // SYMBOL, INTERVAL, LIMIT, ... Unparseable values keep the previous value.
    void applyEnvironmentOverrides(BacktestConfig& config);

    // Clamps and normalises values; throws ConfigException for unrecoverable ones
    void sanitizeConfig(BacktestConfig& config);

    nlohmann::json configToJson(const BacktestConfig& config);

} // namespace core
