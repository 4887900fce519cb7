#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <fstream>
#include <set>
#include <cstdlib>    // For std::getenv
#include <algorithm>  // For std::clamp

namespace core {

    using json = nlohmann::json;

    namespace {

        const std::set<std::string>& validIntervals() {
            static const std::set<std::string> intervals = {
                "1s", "1m", "3m", "5m", "15m", "30m", "1h", "2h", "4h", "6h", "8h",
                "12h", "1d", "3d", "1w", "1M"
            };
            return intervals;
        }

        template <typename T>
        void readField(const json& j, const char* key, T& target) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return;
            }
            try {
                target = it->get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(std::string("Invalid type for config key '") + key + "': " + e.what());
            }
        }

        const char* envValue(const char* name) {
            const char* value = std::getenv(name);
            return (value && *value) ? value : nullptr;
        }

        void overrideString(const char* name, std::string& target) {
            if (const char* v = envValue(name)) target = v;
        }

        void overrideBool(const char* name, bool& target) {
            if (const char* v = envValue(name)) target = utils::parseBool(v);
        }

        void overrideInt(const char* name, int& target) {
            const char* v = envValue(name);
            if (!v) return;
            try {
                std::size_t idx = 0;
                int parsed = std::stoi(v, &idx);
                if (idx == std::string(v).size()) {
                    target = parsed;
                    return;
                }
            } catch (const std::logic_error&) {
                // falls through to the warning
            }
            logging::getLogger()->warn("Ignoring unparseable integer in {}='{}'", name, v);
        }

        void overrideDouble(const char* name, double& target) {
            const char* v = envValue(name);
            if (!v) return;
            try {
                std::size_t idx = 0;
                double parsed = std::stod(v, &idx);
                if (idx == std::string(v).size()) {
                    target = parsed;
                    return;
                }
            } catch (const std::logic_error&) {
                // falls through to the warning
            }
            logging::getLogger()->warn("Ignoring unparseable number in {}='{}'", name, v);
        }

    } // namespace

    bool isValidInterval(const std::string& interval) {
        return validIntervals().count(interval) > 0;
    }

    BacktestConfig configFromJson(const json& j) {
        if (!j.is_object()) {
            throw ConfigException("Configuration root must be a JSON object");
        }
        BacktestConfig config;
        readField(j, "symbol", config.symbol);
        readField(j, "interval", config.interval);
        readField(j, "limit", config.limit);
        readField(j, "testnet", config.testnet);
        readField(j, "data_source", config.data_source);
        readField(j, "csv_path", config.csv_path);
        readField(j, "db_path", config.db_path);
        readField(j, "start", config.start);
        readField(j, "end", config.end);
        readField(j, "starting_cash", config.starting_cash);
        readField(j, "fee_bps", config.fee_bps);
        readField(j, "slippage_bps", config.slippage_bps);
        readField(j, "alloc_pct", config.alloc_pct);
        readField(j, "realized_pnl_net_fees", config.realized_pnl_net_fees);
        readField(j, "log_every", config.log_every);
        readField(j, "rules_enabled", config.rules_enabled);
        readField(j, "rules_use_cache", config.rules_use_cache);
        readField(j, "rules_refresh", config.rules_refresh);
        readField(j, "rules_dir", config.rules_dir);
        readField(j, "reports_dir", config.reports_dir);
        readField(j, "metrics_use_daily", config.metrics_use_daily);
        readField(j, "metrics_annualization_days", config.metrics_annualization_days);

        auto strategy_it = j.find("strategy");
        if (strategy_it != j.end() && !strategy_it->is_null()) {
            if (!strategy_it->is_object()) {
                throw ConfigException("Config key 'strategy' must be a JSON object");
            }
            config.strategy = *strategy_it;
        }
        return config;
    }

    BacktestConfig loadConfig(const std::string& path) {
        auto logger = logging::getLogger();
        json j = json::object();

        if (!path.empty()) {
            std::ifstream config_file(path);
            if (!config_file.is_open()) {
                throw ConfigException("Could not open configuration file: " + path);
            }
            try {
                config_file >> j;
            } catch (const json::parse_error& e) {
                throw ConfigException("Failed to parse configuration file '" + path + "': " + e.what());
            }
            logger->info("Loaded configuration from {}", path);
        } else {
            logger->info("No configuration file given, using defaults");
        }

        BacktestConfig config = configFromJson(j);
        applyEnvironmentOverrides(config);
        sanitizeConfig(config);
        logger->debug("Effective configuration: {}", configToJson(config).dump());
        return config;
    }

    void applyEnvironmentOverrides(BacktestConfig& config) {
        overrideString("SYMBOL", config.symbol);
        overrideString("INTERVAL", config.interval);
        overrideInt("LIMIT", config.limit);
        overrideBool("TESTNET", config.testnet);
        overrideString("DATA_SOURCE", config.data_source);
        overrideString("CSV_PATH", config.csv_path);
        overrideString("DB_PATH", config.db_path);
        overrideString("START", config.start);
        overrideString("END", config.end);
        overrideDouble("STARTING_CASH", config.starting_cash);
        overrideDouble("FEE_BPS", config.fee_bps);
        overrideDouble("SLIPPAGE_BPS", config.slippage_bps);
        overrideDouble("ALLOC_PCT", config.alloc_pct);
        overrideBool("REALIZED_NET_FEES", config.realized_pnl_net_fees);
        overrideInt("LOG_EVERY", config.log_every);
        overrideBool("RULES_ENABLED", config.rules_enabled);
        overrideBool("RULES_USE_CACHE", config.rules_use_cache);
        overrideBool("RULES_REFRESH", config.rules_refresh);
        overrideString("RULES_DIR", config.rules_dir);
        overrideString("REPORTS_DIR", config.reports_dir);
        overrideBool("METRICS_USE_DAILY", config.metrics_use_daily);
        overrideInt("METRICS_ANNUALIZATION_DAYS", config.metrics_annualization_days);
    }

    void sanitizeConfig(BacktestConfig& config) {
        auto logger = logging::getLogger();

        config.symbol = utils::toUpper(config.symbol);
        if (config.symbol.empty()) {
            throw ConfigException("Symbol must not be empty");
        }

        if (!isValidInterval(config.interval)) {
            logger->warn("Invalid interval '{}', falling back to 1h", config.interval);
            config.interval = "1h";
        }

        config.limit = std::clamp(config.limit, 1, 1000);

        if (!(config.starting_cash > 0.0)) {
            throw ConfigException("starting_cash must be > 0, got " + std::to_string(config.starting_cash));
        }

        config.fee_bps = std::max(0.0, config.fee_bps);
        config.slippage_bps = std::max(0.0, config.slippage_bps);
        config.alloc_pct = std::clamp(config.alloc_pct, 0.0, 1.0);
        config.log_every = std::max(0, config.log_every);
        config.metrics_annualization_days = std::max(1, config.metrics_annualization_days);

        if (config.data_source != "binance" && config.data_source != "csv" && config.data_source != "sqlite") {
            throw ConfigException("Unknown data_source '" + config.data_source + "' (expected binance, csv or sqlite)");
        }
        if (config.data_source == "csv" && config.csv_path.empty()) {
            throw ConfigException("data_source 'csv' requires csv_path");
        }
        if (config.data_source == "sqlite" && config.db_path.empty()) {
            throw ConfigException("data_source 'sqlite' requires db_path");
        }
    }

    json configToJson(const BacktestConfig& config) {
        return json{
            {"symbol", config.symbol},
            {"interval", config.interval},
            {"limit", config.limit},
            {"testnet", config.testnet},
            {"data_source", config.data_source},
            {"csv_path", config.csv_path},
            {"db_path", config.db_path},
            {"start", config.start},
            {"end", config.end},
            {"starting_cash", config.starting_cash},
            {"fee_bps", config.fee_bps},
            {"slippage_bps", config.slippage_bps},
            {"alloc_pct", config.alloc_pct},
            {"realized_pnl_net_fees", config.realized_pnl_net_fees},
            {"log_every", config.log_every},
            {"rules_enabled", config.rules_enabled},
            {"rules_use_cache", config.rules_use_cache},
            {"rules_refresh", config.rules_refresh},
            {"rules_dir", config.rules_dir},
            {"reports_dir", config.reports_dir},
            {"metrics_use_daily", config.metrics_use_daily},
            {"metrics_annualization_days", config.metrics_annualization_days},
            {"strategy", config.strategy}
        };
    }

} // namespace core
