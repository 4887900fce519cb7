#include "binance_api_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <cctype>

namespace data {

namespace {

    const std::map<std::string, std::int64_t>& intervalTable() {
        static const std::map<std::string, std::int64_t> table = {
            {"1s", 1000LL},
            {"1m", 60000LL},
            {"3m", 3 * 60000LL},
            {"5m", 5 * 60000LL},
            {"15m", 15 * 60000LL},
            {"30m", 30 * 60000LL},
            {"1h", 60 * 60000LL},
            {"2h", 2 * 60 * 60000LL},
            {"4h", 4 * 60 * 60000LL},
            {"6h", 6 * 60 * 60000LL},
            {"8h", 8 * 60 * 60000LL},
            {"12h", 12 * 60 * 60000LL},
            {"1d", 24 * 60 * 60000LL},
            {"3d", 3 * 24 * 60 * 60000LL},
            {"1w", 7 * 24 * 60 * 60000LL},
            {"1M", 30 * 24 * 60 * 60000LL} // Approximation, only used to advance the cursor
        };
        return table;
    }

    // Binance sends prices as strings, open/close times as integers
    double numberFrom(const nlohmann::json& value) {
        if (value.is_string()) {
            return std::stod(value.get<std::string>());
        }
        return value.get<double>();
    }

    std::int64_t millisFrom(const nlohmann::json& value) {
        if (value.is_string()) {
            return std::stoll(value.get<std::string>());
        }
        return value.get<std::int64_t>();
    }

} // namespace

BinanceApiClient::BinanceApiClient(bool testnet)
    : base_url_(testnet ? "https://testnet.binance.vision" : "https://api.binance.com")
{
    core::logging::getLogger()->debug("BinanceApiClient created for {}", base_url_);
}

nlohmann::json BinanceApiClient::getExchangeInfo(const std::string& symbol) {
    core::logging::getLogger()->info("Requesting exchangeInfo for {}", symbol);
    return performGetRequest("/api/v3/exchangeInfo", {{"symbol", symbol}});
}

core::TimeSeries<core::Bar> BinanceApiClient::getKlines(const std::string& symbol,
                                                        const std::string& interval,
                                                        int limit,
                                                        std::optional<std::int64_t> start_ms,
                                                        std::optional<std::int64_t> end_ms)
{
    auto logger = core::logging::getLogger();

    if (!start_ms && !end_ms) {
        // --- Single request by limit ---
        int effective_limit = std::clamp(limit > 0 ? limit : 500, 1, kMaxKlinesPerRequest);
        logger->info("Requesting {} klines for {} ({})", effective_limit, symbol, interval);
        nlohmann::json rows = performGetRequest("/api/v3/klines", {
            {"symbol", symbol},
            {"interval", interval},
            {"limit", std::to_string(effective_limit)}
        });
        core::TimeSeries<core::Bar> bars = parseKlines(rows, symbol);
        std::sort(bars.begin(), bars.end());
        return bars;
    }

    // --- Paginated range request ---
    std::int64_t step_ms = 0;
    try {
        step_ms = intervalToMillis(interval);
    } catch (const std::invalid_argument& e) {
        throw core::ApiRequestException(e.what());
    }

    std::map<std::int64_t, core::Bar> by_open_time; // Dedup across page boundaries
    std::optional<std::int64_t> cursor = start_ms;
    int page = 0;

    while (true) {
        std::vector<std::pair<std::string, std::string>> params = {
            {"symbol", symbol},
            {"interval", interval},
            {"limit", std::to_string(kMaxKlinesPerRequest)}
        };
        if (cursor) params.emplace_back("startTime", std::to_string(*cursor));
        if (end_ms) params.emplace_back("endTime", std::to_string(*end_ms));

        nlohmann::json rows = performGetRequest("/api/v3/klines", params);
        core::TimeSeries<core::Bar> chunk = parseKlines(rows, symbol);
        ++page;
        logger->debug("Kline page {} for {}: {} rows", page, symbol, chunk.size());
        if (chunk.empty()) {
            break;
        }

        std::int64_t last_open = core::utils::timestampToMillis(chunk.front().timestamp);
        for (const auto& bar : chunk) {
            std::int64_t open_ms = core::utils::timestampToMillis(bar.timestamp);
            by_open_time[open_ms] = bar;
            last_open = std::max(last_open, open_ms);
        }

        std::int64_t next_cursor = last_open + step_ms;
        if (cursor && next_cursor <= *cursor) {
            break; // No progress
        }
        cursor = next_cursor;

        if (end_ms && *cursor >= *end_ms) {
            break;
        }
        if (static_cast<int>(chunk.size()) < kMaxKlinesPerRequest) {
            break;
        }
    }

    core::TimeSeries<core::Bar> bars;
    bars.reserve(by_open_time.size());
    for (const auto& entry : by_open_time) {
        bars.push_back(entry.second);
    }
    logger->info("Downloaded {} klines for {} ({}) in {} page(s)", bars.size(), symbol, interval, page);
    return bars;
}

core::TimeSeries<core::Bar> BinanceApiClient::parseKlines(const nlohmann::json& rows, const std::string& symbol) {
    if (!rows.is_array()) {
        throw core::ApiRequestException("Unexpected klines payload (not an array): " + rows.dump().substr(0, 200));
    }

    core::TimeSeries<core::Bar> bars;
    bars.reserve(rows.size());
    for (const auto& row : rows) {
        if (!row.is_array() || row.size() < 6) {
            throw core::ApiRequestException("Malformed kline row: " + row.dump());
        }
        try {
            core::Bar bar;
            bar.timestamp = core::utils::millisToTimestamp(millisFrom(row[0]));
            bar.open = numberFrom(row[1]);
            bar.high = numberFrom(row[2]);
            bar.low = numberFrom(row[3]);
            bar.close = numberFrom(row[4]);
            bar.volume = numberFrom(row[5]);
            bar.symbol = symbol;
            bars.push_back(bar);
        } catch (const nlohmann::json::exception& e) {
            throw core::ApiRequestException("Malformed kline row " + row.dump() + ": " + e.what());
        } catch (const std::logic_error& e) {
            // std::stod / std::stoll failures
            throw core::ApiRequestException("Non-numeric kline field in " + row.dump() + ": " + e.what());
        }
    }
    return bars;
}

std::int64_t BinanceApiClient::intervalToMillis(const std::string& interval) {
    const auto& table = intervalTable();
    auto it = table.find(interval);
    if (it == table.end()) {
        throw std::invalid_argument("Unsupported interval: " + interval);
    }
    return it->second;
}

std::int64_t BinanceApiClient::toMillis(const std::string& value) {
    std::string s = value;
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c){ return !std::isspace(c); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), s.end());
    if (s.empty()) {
        throw std::invalid_argument("Empty date/timestamp");
    }

    // Date only
    if (s.size() == 10 && s[4] == '-' && s[7] == '-') {
        try {
            return core::utils::timestampToMillis(core::utils::stringToTimestamp(s + "T00:00:00Z"));
        } catch (const std::runtime_error& e) {
            throw std::invalid_argument("Unrecognised date '" + value + "': " + e.what());
        }
    }

    // Numeric: seconds unless it is large enough to be milliseconds
    if (std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); })) {
        std::int64_t number = 0;
        try {
            number = std::stoll(s);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Timestamp out of range: " + value);
        }
        return number > 10000000000LL ? number : number * 1000;
    }

    // Full ISO-8601; a missing offset is taken as UTC
    std::string iso = s;
    bool has_zone = iso.back() == 'Z';
    if (!has_zone && iso.size() > 19) {
        std::string tail = iso.substr(19);
        has_zone = tail.find('+') != std::string::npos || tail.find('-') != std::string::npos;
    }
    if (!has_zone) {
        iso += "Z";
    }
    try {
        return core::utils::timestampToMillis(core::utils::stringToTimestamp(iso));
    } catch (const std::runtime_error& e) {
        throw std::invalid_argument("Unrecognised date/timestamp format '" + value + "': " + e.what());
    }
}

nlohmann::json BinanceApiClient::performGetRequest(const std::string& endpoint,
                                                   const std::vector<std::pair<std::string, std::string>>& params)
{
    auto logger = core::logging::getLogger();
    std::string full_url = base_url_ + endpoint;

    cpr::Parameters parameters{};
    for (const auto& param : params) {
        parameters.Add({param.first, param.second});
    }

    logger->debug("Requesting Binance URL: {}", full_url);
    cpr::Response response = cpr::Get(cpr::Url{full_url},
                                      parameters,
                                      cpr::Header{{"Accept", "application/json"}},
                                      cpr::Timeout{15000});

    logger->debug("Binance API Response Status: {}, Body size: {}", response.status_code, response.text.length());

    if (response.error) {
        throw core::ApiRequestException(fmt::format("Binance request to {} failed (CPR error {}): {}",
                                                    endpoint, static_cast<int>(response.error.code),
                                                    response.error.message));
    }
    if (response.status_code != 200) {
        throw core::ApiRequestException(fmt::format("Binance request to {} failed: status {}, body '{}'",
                                                    endpoint, response.status_code,
                                                    response.text.substr(0, 500)));
    }

    try {
        return nlohmann::json::parse(response.text);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::ApiRequestException(fmt::format("Invalid JSON from Binance {}: {}", endpoint, e.what()));
    }
}

} // namespace data
