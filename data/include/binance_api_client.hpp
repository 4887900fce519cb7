#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "datatypes.hpp" // For TimeSeries, Bar

namespace data {

// Public Binance Spot REST endpoints (exchangeInfo, klines). No signed requests.
class BinanceApiClient {
public:
    static constexpr int kMaxKlinesPerRequest = 1000;

    explicit BinanceApiClient(bool testnet = true);
    virtual ~BinanceApiClient() = default;

    // GET /api/v3/exchangeInfo?symbol=...
    nlohmann::json getExchangeInfo(const std::string& symbol);

    // Without start/end: one request of `limit` rows (latest bars).
    // With start and/or end: pages of 1000 rows from start until end, deduplicated and sorted.
    core::TimeSeries<core::Bar> getKlines(const std::string& symbol,
                                          const std::string& interval,
                                          int limit,
                                          std::optional<std::int64_t> start_ms = std::nullopt,
                                          std::optional<std::int64_t> end_ms = std::nullopt);

    // Kline rows: [open_time, "open", "high", "low", "close", "volume", close_time, ...]
    static core::TimeSeries<core::Bar> parseKlines(const nlohmann::json& rows, const std::string& symbol);

    // "1m" -> 60000. Throws std::invalid_argument for unknown intervals.
    static std::int64_t intervalToMillis(const std::string& interval);

    // "YYYY-MM-DD" (00:00 UTC), epoch seconds or milliseconds (> 1e10 is ms), or ISO-8601.
    // Throws std::invalid_argument when the text matches none of these.
    static std::int64_t toMillis(const std::string& value);

    const std::string& baseUrl() const { return base_url_; }

protected:
    // Performs the HTTP GET and returns the parsed JSON body.
    // Throws core::ApiRequestException on transport errors, non-200 status or invalid JSON.
    virtual nlohmann::json performGetRequest(const std::string& endpoint,
                                             const std::vector<std::pair<std::string, std::string>>& params);

private:
    std::string base_url_;
};

} // namespace data
