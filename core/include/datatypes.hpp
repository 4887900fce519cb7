#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps

namespace core {

    // All timestamps are UTC
    using Timestamp = std::chrono::system_clock::time_point;

    // One OHLCV sample for a fixed interval. Produced by a bar source, never mutated afterwards.
    struct Bar {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0; // Crypto volumes are fractional
        std::string symbol;

        bool operator<(const Bar& other) const {
            return timestamp < other.timestamp;
        }
    };

    enum class Side {
        Buy,
        Sell
    };

    inline const char* sideToString(Side side) {
        return side == Side::Buy ? "BUY" : "SELL";
    }

    // One accepted execution as recorded in the trade ledger
    struct Trade {
        Timestamp timestamp;
        std::string symbol;
        Side side = Side::Buy;
        double quantity = 0.0;      // Executed (rounded) quantity
        double price = 0.0;         // Executed price after slippage and tick rounding
        double fee = 0.0;
        double cash_after = 0.0;
        double quantity_after = 0.0;
        double equity_after = 0.0;
        double realized_pnl = 0.0;  // Always 0 for buys
        double cum_realized_pnl = 0.0;
        std::string note;
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

} // namespace core
