#pragma once

#include <string>
#include <fstream>
#include <optional>
#include <map>

#include "datatypes.hpp"

namespace data {

    // Lazy, forward-only stream of bars in ascending time order
    class IBarSource {
    public:
        virtual ~IBarSource() = default;

        // Next bar, or std::nullopt when exhausted.
        // Throws core::DataLoadException when a bar is malformed or out of order.
        virtual std::optional<core::Bar> next() = 0;
    };

    // Positive OHLC, non-negative volume, timestamp strictly after `previous` (if any).
    // Throws core::DataLoadException naming `origin` on the first violation.
    void validateBar(const core::Bar& bar,
                     const std::optional<core::Timestamp>& previous,
                     const std::string& origin);

    class SeriesBarSource : public IBarSource {
    public:
        explicit SeriesBarSource(core::TimeSeries<core::Bar> bars, std::string origin = "series");

        std::optional<core::Bar> next() override;

        std::size_t size() const { return bars_.size(); }

    private:
        core::TimeSeries<core::Bar> bars_;
        std::string origin_;
        std::size_t index_ = 0;
        std::optional<core::Timestamp> last_timestamp_;
    };

    // CSV with a header row. Timestamp column: `open_time` (epoch ms) or `timestamp`/`ts` (ISO-8601).
    // Value columns: open, high, low, close, volume. Extra columns are ignored.
    class CsvBarSource : public IBarSource {
    public:
        CsvBarSource(const std::string& path, std::string symbol);

        std::optional<core::Bar> next() override;

    private:
        std::string path_;
        std::string symbol_;
        std::ifstream file_;
        std::map<std::string, std::size_t> columns_;
        std::string timestamp_column_;
        bool timestamp_is_millis_ = false;
        std::size_t line_number_ = 1;
        std::optional<core::Timestamp> last_timestamp_;

        void readHeader();
    };

} // namespace data
