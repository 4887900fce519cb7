#include "bar_source.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <sstream>
#include <vector>
#include <cmath>
#include <algorithm>
#include <stdexcept>

namespace data {

    namespace {

        std::string trim(const std::string& s) {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos) return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        std::vector<std::string> splitCsvLine(const std::string& line) {
            std::vector<std::string> fields;
            std::stringstream ss(line);
            std::string field;
            while (std::getline(ss, field, ',')) {
                fields.push_back(trim(field));
            }
            if (!line.empty() && line.back() == ',') {
                fields.emplace_back();
            }
            return fields;
        }

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            return s;
        }

    } // namespace

    void validateBar(const core::Bar& bar,
                     const std::optional<core::Timestamp>& previous,
                     const std::string& origin)
    {
        auto positive = [](double v) { return std::isfinite(v) && v > 0.0; };
        if (!positive(bar.open) || !positive(bar.high) || !positive(bar.low) || !positive(bar.close)) {
            throw core::DataLoadException(fmt::format(
                "{}: non-positive OHLC at {} (o={}, h={}, l={}, c={})", origin,
                core::utils::timestampToString(bar.timestamp), bar.open, bar.high, bar.low, bar.close));
        }
        if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
            throw core::DataLoadException(fmt::format(
                "{}: negative volume {} at {}", origin, bar.volume, core::utils::timestampToString(bar.timestamp)));
        }
        if (previous && bar.timestamp <= *previous) {
            throw core::DataLoadException(fmt::format(
                "{}: timestamps not strictly increasing ({} after {})", origin,
                core::utils::timestampToString(bar.timestamp), core::utils::timestampToString(*previous)));
        }
    }

    // --- SeriesBarSource ---

    SeriesBarSource::SeriesBarSource(core::TimeSeries<core::Bar> bars, std::string origin)
        : bars_(std::move(bars)), origin_(std::move(origin)) {}

    std::optional<core::Bar> SeriesBarSource::next() {
        if (index_ >= bars_.size()) {
            return std::nullopt;
        }
        const core::Bar& bar = bars_[index_++];
        validateBar(bar, last_timestamp_, origin_);
        last_timestamp_ = bar.timestamp;
        return bar;
    }

    // --- CsvBarSource ---

    CsvBarSource::CsvBarSource(const std::string& path, std::string symbol)
        : path_(path), symbol_(std::move(symbol)), file_(path)
    {
        if (!file_.is_open()) {
            throw core::DataLoadException("Could not open bar CSV: " + path_);
        }
        readHeader();
        core::logging::getLogger()->info("Streaming bars for {} from CSV {} (time column '{}')",
                                         symbol_, path_, timestamp_column_);
    }

    void CsvBarSource::readHeader() {
        std::string header;
        if (!std::getline(file_, header)) {
            throw core::DataLoadException("Bar CSV is empty: " + path_);
        }
        // Strip UTF-8 BOM
        if (header.size() >= 3 && header.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            header.erase(0, 3);
        }

        auto names = splitCsvLine(header);
        for (std::size_t i = 0; i < names.size(); ++i) {
            columns_[lower(names[i])] = i;
        }

        for (const char* required : {"open", "high", "low", "close", "volume"}) {
            if (!columns_.count(required)) {
                throw core::DataLoadException(std::string("Bar CSV ") + path_ + " is missing column '" + required + "'");
            }
        }

        if (columns_.count("open_time")) {
            timestamp_column_ = "open_time";
            timestamp_is_millis_ = true;
        } else if (columns_.count("timestamp")) {
            timestamp_column_ = "timestamp";
        } else if (columns_.count("ts")) {
            timestamp_column_ = "ts";
        } else {
            throw core::DataLoadException("Bar CSV " + path_ + " has no open_time, timestamp or ts column");
        }
    }

    std::optional<core::Bar> CsvBarSource::next() {
        std::string line;
        while (std::getline(file_, line)) {
            ++line_number_;
            if (trim(line).empty()) {
                continue;
            }

            auto fields = splitCsvLine(line);
            auto field = [&](const std::string& name) -> const std::string& {
                std::size_t idx = columns_.at(name);
                if (idx >= fields.size()) {
                    throw core::DataLoadException(fmt::format("{}:{}: missing field '{}'", path_, line_number_, name));
                }
                return fields[idx];
            };

            core::Bar bar;
            bar.symbol = symbol_;
            try {
                const std::string& ts_text = field(timestamp_column_);
                if (timestamp_is_millis_) {
                    bar.timestamp = core::utils::millisToTimestamp(std::stoll(ts_text));
                } else {
                    bar.timestamp = core::utils::stringToTimestamp(ts_text);
                }
                bar.open = std::stod(field("open"));
                bar.high = std::stod(field("high"));
                bar.low = std::stod(field("low"));
                bar.close = std::stod(field("close"));
                bar.volume = std::stod(field("volume"));
            } catch (const std::invalid_argument& e) {
                throw core::DataLoadException(fmt::format("{}:{}: unparseable value ({})", path_, line_number_, e.what()));
            } catch (const std::out_of_range& e) {
                throw core::DataLoadException(fmt::format("{}:{}: value out of range ({})", path_, line_number_, e.what()));
            } catch (const core::DataLoadException&) {
                throw;
            } catch (const std::runtime_error& e) {
                // stringToTimestamp failures
                throw core::DataLoadException(fmt::format("{}:{}: {}", path_, line_number_, e.what()));
            }

            validateBar(bar, last_timestamp_, fmt::format("{}:{}", path_, line_number_));
            last_timestamp_ = bar.timestamp;
            return bar;
        }
        return std::nullopt;
    }

} // namespace data
