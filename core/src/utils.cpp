#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <stdexcept>
#include <cmath>      // For std::pow
#include <chrono>
#include <ctime>
#include <cctype>
#include <algorithm>
#include <random>

namespace core {
namespace utils {

    namespace {

        std::tm toUtcTm(std::time_t tt) {
            std::tm time_tm{};
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

    } // namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            int digit_count = 0;
            while (std::isdigit(ss.peek()) && digit_count < 9) {
                digits += static_cast<char>(ss.get());
                digit_count++;
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration = std::chrono::seconds(0);
        char sign_or_z = 0;

        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        } else {
             throw std::runtime_error("Timestamp missing or invalid timezone offset/indicator: " + iso_string);
        }

        // 4. timegm interprets struct tm as UTC
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(
            std::chrono::time_point_cast<std::chrono::seconds>(ts));
        if (std::chrono::system_clock::from_time_t(tt) > ts) {
            --tt; // to_time_t may round; we want the floor for pre-epoch values
        }
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;
        if (ms.count() < 0) ms += std::chrono::seconds{1};

        std::tm time_tm = toUtcTm(tt);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S");
        if (ms.count() != 0) {
            oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        }
        oss << "+00:00";
        return oss.str();
    }

    Timestamp millisToTimestamp(std::int64_t epoch_ms) {
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(epoch_ms)));
    }

    std::int64_t timestampToMillis(const Timestamp& ts) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    }

    std::string utcDateString(const Timestamp& ts) {
        std::int64_t ms = timestampToMillis(ts);
        std::int64_t secs = ms / 1000;
        if (ms % 1000 < 0) --secs;
        std::tm time_tm = toUtcTm(static_cast<std::time_t>(secs));
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    bool parseBool(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return lower == "1" || lower == "true" || lower == "yes" || lower == "y" || lower == "on";
    }

    std::string toUpper(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
        return value;
    }

    std::string generateRunId() {
        static thread_local std::mt19937_64 engine{std::random_device{}()};
        std::uniform_int_distribution<int> nibble(0, 15);
        std::uniform_int_distribution<int> variant(8, 11);

        const char* hex = "0123456789abcdef";
        std::string id;
        id.reserve(36);
        for (int i = 0; i < 32; ++i) {
            if (i == 8 || i == 12 || i == 16 || i == 20) id.push_back('-');
            if (i == 12) {
                id.push_back('4');
            } else if (i == 16) {
                id.push_back(hex[variant(engine)]);
            } else {
                id.push_back(hex[nibble(engine)]);
            }
        }
        return id;
    }

} // namespace utils
} // namespace core
