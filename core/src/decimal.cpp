#include "decimal.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <cctype>
#include <cstdio>   // For std::snprintf
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace core {

    namespace {

        using int128 = __int128;

        constexpr int128 kMaxUnits = std::numeric_limits<std::int64_t>::max();
        constexpr int128 kMinUnits = std::numeric_limits<std::int64_t>::min();

        std::int64_t checkedNarrow(int128 value, const char* what) {
            if (value > kMaxUnits || value < kMinUnits) {
                throw std::out_of_range(std::string("Decimal overflow in ") + what);
            }
            return static_cast<std::int64_t>(value);
        }

        // "1.5", -7 -> "0.00000015"; "2", 16 -> "20000000000000000"
        std::string expandExponent(const std::string& mantissa, int exponent) {
            std::string sign;
            std::string body = mantissa;
            if (!body.empty() && (body[0] == '-' || body[0] == '+')) {
                if (body[0] == '-') sign = "-";
                body.erase(0, 1);
            }
            const auto dot = body.find('.');
            const std::string int_digits = body.substr(0, dot);
            const std::string digits = dot == std::string::npos ? body : int_digits + body.substr(dot + 1);

            const long point = static_cast<long>(int_digits.size()) + exponent;
            if (point <= 0) {
                return sign + "0." + std::string(static_cast<std::size_t>(-point), '0') + digits;
            }
            if (static_cast<std::size_t>(point) >= digits.size()) {
                return sign + digits + std::string(static_cast<std::size_t>(point) - digits.size(), '0');
            }
            return sign + digits.substr(0, static_cast<std::size_t>(point)) + "." + digits.substr(static_cast<std::size_t>(point));
        }

    } // namespace

    Decimal Decimal::fromDouble(double value, Rounding mode) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Decimal::fromDouble: value is not finite");
        }
        const std::string text = fmt::format("{}", value);
        const auto exp_pos = text.find_first_of("eE");
        if (exp_pos == std::string::npos) {
            return fromString(text, mode);
        }
        return fromString(expandExponent(text.substr(0, exp_pos), std::stoi(text.substr(exp_pos + 1))), mode);
    }

    Decimal Decimal::fromString(const std::string& text, Rounding mode) {
        std::size_t pos = 0;
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;

        bool negative = false;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            negative = text[pos] == '-';
            ++pos;
        }

        int128 int_part = 0;
        int128 frac_part = 0;
        int frac_digits = 0;
        bool round_up = false;
        bool dropped_nonzero = false;
        bool any_digit = false;

        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            int_part = int_part * 10 + (text[pos] - '0');
            if (int_part > kMaxUnits) {
                throw std::out_of_range("Decimal::fromString: value out of range: " + text);
            }
            any_digit = true;
            ++pos;
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                int digit = text[pos] - '0';
                if (frac_digits < kScaleDigits) {
                    frac_part = frac_part * 10 + digit;
                    ++frac_digits;
                } else {
                    if (frac_digits == kScaleDigits) {
                        round_up = digit >= 5;
                        ++frac_digits;
                    }
                    dropped_nonzero = dropped_nonzero || digit != 0;
                }
                any_digit = true;
                ++pos;
            }
        }
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;

        if (!any_digit || pos != text.size()) {
            throw std::invalid_argument("Decimal::fromString: not a plain decimal number: '" + text + "'");
        }

        for (int i = std::min(frac_digits, static_cast<int>(kScaleDigits)); i < kScaleDigits; ++i) {
            frac_part *= 10;
        }
        int128 units = int_part * kScale + frac_part;
        if (mode == Rounding::HalfAwayFromZero && round_up) {
            ++units;
        }
        if (negative) {
            units = -units;
            if (mode == Rounding::Floor && dropped_nonzero) {
                --units;
            }
        }
        return fromRaw(checkedNarrow(units, "fromString"));
    }

    double Decimal::toDouble() const {
        std::int64_t whole = units_ / kScale;
        std::int64_t frac = units_ % kScale;
        return static_cast<double>(whole) + static_cast<double>(frac) / static_cast<double>(kScale);
    }

    std::string Decimal::toString() const {
        int128 value = units_;
        bool negative = value < 0;
        if (negative) value = -value;

        auto whole = static_cast<unsigned long long>(value / kScale);
        auto frac = static_cast<unsigned long long>(value % kScale);

        std::string out = negative ? "-" : "";
        out += std::to_string(whole);
        if (frac != 0) {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%08llu", frac);
            std::string digits(buffer);
            while (!digits.empty() && digits.back() == '0') digits.pop_back();
            out += "." + digits;
        }
        return out;
    }

    Decimal Decimal::floorToStep(const Decimal& step) const {
        if (step.units_ <= 0) {
            return *this;
        }
        std::int64_t q = units_ / step.units_;
        std::int64_t r = units_ % step.units_;
        if (r != 0 && units_ < 0) {
            --q; // integer division truncates; floor needs one more step down for negatives
        }
        return fromRaw(checkedNarrow(static_cast<int128>(q) * step.units_, "floorToStep"));
    }

    Decimal Decimal::operator+(const Decimal& other) const {
        return fromRaw(checkedNarrow(static_cast<int128>(units_) + other.units_, "addition"));
    }

    Decimal Decimal::operator-(const Decimal& other) const {
        return fromRaw(checkedNarrow(static_cast<int128>(units_) - other.units_, "subtraction"));
    }

    Decimal Decimal::operator*(const Decimal& other) const {
        int128 product = static_cast<int128>(units_) * other.units_;
        return fromRaw(checkedNarrow(product / kScale, "multiplication"));
    }

    std::ostream& operator<<(std::ostream& os, const Decimal& value) {
        return os << value.toString();
    }

} // namespace core
