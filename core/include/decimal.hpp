#pragma once

#include <cstdint>
#include <string>
#include <ostream>

namespace core {

    // Fixed-point value with 8 fractional digits (the precision of exchange filters).
    // Stored as a signed 64-bit count of 1e-8 units, so tick/step flooring is exact.
    class Decimal {
    public:
        static constexpr int kScaleDigits = 8;
        static constexpr std::int64_t kScale = 100000000LL;

        // How digits past the 8th fractional place are dropped
        enum class Rounding {
            HalfAwayFromZero,
            Floor               // Toward negative infinity; never exceeds the input
        };

        constexpr Decimal() = default;

        // Parses the shortest decimal text that round-trips to `value` (0.29 -> "0.29").
        // Throws std::invalid_argument for NaN/inf, std::out_of_range when it does not fit.
        static Decimal fromDouble(double value, Rounding mode = Rounding::HalfAwayFromZero);

        // Plain decimal notation: "0.00001000", "5", "-1.25", "+3."
        static Decimal fromString(const std::string& text, Rounding mode = Rounding::HalfAwayFromZero);

        static constexpr Decimal fromRaw(std::int64_t units) {
            Decimal d;
            d.units_ = units;
            return d;
        }

        constexpr std::int64_t raw() const { return units_; }
        double toDouble() const;

        // Shortest form without trailing zeros, e.g. "0.01", "5", "-1.25"
        std::string toString() const;

        // Largest multiple of step that is <= this value. Identity when step <= 0.
        Decimal floorToStep(const Decimal& step) const;

        bool isZero() const { return units_ == 0; }
        bool isPositive() const { return units_ > 0; }

        Decimal operator+(const Decimal& other) const;
        Decimal operator-(const Decimal& other) const;
        // Product truncated toward zero at 1e-8
        Decimal operator*(const Decimal& other) const;
        Decimal operator-() const { return fromRaw(-units_); }

        bool operator==(const Decimal& other) const { return units_ == other.units_; }
        bool operator!=(const Decimal& other) const { return units_ != other.units_; }
        bool operator<(const Decimal& other) const { return units_ < other.units_; }
        bool operator<=(const Decimal& other) const { return units_ <= other.units_; }
        bool operator>(const Decimal& other) const { return units_ > other.units_; }
        bool operator>=(const Decimal& other) const { return units_ >= other.units_; }

    private:
        std::int64_t units_ = 0;
    };

    std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace core
