#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace core {

    // Exact fixed-point number: a signed 64-bit count of 1e-8 units.
    // Multiplication and division go through 128-bit intermediates and
    // round half away from zero at the last digit.
    class Decimal {
    public:
        static constexpr int kScaleDigits = 8;
        static constexpr std::int64_t kScale = 100000000LL;

        Decimal() = default;
        explicit Decimal(long long whole);

        // Accepts "151.50", "-0.0002", "+12". Digits past the 8th decimal are rounded.
        static Decimal fromString(const std::string& text);
        // Rounds to `places` decimal places (0..8). Throws std::invalid_argument on NaN/inf.
        static Decimal fromDouble(double value, int places = kScaleDigits);
        static Decimal fromRaw(std::int64_t raw);

        std::int64_t raw() const { return raw_; }
        bool isZero() const { return raw_ == 0; }
        bool isNegative() const { return raw_ < 0; }
        bool isPositive() const { return raw_ > 0; }

        Decimal abs() const;
        Decimal round(int places) const;
        // Largest integer not greater than this value
        long long floor() const;
        double toDouble() const;

        // Canonical form, trailing zeros trimmed ("0.0303", "151.5", "543")
        std::string toString() const;
        // Fixed number of decimal places, rounded half-up
        std::string toString(int places) const;

        Decimal operator-() const;
        Decimal& operator+=(const Decimal& other);
        Decimal& operator-=(const Decimal& other);
        Decimal& operator*=(const Decimal& other);
        Decimal& operator/=(const Decimal& other);

        friend Decimal operator+(Decimal lhs, const Decimal& rhs) { return lhs += rhs; }
        friend Decimal operator-(Decimal lhs, const Decimal& rhs) { return lhs -= rhs; }
        friend Decimal operator*(Decimal lhs, const Decimal& rhs) { return lhs *= rhs; }
        friend Decimal operator/(Decimal lhs, const Decimal& rhs) { return lhs /= rhs; }

        friend bool operator==(const Decimal& a, const Decimal& b) { return a.raw_ == b.raw_; }
        friend bool operator!=(const Decimal& a, const Decimal& b) { return a.raw_ != b.raw_; }
        friend bool operator<(const Decimal& a, const Decimal& b) { return a.raw_ < b.raw_; }
        friend bool operator<=(const Decimal& a, const Decimal& b) { return a.raw_ <= b.raw_; }
        friend bool operator>(const Decimal& a, const Decimal& b) { return a.raw_ > b.raw_; }
        friend bool operator>=(const Decimal& a, const Decimal& b) { return a.raw_ >= b.raw_; }

    private:
        std::int64_t raw_ = 0;
    };

    std::ostream& operator<<(std::ostream& os, const Decimal& value);

    // JSON interchange: always written as a decimal string
    void to_json(nlohmann::json& j, const Decimal& value);
    void from_json(const nlohmann::json& j, Decimal& value);

} // namespace core
