#include "decimal.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cmath>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace core {

    namespace {

        using int128 = __int128;

        constexpr std::int64_t kPow10[] = {
            1LL, 10LL, 100LL, 1000LL, 10000LL, 100000LL, 1000000LL, 10000000LL, 100000000LL
        };

        std::int64_t narrow(int128 value, const char* operation) {
            if (value > std::numeric_limits<std::int64_t>::max() ||
                value < std::numeric_limits<std::int64_t>::min()) {
                throw std::overflow_error(std::string("Decimal overflow in ") + operation);
            }
            return static_cast<std::int64_t>(value);
        }

        // Integer division rounding half away from zero
        int128 divideRounded(int128 numerator, int128 denominator) {
            int128 quotient = numerator / denominator;
            int128 remainder = numerator % denominator;
            if (remainder != 0) {
                int128 abs_rem = remainder < 0 ? -remainder : remainder;
                int128 abs_den = denominator < 0 ? -denominator : denominator;
                if (abs_rem * 2 >= abs_den) {
                    quotient += ((numerator < 0) != (denominator < 0)) ? -1 : 1;
                }
            }
            return quotient;
        }

        void checkPlaces(int places) {
            if (places < 0 || places > Decimal::kScaleDigits) {
                throw std::invalid_argument("Decimal places must be between 0 and 8, got " + std::to_string(places));
            }
        }

        std::string toDigits(int128 value) {
            if (value == 0) return "0";
            std::string digits;
            while (value > 0) {
                digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(value % 10)));
                value /= 10;
            }
            return digits;
        }

        std::string padLeft(const std::string& digits, size_t width) {
            if (digits.size() >= width) return digits;
            return std::string(width - digits.size(), '0') + digits;
        }

    } // end anonymous namespace

    Decimal::Decimal(long long whole)
        : raw_(narrow(static_cast<int128>(whole) * kScale, "construction")) {}

    Decimal Decimal::fromRaw(std::int64_t raw) {
        Decimal d;
        d.raw_ = raw;
        return d;
    }

    Decimal Decimal::fromString(const std::string& text) {
        size_t pos = 0;
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        size_t end = text.size();
        while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

        if (pos == end) {
            throw std::invalid_argument("Cannot parse empty string as Decimal");
        }

        bool negative = false;
        if (text[pos] == '-' || text[pos] == '+') {
            negative = (text[pos] == '-');
            ++pos;
        }

        int128 whole = 0;
        int128 fraction = 0;
        int fraction_digits = 0;
        bool round_up = false;
        bool seen_digit = false;
        bool seen_point = false;

        for (; pos < end; ++pos) {
            char c = text[pos];
            if (c == '.') {
                if (seen_point) {
                    throw std::invalid_argument("Invalid Decimal string: " + text);
                }
                seen_point = true;
                continue;
            }
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Invalid Decimal string: " + text);
            }
            seen_digit = true;
            int digit = c - '0';
            if (!seen_point) {
                whole = whole * 10 + digit;
                if (whole > std::numeric_limits<std::int64_t>::max()) {
                    throw std::overflow_error("Decimal overflow parsing: " + text);
                }
            } else if (fraction_digits < kScaleDigits) {
                fraction = fraction * 10 + digit;
                ++fraction_digits;
            } else if (fraction_digits == kScaleDigits) {
                round_up = digit >= 5;
                ++fraction_digits;
            }
        }

        if (!seen_digit) {
            throw std::invalid_argument("Invalid Decimal string: " + text);
        }

        int used_digits = fraction_digits > kScaleDigits ? kScaleDigits : fraction_digits;
        int128 raw = whole * kScale + fraction * kPow10[kScaleDigits - used_digits];
        if (round_up) ++raw;
        return fromRaw(narrow(negative ? -raw : raw, "parse"));
    }

    Decimal Decimal::fromDouble(double value, int places) {
        checkPlaces(places);
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Cannot convert non-finite double to Decimal");
        }
        // std::round rounds half away from zero
        double scaled = std::round(value * static_cast<double>(kPow10[places]));
        if (std::fabs(scaled) >= 9.2e18) {
            throw std::overflow_error("Decimal overflow converting double");
        }
        int128 raw = static_cast<int128>(static_cast<long long>(scaled)) * kPow10[kScaleDigits - places];
        return fromRaw(narrow(raw, "double conversion"));
    }

    Decimal Decimal::abs() const {
        return raw_ < 0 ? -*this : *this;
    }

    Decimal Decimal::round(int places) const {
        checkPlaces(places);
        const std::int64_t factor = kPow10[kScaleDigits - places];
        int128 quotient = divideRounded(raw_, factor);
        return fromRaw(narrow(quotient * factor, "round"));
    }

    long long Decimal::floor() const {
        std::int64_t quotient = raw_ / kScale;
        if (raw_ % kScale != 0 && raw_ < 0) {
            --quotient;
        }
        return quotient;
    }

    double Decimal::toDouble() const {
        return static_cast<double>(raw_) / static_cast<double>(kScale);
    }

    std::string Decimal::toString() const {
        int128 value = raw_;
        bool negative = value < 0;
        if (negative) value = -value;

        std::string out = negative ? "-" : "";
        out += toDigits(value / kScale);
        int128 fraction = value % kScale;
        if (fraction != 0) {
            std::string frac_digits = padLeft(toDigits(fraction), kScaleDigits);
            frac_digits.erase(frac_digits.find_last_not_of('0') + 1);
            out += "." + frac_digits;
        }
        return out;
    }

    std::string Decimal::toString(int places) const {
        Decimal rounded = round(places);
        int128 value = rounded.raw_;
        bool negative = value < 0;
        if (negative) value = -value;

        std::string out = negative ? "-" : "";
        out += toDigits(value / kScale);
        if (places > 0) {
            int128 fraction = (value % kScale) / kPow10[kScaleDigits - places];
            out += "." + padLeft(toDigits(fraction), static_cast<size_t>(places));
        }
        return out;
    }

    Decimal Decimal::operator-() const {
        return fromRaw(narrow(-static_cast<int128>(raw_), "negation"));
    }

    Decimal& Decimal::operator+=(const Decimal& other) {
        raw_ = narrow(static_cast<int128>(raw_) + other.raw_, "addition");
        return *this;
    }

    Decimal& Decimal::operator-=(const Decimal& other) {
        raw_ = narrow(static_cast<int128>(raw_) - other.raw_, "subtraction");
        return *this;
    }

    Decimal& Decimal::operator*=(const Decimal& other) {
        int128 product = static_cast<int128>(raw_) * other.raw_;
        raw_ = narrow(divideRounded(product, kScale), "multiplication");
        return *this;
    }

    Decimal& Decimal::operator/=(const Decimal& other) {
        if (other.raw_ == 0) {
            throw std::domain_error("Decimal division by zero");
        }
        int128 numerator = static_cast<int128>(raw_) * kScale;
        raw_ = narrow(divideRounded(numerator, other.raw_), "division");
        return *this;
    }

    std::ostream& operator<<(std::ostream& os, const Decimal& value) {
        return os << value.toString();
    }

    void to_json(nlohmann::json& j, const Decimal& value) {
        j = value.toString();
    }

    void from_json(const nlohmann::json& j, Decimal& value) {
        if (j.is_string()) {
            value = Decimal::fromString(j.get<std::string>());
        } else if (j.is_number_integer()) {
            value = Decimal(j.get<long long>());
        } else if (j.is_number()) {
            value = Decimal::fromDouble(j.get<double>());
        } else {
            throw std::invalid_argument("Decimal JSON value must be a string or number, got: " + j.dump());
        }
    }

} // namespace core
