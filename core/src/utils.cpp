#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow
#include <cctype>
#include <ctime>
#include <random>

namespace core {
namespace utils {

    namespace {

        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm{};
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

        Timestamp fromUtcTm(std::tm& tm, const std::string& source) {
            #ifdef _WIN32
                time_t tt = _mkgmtime(&tm);
            #else
                time_t tt = timegm(&tm);
            #endif
            if (tt == (time_t)-1) {
                throw std::runtime_error("Failed to convert date/time to UTC epoch seconds: " + source);
            }
            return std::chrono::system_clock::from_time_t(tt);
        }

        bool isLeapYear(int year) {
            return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
        }

        int daysInMonth(int year, int month_zero_based) {
            static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month_zero_based == 1 && isLeapYear(year)) return 29;
            return kDays[month_zero_based];
        }

    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date part, then optional time part
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date part): " + iso_string);
        }
        if (ss.peek() == std::char_traits<char>::eof()) {
            return fromUtcTm(tm, iso_string);
        }
        if (ss.peek() != 'T' && ss.peek() != ' ') {
            throw std::runtime_error("Failed to parse timestamp (expected 'T'): " + iso_string);
        }
        ss.ignore();
        ss >> std::get_time(&tm, "%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Optional timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration(0);
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
        }

        auto base_tp_utc = fromUtcTm(tm, iso_string);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    std::string timestampToDateString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    Timestamp startOfDay(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        time_tm.tm_hour = 0;
        time_tm.tm_min = 0;
        time_tm.tm_sec = 0;
        return fromUtcTm(time_tm, timestampToString(ts));
    }

    Timestamp addDays(const Timestamp& ts, int days) {
        return ts + std::chrono::hours(24 * days);
    }

    Timestamp addMonths(const Timestamp& ts, int months) {
        std::tm time_tm = toUtcTm(ts);
        int total_months = time_tm.tm_year * 12 + time_tm.tm_mon + months;
        int year_offset = total_months / 12;
        int month = total_months % 12;
        if (month < 0) {
            month += 12;
            --year_offset;
        }
        time_tm.tm_year = year_offset;
        time_tm.tm_mon = month;
        int max_day = daysInMonth(time_tm.tm_year + 1900, month);
        if (time_tm.tm_mday > max_day) {
            time_tm.tm_mday = max_day;
        }
        return fromUtcTm(time_tm, timestampToString(ts));
    }

    double daysBetween(const Timestamp& a, const Timestamp& b) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(b - a).count();
        return static_cast<double>(seconds) / 86400.0;
    }

    std::string generateRunId() {
        static thread_local std::mt19937_64 generator{std::random_device{}()};
        std::uniform_int_distribution<int> nibble(0, 15);
        static const char* kHex = "0123456789abcdef";

        std::string id;
        id.reserve(36);
        for (int i = 0; i < 32; ++i) {
            if (i == 8 || i == 12 || i == 16 || i == 20) id += '-';
            int value = nibble(generator);
            if (i == 12) value = 4;                     // version
            if (i == 16) value = (value & 0x3) | 0x8;   // variant
            id += kHex[value];
        }
        return id;
    }

} // namespace utils
} // namespace core
