#include "utils.hpp"
#include <iomanip> // For std::get_time
#include <sstream>
#include <string>
#include <stdexcept>
#include <chrono>
#include <cctype>
#include <ctime>
#include <limits>

namespace core {
namespace utils {

    namespace {

        constexpr Millis kSecondMs = 1000;
        constexpr Millis kMinuteMs = 60 * kSecondMs;
        constexpr Millis kHourMs = 60 * kMinuteMs;
        constexpr Millis kDayMs = 24 * kHourMs;

        std::time_t toUtcEpoch(std::tm* tm) {
            #ifdef _WIN32
                return _mkgmtime(tm);
            #else
                return timegm(tm);
            #endif
        }

    } // namespace

    Millis intervalToMillis(const std::string& interval) {
        if (interval.size() < 2) {
            throw std::invalid_argument("Invalid interval: '" + interval + "'");
        }
        const std::string count_part = interval.substr(0, interval.size() - 1);
        for (char c : count_part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Invalid interval: '" + interval + "'");
            }
        }

        Millis unit_ms = 0;
        switch (interval.back()) {
            case 's': unit_ms = kSecondMs; break;
            case 'm': unit_ms = kMinuteMs; break;
            case 'h': unit_ms = kHourMs; break;
            case 'd': unit_ms = kDayMs; break;
            case 'w': unit_ms = 7 * kDayMs; break;
            case 'M': unit_ms = 30 * kDayMs; break;
            default:
                throw std::invalid_argument("Unknown interval unit in '" + interval + "'");
        }

        // Accumulate by hand so an oversized count is rejected instead of overflowing
        const Millis max_count = std::numeric_limits<Millis>::max() / unit_ms;
        Millis count = 0;
        for (char c : count_part) {
            count = count * 10 + (c - '0');
            if (count > max_count) {
                throw std::invalid_argument("Interval too long: '" + interval + "'");
            }
        }
        if (count <= 0) {
            throw std::invalid_argument("Interval must be positive: '" + interval + "'");
        }
        return count * unit_ms;
    }

    std::string millisToIsoString(Millis ms) {
        // Floor toward negative infinity so pre-1970 values keep a positive ms part
        Millis seconds = ms / 1000;
        Millis remainder = ms % 1000;
        if (remainder < 0) {
            remainder += 1000;
            seconds -= 1;
        }

        std::time_t tt = static_cast<std::time_t>(seconds);
        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << remainder << 'Z';
        return oss.str();
    }

    Millis isoStringToMillis(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date part
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date part): " + iso_string);
        }

        // 2. Optional time part, then fractional seconds
        Millis fraction_ms = 0;
        if (ss.peek() == 'T' || ss.peek() == ' ') {
            ss.ignore();
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse timestamp (time part): " + iso_string);
            }
            if (ss.peek() == '.') {
                ss.ignore();
                std::string digits;
                while (std::isdigit(ss.peek())) {
                    digits += static_cast<char>(ss.get());
                }
                if (digits.empty()) {
                    throw std::runtime_error("Failed to parse timestamp (fraction): " + iso_string);
                }
                digits.resize(3, '0'); // keep millisecond precision
                fraction_ms = std::stoll(digits);
            }
        }

        // 3. Optional offset (+HH:MM, -HH:MM, or Z); none means UTC
        Millis offset_ms = 0;
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                    throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_ms = offset_h * kHourMs + offset_m * kMinuteMs;
                if (sign_or_z == '-') {
                    offset_ms = -offset_ms;
                }
            } else if (sign_or_z != 'Z') {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
            char trailing = 0;
            if (ss >> trailing) {
                throw std::runtime_error("Trailing characters in timestamp: " + iso_string);
            }
        }

        tm.tm_isdst = 0;
        const std::time_t tt = toUtcEpoch(&tm);
        if (tt == static_cast<std::time_t>(-1)) {
            throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        return static_cast<Millis>(tt) * 1000 + fraction_ms - offset_ms;
    }

    Millis nowMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    bool isDecimalString(const std::string& text) {
        std::size_t i = 0;
        const std::size_t n = text.size();
        if (i < n && (text[i] == '+' || text[i] == '-')) {
            ++i;
        }
        bool digits = false;
        bool dot = false;
        for (; i < n; ++i) {
            const unsigned char c = static_cast<unsigned char>(text[i]);
            if (std::isdigit(c)) {
                digits = true;
            } else if (c == '.' && !dot) {
                dot = true;
            } else {
                break;
            }
        }
        if (!digits) {
            return false;
        }
        if (i < n && (text[i] == 'e' || text[i] == 'E')) {
            ++i;
            if (i < n && (text[i] == '+' || text[i] == '-')) {
                ++i;
            }
            bool exponent_digits = false;
            while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
                exponent_digits = true;
                ++i;
            }
            if (!exponent_digits) {
                return false;
            }
        }
        return i == n;
    }

} // namespace utils
} // namespace core
