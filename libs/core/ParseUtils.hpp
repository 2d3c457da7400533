#pragma once

// Parsing helpers shared by the client protocol codec and the feed normalizer.

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace Vigil::ParseUtils {

inline char asciiToLower(unsigned char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline char asciiToUpper(unsigned char c) {
    if (c >= 'a' && c <= 'z') {
        return static_cast<char>(c - ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (asciiToLower(static_cast<unsigned char>(lhs[i])) != asciiToLower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

inline std::string toUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return asciiToUpper(c); });
    return out;
}

/**
 * String-to-double conversion for feed payloads that carry prices as strings.
 * @return nullopt when no number could be read
 */
inline std::optional<double> fastStringToDouble(std::string_view str) {
    if (str.empty()) return std::nullopt;
    // strtod needs a terminated buffer
    std::string buf(str);
    char* end = nullptr;
    double value = std::strtod(buf.c_str(), &end);
    if (end == buf.c_str()) return std::nullopt;
    return value;
}

inline std::optional<int64_t> fastStringToInt(std::string_view str) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * ISO8601 timestamp parser for feed timestamps.
 * Accepts "2023-02-09T20:32:50.714964855Z" and +HH:MM / -HH:MM offsets.
 * @return epoch milliseconds, or nullopt if the string is not a valid timestamp
 */
inline std::optional<int64_t> parseISO8601Millis(std::string_view iso) {
    if (iso.size() < 19 || iso[4] != '-' || iso[7] != '-' || (iso[10] != 'T' && iso[10] != ' ')) {
        return std::nullopt;
    }

    const auto yearValue   = fastStringToInt(iso.substr(0, 4));
    const auto monthValue  = fastStringToInt(iso.substr(5, 2));
    const auto dayValue    = fastStringToInt(iso.substr(8, 2));
    const auto hourValue   = fastStringToInt(iso.substr(11, 2));
    const auto minuteValue = fastStringToInt(iso.substr(14, 2));
    const auto secondValue = fastStringToInt(iso.substr(17, 2));
    if (!yearValue || !monthValue || !dayValue || !hourValue || !minuteValue || !secondValue) {
        return std::nullopt;
    }

    // Fractional seconds, truncated to microseconds
    size_t pos = 19;
    int64_t fractionalMicros = 0;
    int fractionalDigits = 0;
    if (pos < iso.size() && iso[pos] == '.') {
        ++pos;
        while (pos < iso.size()) {
            char ch = iso[pos];
            if (ch < '0' || ch > '9') break;
            if (fractionalDigits < 6) {
                fractionalMicros = fractionalMicros * 10 + (ch - '0');
                ++fractionalDigits;
            }
            ++pos;
        }
        while (fractionalDigits > 0 && fractionalDigits < 6) {
            fractionalMicros *= 10;
            ++fractionalDigits;
        }
    }

    int tzSign = 0;
    int64_t tzHours = 0;
    int64_t tzMinutes = 0;
    if (pos < iso.size()) {
        const char tzChar = iso[pos];
        if (tzChar == 'Z' || tzChar == 'z') {
            ++pos;
        } else if (tzChar == '+' || tzChar == '-') {
            tzSign = (tzChar == '+') ? 1 : -1;
            ++pos;
            if (pos + 2 <= iso.size()) {
                tzHours = fastStringToInt(iso.substr(pos, 2)).value_or(0);
                pos += 2;
            }
            if (pos < iso.size() && iso[pos] == ':') {
                ++pos;
            }
            if (pos + 2 <= iso.size()) {
                tzMinutes = fastStringToInt(iso.substr(pos, 2)).value_or(0);
                pos += 2;
            }
        } else {
            return std::nullopt;
        }
    }

    using namespace std::chrono;
    const auto y = year{static_cast<int>(*yearValue)};
    const auto m = month{static_cast<unsigned>(*monthValue)};
    const auto d = day{static_cast<unsigned>(*dayValue)};
    const year_month_day ymd{y, m, d};
    if (!ymd.ok() || *hourValue > 23 || *minuteValue > 59 || *secondValue > 60) {
        return std::nullopt;
    }

    auto tp = sys_time<microseconds>(sys_days{ymd});
    tp += hours(*hourValue);
    tp += minutes(*minuteValue);
    tp += seconds(*secondValue);
    tp += microseconds(fractionalMicros);
    if (tzSign != 0) {
        tp -= (hours(tzHours) + minutes(tzMinutes)) * tzSign;
    }
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

/**
 * Format epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
 */
inline std::string formatMillisUtc(int64_t epochMs) {
    using namespace std::chrono;
    const sys_time<milliseconds> tp{milliseconds{epochMs}};
    const auto dp = floor<days>(tp);
    const year_month_day ymd{dp};
    const hh_mm_ss<milliseconds> tod{tp - dp};
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
        static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
        tod.hours().count(), tod.minutes().count(), tod.seconds().count(), tod.subseconds().count());
}

} // namespace Vigil::ParseUtils
