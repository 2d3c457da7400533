#include "Timeframe.hpp"
#include <charconv>

namespace Vigil {

namespace {

constexpr uint64_t unitSeconds(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Minutes: return 60;
        case TimeUnit::Hours:   return 3600;
        case TimeUnit::Days:    return 86400;
        case TimeUnit::Weeks:   return 604800;
        case TimeUnit::Months:  return 2592000;
    }
    return 0;
}

constexpr char unitSuffix(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Minutes: return 'm';
        case TimeUnit::Hours:   return 'h';
        case TimeUnit::Days:    return 'd';
        case TimeUnit::Weeks:   return 'w';
        case TimeUnit::Months:  return 'M';
    }
    return '?';
}

std::optional<TimeUnit> unitFromSuffix(char c) {
    switch (c) {
        case 'm': return TimeUnit::Minutes;
        case 'h': return TimeUnit::Hours;
        case 'd': return TimeUnit::Days;
        case 'w': return TimeUnit::Weeks;
        case 'M': return TimeUnit::Months;
        default:  return std::nullopt;
    }
}

} // namespace

std::optional<Timeframe> Timeframe::make(uint32_t value, TimeUnit unit) {
    if (value == 0) return std::nullopt;
    return Timeframe(value, unit);
}

std::optional<Timeframe> Timeframe::parse(std::string_view text) {
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ') text.remove_suffix(1);
    if (text.size() < 2) return std::nullopt;

    auto unit = unitFromSuffix(text.back());
    if (!unit) return std::nullopt;

    auto digits = text.substr(0, text.size() - 1);
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) return std::nullopt;

    return make(value, *unit);
}

std::vector<Timeframe> Timeframe::standard() {
    return {
        Timeframe(1, TimeUnit::Minutes),  Timeframe(5, TimeUnit::Minutes),
        Timeframe(15, TimeUnit::Minutes), Timeframe(30, TimeUnit::Minutes),
        Timeframe(1, TimeUnit::Hours),    Timeframe(4, TimeUnit::Hours),
        Timeframe(1, TimeUnit::Days),     Timeframe(1, TimeUnit::Weeks),
        Timeframe(1, TimeUnit::Months),
    };
}

uint64_t Timeframe::seconds() const noexcept {
    return static_cast<uint64_t>(m_value) * unitSeconds(m_unit);
}

bool Timeframe::isStandard() const noexcept {
    for (const auto& tf : standard()) {
        if (tf == *this) return true;
    }
    return false;
}

std::string Timeframe::toString() const {
    return std::to_string(m_value) + unitSuffix(m_unit);
}

} // namespace Vigil
