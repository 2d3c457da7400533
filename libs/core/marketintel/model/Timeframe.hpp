#pragma once
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Vigil {

enum class TimeUnit { Minutes, Hours, Days, Weeks, Months };

/// Bar interval: the standard 1m..1M set plus custom "<n><unit>" frames.
/// Ordered by length; a month counts as 30 days.
class Timeframe {
public:
    Timeframe() = default;

    /// nullopt for zero values and unknown units.
    static std::optional<Timeframe> make(uint32_t value, TimeUnit unit);

    /// Parses "1m", "4h", "1M", "90m", ... ("m" is minutes, "M" is months).
    static std::optional<Timeframe> parse(std::string_view text);

    static std::vector<Timeframe> standard();

    [[nodiscard]] uint32_t value() const noexcept { return m_value; }
    [[nodiscard]] TimeUnit unit() const noexcept { return m_unit; }
    [[nodiscard]] uint64_t seconds() const noexcept;
    [[nodiscard]] bool isStandard() const noexcept;
    [[nodiscard]] std::string toString() const;

    bool operator==(const Timeframe& other) const noexcept {
        return m_value == other.m_value && m_unit == other.m_unit;
    }
    std::weak_ordering operator<=>(const Timeframe& other) const noexcept {
        return seconds() <=> other.seconds();
    }

private:
    Timeframe(uint32_t value, TimeUnit unit) : m_value(value), m_unit(unit) {}

    uint32_t m_value{1};
    TimeUnit m_unit{TimeUnit::Minutes};
};

} // namespace Vigil
