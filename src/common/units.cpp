#include "common/units.hpp"

#include <array>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>
#include <fmt/core.h>

namespace
{
    constexpr std::int64_t kMs   = 1;
    constexpr std::int64_t kSec  = 1000 * kMs;
    constexpr std::int64_t kMin  = 60 * kSec;
    constexpr std::int64_t kHour = 60 * kMin;
    constexpr std::int64_t kDay  = 24 * kHour;
    constexpr std::int64_t kWeek = 7 * kDay;
    constexpr std::int64_t kYear = 365 * kDay;

    // 顺序即允许出现的顺序，与 Prometheus 一致：y w d h m s ms
    const std::array<std::pair<const char*, std::int64_t>, 7> kDurationUnits{{
        {"y", kYear}, {"w", kWeek}, {"d", kDay}, {"h", kHour},
        {"m", kMin}, {"s", kSec}, {"ms", kMs},
    }};

    const std::array<std::pair<const char*, std::uint64_t>, 9> kByteUnits{{
        {"B", 1ULL},
        {"KB", 1ULL << 10}, {"KiB", 1ULL << 10},
        {"MB", 1ULL << 20}, {"MiB", 1ULL << 20},
        {"GB", 1ULL << 30}, {"GiB", 1ULL << 30},
        {"TB", 1ULL << 40}, {"TiB", 1ULL << 40},
    }};

    std::uint64_t readNumber(const std::string& text, std::size_t& pos)
    {
        std::uint64_t value = 0;
        std::size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            auto digit = static_cast<std::uint64_t>(text[pos] - '0');
            if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
                throw std::invalid_argument(fmt::format("number overflow in \"{}\"", text));
            value = value * 10 + digit;
            ++pos;
        }
        if (pos == start)
            throw std::invalid_argument(fmt::format("expected a number at offset {} in \"{}\"", start, text));
        return value;
    }

    std::string readUnit(const std::string& text, std::size_t& pos)
    {
        std::size_t start = pos;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos])))
            ++pos;
        return text.substr(start, pos - start);
    }
} // namespace

namespace units
{
    Duration parseDuration(const std::string& text)
    {
        if (text.empty())
            throw std::invalid_argument("empty duration string");
        if (text == "0")
            return Duration::zero();

        std::int64_t total = 0;
        std::size_t pos = 0;
        std::size_t lastUnit = 0;
        while (pos < text.size()) {
            auto value = readNumber(text, pos);
            auto unit = readUnit(text, pos);

            std::size_t idx = 0;
            while (idx < kDurationUnits.size() && unit != kDurationUnits[idx].first) ++idx;
            if (idx == kDurationUnits.size())
                throw std::invalid_argument(fmt::format("unknown unit \"{}\" in duration \"{}\"", unit, text));
            if (idx < lastUnit)
                throw std::invalid_argument(fmt::format("units out of order in duration \"{}\"", text));
            lastUnit = idx + 1;

            auto factor = kDurationUnits[idx].second;
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max() / factor))
                throw std::invalid_argument(fmt::format("duration \"{}\" out of range", text));
            const auto part = static_cast<std::int64_t>(value) * factor;
            if (total > std::numeric_limits<std::int64_t>::max() - part)
                throw std::invalid_argument(fmt::format("duration \"{}\" out of range", text));
            total += part;
        }
        return Duration(total);
    }

    std::string formatDuration(Duration d)
    {
        auto ms = d.count();
        if (ms == 0) return "0s";

        std::string out;
        if (ms < 0) {
            out += '-';
            ms = -ms;
        }
        for (const auto& [name, factor] : kDurationUnits) {
            if (ms >= factor) {
                out += fmt::format("{}{}", ms / factor, name);
                ms %= factor;
            }
        }
        return out;
    }

    std::uint64_t parseBytes(const std::string& text)
    {
        std::size_t pos = 0;
        auto value = readNumber(text, pos);
        auto unit = readUnit(text, pos);
        if (pos != text.size())
            throw std::invalid_argument(fmt::format("trailing characters in size \"{}\"", text));
        if (unit.empty()) return value;

        for (const auto& [name, factor] : kByteUnits) {
            if (unit == name) {
                if (value > std::numeric_limits<std::uint64_t>::max() / factor)
                    throw std::invalid_argument(fmt::format("size \"{}\" out of range", text));
                return value * factor;
            }
        }
        throw std::invalid_argument(fmt::format("unknown unit \"{}\" in size \"{}\"", unit, text));
    }

    std::string formatBytes(std::uint64_t bytes)
    {
        if (bytes == 0) return "0B";
        static const std::array<std::pair<const char*, std::uint64_t>, 4> order{{
            {"TiB", 1ULL << 40}, {"GiB", 1ULL << 30}, {"MiB", 1ULL << 20}, {"KiB", 1ULL << 10},
        }};
        for (const auto& [name, factor] : order) {
            if (bytes % factor == 0) return fmt::format("{}{}", bytes / factor, name);
        }
        return fmt::format("{}B", bytes);
    }
} // namespace units
