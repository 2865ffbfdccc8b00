#include "TableRow.hpp"
#include <charconv>
#include <cstdio>
#include <sstream>
#include <type_traits>

namespace BulkBridge
{

    namespace
    {
        constexpr int64_t MICROS_PER_SECOND = 1'000'000;
        constexpr int64_t SECONDS_PER_DAY = 86'400;

        // Days since 1970-01-01 for a proleptic Gregorian date (Hinnant's algorithm)
        int64_t days_from_civil(int64_t y, unsigned m, unsigned d)
        {
            y -= m <= 2;
            const int64_t era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<int64_t>(doe) - 719468;
        }

        void civil_from_days(int64_t z, int64_t &y, unsigned &m, unsigned &d)
        {
            z += 719468;
            const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            d = doy - (153 * mp + 2) / 5 + 1;
            m = mp < 10 ? mp + 3 : mp - 9;
            y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
        }

        // Reads exactly `width` digits starting at pos
        bool read_fixed(std::string_view text, size_t pos, size_t width, int64_t &out)
        {
            if (pos + width > text.size())
                return false;
            auto first = text.data() + pos;
            auto last = first + width;
            auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc() && ptr == last;
        }
    } // namespace

    std::string format_timestamp(Timestamp ts)
    {
        int64_t seconds = ts.micros / MICROS_PER_SECOND;
        int64_t micros = ts.micros % MICROS_PER_SECOND;
        if (micros < 0)
        {
            micros += MICROS_PER_SECOND;
            --seconds;
        }
        int64_t days = seconds / SECONDS_PER_DAY;
        int64_t secs_of_day = seconds % SECONDS_PER_DAY;
        if (secs_of_day < 0)
        {
            secs_of_day += SECONDS_PER_DAY;
            --days;
        }

        int64_t y;
        unsigned m, d;
        civil_from_days(days, y, m, d);

        char buf[64];
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02lld:%02lld:%02lld.%06lld+00",
                      static_cast<long long>(y), m, d,
                      static_cast<long long>(secs_of_day / 3600),
                      static_cast<long long>((secs_of_day / 60) % 60),
                      static_cast<long long>(secs_of_day % 60),
                      static_cast<long long>(micros));
        return buf;
    }

    std::optional<Timestamp> parse_timestamp(std::string_view text)
    {
        // YYYY-MM-DD?HH:MM:SS is 19 characters
        if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
            (text[10] != ' ' && text[10] != 'T') || text[13] != ':' || text[16] != ':')
            return std::nullopt;

        int64_t y, mo, d, h, mi, s;
        if (!read_fixed(text, 0, 4, y) || !read_fixed(text, 5, 2, mo) || !read_fixed(text, 8, 2, d) ||
            !read_fixed(text, 11, 2, h) || !read_fixed(text, 14, 2, mi) || !read_fixed(text, 17, 2, s))
            return std::nullopt;
        if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s > 60)
            return std::nullopt;

        size_t pos = 19;
        int64_t fraction = 0;
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            int digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                if (digits < 6)
                {
                    fraction = fraction * 10 + (text[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (digits == 0)
                return std::nullopt;
            for (; digits < 6; ++digits)
                fraction *= 10;
        }

        std::string_view zone = text.substr(pos);
        if (!zone.empty() && zone != "Z" && zone != "+00" && zone != "+00:00" && zone != " UTC")
            return std::nullopt;

        int64_t days = days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
        int64_t seconds = days * SECONDS_PER_DAY + h * 3600 + mi * 60 + s;
        return Timestamp{seconds * MICROS_PER_SECOND + fraction};
    }

    std::string to_debug_string(const TableRow &row)
    {
        std::ostringstream oss;
        oss << '{';
        bool first = true;
        for (const auto &[name, value] : row)
        {
            if (!first)
                oss << ", ";
            first = false;
            oss << '"' << name << "\": ";
            std::visit(
                [&oss](const auto &v)
                {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, std::monostate>)
                        oss << "null";
                    else if constexpr (std::is_same_v<T, bool>)
                        oss << (v ? "true" : "false");
                    else if constexpr (std::is_same_v<T, std::string>)
                        oss << '"' << v << '"';
                    else if constexpr (std::is_same_v<T, Timestamp>)
                        oss << format_timestamp(v);
                    else
                        oss << v;
                },
                value);
        }
        oss << '}';
        return oss.str();
    }

} // namespace BulkBridge
