#include "journey_model.hpp"

#include <array>
#include <cstdio>
#include <stdexcept>

namespace
{

constexpr std::int64_t kSecondsPerDay = 24 * 3600;

// Howard Hinnant's days_from_civil / civil_from_days (proleptic Gregorian).
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto         yoe = static_cast<unsigned>(y - era * 400);
    const unsigned     doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned     doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilDate
{
    std::int64_t year;
    unsigned     month;
    unsigned     day;
};

CivilDate civil_from_days(std::int64_t z)
{
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto         doe = static_cast<unsigned>(z - era * 146097);
    const unsigned     yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned     doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned     mp  = (5 * doy + 2) / 153;
    const unsigned     d   = doy - (153 * mp + 2) / 5 + 1;
    const unsigned     m   = mp < 10 ? mp + 3 : mp - 9;
    return { static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0), m, d };
}

bool is_leap(std::int64_t y)
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m)
{
    static constexpr std::array<unsigned, 12> kDays = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (m == 2 && is_leap(y))
        return 29;
    return kDays[m - 1];
}

int read_digits(const std::string& text, std::size_t pos, std::size_t count)
{
    if (pos + count > text.size())
        throw std::runtime_error("timestamp too short: " + text);
    int v = 0;
    for (std::size_t i = pos; i < pos + count; ++i)
    {
        const char c = text[i];
        if (c < '0' || c > '9')
            throw std::runtime_error("expected digit in timestamp: " + text);
        v = v * 10 + (c - '0');
    }
    return v;
}

void expect_char(const std::string& text, std::size_t pos, char c)
{
    if (pos >= text.size() || text[pos] != c)
        throw std::runtime_error(std::string("expected '") + c + "' in timestamp: " + text);
}

} // namespace

std::int64_t parse_iso8601(const std::string& text)
{
    // YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM|+HHMM|-HHMM)
    const int year = read_digits(text, 0, 4);
    expect_char(text, 4, '-');
    const int month = read_digits(text, 5, 2);
    expect_char(text, 7, '-');
    const int day = read_digits(text, 8, 2);
    expect_char(text, 10, 'T');
    const int hour = read_digits(text, 11, 2);
    expect_char(text, 13, ':');
    const int minute = read_digits(text, 14, 2);
    expect_char(text, 16, ':');
    const int second = read_digits(text, 17, 2);

    if (month < 1 || month > 12)
        throw std::runtime_error("month out of range: " + text);
    if (day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month)))
        throw std::runtime_error("day out of range: " + text);
    if (hour > 23 || minute > 59 || second > 59)
        throw std::runtime_error("time out of range: " + text);

    std::size_t pos = 19;
    if (pos < text.size() && text[pos] == '.')
    {
        ++pos;
        const std::size_t frac_start = pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            ++pos;
        if (pos == frac_start)
            throw std::runtime_error("empty fraction in timestamp: " + text);
    }

    if (pos >= text.size())
        throw std::runtime_error("missing zone designator: " + text);

    int offset_seconds = 0;
    if (text[pos] == 'Z')
    {
        ++pos;
    }
    else if (text[pos] == '+' || text[pos] == '-')
    {
        const int sign = text[pos] == '-' ? -1 : 1;
        const int oh   = read_digits(text, pos + 1, 2);
        pos += 3;
        if (pos < text.size() && text[pos] == ':')
            ++pos;
        const int om = read_digits(text, pos, 2);
        pos += 2;
        if (oh > 23 || om > 59)
            throw std::runtime_error("zone offset out of range: " + text);
        offset_seconds = sign * (oh * 3600 + om * 60);
    }
    else
    {
        throw std::runtime_error("bad zone designator: " + text);
    }

    if (pos != text.size())
        throw std::runtime_error("trailing characters in timestamp: " + text);

    const auto days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * kSecondsPerDay + hour * 3600 + minute * 60 + second - offset_seconds;
}

std::string format_iso8601(std::int64_t epoch_seconds)
{
    std::int64_t days = epoch_seconds / kSecondsPerDay;
    std::int64_t secs = epoch_seconds % kSecondsPerDay;
    if (secs < 0)
    {
        secs += kSecondsPerDay;
        --days;
    }
    const auto date = civil_from_days(days);

    std::array<char, 32> buf{};
    std::snprintf(buf.data(), buf.size(), "%04lld-%02u-%02uT%02lld:%02lld:%02lldZ",
                  static_cast<long long>(date.year), date.month, date.day,
                  static_cast<long long>(secs / 3600), static_cast<long long>((secs % 3600) / 60),
                  static_cast<long long>(secs % 60));
    return buf.data();
}

std::string format_medium_date(std::int64_t epoch_seconds, int utc_offset_minutes)
{
    static constexpr std::array<const char*, 12> kMonths = { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                             "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };

    const std::int64_t local = epoch_seconds + static_cast<std::int64_t>(utc_offset_minutes) * 60;
    std::int64_t       days  = local / kSecondsPerDay;
    if (local % kSecondsPerDay < 0)
        --days;
    const auto date = civil_from_days(days);

    return std::string(kMonths[date.month - 1]) + " " + std::to_string(date.day) + ", " +
           std::to_string(date.year);
}
