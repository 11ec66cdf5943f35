#include "trip_atlas/core/capture_time.hpp"
#include "trip_atlas/core/utils.hpp"

#include <array>
#include <iomanip>
#include <regex>
#include <sstream>

namespace trip_atlas::core {

namespace {

constexpr int64_t kSecondsPerDay = 86400;
constexpr int kMaxOffsetMinutes = 18 * 60;

const std::array<const char*, 12> kMonthNames = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"};

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) return 29;
    return days[month - 1];
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

int64_t days_from_civil(int year, int month, int day) {
    const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = floor_div(y, 400);
    const int64_t yoe = y - era * 400;
    const int64_t mp = (month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(int64_t days, int& year, int& month, int& day) {
    const int64_t z = days + 719468;
    const int64_t era = floor_div(z, 146097);
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

std::optional<int> parse_utc_offset(const std::string& text) {
    const std::string s = trim(text);
    if (s.empty()) return std::nullopt;
    if (s == "Z" || s == "z") return 0;

    static const std::regex re(R"(^([+-])(\d{2}):?(\d{2})$)");
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;

    const int hours = std::stoi(m[2].str());
    const int minutes = std::stoi(m[3].str());
    if (minutes >= 60) return std::nullopt;
    const int total = hours * 60 + minutes;
    if (total > kMaxOffsetMinutes) return std::nullopt;
    return m[1].str() == "-" ? -total : total;
}

std::optional<CaptureTime> parse_capture_time(const std::string& text,
                                              const std::string& capture_offset,
                                              const TimePolicy& policy) {
    const std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    static const std::regex re(
        R"(^(\d{4})([:-])(\d{2})\2(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.\d+)?)?)?\s*(Z|z|[+-]\d{2}:?\d{2})?$)");
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;

    const int year = std::stoi(m[1].str());
    const int month = std::stoi(m[3].str());
    const int day = std::stoi(m[4].str());
    const int hour = m[5].matched ? std::stoi(m[5].str()) : 0;
    const int minute = m[6].matched ? std::stoi(m[6].str()) : 0;
    const int second = m[7].matched ? std::stoi(m[7].str()) : 0;

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    const int64_t wall = days_from_civil(year, month, day) * kSecondsPerDay +
                         hour * 3600 + minute * 60 + second;

    const int fallback_offset = parse_utc_offset(capture_offset).value_or(policy.default_offset_minutes);

    CaptureTime out;
    if (m[8].matched) {
        const std::string designator = m[8].str();
        auto explicit_offset = parse_utc_offset(designator);
        if (!explicit_offset) return std::nullopt;
        if (designator == "Z" || designator == "z") {
            out.offset_minutes = fallback_offset;
            out.utc_seconds = wall;
        } else {
            out.offset_minutes = *explicit_offset;
            out.utc_seconds = wall - static_cast<int64_t>(*explicit_offset) * 60;
        }
    } else {
        out.offset_minutes = fallback_offset;
        out.utc_seconds = wall - static_cast<int64_t>(fallback_offset) * 60;
    }
    return out;
}

DayKey day_key(const CaptureTime& t) {
    int y = 0, mo = 0, d = 0;
    civil_from_days(floor_div(t.local_seconds(), kSecondsPerDay), y, mo, d);

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << y << '-'
        << std::setw(2) << mo << '-' << std::setw(2) << d;
    return oss.str();
}

std::string format_display_date(const CaptureTime& t) {
    int y = 0, mo = 0, d = 0;
    civil_from_days(floor_div(t.local_seconds(), kSecondsPerDay), y, mo, d);

    std::ostringstream oss;
    oss << kMonthNames[static_cast<size_t>(mo - 1)] << ' '
        << std::setfill('0') << std::setw(2) << d << ", " << y;
    return oss.str();
}

std::string format_clock(const CaptureTime& t) {
    const int64_t local = t.local_seconds();
    const int64_t secs_of_day = local - floor_div(local, kSecondsPerDay) * kSecondsPerDay;
    const int hour = static_cast<int>(secs_of_day / 3600);
    const int minute = static_cast<int>((secs_of_day % 3600) / 60);

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hour << ':' << std::setw(2) << minute;
    return oss.str();
}

} // namespace trip_atlas::core
