#include "pvl/datetime.hpp"


namespace Pvl {

    namespace {
        void append_two(std::string& out, int v) {
            out += static_cast<char>('0' + v / 10);
            out += static_cast<char>('0' + v % 10);
        }
    } // namespace

    bool is_leap_year(int32_t year) noexcept {
        if (year < 0) year = -(year + 1);
        return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    }

    uint8_t days_in_month(int32_t year, uint8_t month) noexcept {
        static constexpr uint8_t table[] = { 0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
        if (month < 1 || month > 12) return 0;
        if (month == 2 && is_leap_year(year)) return 29;
        return table[month];
    }

    std::optional<date> date_from_ordinal(int32_t year, int day_of_year) noexcept {
        int last = is_leap_year(year) ? 366 : 365;
        if (day_of_year < 1 || day_of_year > last) return std::nullopt;
        uint8_t month = 1;
        while (day_of_year > days_in_month(year, month)) {
            day_of_year -= days_in_month(year, month);
            month++;
        }
        return date{ year, month, static_cast<uint8_t>(day_of_year) };
    }

    bool date::valid() const noexcept {
        return month >= 1 && month <= 12 && day >= 1 && day <= days_in_month(year, month);
    }

    bool time::valid() const noexcept {
        if (hour > 23 || minute > 59 || second > 60) return false;
        if (nanosecond > 999'999'999u) return false;
        if (utc_offset_minutes && (*utc_offset_minutes > 14 * 60 || *utc_offset_minutes < -14 * 60)) return false;
        return true;
    }

    std::string to_string(const date& d) {
        std::string out;
        std::string year = std::to_string(d.year < 0 ? -d.year : d.year);
        if (d.year < 0) out += '-';
        if (year.size() < 4) out.append(4 - year.size(), '0');
        out += year;
        out += '-';
        append_two(out, d.month);
        out += '-';
        append_two(out, d.day);
        return out;
    }

    std::string to_string(const time& t) {
        std::string out;
        append_two(out, t.hour);
        out += ':';
        append_two(out, t.minute);
        if (t.second == 0 && t.nanosecond == 0) return out;

        out += ':';
        append_two(out, t.second);
        if (t.nanosecond != 0) {
            std::string frac = std::to_string(t.nanosecond);
            frac.insert(0, 9 - frac.size(), '0');
            while (frac.back() == '0') frac.pop_back();
            out += '.';
            out += frac;
        }
        return out;
    }

    std::string format_utc_offset(std::optional<int16_t> minutes) {
        if (!minutes) return {};
        int offset = *minutes;
        if (offset == 0) return "Z";
        std::string out;
        out += (offset < 0) ? '-' : '+';
        if (offset < 0) offset = -offset;
        append_two(out, offset / 60);
        if (offset % 60 != 0) {
            out += ':';
            append_two(out, offset % 60);
        }
        return out;
    }

} // namespace Pvl
