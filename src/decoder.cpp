#include "pvl/decoder.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>


namespace Pvl {

    namespace {
        bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
        bool is_sign(char c) noexcept { return c == '+' || c == '-'; }

        // Exactly `n` decimal digits at `pos`.
        bool read_digits(std::string_view s, size_t pos, size_t n, int& out) noexcept {
            if (pos + n > s.size()) return false;
            out = 0;
            for (size_t i = pos; i < pos + n; i++) {
                if (!is_digit(s[i])) return false;
                out = out * 10 + (s[i] - '0');
            }
            return true;
        }

        std::optional<date> parse_date(std::string_view s) {
            int year = 0, month = 0, day = 0;
            if (s.size() == 10 && s[4] == '-' && s[7] == '-') {
                if (!read_digits(s, 0, 4, year) || !read_digits(s, 5, 2, month) || !read_digits(s, 8, 2, day)) return std::nullopt;
                date d{ year, static_cast<uint8_t>(month), static_cast<uint8_t>(day) };
                if (!d.valid()) return std::nullopt;
                return d;
            }
            if (s.size() == 8 && s[4] == '-') {
                int doy = 0;
                if (!read_digits(s, 0, 4, year) || !read_digits(s, 5, 3, doy)) return std::nullopt;
                return date_from_ordinal(year, doy);
            }
            return std::nullopt;
        }

        std::optional<time> parse_clock(std::string_view s, bool allow_leap) {
            int hour = 0, minute = 0, second = 0;
            if (s.size() < 5 || s[2] != ':') return std::nullopt;
            if (!read_digits(s, 0, 2, hour) || !read_digits(s, 3, 2, minute)) return std::nullopt;
            if (hour > 23 || minute > 59) return std::nullopt;

            time t;
            t.hour = static_cast<uint8_t>(hour);
            t.minute = static_cast<uint8_t>(minute);
            if (s.size() == 5) return t;

            if (s.size() < 8 || s[5] != ':' || !read_digits(s, 6, 2, second)) return std::nullopt;
            if (second > 60 || (second == 60 && !allow_leap)) return std::nullopt;
            t.second = static_cast<uint8_t>(second);
            if (s.size() == 8) return t;

            if (s[8] != '.' || s.size() == 9) return std::nullopt;
            uint32_t nanos = 0;
            int kept = 0;
            for (size_t i = 9; i < s.size(); i++) {
                if (!is_digit(s[i])) return std::nullopt;
                if (kept < 9) {
                    nanos = nanos * 10 + static_cast<uint32_t>(s[i] - '0');
                    kept++;
                }
            }
            while (kept < 9) {
                nanos *= 10;
                kept++;
            }
            t.nanosecond = nanos;
            return t;
        }

        // Parses `H`, `HH`, `HHMM` or `HH:MM` into minutes.
        std::optional<int> parse_offset_body(std::string_view s) {
            int hours = 0, minutes = 0;
            switch (s.size()) {
            case 1:
            case 2:
                if (!read_digits(s, 0, s.size(), hours)) return std::nullopt;
                break;
            case 4:
                if (!read_digits(s, 0, 2, hours) || !read_digits(s, 2, 2, minutes)) return std::nullopt;
                break;
            case 5:
                if (s[2] != ':' || !read_digits(s, 0, 2, hours) || !read_digits(s, 3, 2, minutes)) return std::nullopt;
                break;
            default:
                return std::nullopt;
            }
            if (hours > 14 || minutes > 59 || (hours == 14 && minutes > 0)) return std::nullopt;
            return hours * 60 + minutes;
        }

        struct zone_split {
            std::string_view clock;
            int16_t offset_minutes;
        };

        std::optional<zone_split> split_zone(std::string_view s, bool numeric) {
            if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) return zone_split{ s.substr(0, s.size() - 1), 0 };
            auto p = s.find_first_of("+-");
            if (p == std::string_view::npos) return zone_split{ s, 0 };
            if (!numeric) return std::nullopt;
            auto minutes = parse_offset_body(s.substr(p + 1));
            if (!minutes) return std::nullopt;
            int signed_minutes = (s[p] == '-') ? -*minutes : *minutes;
            return zone_split{ s.substr(0, p), static_cast<int16_t>(signed_minutes) };
        }

        bool valid_digit(char c, int radix) noexcept {
            int v = -1;
            if (is_digit(c)) v = c - '0';
            else if (c >= 'a' && c <= 'z') v = 10 + (c - 'a');
            else if (c >= 'A' && c <= 'Z') v = 10 + (c - 'A');
            return v >= 0 && v < radix;
        }

        struct radix_parts {
            bool negative = false;
            int radix = 0;
            std::string_view digits;
        };

        std::optional<radix_parts> split_radix(std::string_view s, const Grammar& g) {
            radix_parts p;
            bool lead = false;
            if (!s.empty() && is_sign(s.front())) {
                if (g.sign_position == radix_sign::after_radix) return std::nullopt;
                p.negative = s.front() == '-';
                lead = true;
                s.remove_prefix(1);
            }
            size_t n = 0;
            while (n < s.size() && n < 2 && is_digit(s[n])) {
                p.radix = p.radix * 10 + (s[n] - '0');
                n++;
            }
            if (n == 0 || !g.is_radix(p.radix)) return std::nullopt;
            s.remove_prefix(n);
            if (s.empty() || s.front() != '#') return std::nullopt;
            s.remove_prefix(1);
            if (!s.empty() && is_sign(s.front())) {
                if (lead || g.sign_position == radix_sign::before_radix) return std::nullopt;
                p.negative = s.front() == '-';
                s.remove_prefix(1);
            }
            if (s.size() < 2 || s.back() != '#') return std::nullopt;
            p.digits = s.substr(0, s.size() - 1);
            bool alnum = std::all_of(p.digits.begin(), p.digits.end(), [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; });
            if (!alnum) return std::nullopt;
            return p;
        }
    } // namespace

    std::string unescape(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); i++) {
            char c = text[i];
            if (c != '\\' || i + 1 >= text.size()) {
                out.push_back(c);
                continue;
            }
            switch (text[i + 1]) {
            case 'n': out.push_back('\n'); i++; break;
            case 't': out.push_back('\t'); i++; break;
            case 'f': out.push_back('\f'); i++; break;
            case 'v': out.push_back('\v'); i++; break;
            case '\\': out.push_back('\\'); i++; break;
            default: out.push_back(c); break;
            }
        }
        return out;
    }

    std::string fold_whitespace(std::string_view text, const Grammar& g) {
        std::string nodash;
        nodash.reserve(text.size());
        for (size_t i = 0; i < text.size(); i++) {
            if (text[i] == '-' && i + 1 < text.size() && g.is_format_effector(static_cast<unsigned char>(text[i + 1]))) {
                i++;
                while (i + 1 < text.size() && g.is_whitespace(static_cast<unsigned char>(text[i + 1]))) i++;
                continue;
            }
            nodash.push_back(text[i]);
        }

        std::string out;
        out.reserve(nodash.size());
        bool pending_space = false;
        for (char c : nodash) {
            if (g.is_whitespace(static_cast<unsigned char>(c))) {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space) out.push_back(' ');
            pending_space = false;
            out.push_back(c);
        }
        return out;
    }

    Decoder::Decoder(const Grammar& g, DecoderRules rules, std::pmr::memory_resource* res)
        : m_Grammar{ &g }, m_Rules{ rules }, m_MemRes{ res } {}

    std::expected<value, DecodeError> Decoder::decode_simple_value(std::string_view text) const {
        if (auto v = decode_quoted_string(text)) return *std::move(v);
        if (is_non_decimal_form(text)) {
            if (auto v = decode_non_decimal(text)) return *std::move(v);
            return std::unexpected(DecodeError{ DecodeError::code::invalid_digits,
                                                "Invalid digits for the radix of \"" + std::string{ text } + "\"" });
        }
        if (auto v = decode_decimal(text)) return *std::move(v);
        if (auto v = decode_datetime(text)) return *std::move(v);
        if (auto v = decode_keyword(text)) return *std::move(v);
        if (auto v = decode_unquoted_string(text)) return *std::move(v);
        return std::unexpected(DecodeError{ DecodeError::code::no_match,
                                            "\"" + std::string{ text } + "\" is not a simple value" });
    }

    std::optional<value> Decoder::decode_quoted_string(std::string_view text) const {
        if (text.size() < 2) return std::nullopt;
        char q = text.front();
        if (!m_Grammar->is_quote(static_cast<unsigned char>(q)) || text.back() != q) return std::nullopt;

        auto inner = text.substr(1, text.size() - 2);
        std::string s = m_Rules.fold_quoted_strings ? fold_whitespace(inner, *m_Grammar) : std::string{ inner };
        return value{ std::string_view{ unescape(s) }, m_MemRes };
    }

    bool Decoder::is_non_decimal_form(std::string_view text) const noexcept {
        return split_radix(text, *m_Grammar).has_value();
    }

    std::optional<value> Decoder::decode_non_decimal(std::string_view text) const {
        auto parts = split_radix(text, *m_Grammar);
        if (!parts) return std::nullopt;
        for (char c : parts->digits) {
            if (!valid_digit(c, parts->radix)) return std::nullopt;
        }
        int64_t magnitude = 0;
        auto [ptr, ec] = std::from_chars(parts->digits.data(), parts->digits.data() + parts->digits.size(), magnitude, parts->radix);
        if (ec != std::errc{} || ptr != parts->digits.data() + parts->digits.size()) return std::nullopt;
        return value{ parts->negative ? -magnitude : magnitude, m_MemRes };
    }

    std::optional<value> Decoder::decode_decimal(std::string_view text) const {
        // from_chars does not accept a leading '+'
        std::string_view s = text;
        size_t i = 0;
        if (!s.empty() && s.front() == '+') s.remove_prefix(1);
        else if (!s.empty() && s.front() == '-') i = 1;

        size_t int_digits = 0, frac_digits = 0;
        bool point = false, exponent = false;
        while (i < s.size() && is_digit(s[i])) { i++; int_digits++; }
        if (i < s.size() && s[i] == '.') {
            point = true;
            i++;
            while (i < s.size() && is_digit(s[i])) { i++; frac_digits++; }
        }
        if (int_digits + frac_digits == 0) return std::nullopt;
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            exponent = true;
            i++;
            if (i < s.size() && is_sign(s[i])) i++;
            size_t exp_digits = 0;
            while (i < s.size() && is_digit(s[i])) { i++; exp_digits++; }
            if (exp_digits == 0) return std::nullopt;
        }
        if (i != s.size()) return std::nullopt;

        const char* first = s.data();
        const char* last = s.data() + s.size();
        if (!point && !exponent) {
            int64_t iv = 0;
            auto [ptr, ec] = std::from_chars(first, last, iv);
            if (ec == std::errc{} && ptr == last) return value{ iv, m_MemRes };
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || ptr != last) return std::nullopt;
        return value{ d, m_MemRes };
    }

    std::optional<value> Decoder::decode_datetime(std::string_view text) const {
        std::string_view dated = text;
        if (!dated.empty() && (dated.back() == 'Z' || dated.back() == 'z')) dated.remove_suffix(1);
        if (auto d = parse_date(dated)) return value{ *d, m_MemRes };

        bool leap = m_Grammar->leap_seconds && leap_seconds_preserved;
        std::optional<date> day;
        std::string_view clock = text;
        if (auto tpos = text.find('T'); tpos != std::string_view::npos) {
            day = parse_date(text.substr(0, tpos));
            if (!day) return std::nullopt;
            clock = text.substr(tpos + 1);
        }

        auto zone = split_zone(clock, m_Rules.numeric_utc_offsets);
        if (!zone) return std::nullopt;
        auto t = parse_clock(zone->clock, leap);
        if (!t) return std::nullopt;
        t->utc_offset_minutes = zone->offset_minutes;

        if (day) return value{ datetime{ *day, *t }, m_MemRes };
        return value{ *t, m_MemRes };
    }

    std::optional<value> Decoder::decode_keyword(std::string_view text) const {
        if (iequals(text, m_Grammar->null_keyword)) return value{ nullptr, m_MemRes };
        if (iequals(text, m_Grammar->true_keyword)) return value{ true, m_MemRes };
        if (iequals(text, m_Grammar->false_keyword)) return value{ false, m_MemRes };
        return std::nullopt;
    }

    std::optional<value> Decoder::decode_unquoted_string(std::string_view text) const {
        if (text.empty()) return std::nullopt;
        for (char c : text) {
            auto u = static_cast<unsigned char>(c);
            if (m_Grammar->is_whitespace(u) || m_Grammar->is_reserved(u)) return std::nullopt;
        }
        if (m_Grammar->contains_comment_marker(text)) return std::nullopt;
        if (m_Grammar->is_reserved_keyword(text)) return std::nullopt;
        if (is_numeric(text) || is_datetime(text)) return std::nullopt;
        return value{ text, m_MemRes };
    }

    value Decoder::decode_quantity(value v, std::string_view units) const {
        if (v.is_quantity()) {
            value magnitude = v.as_quantity().magnitude();
            return value{ quantity{ std::move(magnitude), units }, m_MemRes };
        }
        return value{ quantity{ std::move(v), units }, m_MemRes };
    }

} // namespace Pvl
