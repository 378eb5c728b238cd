#include "pvl/grammar.hpp"

#include <algorithm>
#include <cctype>


namespace Pvl {

    bool iequals(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); i++) {
            if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) return false;
        }
        return true;
    }

    namespace {
        bool contains(std::string_view set, char32_t c) noexcept {
            if (c > 0x7F) return false;
            return set.find(static_cast<char>(c)) != std::string_view::npos;
        }

        bool any_iequals(const std::vector<std::string>& words, std::string_view word) noexcept {
            return std::any_of(words.begin(), words.end(), [&](const std::string& w) { return iequals(w, word); });
        }

        // Reads an unsigned decimal radix at the front of `text`, advancing it.
        bool take_radix(std::string_view& text, int& radix) noexcept {
            size_t n = 0;
            radix = 0;
            while (n < text.size() && n < 2 && std::isdigit(static_cast<unsigned char>(text[n]))) {
                radix = radix * 10 + (text[n] - '0');
                n++;
            }
            if (n == 0) return false;
            text.remove_prefix(n);
            return true;
        }

        bool take_sign(std::string_view& text) noexcept {
            if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
                text.remove_prefix(1);
                return true;
            }
            return false;
        }
    } // namespace

    size_t next_code_point(std::string_view s, size_t i, char32_t& cp) noexcept {
        const unsigned char* data = reinterpret_cast<const unsigned char*>(s.data());
        size_t n = s.size();
        unsigned char c = data[i];

        auto cont = [&](size_t k) { return i + k < n && (data[i + k] & 0xC0) == 0x80; };

        if (c <= 0x7F) {
            cp = c;
            return 1;
        }

        if (c >= 0xC2 && c <= 0xDF) {
            if (!cont(1)) return 0;
            cp = (char32_t(c & 0x1F) << 6) | char32_t(data[i + 1] & 0x3F);
            return 2;
        }

        if (c >= 0xE0 && c <= 0xEF) {
            if (!cont(1) || !cont(2)) return 0;
            unsigned char c1 = data[i + 1];
            if (c == 0xE0 && c1 < 0xA0) return 0;
            if (c == 0xED && c1 > 0x9F) return 0;
            cp = (char32_t(c & 0x0F) << 12) | (char32_t(c1 & 0x3F) << 6) | char32_t(data[i + 2] & 0x3F);
            return 3;
        }

        if (c >= 0xF0 && c <= 0xF4) {
            if (!cont(1) || !cont(2) || !cont(3)) return 0;
            unsigned char c1 = data[i + 1];
            if (c == 0xF0 && c1 < 0x90) return 0;
            if (c == 0xF4 && c1 > 0x8F) return 0;
            cp = (char32_t(c & 0x07) << 18) | (char32_t(c1 & 0x3F) << 12)
               | (char32_t(data[i + 2] & 0x3F) << 6) | char32_t(data[i + 3] & 0x3F);
            return 4;
        }

        return 0;
    }

    bool Grammar::is_whitespace(char32_t c) const noexcept { return contains(whitespace, c); }
    bool Grammar::is_reserved(char32_t c) const noexcept { return contains(reserved_characters, c); }
    bool Grammar::is_quote(char32_t c) const noexcept { return contains(quotes, c); }

    bool Grammar::is_format_effector(char32_t c) const noexcept {
        return c == '\n' || c == '\r' || c == '\v' || c == '\f';
    }

    bool Grammar::char_allowed(char32_t c) const noexcept {
        switch (characters) {
        case charset::ascii:
            return c <= 0x7F;
        case charset::latin1:
            if (c > 0xFF) return false;
            if (c <= 8) return false;
            if (c >= 14 && c <= 31) return false;
            if (c >= 127 && c <= 159) return false;
            return true;
        }
        return false;
    }

    const comment_pair* Grammar::comment_starting_at(std::string_view text, size_t pos) const noexcept {
        if (pos >= text.size()) return nullptr;
        auto rest = text.substr(pos);
        for (const auto& c : comments) {
            if (rest.starts_with(c.open)) return &c;
        }
        return nullptr;
    }

    bool Grammar::contains_comment_marker(std::string_view text) const noexcept {
        for (const auto& p : comments) {
            if (text.find(p.open) != std::string_view::npos) return true;
            if (p.open.size() > 1 && text.find(p.close) != std::string_view::npos) return true;
        }
        return false;
    }

    bool Grammar::is_begin_group(std::string_view word) const noexcept { return any_iequals(group.begin, word); }
    bool Grammar::is_begin_object(std::string_view word) const noexcept { return any_iequals(object.begin, word); }

    bool Grammar::is_begin_aggregation(std::string_view word) const noexcept {
        return is_begin_group(word) || is_begin_object(word);
    }

    bool Grammar::is_end_aggregation(std::string_view word) const noexcept {
        return iequals(group.end, word) || iequals(object.end, word);
    }

    std::string_view Grammar::end_keyword_for(std::string_view begin) const noexcept {
        if (is_begin_group(begin)) return group.end;
        if (is_begin_object(begin)) return object.end;
        return {};
    }

    bool Grammar::is_end_statement(std::string_view word) const noexcept { return any_iequals(end_statements, word); }

    bool Grammar::is_reserved_keyword(std::string_view word) const noexcept {
        return is_end_statement(word) || is_begin_aggregation(word) || is_end_aggregation(word);
    }

    bool Grammar::is_radix(int radix) const noexcept {
        return std::find(radices.begin(), radices.end(), radix) != radices.end();
    }

    bool Grammar::is_non_decimal_prefix(std::string_view text) const noexcept {
        bool lead = take_sign(text);
        if (lead && sign_position == radix_sign::after_radix) return false;

        int radix = 0;
        if (!take_radix(text, radix) || !is_radix(radix)) return false;
        if (text.empty() || text.front() != '#') return false;
        text.remove_prefix(1);

        bool trail = take_sign(text);
        if (trail && (lead || sign_position == radix_sign::before_radix)) return false;
        return text.empty();
    }

#pragma region Named grammars

    namespace {
        Grammar make_pvl() {
            Grammar g;
            g.name = "PVL";
            g.whitespace = " \t\n\r\v\f";
            g.reserved_characters = "&<>'{},[]=!#()%+\";~|";
            g.comments = { { "/*", "*/" } };
            g.group = { { "GROUP", "BEGIN_GROUP" }, "END_GROUP", "BEGIN_GROUP", "END_GROUP" };
            g.object = { { "OBJECT", "BEGIN_OBJECT" }, "END_OBJECT", "BEGIN_OBJECT", "END_OBJECT" };
            g.end_statements = { "END" };
            g.null_keyword = "NULL";
            g.true_keyword = "TRUE";
            g.false_keyword = "FALSE";
            g.quotes = "\"'";
            g.radices = { 2, 8, 16 };
            g.sign_position = radix_sign::before_radix;
            g.leap_seconds = true;
            g.characters = charset::latin1;
            return g;
        }

        std::vector<int> radices_2_to_16() {
            std::vector<int> r;
            for (int i = 2; i <= 16; i++) r.push_back(i);
            return r;
        }

        void unreserve_plus(Grammar& g) {
            std::erase(g.reserved_characters, '+');
        }
    } // namespace

    const Grammar& pvl_grammar() {
        static const Grammar g = make_pvl();
        return g;
    }

    const Grammar& odl_grammar() {
        static const Grammar g = [] {
            Grammar o = make_pvl();
            o.name = "ODL";
            o.group.preferred_begin = "GROUP";
            o.object.preferred_begin = "OBJECT";
            o.radices = radices_2_to_16();
            o.sign_position = radix_sign::after_radix;
            o.leap_seconds = false;
            o.characters = charset::ascii;
            return o;
        }();
        return g;
    }

    const Grammar& isis_grammar() {
        static const Grammar g = [] {
            Grammar i = make_pvl();
            i.name = "ISIS";
            i.group = { { "GROUP" }, "END_GROUP", "Group", "End_Group" };
            i.object = { { "OBJECT" }, "END_OBJECT", "Object", "End_Object" };
            i.comments = { { "/*", "*/" }, { "#", "\n" } };
            unreserve_plus(i);
            return i;
        }();
        return g;
    }

    const Grammar& omni_grammar() {
        static const Grammar g = [] {
            Grammar o = make_pvl();
            o.name = "Omni";
            o.comments = { { "/*", "*/" }, { "#", "\n" } };
            o.radices = radices_2_to_16();
            o.sign_position = radix_sign::either;
            unreserve_plus(o);
            return o;
        }();
        return g;
    }

#pragma endregion

} // namespace Pvl
