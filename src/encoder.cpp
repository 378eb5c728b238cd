#include "pvl/encoder.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <optional>


namespace Pvl {

    namespace {
        using expected_void = std::expected<void, EncodeError>;

        std::unexpected<EncodeError> fail(EncodeError::code c, std::string_view key, std::string_view m) {
            return std::unexpected(EncodeError::make(c, key, m));
        }

        bool odl_scalar(const value& v) {
            switch (v.type()) {
            case kind::integer:
            case kind::real:
            case kind::string:
            case kind::date:
            case kind::time:
            case kind::datetime:
                return true;
            case kind::quantity:
                return v.as_quantity().magnitude().is_number();
            default:
                return false;
            }
        }

        std::string upper(std::string_view s) {
            std::string out{ s };
            for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return out;
        }

        std::string_view trim(std::string_view s, const Grammar& g) {
            while (!s.empty() && g.is_whitespace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
            while (!s.empty() && g.is_whitespace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
            return s;
        }

        // Splits at spaces outside quotes and units expressions.
        std::vector<std::string_view> split_words(std::string_view s, const Grammar& g) {
            std::vector<std::string_view> words;
            char quote = '\0';
            bool units = false;
            size_t start = 0;
            for (size_t i = 0; i < s.size(); i++) {
                char c = s[i];
                if (quote) {
                    if (c == quote) quote = '\0';
                    continue;
                }
                if (units) {
                    if (c == g.units.close) units = false;
                    continue;
                }
                if (g.is_quote(static_cast<unsigned char>(c))) {
                    quote = c;
                } else if (c == g.units.open) {
                    units = true;
                } else if (c == ' ') {
                    if (i > start) words.push_back(s.substr(start, i - start));
                    start = i + 1;
                }
            }
            if (start < s.size()) words.push_back(s.substr(start));
            return words;
        }
    } // namespace

    Encoder::Encoder(const Decoder& d, EncoderRules rules)
        : m_Decoder{ &d }, m_Rules{ std::move(rules) } {}

#pragma region Classification

    bool Encoder::is_identifier(std::string_view s) noexcept {
        if (s.empty()) return false;
        if (!std::isalpha(static_cast<unsigned char>(s.front())) || s.back() == '_') return false;
        return std::all_of(s.begin(), s.end(), [](char c) {
            auto u = static_cast<unsigned char>(c);
            return u < 0x80 && (std::isalnum(u) || c == '_');
        });
    }

    bool Encoder::is_symbol(std::string_view s) noexcept {
        if (s.empty()) return false;
        return std::all_of(s.begin(), s.end(), [](char c) {
            auto u = static_cast<unsigned char>(c);
            return u >= 0x20 && u <= 0x7E && c != '\'';
        });
    }

    bool Encoder::is_pds_group(const container& g) {
        std::vector<std::string_view> keys;
        keys.reserve(g.size());
        for (const auto& [k, v] : g) {
            if (v.is_aggregation()) return false;
            if (k.starts_with('^')) {
                if (v.is_integer()) return false;
                if (v.is_quantity() && v.as_quantity().magnitude().is_integer()) return false;
            }
            keys.push_back(k);
        }
        std::sort(keys.begin(), keys.end());
        return std::adjacent_find(keys.begin(), keys.end()) == keys.end();
    }

#pragma endregion
#pragma region Document

    EncodeResult Encoder::encode(const container& module) const {
        const container* root = &module;
        std::optional<container> converted;

        if (m_Rules.pds_groups) {
            size_t groups = 0, objects = 0;
            for (const auto& [k, v] : module) {
                if (!v.is_aggregation()) continue;
                if (v.as_aggregation().is_group()) groups++;
                else objects++;
            }
            if (groups > 0 && objects == 0) {
                if (!m_Rules.convert_group_to_object)
                    return fail(EncodeError::code::not_representable, {}, "A PDS label with GROUP blocks must also have an OBJECT block");

                converted.emplace(module);
                auto is_group = [](const container::entry& e) { return e.second.is_aggregation() && e.second.as_aggregation().is_group(); };
                auto it = std::find_if(converted->begin(), converted->end(), [&](const container::entry& e) {
                    return is_group(e) && !is_pds_group(e.second.as_aggregation());
                });
                if (it == converted->end()) it = std::find_if(converted->begin(), converted->end(), is_group);
                it->second.as_aggregation().set_type(role::object);
                root = &*converted;
            }
        }

        std::vector<std::string> lines;
        if (auto r = encode_block(*root, 0, lines); !r) return std::unexpected(r.error());

        std::string end_line = grammar().end_statements.front();
        if (m_Rules.end_delimiter) end_line += grammar().delimiter;
        lines.push_back(std::move(end_line));

        std::string out;
        for (size_t i = 0; i < lines.size(); i++) {
            if (i) out += m_Rules.newline;
            out += lines[i];
        }
        if (m_Rules.final_newline) out += m_Rules.newline;

        if (m_Rules.tab_replace > 0) {
            std::string spaces(m_Rules.tab_replace, ' ');
            std::string replaced;
            replaced.reserve(out.size());
            for (char c : out) {
                if (c == '\t') replaced += spaces;
                else replaced.push_back(c);
            }
            out = std::move(replaced);
        }

        for (size_t i = 0; i < out.size();) {
            char32_t cp = 0;
            size_t width = next_code_point(out, i, cp);
            if (width == 0 || !grammar().char_allowed(cp))
                return fail(EncodeError::code::illegal_character, {},
                            "Encoded text contains a character not allowed by the " + grammar().name + " grammar at byte " + std::to_string(i));
            i += width;
        }
        return out;
    }

    expected_void Encoder::encode_block(const container& c, size_t level, std::vector<std::string>& lines) const {
        size_t key_len = 0;
        for (const auto& [k, v] : c) {
            if (!v.is_aggregation()) key_len = std::max(key_len, k.size());
        }

        for (const auto& [k, v] : c) {
            if (v.is_aggregation()) {
                if (auto r = encode_aggregation(k, v.as_aggregation(), level, lines); !r) return r;
                continue;
            }

            auto key = encode_key(k);
            if (!key) return std::unexpected(key.error());
            auto val = encode_value(v, k);
            if (!val) return std::unexpected(val.error());

            std::string stmt = *key;
            if (stmt.size() < key_len) stmt.append(key_len - stmt.size(), ' ');
            stmt += ' ';
            stmt += grammar().assignment;
            stmt += ' ';
            stmt += *val;
            if (m_Rules.end_delimiter) stmt += grammar().delimiter;
            lines.push_back(format(stmt, level));
        }
        return {};
    }

    expected_void Encoder::encode_aggregation(std::string_view name, const container& c, size_t level, std::vector<std::string>& lines) const {
        auto key = encode_key(name);
        if (!key) return std::unexpected(key.error());

        bool as_group = c.is_group();
        if (as_group && m_Rules.pds_groups && !is_pds_group(c)) {
            if (!m_Rules.convert_group_to_object)
                return fail(EncodeError::code::not_representable, name, "Not a valid PDS GROUP");
            as_group = false;
        }
        const aggregation_keywords& kw = as_group ? grammar().group : grammar().object;
        std::string prefix(level * m_Rules.indent, ' ');

        std::string begin = prefix + kw.preferred_begin + " " + grammar().assignment + " " + *key;
        if (m_Rules.end_delimiter) begin += grammar().delimiter;
        lines.push_back(std::move(begin));

        if (auto r = encode_block(c, level + 1, lines); !r) return r;

        std::string end = prefix + kw.preferred_end;
        if (m_Rules.aggregation_end) end += " " + std::string(1, grammar().assignment) + " " + *key;
        if (m_Rules.end_delimiter) end += grammar().delimiter;
        lines.push_back(std::move(end));
        return {};
    }

    std::string Encoder::format(std::string_view statement, size_t level) const {
        std::string prefix(level * m_Rules.indent, ' ');
        if (m_Rules.width == 0 || prefix.size() + statement.size() + m_Rules.newline.size() <= m_Rules.width)
            return prefix + std::string{ statement };

        auto eq = statement.find(grammar().assignment);
        if (eq == std::string_view::npos) return prefix + std::string{ statement };

        std::string head = prefix + std::string{ trim(statement.substr(0, eq), grammar()) } + " " + grammar().assignment + " ";
        std::string indent(head.size(), ' ');
        size_t limit = m_Rules.width > m_Rules.newline.size() ? m_Rules.width - m_Rules.newline.size() : 1;

        std::string out;
        std::string line = head;
        bool has_word = false;
        for (auto w : split_words(statement.substr(eq + 1), grammar())) {
            if (has_word && line.size() + 1 + w.size() > limit) {
                out += line;
                out += m_Rules.newline;
                line = indent;
                has_word = false;
            }
            if (has_word) line += ' ';
            line += w;
            has_word = true;
        }
        out += line;
        return out;
    }

#pragma endregion
#pragma region Values

    EncodeResult Encoder::encode_key(std::string_view key) const {
        if (key.empty()) return fail(EncodeError::code::invalid_key, key, "Empty parameter name");
        if (grammar().is_reserved_keyword(key))
            return fail(EncodeError::code::invalid_key, key, "Parameter name is a reserved keyword");

        if (m_Rules.identifier_keys) {
            if (key.size() > 30) return fail(EncodeError::code::invalid_key, key, "ODL keywords must be 30 characters or less");
            auto body = key.starts_with('^') ? key.substr(1) : key;
            bool ok = is_identifier(body);
            if (!ok) {
                auto colon = body.find(':');
                ok = colon != std::string_view::npos && is_identifier(body.substr(0, colon)) && is_identifier(body.substr(colon + 1));
            }
            if (!ok) return fail(EncodeError::code::invalid_key, key, "Not a valid ODL identifier");
        } else if (!m_Decoder->decode_unquoted_string(key)) {
            return fail(EncodeError::code::invalid_key, key, "Parameter name would not read back as a name");
        }

        if (m_Rules.upper_case_keys) return upper(key);
        return std::string{ key };
    }

    EncodeResult Encoder::encode_value(const value& v, std::string_view key) const {
        const Grammar& g = grammar();
        switch (v.type()) {
        case kind::null:
            return g.null_keyword;
        case kind::boolean:
            return v.as_bool() ? g.true_keyword : g.false_keyword;
        case kind::integer: {
            char buf[32];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v.as_integer());
            return std::string(buf, ptr);
        }
        case kind::real:
            return encode_real(v.as_real(), key);
        case kind::string:
            return encode_string(v.as_string(), key);
        case kind::date:
            return encode_date(v.as_date(), key);
        case kind::time:
            return encode_time(v.as_time(), key);
        case kind::datetime: {
            auto d = encode_date(v.as_datetime().date_part, key);
            if (!d) return d;
            auto t = encode_time(v.as_datetime().time_part, key);
            if (!t) return t;
            return *d + "T" + *t;
        }
        case kind::sequence:
        case kind::set:
            return encode_collection(v, key);
        case kind::aggregation:
            return fail(EncodeError::code::unsupported_value, key, "Aggregations may only appear as block statements");
        case kind::quantity: {
            const quantity& q = v.as_quantity();
            if (m_Rules.units_on_numbers_only && !q.magnitude().is_number())
                return fail(EncodeError::code::not_representable, key, "Units expressions may only follow numeric values");
            auto mag = encode_value(q.magnitude(), key);
            if (!mag) return mag;
            auto units = encode_units(q.units(), key);
            if (!units) return units;
            return *mag + " " + *units;
        }
        case kind::empty:
            return std::string(2, g.quotes.front());
        }
        return fail(EncodeError::code::unsupported_value, key, "Unknown value kind");
    }

    EncodeResult Encoder::encode_collection(const value& v, std::string_view key) const {
        const bool is_set = v.is_set();

        if (m_Rules.scalar_collections) {
            if (is_set) {
                if (!std::all_of(v.as_set().begin(), v.as_set().end(), odl_scalar))
                    return fail(EncodeError::code::not_representable, key, "ODL sets may only hold scalar values");
            } else {
                if (v.as_sequence().empty())
                    return fail(EncodeError::code::not_representable, key, "ODL does not allow empty sequences");
                for (const auto& e : v.as_sequence()) {
                    bool ok = e.is_sequence() ? std::all_of(e.as_sequence().begin(), e.as_sequence().end(), odl_scalar) : odl_scalar(e);
                    if (!ok)
                        return fail(EncodeError::code::not_representable, key,
                                    "ODL only allows one- and two-dimensional sequences of scalar values");
                }
            }
        }

        if (m_Rules.pds_sets && is_set) {
            for (const auto& e : v.as_set()) {
                if (e.is_integer()) continue;
                if (e.is_string() && is_symbol(e.as_string())) continue;
                return fail(EncodeError::code::not_representable, key, "PDS sets may only hold integers and symbols");
            }
        }

        const delimiter_pair& delims = is_set ? grammar().set : grammar().sequence;
        std::string out(1, delims.open);
        bool first = true;
        auto append = [&](const value& e) -> expected_void {
            auto s = encode_value(e, key);
            if (!s) return std::unexpected(s.error());
            if (!first) {
                out += grammar().separator;
                out += ' ';
            }
            out += *s;
            first = false;
            return {};
        };

        if (is_set) {
            for (const auto& e : v.as_set()) {
                if (auto r = append(e); !r) return std::unexpected(r.error());
            }
        } else {
            for (const auto& e : v.as_sequence()) {
                if (auto r = append(e); !r) return std::unexpected(r.error());
            }
        }
        out += delims.close;
        return out;
    }

    EncodeResult Encoder::encode_string(std::string_view s, std::string_view key) const {
        const Grammar& g = grammar();

        std::string escaped;
        escaped.reserve(s.size());
        for (char c : s) {
            switch (c) {
            case '\\': escaped += "\\\\"; continue;
            case '\n': if (m_Rules.fold_strings) { escaped += "\\n"; continue; } break;
            case '\t': if (m_Rules.fold_strings) { escaped += "\\t"; continue; } break;
            case '\f': if (m_Rules.fold_strings) { escaped += "\\f"; continue; } break;
            case '\v': if (m_Rules.fold_strings) { escaped += "\\v"; continue; } break;
            case '\r':
                if (m_Rules.fold_strings)
                    return fail(EncodeError::code::not_representable, key, "A carriage return does not survive whitespace folding");
                break;
            default: break;
            }
            escaped.push_back(c);
        }

        if (m_Rules.fold_strings && escaped != fold_whitespace(escaped, g))
            return fail(EncodeError::code::not_representable, key, "String spacing would be changed by whitespace folding");

        // A bare trailing dash reads as a line continuation to the omni parser.
        bool bare = false;
        if (!s.empty() && escaped == s && s.back() != '-') {
            auto decoded = m_Decoder->decode_simple_value(s);
            bare = decoded && decoded->is_string() && decoded->as_string() == s;
        }

        if (m_Rules.symbol_strings) {
            if (bare && is_identifier(s)) return std::string{ s };
            if (escaped == s && is_symbol(s) && g.is_quote('\'')) return "'" + escaped + "'";
        } else if (bare) {
            return std::string{ s };
        }

        for (char q : g.quotes) {
            if (s.find(q) == std::string_view::npos) return q + escaped + q;
        }
        return fail(EncodeError::code::unquotable_string, key, "String contains every quote character of the grammar");
    }

    EncodeResult Encoder::encode_real(double d, std::string_view key) const {
        if (!std::isfinite(d)) return fail(EncodeError::code::not_representable, key, "Non-finite reals have no PVL form");
        char buf[64];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
        std::string out(buf, ptr);
        if (out.find_first_of(".eE") == std::string::npos) out += ".0";
        return out;
    }

    EncodeResult Encoder::encode_date(const date& d, std::string_view key) const {
        if (d.year < 0 || d.year > 9999 || !d.valid())
            return fail(EncodeError::code::not_representable, key, "Dates must have a four digit year");
        return to_string(d);
    }

    EncodeResult Encoder::encode_time(const time& t, std::string_view key) const {
        if (!t.valid()) return fail(EncodeError::code::not_representable, key, "Invalid time of day");
        if (t.is_leap_second() && !grammar().leap_seconds)
            return fail(EncodeError::code::not_representable, key, "The " + grammar().name + " grammar has no leap second form");

        // Zone-less text reads back as UTC, so a naive time cannot survive the trip.
        if (!t.utc_offset_minutes)
            return fail(EncodeError::code::not_representable, key, "Times must carry a UTC offset to be written");

        std::string out = to_string(t);
        bool utc = *t.utc_offset_minutes == 0;
        switch (m_Rules.zones) {
        case zone_style::bare_utc:
            if (!utc) return fail(EncodeError::code::not_representable, key, "Numeric UTC offsets are not allowed in " + grammar().name);
            return out;
        case zone_style::odl:
            return out + (utc ? std::string{ "Z" } : format_utc_offset(t.utc_offset_minutes));
        case zone_style::utc_only:
            if (!utc) return fail(EncodeError::code::not_representable, key, "PDS labels may only hold UTC times");
            if (t.nanosecond % 1'000'000 != 0)
                return fail(EncodeError::code::not_representable, key, "PDS times carry at most millisecond precision");
            return out + "Z";
        }
        return out;
    }

    EncodeResult Encoder::encode_units(std::string_view units, std::string_view key) const {
        const Grammar& g = grammar();
        if (units.find(g.units.open) != std::string_view::npos || units.find(g.units.close) != std::string_view::npos)
            return fail(EncodeError::code::not_representable, key, "Units may not contain units delimiters");
        if (trim(units, g).size() != units.size())
            return fail(EncodeError::code::not_representable, key, "Units may not begin or end with whitespace");

        if (m_Rules.odl_units) {
            std::string stripped;
            for (char c : units) {
                if (g.is_whitespace(static_cast<unsigned char>(c))) continue;
                if (c == '*' || c == '/' || c == '(' || c == ')' || c == '-') continue;
                stripped.push_back(c);
            }
            if (!is_identifier(stripped))
                return fail(EncodeError::code::not_representable, key, "Not an ODL units expression");
            for (auto pos = units.find("**"); pos != std::string_view::npos; pos = units.find("**", pos + 2)) {
                auto rest = units.substr(pos + 2);
                if (rest.starts_with('-')) rest.remove_prefix(1);
                if (rest.empty() || !std::isdigit(static_cast<unsigned char>(rest.front())))
                    return fail(EncodeError::code::not_representable, key, "Units exponent must be a decimal integer");
            }
        }
        return g.units.open + std::string{ units } + g.units.close;
    }

#pragma endregion

} // namespace Pvl
