#include "pvl/token.hpp"

#include <algorithm>


namespace Pvl {

    TokenClassifier::TokenClassifier(const Decoder& d) noexcept
        : m_Grammar{ &d.grammar() }, m_Decoder{ &d } {}

    bool TokenClassifier::is_space(const Token& t) const noexcept {
        if (t.text.empty()) return false;
        return std::all_of(t.text.begin(), t.text.end(), [&](char c) { return m_Grammar->is_whitespace(static_cast<unsigned char>(c)); });
    }

    bool TokenClassifier::is_comment(const Token& t) const noexcept {
        for (const auto& p : m_Grammar->comments) {
            if (!t.text.starts_with(p.open)) continue;
            if (p.open.size() == 1) return true;
            if (t.text.size() >= p.open.size() + p.close.size() && t.text.ends_with(p.close)) return true;
        }
        return false;
    }

    bool TokenClassifier::is_wsc(const Token& t) const noexcept {
        return is_space(t) || is_comment(t);
    }

    bool TokenClassifier::is_quoted_string(const Token& t) const {
        return m_Decoder->decode_quoted_string(t.text).has_value();
    }

    bool TokenClassifier::is_delimiter(const Token& t) const noexcept {
        return t.text.size() == 1 && t.text.front() == m_Grammar->delimiter;
    }

    bool TokenClassifier::is_assignment(const Token& t) const noexcept {
        return t.text.size() == 1 && t.text.front() == m_Grammar->assignment;
    }

    bool TokenClassifier::is_separator(const Token& t) const noexcept {
        return t.text.size() == 1 && t.text.front() == m_Grammar->separator;
    }

    bool TokenClassifier::is_units(const Token& t) const noexcept {
        return !t.text.empty() && t.text.front() == m_Grammar->units.open;
    }

    bool TokenClassifier::is_begin_aggregation(const Token& t) const noexcept {
        return m_Grammar->is_begin_aggregation(t.text);
    }

    bool TokenClassifier::is_end_aggregation(const Token& t) const noexcept {
        return m_Grammar->is_end_aggregation(t.text);
    }

    bool TokenClassifier::is_end_statement(const Token& t) const noexcept {
        return m_Grammar->is_end_statement(t.text);
    }

    bool TokenClassifier::is_reserved_keyword(const Token& t) const noexcept {
        return m_Grammar->is_reserved_keyword(t.text);
    }

    bool TokenClassifier::is_numeric(const Token& t) const { return m_Decoder->is_numeric(t.text); }
    bool TokenClassifier::is_datetime(const Token& t) const { return m_Decoder->is_datetime(t.text); }

    bool TokenClassifier::is_unquoted_string(const Token& t) const {
        return m_Decoder->decode_unquoted_string(t.text).has_value();
    }

    bool TokenClassifier::is_parameter_name(const Token& t) const {
        if (is_reserved_keyword(t)) return false;
        return is_unquoted_string(t);
    }

    bool TokenClassifier::is_simple_value(const Token& t) const {
        return m_Decoder->decode_simple_value(t.text).has_value();
    }

} // namespace Pvl
