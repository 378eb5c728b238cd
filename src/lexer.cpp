#include "pvl/lexer.hpp"

#include <string>


namespace Pvl {

    namespace {
        bool is_sign(char c) noexcept { return c == '+' || c == '-'; }
        bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
    } // namespace

#pragma region Lexer

    Lexer::Lexer(std::string_view text, const Decoder& d) noexcept
        : m_Text{ text }, m_Decoder{ &d } {}

    LexResult Lexer::next() {
        const Grammar& g = m_Decoder->grammar();
        size_t start = std::string_view::npos;
        preserve state = preserve::none;
        char quote = '\0';
        const comment_pair* comment = nullptr;

        while (m_Pos < m_Text.size()) {
            char32_t cp = 0;
            size_t width = next_code_point(m_Text, m_Pos, cp);
            if (width == 0)
                return std::unexpected(ParseError::at(ParseError::code::illegal_character, m_Text, m_Pos, "Invalid UTF-8 sequence"));
            if (!g.char_allowed(cp))
                return std::unexpected(ParseError::at(ParseError::code::illegal_character, m_Text, m_Pos,
                                                      "Character not allowed by the " + g.name + " grammar"));

            char c = m_Text[m_Pos];
            preserve closed = preserve::none;

            if (state == preserve::none) {
                if (start == std::string_view::npos) {
                    if (g.is_whitespace(cp)) {
                        m_Pos += width;
                        continue;
                    }
                    start = m_Pos;
                }

                auto so_far = m_Text.substr(start, m_Pos - start);
                if (c == '#' && g.is_non_decimal_prefix(std::string{ so_far } + '#')) {
                    state = preserve::non_decimal;
                } else if (const comment_pair* p = g.comment_starting_at(m_Text, m_Pos)) {
                    comment = p;
                    if (p->open.size() > 1) {
                        state = preserve::block_comment;
                        width = p->open.size();
                    } else {
                        state = preserve::line_comment;
                    }
                } else if (c == g.units.open) {
                    state = preserve::units;
                } else if (g.is_quote(cp)) {
                    state = preserve::quote;
                    quote = c;
                }
            } else {
                bool done = false;
                switch (state) {
                case preserve::block_comment: {
                    auto lexeme = m_Text.substr(start, m_Pos + width - start);
                    done = lexeme.size() >= comment->open.size() + comment->close.size() && lexeme.ends_with(comment->close);
                    break;
                }
                case preserve::line_comment:
                    done = !comment->close.empty() && c == comment->close.front();
                    break;
                case preserve::quote:
                    done = c == quote;
                    break;
                case preserve::units:
                    done = c == g.units.close;
                    break;
                case preserve::non_decimal:
                    done = c == '#';
                    break;
                case preserve::none:
                    break;
                }
                if (done) {
                    closed = state;
                    state = preserve::none;
                }
            }

            m_Pos += width;
            if (m_Pos >= m_Text.size()) break;
            if (state != preserve::none) continue;

            auto lexeme = m_Text.substr(start, m_Pos - start);
            char next = m_Text[m_Pos];
            if (keeps_numeric(lexeme, c, next)) continue;
            if (ends_lexeme(lexeme, closed, m_Pos)) return Token{ lexeme, start };
        }

        if (start == std::string_view::npos) return std::nullopt;

        switch (state) {
        case preserve::block_comment:
            return std::unexpected(ParseError::at(ParseError::code::unterminated_comment, m_Text, start, "Unterminated comment"));
        case preserve::quote:
            return std::unexpected(ParseError::at(ParseError::code::unterminated_quote, m_Text, start, "Unterminated quoted string"));
        case preserve::units:
            return std::unexpected(ParseError::at(ParseError::code::unterminated_units, m_Text, start, "Unterminated units expression"));
        case preserve::non_decimal:
            return std::unexpected(ParseError::at(ParseError::code::unterminated_non_decimal, m_Text, start, "Unterminated non-decimal number"));
        case preserve::line_comment:
        case preserve::none:
            break;
        }
        return Token{ m_Text.substr(start), start };
    }

    bool Lexer::keeps_numeric(std::string_view lexeme, char last, char next) const {
        const Grammar& g = m_Decoder->grammar();

        if (is_sign(last) && (is_digit(next) || next == '.')) return true;

        std::string candidate{ lexeme };
        candidate += next;
        if (g.is_non_decimal_prefix(candidate)) return true;

        if ((last == 'e' || last == 'E') && is_sign(next) && m_Decoder->is_decimal(candidate + '2')) return true;

        if (is_sign(next) && m_Decoder->rules().numeric_utc_offsets && m_Decoder->is_datetime(candidate + "01")) return true;

        return false;
    }

    bool Lexer::ends_lexeme(std::string_view lexeme, preserve closed, size_t next_pos) const {
        const Grammar& g = m_Decoder->grammar();
        auto next = static_cast<unsigned char>(m_Text[next_pos]);

        if (g.is_whitespace(next) || g.is_reserved(next)) return true;
        if (g.comment_starting_at(m_Text, next_pos)) return true;
        if (closed == preserve::block_comment || closed == preserve::line_comment) return true;
        if (lexeme.size() == 1 && g.is_reserved(static_cast<unsigned char>(lexeme.front()))) return true;
        if (closed == preserve::quote) return true;
        return false;
    }

#pragma endregion
#pragma region TokenStream

    TokenStream::TokenStream(std::string_view text, const Decoder& d) noexcept
        : m_Lexer{ text, d } {}

    LexResult TokenStream::next() {
        if (!m_Pushed.empty()) {
            Token t = m_Pushed.back();
            m_Pushed.pop_back();
            return t;
        }
        return m_Lexer.next();
    }

    LexResult TokenStream::peek() {
        auto t = next();
        if (t && *t) push_back(**t);
        return t;
    }

    void TokenStream::push_back(Token t) {
        m_Pushed.push_back(t);
    }

#pragma endregion

} // namespace Pvl
