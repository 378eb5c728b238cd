#pragma once


/*
    -------------------------------------
    Pvl::Lexer / Pvl::TokenStream
    -------------------------------------
    The lexer walks the source one code point at a time and cuts it into
    tokens on demand. Nothing past the last requested token is examined,
    so a label followed by a binary payload can be parsed as long as the
    parser stops at the End statement.

    ---------------
    Preserve States
    ---------------
    While a comment, quoted string, units expression or radix literal is
    open, every character is kept verbatim until its terminator:
        - block comment: the grammar's closing pair (`* /`)
        - line comment:  a newline, or the end of input
        - quote:         the same quote character that opened it
        - units:         the closing units delimiter
        - radix literal: the closing `#`

    Outside those states the lexeme is cut before whitespace, reserved
    characters and comment openers, with three exceptions kept inside one
    numeric lexeme:
        - a sign followed by a digit or a decimal point
        - an exponent marker followed by a sign
        - a sign after a complete date/time when numeric zone offsets
          are allowed

    ------
    Errors
    ------
    Invalid UTF-8 and code points the grammar forbids stop the lexer with
    `illegal_character` at the offending byte. A preserve state still open
    at the end of input (other than a line comment) is an `unterminated_*`
    error at the start of the lexeme.

    `TokenStream` layers a push-back stack over the lexer so that the
    parser can return a token it examined but did not consume.
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <vector>

#include "pvl/config.hpp"
#include "pvl/decoder.hpp"
#include "pvl/error.hpp"
#include "pvl/token.hpp"


/// @defgroup PvlLexer Lexer
/// @ingroup Pvl
namespace Pvl {

    /// @ingroup PvlLexer
    using LexResult = std::expected<std::optional<Token>, ParseError>;

    /// @ingroup PvlLexer
    /// @brief Lazy tokenizer over a borrowed source buffer.
    class Lexer {
    public:
        PVL_API Lexer(std::string_view text, const Decoder& d) noexcept;

        /// @ingroup PvlLexer
        /// @brief Scans and returns the next token, nullopt at end of input.
        [[nodiscard]] PVL_API LexResult next();

        [[nodiscard]] std::size_t position() const noexcept { return m_Pos; }
        [[nodiscard]] std::string_view source() const noexcept { return m_Text; }
        [[nodiscard]] bool eof() const noexcept { return m_Pos >= m_Text.size(); }

    private:
        enum class preserve : uint8_t {
            none,
            block_comment,
            line_comment,
            quote,
            units,
            non_decimal,
        };

        std::string_view m_Text;
        const Decoder* m_Decoder;
        std::size_t m_Pos = 0;

        bool keeps_numeric(std::string_view lexeme, char last, char next) const;
        bool ends_lexeme(std::string_view lexeme, preserve closed, std::size_t next_pos) const;
    };

    /// @ingroup PvlLexer
    /// @brief Token sequence with single-token lookahead and push-back.
    class TokenStream {
    public:
        PVL_API TokenStream(std::string_view text, const Decoder& d) noexcept;

        /// @ingroup PvlLexer
        /// @brief Returns the most recently pushed-back token if there is
        ///        one, otherwise the next token from the lexer.
        [[nodiscard]] PVL_API LexResult next();

        /// @ingroup PvlLexer
        /// @brief Returns the next token without consuming it.
        [[nodiscard]] PVL_API LexResult peek();

        /// @ingroup PvlLexer
        /// @brief Returns @p t to the stream; it is produced again by the
        ///        next call to `next()`.
        PVL_API void push_back(Token t);

        [[nodiscard]] std::string_view source() const noexcept { return m_Lexer.source(); }

    private:
        Lexer m_Lexer;
        std::vector<Token> m_Pushed;
    };

} // namespace Pvl
