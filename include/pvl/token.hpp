#pragma once


/*
    ---------------------------------------
    Pvl::Token / Pvl::TokenClassifier
    ---------------------------------------
    A `Token` is an immutable slice of the source text together with its
    byte offset. It carries no behavior of its own; every question about
    what a token *is* goes through a `TokenClassifier`, which pairs the
    grammar tables with the decoder that owns the literal rules.

    Tokens borrow from the source buffer. They must not outlive the text
    the lexer was constructed over.
*/

#include <cstddef>
#include <string_view>

#include "pvl/config.hpp"
#include "pvl/decoder.hpp"
#include "pvl/grammar.hpp"


/// @defgroup PvlToken Tokens
/// @ingroup Pvl
namespace Pvl {

    /// @ingroup PvlToken
    struct Token {
        std::string_view text{}; ///< The lexeme, borrowed from the source.
        std::size_t offset = 0;  ///< Byte offset of the first character.

        [[nodiscard]] std::size_t end() const noexcept { return offset + text.size(); }

        bool operator==(const Token&) const = default;
    };

    /// @ingroup PvlToken
    /// @brief Stateless predicates over tokens for one grammar / decoder pair.
    class TokenClassifier {
    public:
        PVL_API explicit TokenClassifier(const Decoder& d) noexcept;

        [[nodiscard]] const Grammar& grammar() const noexcept { return *m_Grammar; }
        [[nodiscard]] const Decoder& decoder() const noexcept { return *m_Decoder; }

        /// @brief One or more whitespace characters and nothing else.
        [[nodiscard]] PVL_API bool is_space(const Token& t) const noexcept;

        /// @brief Starts with an opening and ends with the matching closing
        ///        comment delimiter. A line comment that ran into the end of
        ///        input is still a comment.
        [[nodiscard]] PVL_API bool is_comment(const Token& t) const noexcept;

        /// @brief Whitespace or comment; filler between meaningful tokens.
        [[nodiscard]] PVL_API bool is_wsc(const Token& t) const noexcept;

        [[nodiscard]] PVL_API bool is_quoted_string(const Token& t) const;
        [[nodiscard]] PVL_API bool is_delimiter(const Token& t) const noexcept;
        [[nodiscard]] PVL_API bool is_assignment(const Token& t) const noexcept;
        [[nodiscard]] PVL_API bool is_separator(const Token& t) const noexcept;
        [[nodiscard]] PVL_API bool is_units(const Token& t) const noexcept;

        [[nodiscard]] PVL_API bool is_begin_aggregation(const Token& t) const noexcept;
        [[nodiscard]] PVL_API bool is_end_aggregation(const Token& t) const noexcept;
        [[nodiscard]] PVL_API bool is_end_statement(const Token& t) const noexcept;
        [[nodiscard]] PVL_API bool is_reserved_keyword(const Token& t) const noexcept;

        [[nodiscard]] PVL_API bool is_numeric(const Token& t) const;
        [[nodiscard]] PVL_API bool is_datetime(const Token& t) const;
        [[nodiscard]] PVL_API bool is_unquoted_string(const Token& t) const;

        /// @brief An unquoted string that is not a reserved keyword.
        [[nodiscard]] PVL_API bool is_parameter_name(const Token& t) const;

        /// @brief Decodable by `Decoder::decode_simple_value`.
        [[nodiscard]] PVL_API bool is_simple_value(const Token& t) const;

    private:
        const Grammar* m_Grammar;
        const Decoder* m_Decoder;
    };

} // namespace Pvl
