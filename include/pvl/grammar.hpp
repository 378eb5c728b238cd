#pragma once


/*
    -------------------------------------------
    Pvl::Grammar - Lexical and syntactic tables
    -------------------------------------------
    A `Grammar` is the immutable description of one member of the PVL
    language family. The lexer, decoder, parser and encoder never test
    which dialect they are working in; they only consult these tables.

    ------
    Tables
    ------
    - whitespace and reserved characters
    - comment delimiter pairs (`/ * * /`, and `#` to end of line in the
      ISIS and Omni profiles)
    - aggregation keywords: accepted Begin spellings for groups and
      objects, their End keyword, and the spelling preferred on output
    - End statement keywords
    - NULL / TRUE / FALSE keywords
    - quote characters, set / sequence / units delimiter pairs, the
      statement delimiter, assignment and element separator
    - non-decimal (radix) literal rules: the accepted radices and where
      the sign may be written
    - whether a seconds field of 60 is accepted
    - the legal character set

    Keyword comparisons are case-insensitive everywhere

    ------------
    Named Grammars
    ------------
    - `pvl_grammar()`   CCSDS 641.0-B-2 "Blue Book" PVL
    - `odl_grammar()`   PDS3 Standards Reference chapter 12 ODL
    - `isis_grammar()`  PVL as written and read by ISIS 3
    - `omni_grammar()`  permissive union for reading labels found in the wild

    The returned references are to function-local statics that live for
    the whole program and may be shared across threads
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "pvl/config.hpp"


/// @defgroup PvlGrammar Grammar Profiles
/// @ingroup Pvl
/// @brief Table-driven description of a PVL dialect's lexical rules
namespace Pvl {

    /// @ingroup PvlGrammar
    /// @brief Where the sign of a radix literal may be written.
    enum class radix_sign : uint8_t {
        before_radix, ///< `-16#FF#` (PVL)
        after_radix,  ///< `16#-FF#` (ODL)
        either,       ///< either position, but not both
    };

    /// @ingroup PvlGrammar
    /// @brief The legal character set of a grammar.
    enum class charset : uint8_t {
        latin1, ///< ISO 8859-1 without the C0 controls 0-8, 14-31 and 127-159
        ascii,  ///< 7-bit ASCII
    };

    /// @ingroup PvlGrammar
    struct delimiter_pair {
        char open;
        char close;
    };

    /// @ingroup PvlGrammar
    struct comment_pair {
        std::string open;
        std::string close;
    };

    /// @ingroup PvlGrammar
    /// @brief Begin/End keywords of one aggregation kind (group or object).
    struct aggregation_keywords {
        std::vector<std::string> begin; ///< Accepted Begin spellings.
        std::string end;                ///< The End keyword paired with every Begin spelling.
        std::string preferred_begin;    ///< Spelling written by the encoder.
        std::string preferred_end;      ///< Spelling written by the encoder.
    };

    /// @ingroup PvlGrammar
    /// @brief Immutable lexical and syntactic configuration of a dialect.
    struct Grammar {
        std::string name;
        std::string whitespace;
        std::string reserved_characters;
        std::vector<comment_pair> comments;
        aggregation_keywords group;
        aggregation_keywords object;
        std::vector<std::string> end_statements;
        std::string null_keyword;
        std::string true_keyword;
        std::string false_keyword;
        std::string quotes;
        delimiter_pair set{ '{', '}' };
        delimiter_pair sequence{ '(', ')' };
        delimiter_pair units{ '<', '>' };
        char delimiter = ';';
        char assignment = '=';
        char separator = ',';
        std::vector<int> radices;
        radix_sign sign_position = radix_sign::before_radix;
        bool leap_seconds = true;
        charset characters = charset::latin1;

        [[nodiscard]] PVL_API bool is_whitespace(char32_t c) const noexcept;
        [[nodiscard]] PVL_API bool is_reserved(char32_t c) const noexcept;
        [[nodiscard]] PVL_API bool is_quote(char32_t c) const noexcept;
        [[nodiscard]] PVL_API bool is_format_effector(char32_t c) const noexcept;

        /// @brief Whether @p c is a legal code point in this grammar.
        [[nodiscard]] PVL_API bool char_allowed(char32_t c) const noexcept;

        /// @brief Returns the comment pair whose opening delimiter starts
        ///        at @p pos in @p text, or nullptr.
        [[nodiscard]] PVL_API const comment_pair* comment_starting_at(std::string_view text, std::size_t pos) const noexcept;

        /// @brief Whether @p text contains any comment delimiter.
        [[nodiscard]] PVL_API bool contains_comment_marker(std::string_view text) const noexcept;

        [[nodiscard]] PVL_API bool is_begin_group(std::string_view word) const noexcept;
        [[nodiscard]] PVL_API bool is_begin_object(std::string_view word) const noexcept;
        [[nodiscard]] PVL_API bool is_begin_aggregation(std::string_view word) const noexcept;
        [[nodiscard]] PVL_API bool is_end_aggregation(std::string_view word) const noexcept;

        /// @brief Returns the End keyword that closes the block opened by
        ///        the Begin keyword @p begin (empty if @p begin is not one).
        [[nodiscard]] PVL_API std::string_view end_keyword_for(std::string_view begin) const noexcept;

        [[nodiscard]] PVL_API bool is_end_statement(std::string_view word) const noexcept;

        /// @brief End statements plus every Begin and End aggregation keyword.
        [[nodiscard]] PVL_API bool is_reserved_keyword(std::string_view word) const noexcept;

        [[nodiscard]] PVL_API bool is_radix(int radix) const noexcept;

        /// @brief Whether @p text is exactly the opening part of a radix
        ///        literal (`[sign]radix#`, `radix#[sign]` ...) in this grammar.
        [[nodiscard]] PVL_API bool is_non_decimal_prefix(std::string_view text) const noexcept;
    };

    /// @ingroup PvlGrammar
    /// @brief Case-insensitive ASCII comparison used for every keyword match.
    [[nodiscard]] PVL_API bool iequals(std::string_view a, std::string_view b) noexcept;

    /// @ingroup PvlGrammar
    /// @brief Decodes the UTF-8 sequence starting at byte @p i of @p s.
    /// @return The sequence length, or 0 if the bytes are not valid UTF-8
    [[nodiscard]] PVL_API std::size_t next_code_point(std::string_view s, std::size_t i, char32_t& cp) noexcept;

    /// @ingroup PvlGrammar
    [[nodiscard]] PVL_API const Grammar& pvl_grammar();
    /// @ingroup PvlGrammar
    [[nodiscard]] PVL_API const Grammar& odl_grammar();
    /// @ingroup PvlGrammar
    [[nodiscard]] PVL_API const Grammar& isis_grammar();
    /// @ingroup PvlGrammar
    [[nodiscard]] PVL_API const Grammar& omni_grammar();

} // namespace Pvl
