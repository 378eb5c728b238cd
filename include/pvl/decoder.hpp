#pragma once


/*
    ----------------------------------------------
    Pvl::Decoder - Literal to value classification
    ----------------------------------------------
    The decoder turns the text of one token into a typed `Pvl::value`.
    Candidates are tried in a fixed priority order and the first success
    wins:

        quoted string -> radix integer -> decimal integer / real
        -> date / time / datetime -> NULL / TRUE / FALSE
        -> unquoted string

    A radix literal whose shape is right but whose digits are not legal
    in the stated radix (`2#0121#`) is an error rather than a fall through.
    Anything else that matches no candidate is reported as `no_match`, and
    the parser decides whether that is fatal.

    ------------
    DecoderRules
    ------------
    What a grammar table cannot express is captured by `DecoderRules`:
    - `fold_quoted_strings`: ODL-style quoted text. A dash followed by a
      line break and indentation is removed, runs of whitespace collapse
      to one space, and leading/trailing whitespace is trimmed
    - `numeric_utc_offsets`: accept `+7`, `-07`, `+0530`, `-05:30` after
      a time, in addition to `Z`

    Times without a zone decode as UTC (offset 0)
*/

#include <cstdint>
#include <expected>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "pvl/config.hpp"
#include "pvl/grammar.hpp"
#include "pvl/value.hpp"


/// @defgroup PvlDecoder Primitive Decoder
/// @ingroup Pvl
namespace Pvl {

    /// @ingroup PvlDecoder
    struct DecoderRules {
        bool fold_quoted_strings = false; ///< Dash continuation and whitespace folding in quoted text.
        bool numeric_utc_offsets = false; ///< Accept `[+-]HH[:MM]` zone suffixes.
    };

    /// @ingroup PvlDecoder
    /// @brief Reason a token's text could not be decoded.
    struct DecodeError {
        enum class code : uint8_t {
            no_match,       ///< No candidate type accepted the text.
            invalid_digits, ///< Radix literal with digits outside the radix.
        };

        code errc{};
        std::string msg{};
    };

    /// @ingroup PvlDecoder
    /// @brief Stateless literal decoder for one grammar.
    class Decoder {
    public:
        PVL_API explicit Decoder(const Grammar& g, DecoderRules rules = {},
                                 std::pmr::memory_resource* res = std::pmr::get_default_resource());

        [[nodiscard]] const Grammar& grammar() const noexcept { return *m_Grammar; }
        [[nodiscard]] const DecoderRules& rules() const noexcept { return m_Rules; }
        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        /// @ingroup PvlDecoder
        /// @brief Runs the full priority chain on @p text.
        [[nodiscard]] PVL_API std::expected<value, DecodeError> decode_simple_value(std::string_view text) const;

        /// @ingroup PvlDecoder
        /// @brief Text between matching quote characters, folded (if the
        ///        rules say so) and then un-escaped.
        [[nodiscard]] PVL_API std::optional<value> decode_quoted_string(std::string_view text) const;

        /// @ingroup PvlDecoder
        /// @brief Whether @p text has the shape of a radix literal in this
        ///        grammar, regardless of whether its digits are valid.
        [[nodiscard]] PVL_API bool is_non_decimal_form(std::string_view text) const noexcept;

        /// @ingroup PvlDecoder
        /// @brief Integer value of a radix literal, nullopt if @p text is not
        ///        one or its digits are invalid for the radix.
        [[nodiscard]] PVL_API std::optional<value> decode_non_decimal(std::string_view text) const;

        /// @ingroup PvlDecoder
        /// @brief `[sign]digits` as an integer; fractional or exponential
        ///        forms, or integers too large for 64 bits, as a real.
        [[nodiscard]] PVL_API std::optional<value> decode_decimal(std::string_view text) const;

        /// @ingroup PvlDecoder
        /// @brief Date (`YYYY-MM-DD`, `YYYY-DDD`), time (`HH:MM[:SS[.f]]`)
        ///        or `dateTtime`, each with an optional zone suffix.
        [[nodiscard]] PVL_API std::optional<value> decode_datetime(std::string_view text) const;

        /// @ingroup PvlDecoder
        /// @brief NULL / TRUE / FALSE, case-insensitively.
        [[nodiscard]] PVL_API std::optional<value> decode_keyword(std::string_view text) const;

        /// @ingroup PvlDecoder
        /// @brief Bare text with no whitespace, reserved characters or
        ///        comment delimiters, that is not a reserved keyword and not
        ///        a date or time.
        [[nodiscard]] PVL_API std::optional<value> decode_unquoted_string(std::string_view text) const;

        /// @ingroup PvlDecoder
        /// @brief Pairs @p v with @p units. If @p v is already a quantity its
        ///        magnitude is used.
        [[nodiscard]] PVL_API value decode_quantity(value v, std::string_view units) const;

        [[nodiscard]] bool is_decimal(std::string_view text) const { return decode_decimal(text).has_value(); }
        [[nodiscard]] bool is_datetime(std::string_view text) const { return decode_datetime(text).has_value(); }
        [[nodiscard]] bool is_numeric(std::string_view text) const { return is_decimal(text) || decode_non_decimal(text).has_value(); }

    private:
        const Grammar* m_Grammar;
        DecoderRules m_Rules;
        std::pmr::memory_resource* m_MemRes;
    };

    /// @ingroup PvlDecoder
    /// @brief Applies ODL quoted-text folding to @p text.
    [[nodiscard]] PVL_API std::string fold_whitespace(std::string_view text, const Grammar& g);

    /// @ingroup PvlDecoder
    /// @brief Expands the `\n \t \f \v \\` escapes; other backslashes are kept.
    [[nodiscard]] PVL_API std::string unescape(std::string_view text);

} // namespace Pvl
