#pragma once


/*
    ---------------------------------------------------------------
    Pvl::ParseError / Pvl::EncodeError - Structured error reporting
    ---------------------------------------------------------------
    `Pvl::ParseError` describes a failure that occurred while lexing or
    parsing a PVL document. `Pvl::EncodeError` describes a failure to
    serialize a container in a chosen dialect.

    -----------------
    ParseError Fields
    -----------------
    - `code errc`:
        * Enumerated error code describing failure category. Lexer
          failures (`illegal_character`, `unterminated_*`) and parser
          failures (`unexpected_token`, `aggregation_name_mismatch`,
          `missing_value`, ...) share one enum so that callers see a
          single error type from `Pvl::parse(...)`
    - `size_t offset`:
        * Byte offset from the start of the (pre-processed) input where
          the error was detected
    - `size_t line`, `size_t column`:
        * 1-based position derived from `offset`
    - `std::string context`:
        * A short excerpt of the source around `offset`, with line breaks
          made visible, for diagnostics
    - `std::string msg`:
        * Human-readable description of the error
        * Intended for debugging and logging; not stable for programmatic use

    ------------------
    EncodeError Fields
    ------------------
    - `code errc`:
        * `unsupported_value`, `not_representable`, `invalid_key`,
          `unquotable_string`, `illegal_character`, `io_error`
    - `std::string key`:
        * The parameter or block name being written when the error was
          detected (empty at module level)
    - `std::string msg`

    ------------------
    Container Addressing
    ------------------
    Key and index errors raised by `Pvl::container` are exceptions,
    following `std::map::at`: `KeyNotFound` and `IndexOutOfRange`, both
    derived from `std::out_of_range`

    This header defines the error structures only; it does not contain
    lexing, parsing or encoding logic
*/

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "pvl/config.hpp"


/// @defgroup PvlError Errors
/// @ingroup Pvl
/// @brief Error codes and structures produced by the lexer, parser and encoder
namespace Pvl {

    /// @ingroup PvlError
    /// @brief Structured error information produced during lexing and parsing.
    ///
    /// @details
    /// A `ParseError` is returned whenever `Pvl::parse(...)` fails to
    /// interpret the input as a PVL module under the selected dialect.
    /// Lexer errors are always fatal; parser errors are fatal in strict
    /// mode and are only produced in lenient mode when recovery is not
    /// possible.
    struct ParseError {
        /// @ingroup PvlError
        /// @brief Enumeration of possible error categories.
        ///
        /// Members:
        /// - `illegal_character`
        ///     A code point outside the grammar's character set, or an
        ///     invalid UTF-8 sequence.
        /// - `unterminated_comment`, `unterminated_quote`,
        ///   `unterminated_units`, `unterminated_non_decimal`
        ///     Input ended while the lexer was preserving a comment, a
        ///     quoted string, a units expression or a radix literal.
        /// - `invalid_non_decimal`
        ///     A radix literal whose digits are not valid in that radix.
        /// - `invalid_units`
        ///     A units expression containing a nested units delimiter, or
        ///     units following a value the dialect does not allow them on.
        /// - `unexpected_token`
        ///     A token that does not fit the statement being parsed.
        /// - `aggregation_name_mismatch`
        ///     The name after an End-Aggregation keyword differs from the
        ///     name given at the beginning of the block.
        /// - `missing_value`
        ///     An assignment with no value (strict mode only).
        /// - `unexpected_end_of_input`
        ///     Input ended inside a statement or an aggregation block.
        /// - `depth_limit_exceeded`
        ///     Aggregations, sets or sequences nested deeper than
        ///     `ParseOptions::max_depth`.
        /// - `io_error`
        ///     The source stream or file could not be read.
        enum class code : uint8_t {
            illegal_character,       ///< Character not allowed by the grammar.
            unterminated_comment,    ///< Comment still open at end of input.
            unterminated_quote,      ///< Quoted string still open at end of input.
            unterminated_units,      ///< Units expression still open at end of input.
            unterminated_non_decimal,///< Radix literal still open at end of input.
            invalid_non_decimal,     ///< Digits not valid for the stated radix.
            invalid_units,           ///< Malformed or misplaced units expression.
            unexpected_token,        ///< Token does not fit the current statement.
            aggregation_name_mismatch, ///< End-Aggregation name differs from the Begin name.
            missing_value,           ///< Assignment without a value.
            unexpected_end_of_input, ///< Input ended prematurely.
            depth_limit_exceeded,    ///< Maximum nesting depth exceeded.
            io_error,                ///< Source could not be read.
        };

        code errc{};          ///< The classification of the error.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string context{};///< Excerpt of the source around the error.
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup PvlError
        /// @brief Constructs a fully-populated `ParseError` instance.
        ///
        /// @param c    The error code describing the category of failure.
        /// @param o    Byte offset from the start of the input.
        /// @param l    Line number (1-based).
        /// @param col  Column number (1-based).
        /// @param m    Human-readable error message.
        /// @return A fully constructed `ParseError` with an empty context.
        PVL_API static ParseError make(code c, std::size_t o, std::size_t l, std::size_t col, std::string_view m);

        /// @ingroup PvlError
        /// @brief Constructs a `ParseError` whose position is derived from
        ///        @p offset within @p doc.
        ///
        /// @details
        /// Line and column are counted the way editors count them: lines
        /// are separated by `\n` and the column is the 1-based byte index
        /// within the line. The context holds up to 20 bytes on either
        /// side of the offset.
        PVL_API static ParseError at(code c, std::string_view doc, std::size_t offset, std::string_view m);

        /// @ingroup PvlError
        /// @brief Formats the error as `msg: line L column C (char O)`.
        [[nodiscard]] PVL_API std::string what() const;
    };

    /// @ingroup PvlError
    /// @brief Structured error information produced while encoding.
    ///
    /// @details
    /// Encoding never approximates: a value that cannot be written in the
    /// target dialect without changing its meaning on re-parse is an error.
    struct EncodeError {
        /// @ingroup PvlError
        /// @brief Enumeration of possible encoding failures.
        enum class code : uint8_t {
            unsupported_value,  ///< Value kind has no representation in the dialect.
            not_representable,  ///< Value would not survive a round trip through the dialect.
            invalid_key,        ///< Parameter or block name is not legal in the dialect.
            unquotable_string,  ///< String contains every quote character of the grammar.
            illegal_character,  ///< Output would contain a character the grammar forbids.
            io_error,           ///< Destination stream failed.
        };

        code errc{};          ///< The classification of the error.
        std::string key{};    ///< Name of the parameter being written, if any.
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup PvlError
        /// @brief Constructs a fully-populated `EncodeError` instance.
        PVL_API static EncodeError make(code c, std::string_view key, std::string_view m);
    };

    /// @ingroup PvlError
    /// @brief Thrown by key-addressed container operations when the key is absent.
    class PVL_API KeyNotFound : public std::out_of_range {
    public:
        explicit KeyNotFound(std::string_view key);

        [[nodiscard]] const std::string& key() const noexcept { return m_Key; }

    private:
        std::string m_Key;
    };

    /// @ingroup PvlError
    /// @brief Thrown when an occurrence index addresses past the last
    ///        matching entry of a container.
    class PVL_API IndexOutOfRange : public std::out_of_range {
    public:
        IndexOutOfRange(std::string_view key, std::size_t index, std::size_t count);

        [[nodiscard]] std::size_t index() const noexcept { return m_Index; }

    private:
        std::size_t m_Index{};
    };

} // namespace Pvl
