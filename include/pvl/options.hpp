#pragma once


/*
    -------------------------------------
    Pvl parsing and writing options
    -------------------------------------
    This header defines the named dialects and the configuration
    structures that control parsing (PVL -> container) and writing
    (container -> PVL).

    --------
    Dialects
    --------
    A dialect bundles everything that differs between members of the PVL
    family: the grammar tables, the decoder rules, the parser policy and
    the encoder rules. Dialects are selected by value:

        - `dialect_id::pvl`   CCSDS PVL, strict
        - `dialect_id::odl`   PDS3 ODL, strict
        - `dialect_id::pds3`  ODL with the PDS3 label restrictions on output
        - `dialect_id::isis`  PVL as written by ISIS 3
        - `dialect_id::omni`  permissive; reads all of the above and
          recovers from broken assignments

    ---------------------------------
    Parsing Options - Pvl::ParseOptions
    ---------------------------------
    - `dialect_id dialect`:
        * Grammar and rules used to read the text. Defaults to Omni
    - `std::optional<bool> strict`:
        * Overrides the dialect's error policy. Strict parsing fails on the
          first malformed statement; lenient parsing records an empty value
          and the line number of the broken assignment and continues
    - `size_t max_depth`:
        * Limit on nesting of aggregations, sets and sequences
        * If exceeded, the parser fails with `depth_limit_exceeded`
        * A value of 0 is treated as no explicit limit

    ---------------------------------
    Writing Options - Pvl::WriteOptions
    ---------------------------------
    - `dialect_id dialect`: output dialect. Defaults to PVL
    - `size_t indent`: spaces per aggregation level
    - `size_t width`: wrap column for long assignments (0 disables wrapping)
    - `std::optional<std::string> newline`: overrides the dialect's line
      separator (`\n` for PVL and ISIS, `\r\n` for ODL and PDS3)
    - `std::optional<bool> end_delimiter`: overrides whether statements
      end with `;`
    - `bool aggregation_end`: repeat the block name after the End keyword
    - `bool convert_group_to_object`: PDS3 only. Write a GROUP that breaks
      the PDS rules as an OBJECT instead of failing
    - `size_t tab_replace`: PDS3 only. Spaces that replace each tab

    These option structures are plain aggregates suitable for
    brace-initialization
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "pvl/config.hpp"
#include "pvl/decoder.hpp"
#include "pvl/encoder.hpp"
#include "pvl/grammar.hpp"


/// @defgroup PvlOptions Dialects, Parsing and Writing Options
/// @ingroup Pvl
/// @brief Configuration objects controlling parsing and serialization
namespace Pvl {

    /// @ingroup PvlOptions
    enum class dialect_id : uint8_t {
        pvl,
        odl,
        pds3,
        isis,
        omni,
    };

    /// @ingroup PvlOptions
    /// @brief Parser policy that the grammar tables cannot express.
    struct ParserRules {
        bool lenient = false;                 ///< Recover from broken assignments.
        bool units_on_numbers_only = false;   ///< Reject units after non-numeric values.
        bool join_dash_continuations = false; ///< Remove `-` + line break + indentation before lexing.
    };

    /// @ingroup PvlOptions
    /// @brief A complete dialect: grammar, decoder, parser and encoder rules.
    struct Dialect {
        dialect_id id = dialect_id::pvl;
        const Grammar* grammar = &pvl_grammar();
        DecoderRules decoder{};
        ParserRules parser{};
        EncoderRules encoder{};

        /// @ingroup PvlOptions
        /// @brief Returns the named preset.
        [[nodiscard]] PVL_API static Dialect preset(dialect_id id);
    };

    /// @ingroup PvlOptions
    [[nodiscard]] PVL_API std::string_view to_string(dialect_id id) noexcept;

    /// @ingroup PvlOptions
    /// @brief Looks a dialect up by name (`pvl`, `odl`, `pds3`, `isis`,
    ///        `omni`), case-insensitively.
    [[nodiscard]] PVL_API std::optional<dialect_id> dialect_from_string(std::string_view name) noexcept;

    /// @ingroup PvlOptions
    /// @brief Configuration controlling parsing behavior
    ///
    /// Example:
    /// @code
    /// Pvl::ParseOptions opts;
    /// opts.dialect = Pvl::dialect_id::odl;
    /// opts.strict = false;
    /// auto result = Pvl::parse(text, opts);
    /// @endcode
    struct ParseOptions {
        dialect_id dialect = dialect_id::omni; ///< Dialect used to read the text.
        std::optional<bool> strict{};          ///< Overrides the dialect's error policy if set.
        std::size_t max_depth = 0;             ///< Maximum nesting depth (0 = unlimited).
    };

    /// @ingroup PvlOptions
    /// @brief Configuration options controlling serialization.
    ///
    /// Example:
    /// @code
    /// Pvl::WriteOptions wo;
    /// wo.dialect = Pvl::dialect_id::pds3;
    /// wo.indent = 4;
    /// auto text = Pvl::dump(module, wo);
    /// @endcode
    struct WriteOptions {
        dialect_id dialect = dialect_id::pvl;        ///< Output dialect.
        std::size_t indent = 2;                      ///< Spaces per aggregation level.
        std::size_t width = 80;                      ///< Wrap column (0 disables wrapping).
        std::optional<std::string> newline{};        ///< Overrides the dialect's line separator.
        std::optional<bool> end_delimiter{};         ///< Overrides the dialect's statement delimiter use.
        bool aggregation_end = true;                 ///< Repeat the block name after End keywords.
        bool convert_group_to_object = true;         ///< PDS3: write invalid GROUPs as OBJECTs.
        std::size_t tab_replace = 4;                 ///< PDS3: spaces per tab (0 keeps tabs).
    };

} // namespace Pvl
