#pragma once


/*
    ---------------------------------------
    Pvl::Encoder - Container to PVL text
    ---------------------------------------
    The encoder walks a container in entry order and writes one
    statement per entry:

        KEY      = value
        BEGIN_GROUP = NAME;
          ...
        END_GROUP = NAME;
        END;

    Assignments in one block are aligned on the longest non-aggregation
    key. Lines wider than `EncoderRules::width` are wrapped at spaces
    that are not inside quotes or units.

    Encoding never approximates. Every value is checked against the
    target dialect and anything that would not decode back to the same
    value is an `EncodeError`.

    ------------
    EncoderRules
    ------------
    The rules split into layout (indent, width, newline, delimiters) and
    the dialect restrictions that ODL and the PDS3 label standard add on
    top of PVL. The named presets in `pvl/options.hpp` fill them in.
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "pvl/config.hpp"
#include "pvl/decoder.hpp"
#include "pvl/error.hpp"
#include "pvl/grammar.hpp"
#include "pvl/value.hpp"


/// @defgroup PvlEncoder Encoder
/// @ingroup Pvl
namespace Pvl {

    /// @ingroup PvlEncoder
    /// @brief How zone information is written after a time.
    enum class zone_style : uint8_t {
        bare_utc, ///< UTC written without a suffix; other offsets rejected (PVL, ISIS)
        odl,      ///< `Z` for UTC, `+HH[:MM]` otherwise (ODL)
        utc_only, ///< `Z`; other offsets and sub-millisecond precision rejected (PDS3)
    };

    /// @ingroup PvlEncoder
    struct EncoderRules {
        std::string newline = "\n";   ///< Line separator.
        std::size_t indent = 2;       ///< Spaces per aggregation level.
        std::size_t width = 80;       ///< Wrap column (0 disables wrapping).
        bool end_delimiter = true;    ///< Terminate statements with the grammar's delimiter.
        bool aggregation_end = true;  ///< Repeat the block name after the End keyword.
        bool final_newline = false;   ///< Write a newline after the End statement.

        bool fold_strings = false;          ///< The paired decoder folds quoted text.
        bool identifier_keys = false;       ///< Keys must be ODL identifiers of at most 30 characters.
        bool upper_case_keys = false;       ///< Keys and block names are written upper-case.
        bool units_on_numbers_only = false; ///< Units only after integers and reals.
        bool odl_units = false;             ///< Units must be ODL units expressions.
        bool scalar_collections = false;    ///< Sequences non-empty and at most 2-D; all elements scalar.
        bool symbol_strings = false;        ///< Identifiers bare, symbols in single quotes.
        bool pds_sets = false;              ///< Sets hold only integers and symbols.
        bool pds_groups = false;            ///< Apply the PDS restrictions on GROUP blocks.
        bool convert_group_to_object = true;///< Write an invalid PDS GROUP as an OBJECT instead of failing.
        std::size_t tab_replace = 0;        ///< Replace each tab with this many spaces (0 keeps tabs).
        zone_style zones = zone_style::bare_utc;
    };

    /// @ingroup PvlEncoder
    using EncodeResult = std::expected<std::string, EncodeError>;

    /// @ingroup PvlEncoder
    /// @brief Writes containers and values in one dialect.
    class Encoder {
    public:
        PVL_API Encoder(const Decoder& d, EncoderRules rules);

        [[nodiscard]] const Grammar& grammar() const noexcept { return m_Decoder->grammar(); }
        [[nodiscard]] const EncoderRules& rules() const noexcept { return m_Rules; }

        /// @ingroup PvlEncoder
        /// @brief Encodes @p module as a complete document, End statement included.
        [[nodiscard]] PVL_API EncodeResult encode(const container& module) const;

        /// @ingroup PvlEncoder
        /// @brief Encodes a value as it would appear to the right of `=`.
        /// @param key Name reported in errors.
        [[nodiscard]] PVL_API EncodeResult encode_value(const value& v, std::string_view key = {}) const;

        [[nodiscard]] PVL_API EncodeResult encode_string(std::string_view s, std::string_view key = {}) const;
        [[nodiscard]] PVL_API EncodeResult encode_real(double d, std::string_view key = {}) const;
        [[nodiscard]] PVL_API EncodeResult encode_date(const date& d, std::string_view key = {}) const;
        [[nodiscard]] PVL_API EncodeResult encode_time(const time& t, std::string_view key = {}) const;
        [[nodiscard]] PVL_API EncodeResult encode_units(std::string_view units, std::string_view key = {}) const;

        /// @ingroup PvlEncoder
        /// @brief The key as written, or `invalid_key` if the dialect does
        ///        not accept it as a parameter or block name.
        [[nodiscard]] PVL_API EncodeResult encode_key(std::string_view key) const;

        /// @ingroup PvlEncoder
        /// @brief Whether @p g satisfies the PDS restrictions on GROUP blocks.
        ///
        /// @details
        /// A PDS GROUP holds no nested aggregations, no repeated keys and no
        /// data location pointers (a `^` key with an integer value).
        [[nodiscard]] PVL_API static bool is_pds_group(const container& g);

        /// @ingroup PvlEncoder
        [[nodiscard]] PVL_API static bool is_identifier(std::string_view s) noexcept;

        /// @ingroup PvlEncoder
        /// @brief Non-empty printable ASCII without apostrophes or format effectors.
        [[nodiscard]] PVL_API static bool is_symbol(std::string_view s) noexcept;

    private:
        const Decoder* m_Decoder;
        EncoderRules m_Rules;

        std::expected<void, EncodeError> encode_block(const container& c, std::size_t level, std::vector<std::string>& lines) const;
        std::expected<void, EncodeError> encode_aggregation(std::string_view name, const container& c, std::size_t level, std::vector<std::string>& lines) const;
        EncodeResult encode_collection(const value& v, std::string_view key) const;
        std::string format(std::string_view statement, std::size_t level) const;
    };

} // namespace Pvl
