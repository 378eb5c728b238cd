#pragma once


/*
    --------------------------------------------------------------------
    Pvl - C++ Parameter Value Language library (DOM + parsing + writing)
    --------------------------------------------------------------------

    This is the main public header for Pvl

    It brings together:
        - The document model:           `Pvl::container`, `Pvl::value`
        - Error reporting types:        `Pvl::ParseError`, `Pvl::EncodeError`
        - Parsing functions:            `Pvl::parse(...)`, `Pvl::parse_file(...)`
        - Serialization functions:      `Pvl::dump(...)`
        - Configuration options:        `Pvl::ParseOptions`,
                                        `Pvl::WriteOptions`, `Pvl::Dialect`

    -------------------
    High-Level Overview
    -------------------
    - DOM:
        * A parsed document is a `Pvl::container` in the module role. It
          is an ordered multi-map: keys may repeat and entry order is kept
        * Aggregation blocks (GROUP / OBJECT) are nested containers held
          by `Pvl::value`
    - Parsing:
        * `std::expected<container, ParseError> parse(std::string_view, const ParseOptions& = {})`
        * `std::expected<container, ParseError> parse(std::istream&, const ParseOptions& = {})`
        * `std::expected<container, ParseError> parse_file(const std::filesystem::path&, const ParseOptions& = {})`
        * The dialect and error policy are chosen through `ParseOptions`.
          The default Omni dialect reads PVL, ODL, PDS3 and ISIS labels and
          records broken assignments instead of failing on them
    - Serialization:
        * `std::expected<std::string, EncodeError> dump(const container&, const WriteOptions& = {})`
        * `std::expected<void, EncodeError> dump(const container&, std::ostream&, const WriteOptions& = {})`
        * A value that the target dialect cannot represent exactly is an
          error; nothing is approximated

    -------------
    Binary labels
    -------------
    Lexing is lazy and parsing stops at the End statement, so a label
    followed by binary data (ISIS cubes, attached PDS labels) is read
    without touching the payload

    -----
    Usage
    -----
        #include <pvl/pvl.hpp>

        int main() {
            auto result = Pvl::parse("Name = Mars\nGroup = Orbit\n  Period = 686.98 <d>\nEnd_Group\nEnd");
            if (!result) {
                std::cerr << "Parse Error: " << result.error().what() << '\n';
                return 1;
            }

            Pvl::container& label = result.value();
            label.append("Moons", 2);

            auto text = Pvl::dump(label, { .dialect = Pvl::dialect_id::odl });
            if (text) std::cout << *text;
        }

    Include this header if you want the full Pvl API. The grammar,
    lexer, decoder and encoder headers can be used on their own to work
    at the token or literal level
*/

/// @defgroup PvlAPI Top-level Parsing and Serialization API
/// @ingroup Pvl
/// @brief Convenient free functions for parsing and writing PVL

#include <expected>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

#include "pvl/config.hpp"
#include "pvl/encoder.hpp"
#include "pvl/error.hpp"
#include "pvl/options.hpp"
#include "pvl/value.hpp"

namespace Pvl {

    /// @ingroup PvlAPI
    /// @brief Alias for the result type returned by the parsing functions
    ///
    /// @details
    /// Successful parsing yields a `Pvl::container` in the module role.
    /// Lines of assignments recovered by lenient parsing are available
    /// through `container::errors()`. Failures are reported through a
    /// `ParseError` containing:
    ///  - error code
    ///  - line/column information
    ///  - byte offset and a short excerpt of the source
    ///  - human-readable message
    using ParseResult = std::expected<container, ParseError>;

    /// @ingroup PvlAPI
    /// @brief Parses a PVL module from a string view
    ///
    /// @details
    /// The text is read with the dialect named by `opts.dialect`. Parsing
    /// stops at the End statement; anything after it is not examined.
    ///
    /// Example:
    /// @code
    /// auto res = Pvl::parse("a = 1\nb = (2, 3) <m>\nEND");
    /// if (!res) {
    ///     std::cerr << res.error().what() << '\n';
    /// }
    /// @endcode
    ///
    /// @param input UTF-8 encoded label text
    /// @param opts Dialect, error policy and depth limit
    /// @return A `ParseResult` containing either the module or a parse error
    [[nodiscard]] PVL_API ParseResult parse(std::string_view input, const ParseOptions& opts = {});

    /// @ingroup PvlAPI
    /// @brief Parses a PVL module with a caller-assembled dialect
    ///
    /// @details
    /// `opts.dialect` is ignored; `opts.strict` and `opts.max_depth` apply.
    [[nodiscard]] PVL_API ParseResult parse(std::string_view input, const Dialect& dialect, const ParseOptions& opts = {});

    /// @ingroup PvlAPI
    /// @brief Parses a PVL module from an input stream
    ///
    /// @details
    /// Reads the entire contents of @p is before parsing. A stream that is
    /// already in a failed state is reported as `io_error`.
    [[nodiscard]] PVL_API ParseResult parse(std::istream& is, const ParseOptions& opts = {});

    /// @ingroup PvlAPI
    /// @brief Parses the label at the start of the file at @p path
    ///
    /// @return The module, or `io_error` if the file cannot be opened
    [[nodiscard]] PVL_API ParseResult parse_file(const std::filesystem::path& path, const ParseOptions& opts = {});

    /// @ingroup PvlAPI
    /// @brief Serializes a module to a string
    ///
    /// @details
    /// Writes @p module in the dialect named by `opts.dialect`. The layout
    /// fields of @p opts override the dialect's defaults.
    ///
    /// Example:
    /// @code
    /// auto text = Pvl::dump(module, { .dialect = Pvl::dialect_id::pds3, .indent = 4 });
    /// if (!text) std::cerr << text.error().msg << '\n';
    /// @endcode
    [[nodiscard]] PVL_API EncodeResult dump(const container& module, const WriteOptions& opts = {});

    /// @ingroup PvlAPI
    /// @brief Serializes a module with a caller-assembled dialect
    ///
    /// @details
    /// `opts.dialect` is ignored; the layout fields of @p opts still apply.
    [[nodiscard]] PVL_API EncodeResult dump(const container& module, const Dialect& dialect, const WriteOptions& opts = {});

    /// @ingroup PvlAPI
    /// @brief Serializes a module and writes it to an output stream
    ///
    /// @details
    /// Nothing is written if encoding fails. A stream that fails while
    /// writing is reported as `io_error`.
    [[nodiscard]] PVL_API std::expected<void, EncodeError> dump(const container& module, std::ostream& os, const WriteOptions& opts = {});

} // namespace Pvl
